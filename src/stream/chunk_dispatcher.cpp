#include "stream/chunk_dispatcher.hpp"
#include "delta/patch_applier.hpp"
#include "stream/artifact_sections.hpp"

namespace dxsync {

const char* dispatch_status_name(DispatchStatus status) {
    switch (status) {
    case DispatchStatus::kOk:                return "ok";
    case DispatchStatus::kMissingBase:       return "missing_base";
    case DispatchStatus::kPatchFailed:       return "patch_failed";
    case DispatchStatus::kMalformedArtifact: return "malformed_artifact";
    case DispatchStatus::kUnexpectedChunk:   return "unexpected_chunk";
    case DispatchStatus::kProtocolError:     return "protocol_error";
    }
    return "unknown";
}

ChunkDispatcher::ChunkDispatcher(ChunkHandlers handlers, PatchTarget target,
                                 uint32_t block_size)
    : handlers_(std::move(handlers)),
      target_(target),
      block_size_(block_size > 0 ? block_size : PATCH_BLOCK_SIZE) {}

void ChunkDispatcher::set_base(std::vector<uint8_t> base) {
    base_ = std::move(base);
    has_base_ = true;
}

void ChunkDispatcher::clear_base() {
    base_.clear();
    has_base_ = false;
}

void ChunkDispatcher::reset_stream() {
    pending_artifact_.clear();
    pending_sections_ = 0;
    stream_patched_ = false;
    header_seen_ = false;
    completed_ = false;
    dispatched_ = 0;
    last_patch_status_ = PatchStatus::kOk;
}

void ChunkDispatcher::forward(ChunkType type, const std::vector<uint8_t>& body) {
    const ChunkHandlers::BodyHandler* handler = nullptr;
    switch (type) {
    case ChunkType::kHeader: handler = &handlers_.on_header; break;
    case ChunkType::kLayout: handler = &handlers_.on_layout; break;
    case ChunkType::kState:  handler = &handlers_.on_state; break;
    case ChunkType::kCode:   handler = &handlers_.on_code; break;
    default: return;
    }
    if (*handler) (*handler)(body);
}

DispatchStatus ChunkDispatcher::dispatch(const Chunk& chunk) {
    switch (chunk.type) {
    case ChunkType::kHeader:
    case ChunkType::kLayout:
    case ChunkType::kState:
    case ChunkType::kCode:
        forward(chunk.type, chunk.body);
        if (chunk.type == ChunkType::kHeader) header_seen_ = true;
        append_chunk(pending_artifact_, chunk.type,
                     chunk.body.data(), chunk.body.size());
        pending_sections_++;
        if ((target_ == PatchTarget::kLayout && chunk.type == ChunkType::kLayout) ||
            (target_ == PatchTarget::kCode && chunk.type == ChunkType::kCode)) {
            set_base(chunk.body);
        }
        dispatched_++;
        return DispatchStatus::kOk;

    case ChunkType::kPatch: {
        DispatchStatus st = apply_patch_chunk(chunk.body);
        if (st == DispatchStatus::kOk) dispatched_++;
        return st;
    }

    default:
        return DispatchStatus::kUnexpectedChunk;
    }
}

DispatchStatus ChunkDispatcher::apply_patch_chunk(const std::vector<uint8_t>& body) {
    if (!has_base_) return DispatchStatus::kMissingBase;

    std::vector<uint8_t> result;
    last_patch_status_ = apply_patch(base_, body.data(), body.size(),
                                     result, block_size_);
    if (last_patch_status_ != PatchStatus::kOk) {
        return DispatchStatus::kPatchFailed;
    }

    switch (target_) {
    case PatchTarget::kLayout:
        forward(ChunkType::kLayout, result);
        break;
    case PatchTarget::kCode:
        forward(ChunkType::kCode, result);
        break;
    case PatchTarget::kArtifact: {
        ArtifactSections sections;
        if (!unpack_sections(result, sections)) {
            return DispatchStatus::kMalformedArtifact;
        }
        if (!header_seen_) forward(ChunkType::kHeader, blob_bytes(sections.header));
        forward(ChunkType::kLayout, blob_bytes(sections.layout));
        forward(ChunkType::kState, blob_bytes(sections.state));
        forward(ChunkType::kCode, blob_bytes(sections.code));
        break;
    }
    }

    set_base(std::move(result));
    stream_patched_ = true;
    patches_applied_++;
    return DispatchStatus::kOk;
}

void ChunkDispatcher::complete() {
    if (completed_) return;
    completed_ = true;

    // A complete full stream (all four sections, no patch) is the new base
    // of the packed artifact.
    if (target_ == PatchTarget::kArtifact && !stream_patched_ &&
        pending_sections_ == 4) {
        ArtifactSections check;
        if (unpack_sections(pending_artifact_, check)) {
            set_base(std::move(pending_artifact_));
        }
    }
    pending_artifact_.clear();
    pending_sections_ = 0;
    header_seen_ = false;

    if (handlers_.on_complete) handlers_.on_complete();
}

DispatchStatus ChunkDispatcher::drain(StreamReader& reader) {
    while (auto chunk = reader.poll_chunk()) {
        DispatchStatus st = dispatch(*chunk);
        if (st != DispatchStatus::kOk) return st;
    }
    if (reader.failed()) return DispatchStatus::kProtocolError;
    if (reader.is_finished()) complete();
    return DispatchStatus::kOk;
}

} // namespace dxsync
