#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

#include "core/config.hpp"
#include "protocol/chunk.hpp"
#include "protocol/patch_format.hpp"
#include "stream/stream_reader.hpp"

namespace dxsync {

// Consumers of decoded sections. Unset handlers drop their section.
struct ChunkHandlers {
    using BodyHandler = std::function<void(const std::vector<uint8_t>&)>;

    BodyHandler on_header;   // metadata record (opaque)
    BodyHandler on_layout;   // template registrar
    BodyHandler on_state;    // state hydrator
    BodyHandler on_code;     // code loader
    std::function<void()> on_complete;  // stream reached Eof
};

// What the reconstructed bytes of a Patch chunk are.
enum class PatchTarget : uint8_t {
    kLayout,    // a Layout section
    kCode,      // a Code section
    kArtifact,  // a packed artifact; each contained section is forwarded
};

enum class DispatchStatus : uint8_t {
    kOk = 0,
    kMissingBase,         // Patch arrived without a cached base binary
    kPatchFailed,         // see last_patch_status()
    kMalformedArtifact,   // patched artifact does not unpack into sections
    kUnexpectedChunk,     // chunk type not valid here (Eof, unknown)
    kProtocolError,       // the reader failed (see its error())
};

const char* dispatch_status_name(DispatchStatus status);

// Routes completed chunks to their consumers in arrival order.
//
// A Patch chunk is applied to the cached base and the result is forwarded
// exactly as if the targeted chunk type(s) had arrived directly, except that
// a packed artifact's header is not forwarded again when the stream already
// carried a Header chunk. Effects of
// chunks already dispatched are never rolled back; a failing chunk has no
// effect and leaves the base untouched.
class ChunkDispatcher {
public:
    explicit ChunkDispatcher(ChunkHandlers handlers,
                             PatchTarget target = PatchTarget::kArtifact,
                             uint32_t block_size = PATCH_BLOCK_SIZE);

    // Cached binary that the next Patch applies to: the packed artifact in
    // kArtifact mode, the target section otherwise.
    void set_base(std::vector<uint8_t> base);
    void clear_base();
    bool has_base() const { return has_base_; }
    const std::vector<uint8_t>& base() const { return base_; }

    DispatchStatus dispatch(const Chunk& chunk);

    // Poll every ready chunk from reader and dispatch it; fires on_complete
    // once the reader has finished and its queue is drained. Stops at the
    // first failure.
    DispatchStatus drain(StreamReader& reader);

    // Signal end of stream (Eof). Idempotent.
    void complete();

    bool completed() const { return completed_; }
    PatchStatus last_patch_status() const { return last_patch_status_; }
    PatchTarget target() const { return target_; }
    size_t dispatched() const { return dispatched_; }
    size_t patches_applied() const { return patches_applied_; }

    // Forget per-stream progress (keeps the base) before reusing the
    // dispatcher for another stream.
    void reset_stream();

private:
    ChunkHandlers handlers_;
    PatchTarget target_;
    uint32_t block_size_;

    std::vector<uint8_t> base_;
    bool has_base_ = false;

    // Sections seen directly in the current stream, re-packed as they come
    // so that a complete full stream becomes the next base.
    std::vector<uint8_t> pending_artifact_;
    int pending_sections_ = 0;
    bool stream_patched_ = false;
    bool header_seen_ = false;

    bool completed_ = false;
    size_t dispatched_ = 0;
    size_t patches_applied_ = 0;
    PatchStatus last_patch_status_ = PatchStatus::kOk;

    void forward(ChunkType type, const std::vector<uint8_t>& body);
    DispatchStatus apply_patch_chunk(const std::vector<uint8_t>& body);
};

} // namespace dxsync
