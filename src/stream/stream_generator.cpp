#include "stream/stream_generator.hpp"

#include <algorithm>
#include <cstring>

namespace dxsync {

void StreamGenerator::add(ChunkType type, Blob body) {
    PlannedChunk c;
    c.type = type;
    c.body = body ? std::move(body) : make_blob({});
    encode_chunk_header(type, static_cast<uint32_t>(c.body->size()), c.header);
    total_ += CHUNK_HEADER_SIZE + c.body->size();
    plan_.push_back(std::move(c));
}

StreamGenerator StreamGenerator::full_stream(const ArtifactSections& sections) {
    StreamGenerator gen;
    gen.add(ChunkType::kHeader, sections.header);
    gen.add(ChunkType::kLayout, sections.layout);
    gen.add(ChunkType::kState, sections.state);
    gen.add(ChunkType::kCode, sections.code);
    gen.add(ChunkType::kEof, nullptr);
    return gen;
}

StreamGenerator StreamGenerator::patch_stream(const Blob& header, const Patch& patch) {
    return patch_stream(header, make_blob(serialize(patch)));
}

StreamGenerator StreamGenerator::patch_stream(const Blob& header, Blob serialized_patch) {
    StreamGenerator gen;
    gen.add(ChunkType::kHeader, header);
    gen.add(ChunkType::kPatch, std::move(serialized_patch));
    gen.add(ChunkType::kEof, nullptr);
    return gen;
}

size_t StreamGenerator::read(uint8_t* out, size_t capacity) {
    size_t written = 0;
    while (written < capacity && chunk_index_ < plan_.size()) {
        const PlannedChunk& c = plan_[chunk_index_];
        const size_t chunk_size = CHUNK_HEADER_SIZE + c.body->size();

        if (chunk_offset_ < CHUNK_HEADER_SIZE) {
            size_t n = std::min(CHUNK_HEADER_SIZE - chunk_offset_, capacity - written);
            std::memcpy(out + written, c.header + chunk_offset_, n);
            written += n;
            chunk_offset_ += n;
        } else {
            size_t body_off = chunk_offset_ - CHUNK_HEADER_SIZE;
            size_t n = std::min(c.body->size() - body_off, capacity - written);
            std::memcpy(out + written, c.body->data() + body_off, n);
            written += n;
            chunk_offset_ += n;
        }

        if (chunk_offset_ == chunk_size) {
            chunk_index_++;
            chunk_offset_ = 0;
        }
    }
    emitted_ += written;
    return written;
}

bool StreamGenerator::next_chunk(ChunkType& type, Blob& body) {
    if (chunk_index_ >= plan_.size() || chunk_offset_ != 0) return false;
    const PlannedChunk& c = plan_[chunk_index_];
    type = c.type;
    body = c.body;
    emitted_ += CHUNK_HEADER_SIZE + c.body->size();
    chunk_index_++;
    return true;
}

std::vector<uint8_t> StreamGenerator::collect() {
    std::vector<uint8_t> out(remaining());
    size_t n = read(out.data(), out.size());
    out.resize(n);
    return out;
}

} // namespace dxsync
