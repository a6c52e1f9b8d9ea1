#include "protocol/chunk.hpp"
#include "protocol/byte_io.hpp"

namespace dxsync {

bool is_known_chunk_type(uint8_t tag) {
    switch (static_cast<ChunkType>(tag)) {
    case ChunkType::kHeader:
    case ChunkType::kLayout:
    case ChunkType::kState:
    case ChunkType::kCode:
    case ChunkType::kPatch:
    case ChunkType::kEof:
        return true;
    }
    return false;
}

const char* chunk_type_name(uint8_t tag) {
    switch (static_cast<ChunkType>(tag)) {
    case ChunkType::kHeader: return "header";
    case ChunkType::kLayout: return "layout";
    case ChunkType::kState:  return "state";
    case ChunkType::kCode:   return "code";
    case ChunkType::kPatch:  return "patch";
    case ChunkType::kEof:    return "eof";
    }
    return "unknown";
}

void encode_chunk_header(ChunkType type, uint32_t length, uint8_t* out) {
    out[0] = static_cast<uint8_t>(type);
    store_u32(out + 1, length);
}

void append_chunk(std::vector<uint8_t>& buf, ChunkType type,
                  const uint8_t* body, size_t size) {
    size_t at = buf.size();
    buf.resize(at + CHUNK_HEADER_SIZE);
    encode_chunk_header(type, static_cast<uint32_t>(size), buf.data() + at);
    if (size > 0) {
        buf.insert(buf.end(), body, body + size);
    }
}

std::vector<uint8_t> encode_chunk(ChunkType type, const std::vector<uint8_t>& body) {
    std::vector<uint8_t> buf;
    buf.reserve(CHUNK_HEADER_SIZE + body.size());
    append_chunk(buf, type, body.data(), body.size());
    return buf;
}

std::optional<ChunkHeader> decode_header(const uint8_t* data, size_t size) {
    if (size < CHUNK_HEADER_SIZE) return std::nullopt;
    ChunkHeader hdr;
    hdr.chunk_type = data[0];
    hdr.length = load_u32(data + 1);
    return hdr;
}

} // namespace dxsync
