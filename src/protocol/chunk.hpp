#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "core/config.hpp"

namespace dxsync {

// Chunk types (fixed numeric tags on the wire)
enum class ChunkType : uint8_t {
    kHeader = 0x01,  // artifact metadata, opaque
    kLayout = 0x02,  // template dictionary
    kState  = 0x03,  // state snapshot
    kCode   = 0x04,  // code module
    kPatch  = 0x05,  // serialized Patch
    kEof    = 0xFF,  // end of stream, body always empty
};

// 5-byte chunk header: u8 chunk_type | u32 length (LE).
// Decoded field by field; never memcpy'd from the wire.
struct ChunkHeader {
    uint8_t  chunk_type;
    uint32_t length;
};

// A completed chunk: type and its exact body.
struct Chunk {
    ChunkType type;
    std::vector<uint8_t> body;
};

bool is_known_chunk_type(uint8_t tag);

// Stable lowercase name ("layout", "eof", ...). "unknown" for other tags.
const char* chunk_type_name(uint8_t tag);
inline const char* chunk_type_name(ChunkType type) {
    return chunk_type_name(static_cast<uint8_t>(type));
}

// Write the 5-byte header for (type, length) into out[0..5).
void encode_chunk_header(ChunkType type, uint32_t length, uint8_t* out);

// Append header + body to buf.
void append_chunk(std::vector<uint8_t>& buf, ChunkType type,
                  const uint8_t* body, size_t size);

// Encode one chunk into a fresh buffer of exactly 5 + size bytes.
std::vector<uint8_t> encode_chunk(ChunkType type, const std::vector<uint8_t>& body);

// Decode a chunk header from the first 5 bytes of data.
// Returns nullopt when fewer than 5 bytes are available; the caller must
// wait for more data. The tag is not validated here.
std::optional<ChunkHeader> decode_header(const uint8_t* data, size_t size);

} // namespace dxsync
