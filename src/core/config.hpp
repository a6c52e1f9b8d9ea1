#pragma once

#include <cstdint>
#include <cstddef>

#if __cplusplus >= 202002L
#include <bit>
#endif

namespace dxsync {

// Endianness check
#if __cplusplus >= 202002L
static_assert(std::endian::native == std::endian::little,
              "dxsync requires a little-endian platform");
#else
static_assert(__BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__,
              "dxsync requires a little-endian platform");
#endif

// Chunk header: u8 chunk_type + u32 length (LE)
inline constexpr size_t CHUNK_HEADER_SIZE = 5;

// Maximum chunk body size accepted by a StreamReader: 64 MB (sanity limit)
inline constexpr uint32_t MAX_CHUNK_SIZE = 64 * 1024 * 1024;

// Canonical patch block size shared by producer and consumer.
// The patch wire format does not carry it.
inline constexpr uint32_t PATCH_BLOCK_SIZE = 4096;

// xor_len is a u16 on the wire
inline constexpr uint32_t MAX_PATCH_BLOCK_SIZE = 65535;

// Patch algorithm tags
inline constexpr uint8_t PATCH_ALGORITHM_XOR = 1;

// PatchHeader (17) + target_length (4) + block_count (4)
inline constexpr size_t PATCH_PREAMBLE_SIZE = 25;

// Block preamble: index (4) + xor_len (2)
inline constexpr size_t PATCH_BLOCK_HEADER_SIZE = 6;

// Number of versions retained by a VersionStore unless configured otherwise
inline constexpr size_t DEFAULT_STORE_CAPACITY = 5;

// Below this many blocks the diff engine compares serially
inline constexpr size_t PARALLEL_DIFF_MIN_BLOCKS = 64;

} // namespace dxsync
