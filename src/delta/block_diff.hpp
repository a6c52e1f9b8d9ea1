#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "core/config.hpp"
#include "protocol/patch_format.hpp"

namespace dxsync {

// Compute a block-XOR patch turning old_bin into new_bin.
//
// new_bin is split into block_size-byte blocks; bytes past the end of old_bin
// compare as zero. A block is emitted when its XOR is non-zero or when the
// old and new effective lengths inside it differ. Emitted blocks carry the
// full XOR of the aligned range and are ordered by index.
//
// block_size must be in [1, MAX_PATCH_BLOCK_SIZE]; 0 selects PATCH_BLOCK_SIZE.
// Large inputs are compared in parallel on the current TBB arena.
Patch diff_binary(const std::vector<uint8_t>& old_bin,
                  const std::vector<uint8_t>& new_bin,
                  uint32_t block_size = PATCH_BLOCK_SIZE);

// Same, with hashes already known to the caller (skips rehashing).
Patch diff_binary(const std::vector<uint8_t>& old_bin, VersionToken old_hash,
                  const std::vector<uint8_t>& new_bin, VersionToken new_hash,
                  uint32_t block_size = PATCH_BLOCK_SIZE);

// Size statistics of a patch relative to the full target.
struct PatchInfo {
    VersionToken from_hash = 0;
    VersionToken to_hash = 0;
    size_t block_count = 0;
    size_t patch_size = 0;       // serialized bytes
    size_t target_size = 0;
    double compression_ratio = 0.0;  // target_size / patch_size
};

PatchInfo describe_patch(const Patch& patch);

} // namespace dxsync
