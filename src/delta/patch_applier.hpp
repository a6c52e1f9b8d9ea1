#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "core/config.hpp"
#include "protocol/patch_format.hpp"

namespace dxsync {

// Reconstruct the target of a patch from old_bin.
//
// Verifies hash(old_bin) == base_hash, sizes the result to target_length
// (copying the common prefix, zero-filling any extension) and XORs every
// block at index * block_size. On failure out is left unchanged.
PatchStatus apply_patch(const std::vector<uint8_t>& old_bin, const Patch& patch,
                        std::vector<uint8_t>& out,
                        uint32_t block_size = PATCH_BLOCK_SIZE);

// Same, decoding the serialized patch first.
PatchStatus apply_patch(const std::vector<uint8_t>& old_bin,
                        const uint8_t* patch_data, size_t patch_size,
                        std::vector<uint8_t>& out,
                        uint32_t block_size = PATCH_BLOCK_SIZE);

// Apply in place on a caller-owned buffer holding the base version.
// Requires buffer.size() == target_length (returns kBlockOutOfBounds
// otherwise, use apply_patch for resizing updates). All blocks are
// range-checked before the buffer is touched.
PatchStatus apply_patch_inplace(std::vector<uint8_t>& buffer, const Patch& patch,
                                uint32_t block_size = PATCH_BLOCK_SIZE);

} // namespace dxsync
