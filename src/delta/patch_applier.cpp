#include "delta/patch_applier.hpp"
#include "core/version_hash.hpp"

#include <algorithm>
#include <cstring>

namespace dxsync {

// Every block must lie inside [0, target_length) and fit in one block.
static PatchStatus check_blocks(const Patch& patch, uint32_t block_size) {
    for (const auto& b : patch.blocks) {
        if (b.xor_data.size() > block_size) return PatchStatus::kBlockOutOfBounds;
        uint64_t begin = static_cast<uint64_t>(b.index) * block_size;
        uint64_t end = begin + b.xor_data.size();
        if (end > patch.target_length) return PatchStatus::kBlockOutOfBounds;
    }
    return PatchStatus::kOk;
}

static void xor_blocks(uint8_t* dst, const Patch& patch, uint32_t block_size) {
    for (const auto& b : patch.blocks) {
        uint8_t* p = dst + static_cast<size_t>(b.index) * block_size;
        for (size_t j = 0; j < b.xor_data.size(); j++) {
            p[j] ^= b.xor_data[j];
        }
    }
}

PatchStatus apply_patch(const std::vector<uint8_t>& old_bin, const Patch& patch,
                        std::vector<uint8_t>& out, uint32_t block_size) {
    if (block_size == 0) block_size = PATCH_BLOCK_SIZE;
    if (patch.header.algorithm != PATCH_ALGORITHM_XOR) {
        return PatchStatus::kUnsupportedAlgorithm;
    }
    if (hash_binary(old_bin) != patch.header.base_hash) {
        return PatchStatus::kBaseMismatch;
    }
    PatchStatus st = check_blocks(patch, block_size);
    if (st != PatchStatus::kOk) return st;

    std::vector<uint8_t> result(patch.target_length, 0);
    size_t common = std::min(old_bin.size(), static_cast<size_t>(patch.target_length));
    if (common > 0) {
        std::memcpy(result.data(), old_bin.data(), common);
    }
    xor_blocks(result.data(), patch, block_size);

    out = std::move(result);
    return PatchStatus::kOk;
}

PatchStatus apply_patch(const std::vector<uint8_t>& old_bin,
                        const uint8_t* patch_data, size_t patch_size,
                        std::vector<uint8_t>& out, uint32_t block_size) {
    Patch patch;
    PatchStatus st = deserialize(patch_data, patch_size, patch);
    if (st != PatchStatus::kOk) return st;
    return apply_patch(old_bin, patch, out, block_size);
}

PatchStatus apply_patch_inplace(std::vector<uint8_t>& buffer, const Patch& patch,
                                uint32_t block_size) {
    if (block_size == 0) block_size = PATCH_BLOCK_SIZE;
    if (patch.header.algorithm != PATCH_ALGORITHM_XOR) {
        return PatchStatus::kUnsupportedAlgorithm;
    }
    if (hash_binary(buffer) != patch.header.base_hash) {
        return PatchStatus::kBaseMismatch;
    }
    if (buffer.size() != patch.target_length) {
        return PatchStatus::kBlockOutOfBounds;
    }
    PatchStatus st = check_blocks(patch, block_size);
    if (st != PatchStatus::kOk) return st;

    xor_blocks(buffer.data(), patch, block_size);
    return PatchStatus::kOk;
}

} // namespace dxsync
