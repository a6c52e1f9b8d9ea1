#include "delta/block_diff.hpp"
#include "core/version_hash.hpp"

#include <algorithm>

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

namespace dxsync {

namespace {

struct BlockSpan {
    size_t begin;      // offset of the block in new_bin
    size_t new_len;    // bytes of new_bin inside the block
    size_t old_len;    // bytes of old_bin inside the block
};

BlockSpan block_span(size_t index, uint32_t block_size,
                     size_t old_size, size_t new_size) {
    BlockSpan s;
    s.begin = index * block_size;
    size_t end = std::min(s.begin + block_size, new_size);
    s.new_len = end - s.begin;
    s.old_len = (s.begin < old_size)
        ? std::min(old_size, s.begin + block_size) - s.begin
        : 0;
    return s;
}

bool block_changed(const std::vector<uint8_t>& old_bin,
                   const std::vector<uint8_t>& new_bin,
                   const BlockSpan& s) {
    if (s.old_len != s.new_len) return true;
    // old_len == new_len, so both ranges are fully populated.
    return !std::equal(new_bin.begin() + static_cast<std::ptrdiff_t>(s.begin),
                       new_bin.begin() + static_cast<std::ptrdiff_t>(s.begin + s.new_len),
                       old_bin.begin() + static_cast<std::ptrdiff_t>(s.begin));
}

} // namespace

Patch diff_binary(const std::vector<uint8_t>& old_bin,
                  const std::vector<uint8_t>& new_bin,
                  uint32_t block_size) {
    return diff_binary(old_bin, hash_binary(old_bin),
                       new_bin, hash_binary(new_bin), block_size);
}

Patch diff_binary(const std::vector<uint8_t>& old_bin, VersionToken old_hash,
                  const std::vector<uint8_t>& new_bin, VersionToken new_hash,
                  uint32_t block_size) {
    if (block_size == 0) block_size = PATCH_BLOCK_SIZE;
    if (block_size > MAX_PATCH_BLOCK_SIZE) block_size = MAX_PATCH_BLOCK_SIZE;

    Patch patch;
    patch.header.base_hash = old_hash;
    patch.header.target_hash = new_hash;
    patch.header.algorithm = PATCH_ALGORITHM_XOR;
    patch.target_length = static_cast<uint32_t>(new_bin.size());

    const size_t old_size = old_bin.size();
    const size_t new_size = new_bin.size();
    const size_t num_blocks = (new_size + block_size - 1) / block_size;

    // Pass 1: mark changed blocks (parallel for large inputs).
    std::vector<uint8_t> changed(num_blocks, 0);
    auto mark = [&](size_t lo, size_t hi) {
        for (size_t i = lo; i < hi; i++) {
            BlockSpan s = block_span(i, block_size, old_size, new_size);
            changed[i] = block_changed(old_bin, new_bin, s) ? 1 : 0;
        }
    };

    if (num_blocks >= PARALLEL_DIFF_MIN_BLOCKS) {
        tbb::parallel_for(tbb::blocked_range<size_t>(0, num_blocks, 16),
            [&](const tbb::blocked_range<size_t>& range) {
                mark(range.begin(), range.end());
            });
    } else {
        mark(0, num_blocks);
    }

    // Pass 2: emit XOR data for changed blocks, in index order.
    for (size_t i = 0; i < num_blocks; i++) {
        if (!changed[i]) continue;
        BlockSpan s = block_span(i, block_size, old_size, new_size);

        PatchBlock b;
        b.index = static_cast<uint32_t>(i);
        b.xor_data.resize(s.new_len);
        for (size_t j = 0; j < s.new_len; j++) {
            size_t pos = s.begin + j;
            uint8_t old_byte = (pos < old_size) ? old_bin[pos] : 0;
            b.xor_data[j] = static_cast<uint8_t>(new_bin[pos] ^ old_byte);
        }
        patch.blocks.push_back(std::move(b));
    }

    return patch;
}

PatchInfo describe_patch(const Patch& patch) {
    PatchInfo info;
    info.from_hash = patch.header.base_hash;
    info.to_hash = patch.header.target_hash;
    info.block_count = patch.blocks.size();
    info.patch_size = serialized_size(patch);
    info.target_size = patch.target_length;
    info.compression_ratio = info.patch_size > 0
        ? static_cast<double>(info.target_size) / static_cast<double>(info.patch_size)
        : 0.0;
    return info;
}

} // namespace dxsync
