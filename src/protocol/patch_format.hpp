#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "core/types.hpp"

namespace dxsync {

// Outcome of decoding or applying a patch.
enum class PatchStatus : uint8_t {
    kOk = 0,
    kBaseMismatch,          // hash(old) != base_hash
    kBlockOutOfBounds,      // block range exceeds target_length, or xor_len > block size
    kTruncatedPatch,        // patch body ends inside a field
    kUnsupportedAlgorithm,  // algorithm tag is not block-XOR
    kTrailingData,          // bytes left after the last block
};

const char* patch_status_name(PatchStatus status);

struct PatchHeader {
    VersionToken base_hash = 0;
    VersionToken target_hash = 0;
    uint8_t algorithm = 0;
};

struct PatchBlock {
    uint32_t index = 0;
    std::vector<uint8_t> xor_data;  // size <= block size
};

// Sparse block-XOR difference between two versions.
// Blocks may appear in any order.
struct Patch {
    PatchHeader header;
    uint32_t target_length = 0;
    std::vector<PatchBlock> blocks;

    // Sum of xor_data sizes.
    size_t changed_bytes() const;
};

// Size of serialize(patch) without building it.
size_t serialized_size(const Patch& patch);

std::vector<uint8_t> serialize(const Patch& patch);

// Decode a serialized patch. Only structure is checked here; block ranges
// are validated against the block size when the patch is applied.
PatchStatus deserialize(const uint8_t* data, size_t size, Patch& patch);
PatchStatus deserialize(const std::vector<uint8_t>& data, Patch& patch);

} // namespace dxsync
