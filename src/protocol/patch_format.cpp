#include "protocol/patch_format.hpp"
#include "protocol/byte_io.hpp"
#include "core/config.hpp"

namespace dxsync {

const char* patch_status_name(PatchStatus status) {
    switch (status) {
    case PatchStatus::kOk:                   return "ok";
    case PatchStatus::kBaseMismatch:         return "base_mismatch";
    case PatchStatus::kBlockOutOfBounds:     return "block_out_of_bounds";
    case PatchStatus::kTruncatedPatch:       return "truncated_patch";
    case PatchStatus::kUnsupportedAlgorithm: return "unsupported_algorithm";
    case PatchStatus::kTrailingData:         return "trailing_data";
    }
    return "unknown";
}

size_t Patch::changed_bytes() const {
    size_t total = 0;
    for (const auto& b : blocks) total += b.xor_data.size();
    return total;
}

size_t serialized_size(const Patch& patch) {
    return PATCH_PREAMBLE_SIZE +
           patch.blocks.size() * PATCH_BLOCK_HEADER_SIZE +
           patch.changed_bytes();
}

std::vector<uint8_t> serialize(const Patch& patch) {
    std::vector<uint8_t> buf;
    buf.reserve(serialized_size(patch));

    put_u64(buf, patch.header.base_hash);
    put_u64(buf, patch.header.target_hash);
    put_u8(buf, patch.header.algorithm);
    put_u32(buf, patch.target_length);
    put_u32(buf, static_cast<uint32_t>(patch.blocks.size()));

    for (const auto& b : patch.blocks) {
        put_u32(buf, b.index);
        put_u16(buf, static_cast<uint16_t>(b.xor_data.size()));
        buf.insert(buf.end(), b.xor_data.begin(), b.xor_data.end());
    }
    return buf;
}

PatchStatus deserialize(const uint8_t* data, size_t size, Patch& patch) {
    ByteReader r(data, size);

    if (!r.get_u64(patch.header.base_hash)) return PatchStatus::kTruncatedPatch;
    if (!r.get_u64(patch.header.target_hash)) return PatchStatus::kTruncatedPatch;
    if (!r.get_u8(patch.header.algorithm)) return PatchStatus::kTruncatedPatch;
    if (patch.header.algorithm != PATCH_ALGORITHM_XOR) {
        return PatchStatus::kUnsupportedAlgorithm;
    }
    if (!r.get_u32(patch.target_length)) return PatchStatus::kTruncatedPatch;

    uint32_t block_count;
    if (!r.get_u32(block_count)) return PatchStatus::kTruncatedPatch;

    // A lying block_count must not drive a huge reservation.
    if (block_count > r.remaining() / PATCH_BLOCK_HEADER_SIZE) {
        return PatchStatus::kTruncatedPatch;
    }

    patch.blocks.clear();
    patch.blocks.reserve(block_count);
    for (uint32_t i = 0; i < block_count; i++) {
        PatchBlock b;
        uint16_t xor_len;
        if (!r.get_u32(b.index)) return PatchStatus::kTruncatedPatch;
        if (!r.get_u16(xor_len)) return PatchStatus::kTruncatedPatch;
        if (!r.get_bytes(xor_len, b.xor_data)) return PatchStatus::kTruncatedPatch;
        patch.blocks.push_back(std::move(b));
    }

    if (r.remaining() != 0) return PatchStatus::kTrailingData;
    return PatchStatus::kOk;
}

PatchStatus deserialize(const std::vector<uint8_t>& data, Patch& patch) {
    return deserialize(data.data(), data.size(), patch);
}

} // namespace dxsync
