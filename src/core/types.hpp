#pragma once

#include <cstdint>
#include <memory>
#include <vector>

namespace dxsync {

using ByteVec = std::vector<uint8_t>;

// Immutable shared byte buffer. Published sections and retained versions
// are handed out as Blobs so that concurrent readers never copy them.
using Blob = std::shared_ptr<const ByteVec>;

// Version token: identifies an artifact version by its content.
using VersionToken = uint64_t;

inline Blob make_blob(ByteVec bytes) {
    return std::make_shared<const ByteVec>(std::move(bytes));
}

inline const ByteVec& blob_bytes(const Blob& blob) {
    static const ByteVec kEmpty;
    return blob ? *blob : kEmpty;
}

} // namespace dxsync
