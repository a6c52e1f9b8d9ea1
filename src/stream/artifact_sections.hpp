#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "core/types.hpp"
#include "protocol/chunk.hpp"

namespace dxsync {

// The four named sections of an application artifact, as produced by the
// artifact builder. Null blobs are treated as empty sections.
struct ArtifactSections {
    Blob header;
    Blob layout;
    Blob state;
    Blob code;

    const Blob& section(ChunkType type) const;
    size_t total_size() const;
};

// Canonical packed form: Header, Layout, State and Code chunks in this
// order, without Eof. This is the versioned binary; a full chunk stream is
// exactly the packed form followed by an Eof chunk.
std::vector<uint8_t> pack_sections(const ArtifactSections& sections);

// Inverse of pack_sections. Returns false unless data holds exactly the
// four section chunks in canonical order.
bool unpack_sections(const uint8_t* data, size_t size, ArtifactSections& sections);
inline bool unpack_sections(const std::vector<uint8_t>& data, ArtifactSections& sections) {
    return unpack_sections(data.data(), data.size(), sections);
}

} // namespace dxsync
