#pragma once

#include <cstdint>
#include <string>

#include "stream/artifact_sections.hpp"

namespace dxsync {

// File names of the four sections inside an artifact directory.
struct ArtifactLayout {
    std::string header = "header.bin";
    std::string layout = "layout.bin";
    std::string state = "state.bin";
    std::string code = "code.bin";

    const std::string& file_for(ChunkType type) const;
};

static constexpr const char* ARTIFACT_MANIFEST_NAME = "manifest.json";

// Read manifest.json from dir if present. Keys "header", "layout", "state"
// and "code" override the default file names; other keys are ignored.
// Returns false only when the manifest exists but is malformed.
bool load_manifest(const std::string& dir, ArtifactLayout& layout,
                   std::string& error_msg);

// Load sections from dir. A missing section file yields an empty section;
// a directory without any section file is an error.
bool load_sections(const std::string& dir, ArtifactSections& sections,
                   std::string& error_msg);

// Write all four sections (empty ones included) using the default names.
bool write_sections(const std::string& dir, const ArtifactSections& sections,
                    std::string& error_msg);

// Sum of section file mtimes and sizes, used to detect a rebuilt artifact
// without reading it. 0 when the directory holds no section file.
uint64_t artifact_fingerprint(const std::string& dir);

} // namespace dxsync
