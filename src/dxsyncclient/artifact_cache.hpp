#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace dxsync {

// On-disk cache of the last packed artifact a client received.
//
//   <dir>/artifact.bin   packed artifact (the patch base)
//   <dir>/cache.json     {"token", "size", "sha256", "saved_at"}
class ArtifactCache {
public:
    explicit ArtifactCache(std::string dir);

    // Load the cache. Returns true when the cache is absent (empty cache) or
    // valid. Returns false with error_msg when it exists but is unreadable or
    // inconsistent; the cache is then left empty.
    bool load(std::string& error_msg);

    // Store a new packed artifact. token must be its hash.
    bool save(VersionToken token, const std::vector<uint8_t>& packed,
              std::string& error_msg);

    // Remove both files and empty the cache.
    void clear();

    bool has_artifact() const { return has_; }
    VersionToken token() const { return token_; }
    const std::vector<uint8_t>& artifact() const { return packed_; }
    const std::string& dir() const { return dir_; }

private:
    std::string dir_;
    bool has_ = false;
    VersionToken token_ = 0;
    std::vector<uint8_t> packed_;

    std::string artifact_path() const;
    std::string meta_path() const;
};

} // namespace dxsync
