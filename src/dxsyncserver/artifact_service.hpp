#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>

#include <json/json.h>

#include "core/config.hpp"
#include "core/types.hpp"
#include "store/version_store.hpp"
#include "stream/artifact_sections.hpp"
#include "stream/stream_generator.hpp"

namespace dxsync {

// What to send a client, ready to be streamed.
struct UpdatePlan {
    NegotiationResult::Kind kind = NegotiationResult::Kind::kFullBinary;
    VersionToken token = 0;      // current version (ETag)
    StreamGenerator stream;      // empty for kNotModified
    size_t patch_blocks = 0;     // kPatch only
    size_t patch_bytes = 0;      // serialized patch size, kPatch only
};

// Producer-side state shared by all request handlers: the published
// artifact, the version store it is recorded in, and serialized patches
// memoized per base version until the next publish.
class ArtifactService {
public:
    explicit ArtifactService(std::shared_ptr<VersionStore> store);

    // Publish a new artifact and return its token. Republishing the current
    // content changes nothing.
    VersionToken publish(const ArtifactSections& sections);

    // Largest Patch chunk sent to clients. A patch above this limit, or one
    // no smaller than the packed artifact, is replaced by a full stream.
    void set_max_chunk_size(uint64_t size) { max_chunk_size_ = size; }
    uint64_t max_chunk_size() const { return max_chunk_size_; }

    // Plan the response for a client that holds client_token.
    // Returns false when nothing has been published yet.
    bool plan_update(std::optional<VersionToken> client_token, UpdatePlan& plan);

    bool has_artifact() const;
    std::optional<VersionToken> current_token() const;

    // Current sections (null blobs before the first publish).
    ArtifactSections current_sections() const;

    // {"current", "capacity", "block_size", "sections", "versions"}
    Json::Value info_json() const;

    size_t memoized_patches() const;

    const VersionStore& store() const { return *store_; }

private:
    struct Current {
        VersionToken token = 0;
        ArtifactSections sections;
        Blob packed;
    };

    // serialized is null when the client is better served by a full stream.
    struct MemoEntry {
        Blob serialized;
        size_t blocks = 0;
    };

    std::shared_ptr<VersionStore> store_;
    uint64_t max_chunk_size_ = MAX_CHUNK_SIZE;

    mutable std::shared_mutex mutex_;
    bool published_ = false;
    Current current_;

    mutable std::mutex memo_mutex_;
    VersionToken memo_token_ = 0;  // current token the memo was built for
    std::unordered_map<VersionToken, MemoEntry> memo_;
};

} // namespace dxsync
