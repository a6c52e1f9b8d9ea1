#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/types.hpp"
#include "dxsyncclient/artifact_cache.hpp"
#include "stream/artifact_sections.hpp"
#include "stream/stream_sink.hpp"
#include "util/logger.hpp"

namespace dxsync {

// Status line and negotiation headers of one /api/v1/stream response.
struct StreamResponse {
    long http_code = 0;
    std::optional<VersionToken> etag;
    std::string update_kind;  // X-Dxsync-Update: "patch" or "full"
};

// GET <url> and push the body into sink as it arrives.
// Returns false on transport failure; a sink failure aborts the transfer and
// is reported through the sink, not error_msg.
bool fetch_stream(const std::string& url, std::optional<VersionToken> if_none_match,
                  long timeout_seconds, StreamSink& sink, StreamResponse& resp,
                  std::string& error_msg);

struct UpdateOptions {
    std::string base_url;          // e.g. http://host:8080 or http://host:8080/app
    size_t fragment = 0;           // re-split received buffers (0 = as received)
    long timeout_seconds = 300;
    uint32_t max_chunk_size = MAX_CHUNK_SIZE;
};

enum class UpdateKind : uint8_t { kUnchanged, kPatched, kFull };

const char* update_kind_name(UpdateKind kind);

struct UpdateResult {
    UpdateKind kind = UpdateKind::kFull;
    VersionToken token = 0;
    ArtifactSections sections;
    std::vector<uint8_t> packed;   // new base for the cache
    uint64_t bytes_received = 0;
    bool retried_full = false;
};

// Brings a cached artifact up to date against a dxsyncserver.
class UpdateClient {
public:
    UpdateClient(UpdateOptions options, const Logger& logger);

    // One update cycle. A rejected patch is retried once as a full download.
    bool update(const ArtifactCache& cache, UpdateResult& result,
                std::string& error_msg);

    std::string stream_url() const;

private:
    enum class Attempt { kOk, kRetryFull, kFailed };

    UpdateOptions options_;
    Logger logger_;

    Attempt attempt(const ArtifactCache* cache, UpdateResult& result,
                    std::string& error_msg);
};

} // namespace dxsync
