#include "dxsyncclient/update_client.hpp"

#include <curl/curl.h>

#include <cctype>

#include "core/version_hash.hpp"
#include "dxsyncclient/retry_policy.hpp"

namespace dxsync {

namespace {

struct TransferState {
    StreamSink* sink;
    StreamResponse* resp;
};

// libcurl write callback: hand received bytes to the sink.
// Returning a short count aborts the transfer.
size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* st = static_cast<TransferState*>(userdata);
    size_t total = size * nmemb;
    if (!st->sink->write(reinterpret_cast<const uint8_t*>(ptr), total)) {
        return 0;
    }
    return total;
}

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) b++;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;
    return s.substr(b, e - b);
}

bool iequals(const std::string& a, const char* b) {
    size_t i = 0;
    for (; i < a.size() && b[i] != '\0'; i++) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) return false;
    }
    return i == a.size() && b[i] == '\0';
}

// libcurl header callback: one header line per call.
size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* st = static_cast<TransferState*>(userdata);
    size_t total = size * nitems;
    std::string line(buffer, total);

    // A new status line starts a new response (redirects, 100-continue)
    if (line.compare(0, 5, "HTTP/") == 0) {
        st->resp->etag.reset();
        st->resp->update_kind.clear();
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string::npos) return total;
    std::string name = trim(line.substr(0, colon));
    std::string value = trim(line.substr(colon + 1));

    if (iequals(name, "ETag")) {
        st->resp->etag = parse_etag(value);
    } else if (iequals(name, "X-Dxsync-Update")) {
        st->resp->update_kind = value;
    }
    return total;
}

} // namespace

bool fetch_stream(const std::string& url, std::optional<VersionToken> if_none_match,
                  long timeout_seconds, StreamSink& sink, StreamResponse& resp,
                  std::string& error_msg) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        error_msg = "Failed to initialize libcurl";
        return false;
    }

    resp = StreamResponse();
    TransferState state{&sink, &resp};

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &state);

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/vnd.dxsync-stream");
    if (if_none_match) {
        std::string h = "If-None-Match: " + format_etag(*if_none_match);
        headers = curl_slist_append(headers, h.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    resp.http_code = http_code;

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res == CURLE_WRITE_ERROR && !sink.ok()) {
        return true;
    }
    if (res != CURLE_OK) {
        error_msg = "HTTP request failed: ";
        error_msg += curl_easy_strerror(res);
        return false;
    }
    return true;
}

const char* update_kind_name(UpdateKind kind) {
    switch (kind) {
    case UpdateKind::kUnchanged: return "unchanged";
    case UpdateKind::kPatched:   return "patched";
    case UpdateKind::kFull:      return "full";
    }
    return "unknown";
}

UpdateClient::UpdateClient(UpdateOptions options, const Logger& logger)
    : options_(std::move(options)), logger_(logger.child("update")) {}

std::string UpdateClient::stream_url() const {
    std::string url = options_.base_url;
    if (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url + "/api/v1/stream";
}

UpdateClient::Attempt UpdateClient::attempt(const ArtifactCache* cache,
                                            UpdateResult& result,
                                            std::string& error_msg) {
    std::optional<VersionToken> base_token;
    if (cache && cache->has_artifact()) base_token = cache->token();

    ArtifactSections received;
    ChunkHandlers handlers;
    handlers.on_header = [&](const std::vector<uint8_t>& b) { received.header = make_blob(b); };
    handlers.on_layout = [&](const std::vector<uint8_t>& b) { received.layout = make_blob(b); };
    handlers.on_state = [&](const std::vector<uint8_t>& b) { received.state = make_blob(b); };
    handlers.on_code = [&](const std::vector<uint8_t>& b) { received.code = make_blob(b); };

    ChunkDispatcher dispatcher(std::move(handlers), PatchTarget::kArtifact);
    if (base_token) dispatcher.set_base(cache->artifact());

    StreamReader reader(options_.max_chunk_size);
    StreamSink sink(reader, dispatcher, options_.fragment);
    StreamResponse resp;

    logger_.debug("GET %s (If-None-Match: %s)", stream_url().c_str(),
                  base_token ? format_token(*base_token).c_str() : "-");

    if (!fetch_stream(stream_url(), base_token, options_.timeout_seconds,
                      sink, resp, error_msg)) {
        return Attempt::kFailed;
    }
    result.bytes_received += sink.bytes_written();

    if (resp.http_code == 304) {
        if (!base_token) {
            error_msg = "Server answered 304 without a cached version";
            return Attempt::kFailed;
        }
        if (resp.etag && *resp.etag != *base_token) {
            error_msg = "Server answered 304 with a different ETag";
            return Attempt::kRetryFull;
        }
        if (!unpack_sections(cache->artifact(), result.sections)) {
            error_msg = "Cached artifact is malformed";
            return Attempt::kRetryFull;
        }
        result.kind = UpdateKind::kUnchanged;
        result.token = *base_token;
        result.packed = cache->artifact();
        return Attempt::kOk;
    }
    if (resp.http_code == 503) {
        error_msg = "Server has no artifact yet (HTTP 503)";
        return Attempt::kFailed;
    }
    if (resp.http_code != 200) {
        error_msg = "HTTP " + std::to_string(resp.http_code);
        return Attempt::kFailed;
    }
    if (!resp.etag) {
        error_msg = "Response carries no ETag";
        return Attempt::kFailed;
    }

    if (!sink.finish()) {
        DispatchStatus st = sink.status();
        if (st == DispatchStatus::kProtocolError) {
            error_msg = std::string("Malformed stream: ") +
                        protocol_error_name(sink.protocol_error());
        } else {
            error_msg = dispatch_status_name(st);
            if (st == DispatchStatus::kPatchFailed) {
                error_msg += std::string(" (") + patch_status_name(dispatcher.last_patch_status()) + ")";
            }
        }
        return retry_as_full(st, base_token.has_value(), resp.update_kind == "patch")
                   ? Attempt::kRetryFull
                   : Attempt::kFailed;
    }

    bool patched = dispatcher.patches_applied() > 0;
    logger_.debug("Received %s stream: %llu bytes, %llu chunks",
                  resp.update_kind.empty() ? "?" : resp.update_kind.c_str(),
                  static_cast<unsigned long long>(sink.bytes_written()),
                  static_cast<unsigned long long>(reader.chunks_completed()));

    VersionToken got = hash_binary(dispatcher.base());
    if (got != *resp.etag) {
        error_msg = "Result " + format_token(got) + " does not match ETag " +
                    format_token(*resp.etag);
        return patched ? Attempt::kRetryFull : Attempt::kFailed;
    }

    result.kind = patched ? UpdateKind::kPatched : UpdateKind::kFull;
    result.token = got;
    result.sections = received;
    result.packed = dispatcher.base();
    return Attempt::kOk;
}

bool UpdateClient::update(const ArtifactCache& cache, UpdateResult& result,
                          std::string& error_msg) {
    result = UpdateResult();

    Attempt a = attempt(&cache, result, error_msg);
    if (a == Attempt::kRetryFull) {
        logger_.warn("Incremental update rejected (%s); requesting full artifact",
                     error_msg.c_str());
        error_msg.clear();
        result.retried_full = true;
        a = attempt(nullptr, result, error_msg);
    }
    return a == Attempt::kOk;
}

} // namespace dxsync
