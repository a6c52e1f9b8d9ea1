#include "dxsyncclient/artifact_cache.hpp"

#include <json/json.h>

#include <chrono>
#include <ctime>
#include <memory>

#include "core/version_hash.hpp"
#include "io/file_io.hpp"

namespace dxsync {

ArtifactCache::ArtifactCache(std::string dir) : dir_(std::move(dir)) {}

std::string ArtifactCache::artifact_path() const { return join_path(dir_, "artifact.bin"); }
std::string ArtifactCache::meta_path() const { return join_path(dir_, "cache.json"); }

bool ArtifactCache::load(std::string& error_msg) {
    has_ = false;
    token_ = 0;
    packed_.clear();

    if (!file_exists(meta_path())) return true;

    std::string text;
    if (!read_file_string(meta_path(), text, error_msg)) return false;

    Json::CharReaderBuilder reader_builder;
    std::unique_ptr<Json::CharReader> reader(reader_builder.newCharReader());
    Json::Value root;
    std::string parse_errors;
    if (!reader->parse(text.c_str(), text.c_str() + text.size(),
                       &root, &parse_errors) || !root.isObject()) {
        error_msg = "Invalid cache metadata " + meta_path() + ": " + parse_errors;
        return false;
    }

    auto token = parse_token(root.get("token", "").asString());
    if (!token) {
        error_msg = "Cache metadata has no valid token";
        return false;
    }

    std::vector<uint8_t> packed;
    if (!read_file(artifact_path(), packed, error_msg)) return false;

    if (root.isMember("size") && root["size"].asUInt64() != packed.size()) {
        error_msg = "Cached artifact size does not match metadata";
        return false;
    }
    if (hash_binary(packed) != *token) {
        error_msg = "Cached artifact does not match token " + format_token(*token);
        return false;
    }

    token_ = *token;
    packed_ = std::move(packed);
    has_ = true;
    return true;
}

bool ArtifactCache::save(VersionToken token, const std::vector<uint8_t>& packed,
                         std::string& error_msg) {
    if (!make_dirs(dir_, error_msg)) return false;

    // Artifact first: metadata never points at bytes that are not there yet.
    if (!write_file(artifact_path(), packed, error_msg)) return false;

    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf;
    gmtime_r(&now, &tm_buf);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);

    Json::Value root;
    root["token"] = format_token(token);
    root["size"] = static_cast<Json::UInt64>(packed.size());
    root["sha256"] = sha256_hex(packed.data(), packed.size());
    root["saved_at"] = stamp;

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";
    if (!write_file_string(meta_path(), Json::writeString(writer, root) + "\n", error_msg)) {
        return false;
    }

    token_ = token;
    packed_ = packed;
    has_ = true;
    return true;
}

void ArtifactCache::clear() {
    remove_recursive(meta_path());
    remove_recursive(artifact_path());
    has_ = false;
    token_ = 0;
    packed_.clear();
}

} // namespace dxsync
