#include "dxsyncserver/artifact_service.hpp"

#include <chrono>
#include <ctime>

#include "core/version_hash.hpp"

namespace dxsync {

ArtifactService::ArtifactService(std::shared_ptr<VersionStore> store)
    : store_(std::move(store)) {}

VersionToken ArtifactService::publish(const ArtifactSections& sections) {
    Blob packed = make_blob(pack_sections(sections));
    VersionToken token = hash_binary(*packed);

    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (published_ && current_.token == token) return token;
    }

    store_->store(packed);

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        current_.token = token;
        current_.sections = sections;
        current_.packed = std::move(packed);
        published_ = true;
    }

    std::lock_guard<std::mutex> lock(memo_mutex_);
    memo_.clear();
    memo_token_ = token;
    return token;
}

bool ArtifactService::plan_update(std::optional<VersionToken> client_token,
                                  UpdatePlan& plan) {
    Current cur;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (!published_) return false;
        cur = current_;
    }

    plan = UpdatePlan();
    plan.token = cur.token;

    if (client_token && *client_token == cur.token) {
        plan.kind = NegotiationResult::Kind::kNotModified;
        return true;
    }

    if (client_token) {
        std::lock_guard<std::mutex> lock(memo_mutex_);
        if (memo_token_ == cur.token) {
            auto it = memo_.find(*client_token);
            if (it != memo_.end() && !it->second.serialized) {
                plan.kind = NegotiationResult::Kind::kFullBinary;
                plan.stream = StreamGenerator::full_stream(cur.sections);
                return true;
            }
            if (it != memo_.end()) {
                plan.kind = NegotiationResult::Kind::kPatch;
                plan.patch_blocks = it->second.blocks;
                plan.patch_bytes = it->second.serialized->size();
                plan.stream = StreamGenerator::patch_stream(cur.sections.header,
                                                            it->second.serialized);
                return true;
            }
        }
    }

    NegotiationResult nr = store_->negotiate(client_token, cur.packed, cur.token);
    plan.kind = nr.kind;

    switch (nr.kind) {
    case NegotiationResult::Kind::kNotModified:
        break;
    case NegotiationResult::Kind::kPatch: {
        Blob serialized = make_blob(serialize(nr.patch));
        bool oversized = serialized->size() > max_chunk_size_ ||
                         serialized->size() >= blob_bytes(cur.packed).size();
        if (oversized) {
            plan.kind = NegotiationResult::Kind::kFullBinary;
            plan.stream = StreamGenerator::full_stream(cur.sections);
            serialized.reset();
        } else {
            plan.patch_blocks = nr.patch.blocks.size();
            plan.patch_bytes = serialized->size();
            plan.stream = StreamGenerator::patch_stream(cur.sections.header, serialized);
        }

        std::lock_guard<std::mutex> lock(memo_mutex_);
        if (memo_token_ == cur.token) {
            memo_[*client_token] = MemoEntry{serialized, plan.patch_blocks};
        }
        break;
    }
    case NegotiationResult::Kind::kFullBinary:
        plan.stream = StreamGenerator::full_stream(cur.sections);
        break;
    }
    return true;
}

bool ArtifactService::has_artifact() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return published_;
}

std::optional<VersionToken> ArtifactService::current_token() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (!published_) return std::nullopt;
    return current_.token;
}

ArtifactSections ArtifactService::current_sections() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return current_.sections;
}

size_t ArtifactService::memoized_patches() const {
    std::lock_guard<std::mutex> lock(memo_mutex_);
    return memo_.size();
}

static std::string format_utc(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf;
    gmtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return buf;
}

Json::Value ArtifactService::info_json() const {
    Json::Value result;

    Current cur;
    bool published;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        cur = current_;
        published = published_;
    }

    if (published) {
        result["current"] = format_token(cur.token);
        Json::Value sections;
        sections["header"] = static_cast<Json::UInt64>(blob_bytes(cur.sections.header).size());
        sections["layout"] = static_cast<Json::UInt64>(blob_bytes(cur.sections.layout).size());
        sections["state"] = static_cast<Json::UInt64>(blob_bytes(cur.sections.state).size());
        sections["code"] = static_cast<Json::UInt64>(blob_bytes(cur.sections.code).size());
        result["sections"] = std::move(sections);
    } else {
        result["current"] = Json::Value(Json::nullValue);
    }

    result["capacity"] = static_cast<Json::UInt64>(store_->capacity());
    result["block_size"] = store_->block_size();

    Json::Value versions(Json::arrayValue);
    for (const auto& e : store_->entries()) {
        Json::Value v;
        v["token"] = format_token(e.hash);
        v["size"] = static_cast<Json::UInt64>(blob_bytes(e.binary).size());
        v["created_at"] = format_utc(e.created_at);
        versions.append(std::move(v));
    }
    result["versions"] = std::move(versions);
    result["memoized_patches"] = static_cast<Json::UInt64>(memoized_patches());
    return result;
}

} // namespace dxsync
