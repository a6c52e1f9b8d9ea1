#include "dxsyncserver/artifact_watcher.hpp"

#include <chrono>

#include "core/version_hash.hpp"
#include "io/artifact_loader.hpp"

namespace dxsync {

ArtifactWatcher::ArtifactWatcher(std::string dir, ArtifactService& service,
                                 const Logger& logger)
    : dir_(std::move(dir)), service_(service), logger_(logger.child("watcher")) {}

ArtifactWatcher::~ArtifactWatcher() {
    stop();
}

bool ArtifactWatcher::poll_once() {
    std::lock_guard<std::mutex> guard(poll_mutex_);

    uint64_t fp = artifact_fingerprint(dir_);
    if (fp == 0 || fp == fingerprint_) return false;

    ArtifactSections sections;
    std::string error_msg;
    if (!load_sections(dir_, sections, error_msg)) {
        logger_.warn("Reload skipped: %s", error_msg.c_str());
        return false;
    }
    fingerprint_ = fp;

    for (ChunkType type : {ChunkType::kHeader, ChunkType::kLayout,
                           ChunkType::kState, ChunkType::kCode}) {
        size_t size = blob_bytes(sections.section(type)).size();
        if (size > max_section_size_) {
            logger_.error("Reload refused: %s section is %zu bytes (limit %llu)",
                          chunk_type_name(type), size,
                          static_cast<unsigned long long>(max_section_size_));
            return false;
        }
    }

    auto before = service_.current_token();
    VersionToken token = service_.publish(sections);
    if (before && *before == token) {
        logger_.debug("Artifact files touched, content unchanged (%s)",
                      format_token(token).c_str());
        return false;
    }

    reloads_++;
    logger_.info("Published version %s (%zu bytes)",
                 format_token(token).c_str(), sections.total_size());
    return true;
}

void ArtifactWatcher::start(int interval_seconds) {
    if (thread_.joinable() || interval_seconds <= 0) return;
    stop_.store(false);

    thread_ = std::thread([this, interval_seconds] {
        while (!stop_.load()) {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait_for(lock, std::chrono::seconds(interval_seconds),
                             [this] { return stop_.load(); });
            }
            if (stop_.load()) break;
            poll_once();
        }
    });
}

void ArtifactWatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_.store(true);
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

} // namespace dxsync
