#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

#include "core/config.hpp"
#include "dxsyncserver/artifact_service.hpp"
#include "util/logger.hpp"

namespace dxsync {

// Reloads an artifact directory into an ArtifactService when its section
// files change, either on demand (poll_once) or from a background thread.
class ArtifactWatcher {
public:
    ArtifactWatcher(std::string dir, ArtifactService& service, const Logger& logger);
    ~ArtifactWatcher();

    ArtifactWatcher(const ArtifactWatcher&) = delete;
    ArtifactWatcher& operator=(const ArtifactWatcher&) = delete;

    // Check the directory once. Returns true if a new version was published.
    // Load errors are logged and leave the current version in place.
    bool poll_once();

    // Poll every interval_seconds until stop(). No-op if already running.
    void start(int interval_seconds);
    void stop();

    // Sections larger than this are refused (clients could not read them).
    void set_max_section_size(uint64_t bytes) { max_section_size_ = bytes; }

    bool running() const { return thread_.joinable(); }
    uint64_t reloads() const { return reloads_.load(); }

private:
    std::string dir_;
    ArtifactService& service_;
    Logger logger_;
    uint64_t fingerprint_ = 0;
    uint64_t max_section_size_ = MAX_CHUNK_SIZE;
    std::atomic<uint64_t> reloads_{0};

    std::thread thread_;
    std::atomic<bool> stop_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
    std::mutex poll_mutex_;
};

} // namespace dxsync
