#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <shared_mutex>
#include <vector>

#include "core/config.hpp"
#include "core/types.hpp"
#include "protocol/patch_format.hpp"

namespace dxsync {

// One retained artifact version.
struct VersionEntry {
    VersionToken hash = 0;
    Blob binary;
    std::chrono::system_clock::time_point created_at;
};

// Outcome of negotiating a client's known version against the current one.
struct NegotiationResult {
    enum class Kind { kNotModified, kPatch, kFullBinary };

    Kind kind = Kind::kFullBinary;
    VersionToken current = 0;  // token of the current binary
    Patch patch;               // kPatch only
    Blob binary;               // kFullBinary only
};

const char* negotiation_kind_name(NegotiationResult::Kind kind);

// Bounded retention of recent artifact versions keyed by content hash.
//
// Readers (get/contains/negotiate) take a shared lock only for the lookup;
// store() takes a short exclusive lock for insertion and eviction.
// Eviction is oldest-first by insertion time.
class VersionStore {
public:
    explicit VersionStore(size_t capacity = DEFAULT_STORE_CAPACITY,
                          uint32_t block_size = PATCH_BLOCK_SIZE);

    VersionStore(const VersionStore&) = delete;
    VersionStore& operator=(const VersionStore&) = delete;

    // Insert a version and return its hash. Storing a hash already retained
    // keeps the existing entry and its position.
    VersionToken store(const std::vector<uint8_t>& binary);
    VersionToken store(Blob binary);

    // Retained binary for hash, or nullptr.
    Blob get(VersionToken hash) const;

    bool contains(VersionToken hash) const;

    // Decide between NotModified, Patch and FullBinary for a client that
    // knows client_hash (nullopt = no cached version).
    NegotiationResult negotiate(std::optional<VersionToken> client_hash,
                                const Blob& current) const;

    // Same, with the current hash precomputed by the caller.
    NegotiationResult negotiate(std::optional<VersionToken> client_hash,
                                const Blob& current,
                                VersionToken current_hash) const;

    size_t size() const;
    size_t capacity() const { return capacity_; }
    uint32_t block_size() const { return block_size_; }

    // Retained hashes, oldest first.
    std::vector<VersionToken> hashes() const;

    // Snapshot of retained entries, oldest first.
    std::vector<VersionEntry> entries() const;

private:
    size_t capacity_;
    uint32_t block_size_;

    mutable std::shared_mutex mutex_;
    std::deque<VersionEntry> entries_;  // front = oldest

    VersionToken insert(Blob binary, VersionToken hash);
};

} // namespace dxsync
