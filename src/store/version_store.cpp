#include "store/version_store.hpp"
#include "core/version_hash.hpp"
#include "delta/block_diff.hpp"

#include <mutex>

namespace dxsync {

const char* negotiation_kind_name(NegotiationResult::Kind kind) {
    switch (kind) {
    case NegotiationResult::Kind::kNotModified: return "not_modified";
    case NegotiationResult::Kind::kPatch:       return "patch";
    case NegotiationResult::Kind::kFullBinary:  return "full";
    }
    return "unknown";
}

VersionStore::VersionStore(size_t capacity, uint32_t block_size)
    : capacity_(capacity > 0 ? capacity : 1),
      block_size_(block_size > 0 ? block_size : PATCH_BLOCK_SIZE) {}

VersionToken VersionStore::store(const std::vector<uint8_t>& binary) {
    return store(make_blob(binary));
}

VersionToken VersionStore::store(Blob binary) {
    if (!binary) binary = make_blob({});
    // Hash outside the lock.
    VersionToken hash = hash_binary(*binary);
    return insert(std::move(binary), hash);
}

VersionToken VersionStore::insert(Blob binary, VersionToken hash) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (const auto& e : entries_) {
        if (e.hash == hash) return hash;
    }

    VersionEntry entry;
    entry.hash = hash;
    entry.binary = std::move(binary);
    entry.created_at = std::chrono::system_clock::now();
    entries_.push_back(std::move(entry));

    while (entries_.size() > capacity_) {
        entries_.pop_front();
    }
    return hash;
}

Blob VersionStore::get(VersionToken hash) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& e : entries_) {
        if (e.hash == hash) return e.binary;
    }
    return nullptr;
}

bool VersionStore::contains(VersionToken hash) const {
    return get(hash) != nullptr;
}

NegotiationResult VersionStore::negotiate(std::optional<VersionToken> client_hash,
                                          const Blob& current) const {
    return negotiate(client_hash, current, hash_binary(blob_bytes(current)));
}

NegotiationResult VersionStore::negotiate(std::optional<VersionToken> client_hash,
                                          const Blob& current,
                                          VersionToken current_hash) const {
    NegotiationResult result;
    result.current = current_hash;

    if (client_hash && *client_hash == current_hash) {
        result.kind = NegotiationResult::Kind::kNotModified;
        return result;
    }

    if (client_hash) {
        // The diff runs on the shared blob, outside the lock.
        Blob old_bin = get(*client_hash);
        if (old_bin) {
            result.kind = NegotiationResult::Kind::kPatch;
            result.patch = diff_binary(*old_bin, *client_hash,
                                       blob_bytes(current), current_hash,
                                       block_size_);
            return result;
        }
    }

    result.kind = NegotiationResult::Kind::kFullBinary;
    result.binary = current ? current : make_blob({});
    return result;
}

size_t VersionStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

std::vector<VersionToken> VersionStore::hashes() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<VersionToken> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) out.push_back(e.hash);
    return out;
}

std::vector<VersionEntry> VersionStore::entries() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return std::vector<VersionEntry>(entries_.begin(), entries_.end());
}

} // namespace dxsync
