#include "stream/session_arena.hpp"

namespace dxsync {

SessionArena::Handle SessionArena::create(ChunkHandlers handlers, PatchTarget target) {
    uint32_t index;
    if (!free_.empty()) {
        index = free_.back();
        free_.pop_back();
    } else {
        index = static_cast<uint32_t>(slots_.size());
        slots_.emplace_back();
    }

    Slot& slot = slots_[index];
    slot.session = std::make_unique<StreamSession>(std::move(handlers), target);
    live_++;
    return (static_cast<Handle>(slot.generation) << 32) | (static_cast<Handle>(index) + 1);
}

StreamSession* SessionArena::get(Handle handle) {
    uint32_t low = static_cast<uint32_t>(handle & 0xFFFFFFFFu);
    if (low == 0) return nullptr;
    uint32_t index = low - 1;
    uint32_t generation = static_cast<uint32_t>(handle >> 32);

    if (index >= slots_.size()) return nullptr;
    Slot& slot = slots_[index];
    if (slot.generation != generation || !slot.session) return nullptr;
    return slot.session.get();
}

bool SessionArena::destroy(Handle handle) {
    if (!get(handle)) return false;
    uint32_t index = static_cast<uint32_t>(handle & 0xFFFFFFFFu) - 1;

    Slot& slot = slots_[index];
    slot.session.reset();
    slot.generation++;
    if (slot.generation == 0) slot.generation = 1;
    free_.push_back(index);
    live_--;
    return true;
}

} // namespace dxsync
