#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "stream/chunk_dispatcher.hpp"
#include "stream/stream_reader.hpp"

namespace dxsync {

// One consumer-side stream: a reader and the dispatcher it drains into.
struct StreamSession {
    StreamSession(ChunkHandlers handlers, PatchTarget target)
        : dispatcher(std::move(handlers), target) {}

    StreamReader reader;
    ChunkDispatcher dispatcher;
};

// Owner of consumer sessions addressed by opaque handles.
//
// A handle packs (generation << 32) | (slot index + 1); 0 is never a valid
// handle. Destroying a session bumps its slot's generation, so handles kept
// past destroy() no longer resolve. Not synchronized; callers serialize access.
class SessionArena {
public:
    using Handle = uint64_t;

    Handle create(ChunkHandlers handlers, PatchTarget target = PatchTarget::kArtifact);

    // Session for handle, or nullptr when the handle is stale or invalid.
    StreamSession* get(Handle handle);

    bool destroy(Handle handle);

    size_t live() const { return live_; }

private:
    struct Slot {
        uint32_t generation = 1;
        std::unique_ptr<StreamSession> session;
    };

    std::vector<Slot> slots_;
    std::vector<uint32_t> free_;
    size_t live_ = 0;
};

} // namespace dxsync
