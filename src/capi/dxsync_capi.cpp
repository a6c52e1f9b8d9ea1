#include "capi/dxsync_capi.h"
#include "stream/session_arena.hpp"

#include <new>

using namespace dxsync;

struct dxsync_arena {
    SessionArena sessions;
};

static StreamSession* lookup(dxsync_arena* arena, dxsync_handle h) {
    return arena ? arena->sessions.get(h) : nullptr;
}

static int status_code(DispatchStatus st) {
    switch (st) {
    case DispatchStatus::kOk:                return DXSYNC_OK;
    case DispatchStatus::kMissingBase:       return DXSYNC_ERR_MISSING_BASE;
    case DispatchStatus::kPatchFailed:       return DXSYNC_ERR_PATCH;
    case DispatchStatus::kMalformedArtifact: return DXSYNC_ERR_ARTIFACT;
    case DispatchStatus::kUnexpectedChunk:   return DXSYNC_ERR_UNEXPECTED_CHUNK;
    case DispatchStatus::kProtocolError:     return DXSYNC_ERR_PROTOCOL;
    }
    return DXSYNC_ERR_PROTOCOL;
}

static ChunkHandlers make_handlers(dxsync_section_cb cb, void* user) {
    ChunkHandlers h;
    auto bind = [cb, user](uint8_t tag) {
        return [cb, user, tag](const std::vector<uint8_t>& body) {
            cb(user, tag, body.data(), body.size());
        };
    };
    h.on_header = bind(DXSYNC_CHUNK_HEADER);
    h.on_layout = bind(DXSYNC_CHUNK_LAYOUT);
    h.on_state = bind(DXSYNC_CHUNK_STATE);
    h.on_code = bind(DXSYNC_CHUNK_CODE);
    h.on_complete = [cb, user] { cb(user, DXSYNC_CHUNK_EOF, nullptr, 0); };
    return h;
}

extern "C" {

dxsync_arena* dxsync_arena_create(void) {
    return new (std::nothrow) dxsync_arena;
}

void dxsync_arena_destroy(dxsync_arena* arena) {
    delete arena;
}

int dxsync_arena_live(const dxsync_arena* arena) {
    if (!arena) return DXSYNC_ERR_INVALID_ARGUMENT;
    return static_cast<int>(arena->sessions.live());
}

dxsync_handle dxsync_session_create(dxsync_arena* arena, dxsync_section_cb cb,
                                    void* user) {
    if (!arena || !cb) return 0;
    return arena->sessions.create(make_handlers(cb, user), PatchTarget::kArtifact);
}

int dxsync_session_destroy(dxsync_arena* arena, dxsync_handle h) {
    if (!arena) return DXSYNC_ERR_INVALID_HANDLE;
    return arena->sessions.destroy(h) ? DXSYNC_OK : DXSYNC_ERR_INVALID_HANDLE;
}

int dxsync_session_set_base(dxsync_arena* arena, dxsync_handle h,
                             const uint8_t* data, size_t len) {
    StreamSession* s = lookup(arena, h);
    if (!s) return DXSYNC_ERR_INVALID_HANDLE;
    if (!data && len > 0) return DXSYNC_ERR_INVALID_ARGUMENT;
    s->dispatcher.set_base(std::vector<uint8_t>(data, data + len));
    return DXSYNC_OK;
}

int dxsync_session_feed(dxsync_arena* arena, dxsync_handle h,
                        const uint8_t* data, size_t len, uint32_t* ready) {
    StreamSession* s = lookup(arena, h);
    if (!s) return DXSYNC_ERR_INVALID_HANDLE;
    if (!data && len > 0) return DXSYNC_ERR_INVALID_ARGUMENT;

    size_t n = 0;
    bool ok = s->reader.feed(data, len, n);
    if (ready) *ready = static_cast<uint32_t>(n);
    return ok ? DXSYNC_OK : DXSYNC_ERR_PROTOCOL;
}

int dxsync_session_poll(dxsync_arena* arena, dxsync_handle h, int* processed) {
    StreamSession* s = lookup(arena, h);
    if (!s) return DXSYNC_ERR_INVALID_HANDLE;
    if (processed) *processed = 0;

    auto chunk = s->reader.poll_chunk();
    if (chunk) {
        DispatchStatus st = s->dispatcher.dispatch(*chunk);
        if (st != DispatchStatus::kOk) return status_code(st);
        if (processed) *processed = 1;
    }
    if (s->reader.pending() == 0) {
        // A rejected stream never completes, even past its Eof
        if (s->reader.failed()) return DXSYNC_ERR_PROTOCOL;
        if (s->reader.is_finished()) s->dispatcher.complete();
    }
    return DXSYNC_OK;
}

int dxsync_session_is_finished(dxsync_arena* arena, dxsync_handle h) {
    StreamSession* s = lookup(arena, h);
    if (!s) return DXSYNC_ERR_INVALID_HANDLE;
    return (s->reader.is_finished() && !s->reader.failed()) ? 1 : 0;
}

int dxsync_session_base(dxsync_arena* arena, dxsync_handle h,
                        const uint8_t** data, size_t* len) {
    StreamSession* s = lookup(arena, h);
    if (!s) return DXSYNC_ERR_INVALID_HANDLE;
    if (!data || !len) return DXSYNC_ERR_INVALID_ARGUMENT;
    const auto& base = s->dispatcher.base();
    *data = base.data();
    *len = base.size();
    return DXSYNC_OK;
}

} // extern "C"
