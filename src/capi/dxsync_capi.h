#ifndef DXSYNC_CAPI_H
#define DXSYNC_CAPI_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* Session container owned by the embedding application. Not thread-safe:
 * calls on one arena must be serialized by the caller. */
typedef struct dxsync_arena dxsync_arena;

/* Opaque session handle within an arena; 0 is never valid. */
typedef uint64_t dxsync_handle;

/* Return codes */
#define DXSYNC_OK                    0
#define DXSYNC_ERR_INVALID_HANDLE   -1
#define DXSYNC_ERR_INVALID_ARGUMENT -2
#define DXSYNC_ERR_PROTOCOL         -3  /* malformed or truncated stream */
#define DXSYNC_ERR_MISSING_BASE     -4  /* patch without cached base: request full */
#define DXSYNC_ERR_PATCH            -5  /* patch rejected: request full */
#define DXSYNC_ERR_ARTIFACT         -6  /* patched artifact malformed */
#define DXSYNC_ERR_UNEXPECTED_CHUNK -7

/* Chunk type tags passed to the section callback */
#define DXSYNC_CHUNK_HEADER 0x01
#define DXSYNC_CHUNK_LAYOUT 0x02
#define DXSYNC_CHUNK_STATE  0x03
#define DXSYNC_CHUNK_CODE   0x04
#define DXSYNC_CHUNK_EOF    0xFF  /* completion signal, data is NULL */

/* Called for every decoded section, including sections rebuilt from a patch. */
typedef void (*dxsync_section_cb)(void* user, uint8_t chunk_type,
                                  const uint8_t* data, size_t len);

/* Returns NULL on allocation failure. Destroying an arena destroys its
 * sessions. */
dxsync_arena* dxsync_arena_create(void);
void dxsync_arena_destroy(dxsync_arena* arena);

/* Number of live sessions, or negative when arena is NULL. */
int dxsync_arena_live(const dxsync_arena* arena);

/* Sessions expect packed-artifact patches. Returns 0 on failure. */
dxsync_handle dxsync_session_create(dxsync_arena* arena, dxsync_section_cb cb,
                                    void* user);
int dxsync_session_destroy(dxsync_arena* arena, dxsync_handle h);

/* Cached packed artifact that an incoming patch applies to. */
int dxsync_session_set_base(dxsync_arena* arena, dxsync_handle h,
                             const uint8_t* data, size_t len);

/* Feed raw bytes; *ready receives the number of newly completed chunks. */
int dxsync_session_feed(dxsync_arena* arena, dxsync_handle h,
                        const uint8_t* data, size_t len, uint32_t* ready);

/* Dispatch the oldest ready chunk; *processed is 1 if one was dispatched.
 * Once the queue is empty, returns DXSYNC_ERR_PROTOCOL if the stream was
 * rejected; the completion callback then never fires. */
int dxsync_session_poll(dxsync_arena* arena, dxsync_handle h, int* processed);

/* 1 if Eof was received and the stream was accepted, 0 if not, negative on
 * invalid handle. */
int dxsync_session_is_finished(dxsync_arena* arena, dxsync_handle h);

/* Current base (valid until the next call on this session). */
int dxsync_session_base(dxsync_arena* arena, dxsync_handle h,
                        const uint8_t** data, size_t* len);

#ifdef __cplusplus
}
#endif

#endif /* DXSYNC_CAPI_H */
