#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <vector>

#include "core/config.hpp"
#include "protocol/chunk.hpp"

namespace dxsync {

// Fatal decode errors of a chunk stream.
enum class ProtocolError : uint8_t {
    kNone = 0,
    kUnknownChunkType,  // header tag outside the ChunkType set
    kNonEmptyEof,       // Eof header with length != 0
    kChunkTooLarge,     // body length above the reader's limit
    kTrailingData,      // bytes after Eof
    kTruncatedStream,   // input ended before Eof
};

const char* protocol_error_name(ProtocolError error);

// Incremental chunk stream parser.
//
// feed() accepts arbitrarily fragmented input and advances as far as the
// buffered bytes allow, queueing each completed chunk. Suspension is purely
// data-driven: when the current state needs more bytes than are buffered,
// feed() returns and the caller resumes by feeding again. The sequence
// returned by poll_chunk() does not depend on how the input was split.
//
// Single-threaded; one instance per logical stream.
class StreamReader {
public:
    enum class State { kReadingHeader, kReadingBody, kFinished, kFailed };

    explicit StreamReader(uint32_t max_chunk_size = MAX_CHUNK_SIZE);

    // Append data and parse. ready receives the number of chunks that became
    // ready during this call. Returns false on a protocol error (see error());
    // chunks completed before the error stay queued.
    bool feed(const uint8_t* data, size_t size, size_t& ready);
    bool feed(const std::vector<uint8_t>& data, size_t& ready) {
        return feed(data.data(), data.size(), ready);
    }

    // Oldest ready chunk. Eof is never returned; it only finishes the stream.
    std::optional<Chunk> poll_chunk();

    // The transport reached end of input. Returns false (kTruncatedStream)
    // unless Eof has been seen.
    bool finish_input();

    bool is_finished() const { return finished_; }
    bool failed() const { return state_ == State::kFailed; }
    ProtocolError error() const { return error_; }
    State state() const { return state_; }

    // Bytes received but not yet consumed by the state machine.
    size_t buffered() const { return buffer_.size() - read_pos_; }

    // Chunks ready to be polled.
    size_t pending() const { return ready_.size(); }

    // Total chunks completed so far, Eof excluded.
    uint64_t chunks_completed() const { return completed_; }

    uint64_t bytes_fed() const { return bytes_fed_; }

private:
    uint32_t max_chunk_size_;
    State state_ = State::kReadingHeader;
    ChunkHeader current_{};
    bool finished_ = false;
    ProtocolError error_ = ProtocolError::kNone;

    std::vector<uint8_t> buffer_;
    size_t read_pos_ = 0;
    std::deque<Chunk> ready_;
    uint64_t completed_ = 0;
    uint64_t bytes_fed_ = 0;

    bool fail(ProtocolError error);
    void compact();
};

} // namespace dxsync
