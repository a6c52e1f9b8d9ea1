#pragma once

#include <cstddef>
#include <cstdint>

#include "stream/chunk_dispatcher.hpp"
#include "stream/stream_reader.hpp"

namespace dxsync {

// Glue between a byte transport and a reader/dispatcher pair.
//
// Every write() is fed to the reader (re-split into `fragment`-byte pieces
// when fragment > 0) and the dispatcher drains after each piece. The first
// failure latches; later writes are refused.
class StreamSink {
public:
    StreamSink(StreamReader& reader, ChunkDispatcher& dispatcher, size_t fragment = 0);

    // Returns false once the stream has failed.
    bool write(const uint8_t* data, size_t size);

    // The transport reached end of input. Returns true if the stream ended
    // with Eof and every chunk dispatched cleanly.
    bool finish();

    bool ok() const { return status_ == DispatchStatus::kOk; }
    DispatchStatus status() const { return status_; }
    ProtocolError protocol_error() const { return reader_.error(); }
    uint64_t bytes_written() const { return bytes_; }
    uint64_t writes() const { return writes_; }

private:
    StreamReader& reader_;
    ChunkDispatcher& dispatcher_;
    size_t fragment_;
    DispatchStatus status_ = DispatchStatus::kOk;
    uint64_t bytes_ = 0;
    uint64_t writes_ = 0;

    bool feed_piece(const uint8_t* data, size_t size);
};

} // namespace dxsync
