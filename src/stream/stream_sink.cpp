#include "stream/stream_sink.hpp"

#include <algorithm>

namespace dxsync {

StreamSink::StreamSink(StreamReader& reader, ChunkDispatcher& dispatcher, size_t fragment)
    : reader_(reader), dispatcher_(dispatcher), fragment_(fragment) {}

bool StreamSink::feed_piece(const uint8_t* data, size_t size) {
    size_t ready = 0;
    reader_.feed(data, size, ready);
    status_ = dispatcher_.drain(reader_);
    return ok();
}

bool StreamSink::write(const uint8_t* data, size_t size) {
    if (!ok()) return false;
    writes_++;
    bytes_ += size;

    if (fragment_ == 0 || size <= fragment_) {
        return feed_piece(data, size);
    }
    for (size_t off = 0; off < size; off += fragment_) {
        if (!feed_piece(data + off, std::min(fragment_, size - off))) return false;
    }
    return true;
}

bool StreamSink::finish() {
    if (!ok()) return false;
    reader_.finish_input();
    status_ = dispatcher_.drain(reader_);
    return ok() && dispatcher_.completed();
}

} // namespace dxsync
