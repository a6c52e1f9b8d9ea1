#include "stream/stream_reader.hpp"

namespace dxsync {

const char* protocol_error_name(ProtocolError error) {
    switch (error) {
    case ProtocolError::kNone:             return "none";
    case ProtocolError::kUnknownChunkType: return "unknown_chunk_type";
    case ProtocolError::kNonEmptyEof:      return "non_empty_eof";
    case ProtocolError::kChunkTooLarge:    return "chunk_too_large";
    case ProtocolError::kTrailingData:     return "trailing_data";
    case ProtocolError::kTruncatedStream:  return "truncated_stream";
    }
    return "unknown";
}

StreamReader::StreamReader(uint32_t max_chunk_size)
    : max_chunk_size_(max_chunk_size) {}

bool StreamReader::fail(ProtocolError error) {
    state_ = State::kFailed;
    error_ = error;
    return false;
}

// Drop consumed bytes once they make up at least half of the buffer.
void StreamReader::compact() {
    if (read_pos_ == 0) return;
    if (read_pos_ == buffer_.size()) {
        buffer_.clear();
        read_pos_ = 0;
    } else if (read_pos_ * 2 >= buffer_.size()) {
        buffer_.erase(buffer_.begin(),
                      buffer_.begin() + static_cast<std::ptrdiff_t>(read_pos_));
        read_pos_ = 0;
    }
}

bool StreamReader::feed(const uint8_t* data, size_t size, size_t& ready) {
    ready = 0;
    if (state_ == State::kFailed) return false;
    if (size == 0) return true;
    bytes_fed_ += size;

    if (state_ == State::kFinished) {
        return fail(ProtocolError::kTrailingData);
    }

    compact();
    buffer_.insert(buffer_.end(), data, data + size);

    while (true) {
        size_t avail = buffer_.size() - read_pos_;

        if (state_ == State::kReadingHeader) {
            auto hdr = decode_header(buffer_.data() + read_pos_, avail);
            if (!hdr) break;  // need more bytes

            if (!is_known_chunk_type(hdr->chunk_type)) {
                return fail(ProtocolError::kUnknownChunkType);
            }
            read_pos_ += CHUNK_HEADER_SIZE;

            if (hdr->chunk_type == static_cast<uint8_t>(ChunkType::kEof)) {
                if (hdr->length != 0) return fail(ProtocolError::kNonEmptyEof);
                // Eof completes immediately; it has no body to wait for.
                state_ = State::kFinished;
                finished_ = true;
                if (read_pos_ != buffer_.size()) {
                    return fail(ProtocolError::kTrailingData);
                }
                buffer_.clear();
                read_pos_ = 0;
                break;
            }

            if (hdr->length > max_chunk_size_) {
                return fail(ProtocolError::kChunkTooLarge);
            }
            current_ = *hdr;
            state_ = State::kReadingBody;
            continue;
        }

        if (state_ == State::kReadingBody) {
            if (avail < current_.length) break;  // need more bytes

            Chunk chunk;
            chunk.type = static_cast<ChunkType>(current_.chunk_type);
            const uint8_t* body = buffer_.data() + read_pos_;
            chunk.body.assign(body, body + current_.length);
            read_pos_ += current_.length;

            ready_.push_back(std::move(chunk));
            ready++;
            completed_++;
            state_ = State::kReadingHeader;
            continue;
        }

        break;
    }
    return true;
}

std::optional<Chunk> StreamReader::poll_chunk() {
    if (ready_.empty()) return std::nullopt;
    Chunk chunk = std::move(ready_.front());
    ready_.pop_front();
    return chunk;
}

bool StreamReader::finish_input() {
    if (state_ == State::kFailed) return false;
    if (!finished_) return fail(ProtocolError::kTruncatedStream);
    return true;
}

} // namespace dxsync
