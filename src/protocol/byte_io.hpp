#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace dxsync {

// Append little-endian integers to a buffer.

inline void put_u8(std::vector<uint8_t>& buf, uint8_t v) {
    buf.push_back(v);
}

inline void put_u16(std::vector<uint8_t>& buf, uint16_t v) {
    buf.push_back(static_cast<uint8_t>(v));
    buf.push_back(static_cast<uint8_t>(v >> 8));
}

inline void put_u32(std::vector<uint8_t>& buf, uint32_t v) {
    buf.push_back(static_cast<uint8_t>(v));
    buf.push_back(static_cast<uint8_t>(v >> 8));
    buf.push_back(static_cast<uint8_t>(v >> 16));
    buf.push_back(static_cast<uint8_t>(v >> 24));
}

inline void put_u64(std::vector<uint8_t>& buf, uint64_t v) {
    for (int i = 0; i < 8; i++) {
        buf.push_back(static_cast<uint8_t>(v >> (i * 8)));
    }
}

inline uint32_t load_u32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

inline void store_u32(uint8_t* p, uint32_t v) {
    p[0] = static_cast<uint8_t>(v);
    p[1] = static_cast<uint8_t>(v >> 8);
    p[2] = static_cast<uint8_t>(v >> 16);
    p[3] = static_cast<uint8_t>(v >> 24);
}

// Bounds-checked little-endian reader over a byte range.
// Every getter returns false instead of reading past the end.
class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size) : data_(data), size_(size), pos_(0) {}

    bool has(size_t n) const { return n <= size_ - pos_; }
    size_t remaining() const { return size_ - pos_; }
    size_t position() const { return pos_; }
    const uint8_t* cursor() const { return data_ + pos_; }

    bool get_u8(uint8_t& v) {
        if (!has(1)) return false;
        v = data_[pos_++];
        return true;
    }

    bool get_u16(uint16_t& v) {
        if (!has(2)) return false;
        v = static_cast<uint16_t>(data_[pos_]) |
            static_cast<uint16_t>(static_cast<uint16_t>(data_[pos_ + 1]) << 8);
        pos_ += 2;
        return true;
    }

    bool get_u32(uint32_t& v) {
        if (!has(4)) return false;
        v = load_u32(data_ + pos_);
        pos_ += 4;
        return true;
    }

    bool get_u64(uint64_t& v) {
        if (!has(8)) return false;
        v = 0;
        for (int i = 0; i < 8; i++) {
            v |= static_cast<uint64_t>(data_[pos_ + i]) << (i * 8);
        }
        pos_ += 8;
        return true;
    }

    bool get_bytes(size_t n, std::vector<uint8_t>& out) {
        if (!has(n)) return false;
        out.assign(data_ + pos_, data_ + pos_ + n);
        pos_ += n;
        return true;
    }

    bool skip(size_t n) {
        if (!has(n)) return false;
        pos_ += n;
        return true;
    }

private:
    const uint8_t* data_;
    size_t size_;
    size_t pos_;
};

} // namespace dxsync
