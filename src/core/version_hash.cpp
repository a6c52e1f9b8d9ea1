#include "core/version_hash.hpp"

#include <iomanip>
#include <sstream>

#include <openssl/evp.h>

namespace dxsync {

static bool sha256(const uint8_t* data, size_t size,
                   unsigned char* digest, unsigned int& digest_len) {
    return EVP_Digest(data, size, digest, &digest_len,
                      EVP_sha256(), nullptr) == 1;
}

VersionToken hash_binary(const uint8_t* data, size_t size) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (!sha256(data, size, digest, digest_len) || digest_len < 8) {
        return 0;
    }
    VersionToken token = 0;
    for (int i = 0; i < 8; i++) {
        token |= static_cast<VersionToken>(digest[i]) << (i * 8);
    }
    return token;
}

VersionToken hash_binary(const ByteVec& data) {
    return hash_binary(data.data(), data.size());
}

std::string sha256_hex(const uint8_t* data, size_t size) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (!sha256(data, size, digest, digest_len)) return "";

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digest_len; i++)
        oss << std::setw(2) << static_cast<unsigned>(digest[i]);
    return oss.str();
}

std::string format_token(VersionToken token) {
    static const char kHex[] = "0123456789abcdef";
    std::string s(16, '0');
    for (int i = 15; i >= 0; i--) {
        s[static_cast<size_t>(i)] = kHex[token & 0xF];
        token >>= 4;
    }
    return s;
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<VersionToken> parse_token(const std::string& text) {
    if (text.size() != 16) return std::nullopt;
    VersionToken token = 0;
    for (char c : text) {
        int v = hex_value(c);
        if (v < 0) return std::nullopt;
        token = (token << 4) | static_cast<VersionToken>(v);
    }
    return token;
}

std::string format_etag(VersionToken token) {
    return "\"" + format_token(token) + "\"";
}

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

std::optional<VersionToken> parse_etag(const std::string& header_value) {
    size_t pos = 0;
    while (pos <= header_value.size()) {
        size_t comma = header_value.find(',', pos);
        if (comma == std::string::npos) comma = header_value.size();
        std::string item = trim(header_value.substr(pos, comma - pos));
        pos = comma + 1;

        if (item.size() >= 2 && item[0] == 'W' && item[1] == '/') {
            item = item.substr(2);
        }
        if (item.size() >= 2 && item.front() == '"' && item.back() == '"') {
            item = item.substr(1, item.size() - 2);
        }
        auto token = parse_token(item);
        if (token) return token;
    }
    return std::nullopt;
}

} // namespace dxsync
