#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "core/types.hpp"

namespace dxsync {

// Version token of a binary: the first 8 bytes (little-endian) of its
// SHA-256 digest. Identifies a version; makes no integrity claim.
VersionToken hash_binary(const uint8_t* data, size_t size);
VersionToken hash_binary(const ByteVec& data);

// Full SHA-256 digest as lowercase hex (64 chars).
std::string sha256_hex(const uint8_t* data, size_t size);

// 16 lowercase hex digits.
std::string format_token(VersionToken token);

// Parse exactly 16 hex digits (either case). Returns nullopt otherwise.
std::optional<VersionToken> parse_token(const std::string& text);

// ETag form: the token in double quotes.
std::string format_etag(VersionToken token);

// Parse an If-None-Match / ETag header value. Accepts a weak "W/" prefix,
// optional quotes and comma-separated lists; the first parseable token wins.
std::optional<VersionToken> parse_etag(const std::string& header_value);

} // namespace dxsync
