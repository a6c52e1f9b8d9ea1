#include "test_util.hpp"
#include "core/version_hash.hpp"

using namespace dxsync;

static void test_known_digest() {
    // SHA-256("") = e3b0c442 98fc1c14 ...
    CHECK_STR_EQ(sha256_hex(nullptr, 0),
                 "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    CHECK_EQ(hash_binary(ByteVec{}), 0x141cfc9842c4b0e3ULL);
    CHECK_STR_EQ(format_token(hash_binary(ByteVec{})), "141cfc9842c4b0e3");

    // SHA-256("abc") = ba7816bf 8f01cfea ...
    auto abc = test_str("abc");
    CHECK_EQ(hash_binary(abc), 0xeacf018fbf1678baULL);
}

static void test_hash_properties() {
    auto a = test_bytes(10000, 1);
    auto b = a;
    CHECK_EQ(hash_binary(a), hash_binary(b));
    b[5000] ^= 1;
    CHECK(hash_binary(a) != hash_binary(b));
    CHECK_EQ(hash_binary(a.data(), a.size()), hash_binary(a));
}

static void test_token_text() {
    CHECK_STR_EQ(format_token(0), "0000000000000000");
    CHECK_STR_EQ(format_token(0x0123456789abcdefULL), "0123456789abcdef");

    auto t = parse_token("0123456789ABCDEF");
    CHECK(t.has_value());
    CHECK_EQ(*t, 0x0123456789abcdefULL);

    CHECK(!parse_token("").has_value());
    CHECK(!parse_token("0123456789abcde").has_value());
    CHECK(!parse_token("0123456789abcdef0").has_value());
    CHECK(!parse_token("0123456789abcdeg").has_value());
}

static void test_etag_forms() {
    const VersionToken tok = 0xfedcba9876543210ULL;
    CHECK_STR_EQ(format_etag(tok), "\"fedcba9876543210\"");

    auto plain = parse_etag("\"fedcba9876543210\"");
    CHECK(plain.has_value());
    CHECK_EQ(*plain, tok);

    auto weak = parse_etag("W/\"fedcba9876543210\"");
    CHECK(weak.has_value());
    CHECK_EQ(*weak, tok);

    auto unquoted = parse_etag("fedcba9876543210");
    CHECK(unquoted.has_value());
    CHECK_EQ(*unquoted, tok);

    // First parseable entry of a list wins
    auto list = parse_etag("\"junk\", W/\"fedcba9876543210\" , \"0000000000000001\"");
    CHECK(list.has_value());
    CHECK_EQ(*list, tok);

    CHECK(!parse_etag("").has_value());
    CHECK(!parse_etag("*").has_value());
    CHECK(!parse_etag("\"xyz\"").has_value());
}

int main() {
    test_known_digest();
    test_hash_properties();
    test_token_text();
    test_etag_forms();
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
