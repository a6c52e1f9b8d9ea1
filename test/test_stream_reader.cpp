#include "test_util.hpp"
#include "protocol/chunk.hpp"
#include "stream/stream_reader.hpp"

#include <algorithm>

using namespace dxsync;

static std::vector<uint8_t> sample_stream() {
    std::vector<uint8_t> s;
    auto hdr = test_str("{\"v\":1}");
    auto layout = test_bytes(3000, 1);
    auto state = test_bytes(17, 2);
    auto code = test_bytes(70000, 3);
    append_chunk(s, ChunkType::kHeader, hdr.data(), hdr.size());
    append_chunk(s, ChunkType::kLayout, layout.data(), layout.size());
    append_chunk(s, ChunkType::kState, state.data(), state.size());
    append_chunk(s, ChunkType::kCode, code.data(), code.size());
    append_chunk(s, ChunkType::kEof, nullptr, 0);
    return s;
}

static std::vector<Chunk> drain(StreamReader& r) {
    std::vector<Chunk> out;
    while (auto c = r.poll_chunk()) out.push_back(std::move(*c));
    return out;
}

static void test_header_then_body() {
    StreamReader r;
    size_t ready = 99;
    uint8_t hdr[] = {0x02, 0x0A, 0x00, 0x00, 0x00};
    CHECK(r.feed(hdr, sizeof(hdr), ready));
    CHECK_EQ(ready, 0u);
    CHECK(r.state() == StreamReader::State::kReadingBody);
    CHECK(!r.poll_chunk().has_value());

    std::vector<uint8_t> body(10, 0x33);
    CHECK(r.feed(body, ready));
    CHECK_EQ(ready, 1u);
    auto c = r.poll_chunk();
    CHECK(c.has_value());
    CHECK(c->type == ChunkType::kLayout);
    CHECK(c->body == body);
    CHECK(!r.is_finished());
}

static void test_two_chunks_one_buffer() {
    std::vector<uint8_t> buf;
    uint8_t layout[] = {1, 2, 3, 4, 5};
    uint8_t state[] = {6, 7, 8};
    append_chunk(buf, ChunkType::kLayout, layout, sizeof(layout));
    append_chunk(buf, ChunkType::kState, state, sizeof(state));

    StreamReader r;
    size_t ready = 0;
    CHECK(r.feed(buf, ready));
    CHECK_EQ(ready, 2u);
    CHECK_EQ(r.pending(), 2u);

    auto first = r.poll_chunk();
    auto second = r.poll_chunk();
    CHECK(first && first->type == ChunkType::kLayout);
    CHECK(second && second->type == ChunkType::kState);
    CHECK_EQ(second->body.size(), 3u);
    CHECK(!r.poll_chunk().has_value());
}

static void test_eof_only() {
    StreamReader r;
    size_t ready = 0;
    uint8_t eof[] = {0xFF, 0, 0, 0, 0};
    CHECK(r.feed(eof, sizeof(eof), ready));
    CHECK_EQ(ready, 0u);
    CHECK(r.is_finished());
    CHECK(r.state() == StreamReader::State::kFinished);
    CHECK(!r.poll_chunk().has_value());
    CHECK(r.finish_input());
}

static void test_fragmentation_invariance() {
    auto stream = sample_stream();

    StreamReader whole;
    size_t ready = 0;
    CHECK(whole.feed(stream, ready));
    CHECK_EQ(ready, 4u);
    auto expected = drain(whole);
    CHECK_EQ(expected.size(), 4u);
    CHECK(whole.is_finished());

    for (size_t step : {size_t(1), size_t(2), size_t(3), size_t(5), size_t(7),
                        size_t(4096), size_t(65537)}) {
        StreamReader r;
        size_t total_ready = 0;
        bool ok = true;
        for (size_t off = 0; off < stream.size(); off += step) {
            size_t n = std::min(step, stream.size() - off);
            ok = ok && r.feed(stream.data() + off, n, ready);
            total_ready += ready;
        }
        CHECK(ok);
        CHECK_EQ(total_ready, 4u);
        CHECK(r.is_finished());
        auto got = drain(r);
        CHECK_EQ(got.size(), expected.size());
        for (size_t i = 0; i < got.size() && i < expected.size(); i++) {
            CHECK(got[i].type == expected[i].type);
            CHECK(got[i].body == expected[i].body);
        }
        CHECK_EQ(r.bytes_fed(), stream.size());
        CHECK_EQ(r.buffered(), 0u);
    }
}

// Feed stream split at the given cut offsets and compare with expected.
static void check_split(const std::vector<uint8_t>& stream, std::vector<size_t> cuts,
                        const std::vector<Chunk>& expected) {
    std::sort(cuts.begin(), cuts.end());
    cuts.push_back(stream.size());

    StreamReader r;
    std::vector<Chunk> got;
    size_t ready = 0;
    size_t prev = 0;
    bool ok = true;
    for (size_t cut : cuts) {
        ok = ok && r.feed(stream.data() + prev, cut - prev, ready);
        auto part = drain(r);
        for (auto& c : part) got.push_back(std::move(c));
        prev = cut;
    }
    CHECK(ok);
    CHECK(r.is_finished());
    CHECK(r.finish_input());
    CHECK_EQ(got.size(), expected.size());
    for (size_t i = 0; i < got.size() && i < expected.size(); i++) {
        CHECK(got[i].type == expected[i].type);
        CHECK(got[i].body == expected[i].body);
    }
}

static void test_random_splits() {
    auto stream = sample_stream();
    StreamReader whole;
    size_t ready = 0;
    CHECK(whole.feed(stream, ready));
    auto expected = drain(whole);

    // Right after the Eof tag byte, and inside its length field
    size_t eof_at = stream.size() - CHUNK_HEADER_SIZE;
    check_split(stream, {eof_at + 1}, expected);
    check_split(stream, {eof_at, eof_at + 1, eof_at + 3}, expected);

    uint32_t x = 0x2545f491u;
    for (int round = 0; round < 200; round++) {
        std::vector<size_t> cuts;
        int n = 1 + round % 40;
        for (int i = 0; i < n; i++) {
            x ^= x << 13;
            x ^= x >> 17;
            x ^= x << 5;
            cuts.push_back(x % (stream.size() + 1));
        }
        check_split(stream, cuts, expected);
    }
}

static void test_no_eof_never_finishes() {
    auto stream = sample_stream();
    stream.resize(stream.size() - CHUNK_HEADER_SIZE);

    StreamReader r;
    size_t ready = 0;
    CHECK(r.feed(stream, ready));
    CHECK_EQ(ready, 4u);
    CHECK(!r.is_finished());
    CHECK(!r.finish_input());
    CHECK(r.error() == ProtocolError::kTruncatedStream);
    // Chunks completed earlier are still available
    CHECK_EQ(drain(r).size(), 4u);
}

static void test_truncated_body() {
    std::vector<uint8_t> buf;
    auto body = test_bytes(100, 9);
    append_chunk(buf, ChunkType::kCode, body.data(), body.size());
    buf.resize(50);

    StreamReader r;
    size_t ready = 0;
    CHECK(r.feed(buf, ready));
    CHECK_EQ(ready, 0u);
    CHECK(r.state() == StreamReader::State::kReadingBody);
    CHECK(!r.finish_input());
    CHECK(r.failed());
}

static void test_unknown_type() {
    StreamReader r;
    size_t ready = 0;
    std::vector<uint8_t> buf;
    uint8_t ok_body[] = {1};
    append_chunk(buf, ChunkType::kHeader, ok_body, 1);
    uint8_t bad[] = {0x09, 0, 0, 0, 0};
    buf.insert(buf.end(), bad, bad + sizeof(bad));

    CHECK(!r.feed(buf, ready));
    CHECK_EQ(ready, 1u);
    CHECK(r.failed());
    CHECK(r.error() == ProtocolError::kUnknownChunkType);
    CHECK_EQ(r.pending(), 1u);

    // Further input is refused
    CHECK(!r.feed(ok_body, 1, ready));
    CHECK_EQ(ready, 0u);
    CHECK_STR_EQ(protocol_error_name(r.error()), "unknown_chunk_type");
}

static void test_non_empty_eof() {
    StreamReader r;
    size_t ready = 0;
    uint8_t eof[] = {0xFF, 1, 0, 0, 0, 0};
    CHECK(!r.feed(eof, sizeof(eof), ready));
    CHECK(r.error() == ProtocolError::kNonEmptyEof);
    CHECK(!r.is_finished());
}

static void test_chunk_too_large() {
    StreamReader r(1024);
    size_t ready = 0;
    uint8_t hdr[5];
    encode_chunk_header(ChunkType::kCode, 1025, hdr);
    CHECK(!r.feed(hdr, sizeof(hdr), ready));
    CHECK(r.error() == ProtocolError::kChunkTooLarge);

    StreamReader r2(1024);
    encode_chunk_header(ChunkType::kCode, 1024, hdr);
    CHECK(r2.feed(hdr, sizeof(hdr), ready));

    // Default limit is 64 MiB
    StreamReader r3;
    encode_chunk_header(ChunkType::kCode, MAX_CHUNK_SIZE + 1, hdr);
    CHECK(!r3.feed(hdr, sizeof(hdr), ready));
    CHECK(r3.error() == ProtocolError::kChunkTooLarge);
}

static void test_trailing_data() {
    std::vector<uint8_t> buf;
    append_chunk(buf, ChunkType::kEof, nullptr, 0);
    buf.push_back(0x01);

    StreamReader r;
    size_t ready = 0;
    CHECK(!r.feed(buf, ready));
    CHECK(r.error() == ProtocolError::kTrailingData);
    CHECK(r.is_finished());

    // Same, with the extra bytes in a later feed
    StreamReader r2;
    CHECK(r2.feed(buf.data(), CHUNK_HEADER_SIZE, ready));
    CHECK(r2.is_finished());
    CHECK(r2.feed(nullptr, 0, ready));
    CHECK(!r2.feed(buf.data() + CHUNK_HEADER_SIZE, 1, ready));
    CHECK(r2.error() == ProtocolError::kTrailingData);
}

static void test_empty_sections() {
    std::vector<uint8_t> buf;
    append_chunk(buf, ChunkType::kHeader, nullptr, 0);
    append_chunk(buf, ChunkType::kState, nullptr, 0);
    append_chunk(buf, ChunkType::kEof, nullptr, 0);

    StreamReader r;
    size_t ready = 0;
    CHECK(r.feed(buf, ready));
    CHECK_EQ(ready, 2u);
    CHECK_EQ(r.chunks_completed(), 2u);
    auto got = drain(r);
    CHECK(got[0].body.empty());
    CHECK(got[1].type == ChunkType::kState);
}

int main() {
    test_header_then_body();
    test_two_chunks_one_buffer();
    test_eof_only();
    test_fragmentation_invariance();
    test_random_splits();
    test_no_eof_never_finishes();
    test_truncated_body();
    test_unknown_type();
    test_non_empty_eof();
    test_chunk_too_large();
    test_trailing_data();
    test_empty_sections();
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
