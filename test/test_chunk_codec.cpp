#include "test_util.hpp"
#include "protocol/byte_io.hpp"
#include "protocol/chunk.hpp"
#include "stream/artifact_sections.hpp"

using namespace dxsync;

static void test_header_layout() {
    uint8_t hdr[CHUNK_HEADER_SIZE];
    encode_chunk_header(ChunkType::kLayout, 0x0102030A, hdr);
    CHECK_EQ(hdr[0], 0x02);
    CHECK_EQ(hdr[1], 0x0A);
    CHECK_EQ(hdr[2], 0x03);
    CHECK_EQ(hdr[3], 0x02);
    CHECK_EQ(hdr[4], 0x01);

    auto decoded = decode_header(hdr, sizeof(hdr));
    CHECK(decoded.has_value());
    CHECK_EQ(decoded->chunk_type, 0x02);
    CHECK_EQ(decoded->length, 0x0102030Au);
}

static void test_decode_needs_five_bytes() {
    uint8_t hdr[CHUNK_HEADER_SIZE] = {0x04, 1, 0, 0, 0};
    for (size_t n = 0; n < CHUNK_HEADER_SIZE; n++) {
        CHECK(!decode_header(hdr, n).has_value());
    }
    CHECK(decode_header(hdr, CHUNK_HEADER_SIZE).has_value());

    // The decoder does not validate the tag
    uint8_t odd[CHUNK_HEADER_SIZE] = {0x42, 0, 0, 0, 0};
    auto h = decode_header(odd, sizeof(odd));
    CHECK(h.has_value());
    CHECK_EQ(h->chunk_type, 0x42);
}

static void test_encode_chunk() {
    auto buf = encode_chunk(ChunkType::kState, {7, 8, 9});
    CHECK_EQ(buf.size(), 8u);
    CHECK_EQ(buf[0], 0x03);
    CHECK_EQ(load_u32(buf.data() + 1), 3u);
    CHECK_EQ(buf[5], 7);
    CHECK_EQ(buf[7], 9);

    auto eof = encode_chunk(ChunkType::kEof, {});
    CHECK_EQ(eof.size(), CHUNK_HEADER_SIZE);
    CHECK_EQ(eof[0], 0xFF);
    CHECK_EQ(load_u32(eof.data() + 1), 0u);
}

static void test_known_types() {
    CHECK(is_known_chunk_type(0x01));
    CHECK(is_known_chunk_type(0x05));
    CHECK(is_known_chunk_type(0xFF));
    CHECK(!is_known_chunk_type(0x00));
    CHECK(!is_known_chunk_type(0x06));
    CHECK(!is_known_chunk_type(0xFE));

    CHECK_STR_EQ(chunk_type_name(ChunkType::kCode), "code");
    CHECK_STR_EQ(chunk_type_name(ChunkType::kPatch), "patch");
    CHECK_STR_EQ(chunk_type_name(uint8_t(0x33)), "unknown");
}

static void test_byte_reader() {
    std::vector<uint8_t> buf;
    put_u8(buf, 0xAB);
    put_u16(buf, 0x1234);
    put_u32(buf, 0xDEADBEEF);
    put_u64(buf, 0x0102030405060708ULL);
    CHECK_EQ(buf.size(), 15u);
    CHECK_EQ(buf[1], 0x34);

    ByteReader r(buf.data(), buf.size());
    uint8_t a;
    uint16_t b;
    uint32_t c;
    uint64_t d;
    CHECK(r.get_u8(a));
    CHECK(r.get_u16(b));
    CHECK(r.get_u32(c));
    CHECK(r.get_u64(d));
    CHECK_EQ(a, 0xABu);
    CHECK_EQ(b, 0x1234u);
    CHECK_EQ(c, 0xDEADBEEFu);
    CHECK_EQ(d, 0x0102030405060708ULL);
    CHECK_EQ(r.remaining(), 0u);
    CHECK(!r.get_u8(a));
    CHECK(!r.skip(1));
}

static void test_packed_sections() {
    ArtifactSections s;
    s.header = make_blob(test_str("hdr"));
    s.layout = make_blob(test_str("<div/>"));
    s.state = nullptr;  // empty
    s.code = make_blob(test_str("main()"));

    auto packed = pack_sections(s);
    CHECK_EQ(packed.size(), 4 * CHUNK_HEADER_SIZE + 3 + 6 + 0 + 6);
    CHECK_EQ(packed[0], 0x01);
    CHECK_EQ(packed[CHUNK_HEADER_SIZE + 3], 0x02);

    ArtifactSections back;
    CHECK(unpack_sections(packed, back));
    CHECK(blob_bytes(back.layout) == test_str("<div/>"));
    CHECK(blob_bytes(back.state).empty());
    CHECK(blob_bytes(back.code) == test_str("main()"));

    // Trailing byte, truncation and wrong order are all rejected
    auto extra = packed;
    extra.push_back(0);
    CHECK(!unpack_sections(extra, back));
    auto cut = packed;
    cut.pop_back();
    CHECK(!unpack_sections(cut, back));
    auto swapped = packed;
    swapped[0] = 0x02;
    CHECK(!unpack_sections(swapped, back));
}

int main() {
    test_header_layout();
    test_decode_needs_five_bytes();
    test_encode_chunk();
    test_known_types();
    test_byte_reader();
    test_packed_sections();
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
