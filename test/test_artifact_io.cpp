#include "test_util.hpp"
#include "core/version_hash.hpp"
#include "dxsyncclient/artifact_cache.hpp"
#include "io/artifact_loader.hpp"
#include "io/file_io.hpp"

using namespace dxsync;

static void test_file_roundtrip(const std::string& dir) {
    std::string error_msg;
    CHECK(make_dirs(dir + "/a/b", error_msg));
    CHECK(dir_exists(dir + "/a/b"));

    auto data = test_bytes(100000, 1);
    std::string path = join_path(dir, "a/b/blob.bin");
    CHECK(write_file(path, data, error_msg));
    CHECK(file_exists(path));
    CHECK(!file_exists(path + ".tmp." + std::to_string(::getpid())));

    std::vector<uint8_t> back;
    CHECK(read_file(path, back, error_msg));
    CHECK(back == data);
    CHECK(file_mtime_ns(path) > 0);

    CHECK(!read_file(dir + "/missing", back, error_msg));
    CHECK(!error_msg.empty());

    CHECK_STR_EQ(join_path("x/", "y"), "x/y");
    CHECK_STR_EQ(join_path("x", "/abs"), "/abs");
}

static void test_sections_roundtrip(const std::string& dir) {
    std::string error_msg;
    std::string art = dir + "/artifact";

    ArtifactSections s;
    s.header = make_blob(test_str("{}"));
    s.layout = make_blob(test_bytes(500, 2));
    s.state = make_blob({});
    s.code = make_blob(test_bytes(800, 3));
    CHECK(write_sections(art, s, error_msg));
    CHECK(file_exists(art + "/state.bin"));

    ArtifactSections back;
    CHECK(load_sections(art, back, error_msg));
    CHECK(pack_sections(back) == pack_sections(s));
    CHECK(artifact_fingerprint(art) != 0);

    // Missing section files load as empty
    ::unlink((art + "/code.bin").c_str());
    CHECK(load_sections(art, back, error_msg));
    CHECK(blob_bytes(back.code).empty());
    CHECK_EQ(blob_bytes(back.layout).size(), 500u);
}

static void test_loader_errors(const std::string& dir) {
    std::string error_msg;
    ArtifactSections s;
    CHECK(!load_sections(dir + "/nope", s, error_msg));

    std::string empty = dir + "/empty";
    CHECK(make_dirs(empty, error_msg));
    error_msg.clear();
    CHECK(!load_sections(empty, s, error_msg));
    CHECK(!error_msg.empty());
    CHECK_EQ(artifact_fingerprint(empty), 0u);
}

static void test_manifest(const std::string& dir) {
    std::string error_msg;
    std::string art = dir + "/manifest";
    CHECK(make_dirs(art, error_msg));
    CHECK(write_file_string(art + "/manifest.json",
                            "{\"code\": \"app.wasm\", \"layout\": \"tpl.html\"}", error_msg));
    CHECK(write_file_string(art + "/app.wasm", "WASM", error_msg));
    CHECK(write_file_string(art + "/tpl.html", "<p/>", error_msg));
    CHECK(write_file_string(art + "/header.bin", "H", error_msg));

    ArtifactLayout layout;
    CHECK(load_manifest(art, layout, error_msg));
    CHECK_STR_EQ(layout.code, "app.wasm");
    CHECK_STR_EQ(layout.state, "state.bin");

    ArtifactSections s;
    CHECK(load_sections(art, s, error_msg));
    CHECK(blob_bytes(s.code) == test_str("WASM"));
    CHECK(blob_bytes(s.layout) == test_str("<p/>"));
    CHECK(blob_bytes(s.header) == test_str("H"));
    CHECK(blob_bytes(s.state).empty());

    CHECK(write_file_string(art + "/manifest.json", "[1, 2]", error_msg));
    error_msg.clear();
    CHECK(!load_sections(art, s, error_msg));
    CHECK(!error_msg.empty());

    CHECK(write_file_string(art + "/manifest.json", "{\"code\": 5}", error_msg));
    CHECK(!load_manifest(art, layout, error_msg));

    CHECK(write_file_string(art + "/manifest.json", "{not json", error_msg));
    CHECK(!load_manifest(art, layout, error_msg));
}

static void test_cache(const std::string& dir) {
    std::string error_msg;
    std::string cdir = dir + "/cache";

    ArtifactCache empty(cdir);
    CHECK(empty.load(error_msg));
    CHECK(!empty.has_artifact());

    auto packed = test_bytes(4000, 7);
    VersionToken tok = hash_binary(packed);
    CHECK(empty.save(tok, packed, error_msg));
    CHECK(empty.has_artifact());

    ArtifactCache loaded(cdir);
    CHECK(loaded.load(error_msg));
    CHECK(loaded.has_artifact());
    CHECK_EQ(loaded.token(), tok);
    CHECK(loaded.artifact() == packed);

    // Corrupted artifact bytes are detected
    auto bad = packed;
    bad[10] ^= 1;
    CHECK(write_file(cdir + "/artifact.bin", bad, error_msg));
    ArtifactCache corrupt(cdir);
    error_msg.clear();
    CHECK(!corrupt.load(error_msg));
    CHECK(!corrupt.has_artifact());
    CHECK(!error_msg.empty());

    corrupt.clear();
    ArtifactCache cleared(cdir);
    CHECK(cleared.load(error_msg));
    CHECK(!cleared.has_artifact());

    CHECK(write_file_string(cdir + "/cache.json", "{\"token\": \"zz\"}", error_msg));
    ArtifactCache badmeta(cdir);
    CHECK(!badmeta.load(error_msg));
}

int main() {
    std::string dir = test_tmp_dir("io");
    remove_recursive(dir);
    std::string error_msg;
    if (!make_dirs(dir, error_msg)) {
        std::fprintf(stderr, "cannot create %s: %s\n", dir.c_str(), error_msg.c_str());
        return 1;
    }

    test_file_roundtrip(dir);
    test_sections_roundtrip(dir);
    test_loader_errors(dir);
    test_manifest(dir);
    test_cache(dir);

    remove_recursive(dir);
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
