#include "test_util.hpp"
#include "util/address_parser.hpp"
#include "util/cli_parser.hpp"
#include "util/size_parser.hpp"

using namespace dxsync;

// CliParser takes a mutable argv; keep the strings alive in the caller.
static CliParser parse(std::vector<std::string>& args,
                       std::initializer_list<const char*> flags = {}) {
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    return CliParser(static_cast<int>(argv.size()), argv.data(), flags);
}

static void test_key_values() {
    std::vector<std::string> args = {
        "dxsyncserver", "-artifacts", "/srv/app", "-threads", "8",
        "-capacity", "x", "--listen=127.0.0.1:9000", "-poll_interval", "2.5"};
    CliParser cli = parse(args);

    CHECK_STR_EQ(cli.program(), "dxsyncserver");
    CHECK(cli.has("-artifacts"));
    CHECK_STR_EQ(cli.get_string("-artifacts"), "/srv/app");
    CHECK_EQ(cli.get_int("-threads", 1), 8);
    CHECK_EQ(cli.get_int("-capacity", 5), 5);
    CHECK_EQ(cli.get_int("-missing", 3), 3);
    CHECK_STR_EQ(cli.get_string("--listen"), "127.0.0.1:9000");
    CHECK(cli.get_double("-poll_interval") == 2.5);
    CHECK_STR_EQ(cli.get_string("-nothing", "dflt"), "dflt");
}

static void test_flags_and_positional() {
    std::vector<std::string> args = {
        "dxsyncpatch", "-v", "diff", "base.bin", "-o", "out.patch", "target.bin"};
    CliParser cli = parse(args, {"-v"});

    CHECK(cli.has("-v"));
    CHECK_STR_EQ(cli.get_string("-o"), "out.patch");
    CHECK_EQ(cli.positional().size(), 3u);
    CHECK_STR_EQ(cli.positional()[0], "diff");
    CHECK_STR_EQ(cli.positional()[2], "target.bin");

    // Without the flag list, -v swallows the next word
    std::vector<std::string> args2 = {"dxsyncpatch", "-v", "diff"};
    CliParser greedy = parse(args2);
    CHECK_STR_EQ(greedy.get_string("-v"), "diff");
    CHECK(greedy.positional().empty());

    // Option followed by another option has no value
    std::vector<std::string> args3 = {"prog", "-a", "-b", "1"};
    CliParser bare = parse(args3);
    CHECK_STR_EQ(bare.get_string("-a"), "1");
    CHECK_EQ(bare.get_int("-b"), 1);
}

static void test_repeated() {
    std::vector<std::string> args = {"prog", "-H", "a", "-H", "b", "-H", "c"};
    CliParser cli = parse(args);
    auto all = cli.get_strings("-H");
    CHECK_EQ(all.size(), 3u);
    CHECK_STR_EQ(all[1], "b");
    CHECK_STR_EQ(cli.get_string("-H"), "c");
    CHECK(cli.get_strings("-X").empty());
}

static void test_sizes() {
    CHECK_EQ(parse_size_string("1024"), 1024u);
    CHECK_EQ(parse_size_string("4K"), 4096u);
    CHECK_EQ(parse_size_string("64M"), 64ull << 20);
    CHECK_EQ(parse_size_string("2GB"), 2ull << 30);
    CHECK_EQ(parse_size_string("1.5k"), 1536u);
    CHECK_EQ(parse_size_string(""), 0u);
    CHECK_EQ(parse_size_string("12X"), 0u);
    CHECK_EQ(parse_size_string("4KiB"), 0u);
    CHECK_EQ(parse_size_string("abc"), 0u);

    std::vector<std::string> args = {"prog", "-max_chunk_size", "16M", "-bad", "zz"};
    CliParser cli = parse(args);
    CHECK_EQ(cli.get_size("-max_chunk_size"), 16ull << 20);
    CHECK_EQ(cli.get_size("-bad", 7), 7u);

    CHECK_STR_EQ(format_size(512), "512 B");
    CHECK_STR_EQ(format_size(1536), "1.5 KiB");
    CHECK_STR_EQ(format_size(64ull << 20), "64.0 MiB");
}

static void test_addresses() {
    std::string host;
    uint16_t port = 0;
    CHECK(parse_host_port("127.0.0.1:8080", host, port));
    CHECK_STR_EQ(host, "127.0.0.1");
    CHECK_EQ(port, 8080);

    CHECK(parse_host_port(":9000", host, port));
    CHECK_STR_EQ(host, "0.0.0.0");
    CHECK_EQ(port, 9000);

    CHECK(!parse_host_port("localhost", host, port));
    CHECK(!parse_host_port("localhost:", host, port));
    CHECK(!parse_host_port("localhost:70000", host, port));
    CHECK(!parse_host_port("localhost:80x", host, port));

    CHECK_STR_EQ(normalize_path_prefix(""), "");
    CHECK_STR_EQ(normalize_path_prefix("/"), "");
    CHECK_STR_EQ(normalize_path_prefix("app/"), "/app");
    CHECK_STR_EQ(normalize_path_prefix("/app"), "/app");
}

int main() {
    test_key_values();
    test_flags_and_positional();
    test_repeated();
    test_sizes();
    test_addresses();

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
