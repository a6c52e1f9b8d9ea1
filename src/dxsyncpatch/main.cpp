#include "core/config.hpp"
#include "core/version.hpp"
#include "core/version_hash.hpp"
#include "delta/block_diff.hpp"
#include "delta/patch_applier.hpp"
#include "io/artifact_loader.hpp"
#include "io/file_io.hpp"
#include "protocol/patch_format.hpp"
#include "stream/stream_generator.hpp"
#include "stream/stream_reader.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/logger.hpp"
#include "util/size_parser.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

using namespace dxsync;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s <command> [options]\n"
        "\n"
        "Commands:\n"
        "  diff -old <file> -new <file> -o <patch> [-block_size <int>]\n"
        "      Write a block-XOR patch turning <old> into <new>\n"
        "  apply -old <file> -patch <file> -o <out> [-block_size <int>]\n"
        "      Apply a patch to <old>\n"
        "  pack -artifacts <dir> -o <stream>\n"
        "      Write the full chunk stream of an artifact directory\n"
        "  inspect -stream <file> [-fragment <int>] [-max_chunk_size <size>]\n"
        "      Parse a chunk stream and list its chunks\n"
        "\n"
        "Common options:\n"
        "  -v, --verbose               Verbose logging\n"
        "  --version                   Print version and exit\n",
        prog);
}

static uint32_t block_size_option(const CliParser& cli, const Logger& logger) {
    int bs = cli.get_int("-block_size", static_cast<int>(PATCH_BLOCK_SIZE));
    if (bs <= 0 || bs > static_cast<int>(MAX_PATCH_BLOCK_SIZE)) {
        logger.warn("Invalid -block_size %d, using %u", bs, PATCH_BLOCK_SIZE);
        return PATCH_BLOCK_SIZE;
    }
    return static_cast<uint32_t>(bs);
}

static int cmd_diff(const CliParser& cli, const Logger& logger) {
    if (!require_options(cli, {"-old", "-new", "-o"})) return 1;

    std::vector<uint8_t> old_bin, new_bin;
    std::string error_msg;
    if (!read_file(cli.get_string("-old"), old_bin, error_msg) ||
        !read_file(cli.get_string("-new"), new_bin, error_msg)) {
        logger.error("%s", error_msg.c_str());
        return 1;
    }

    uint32_t block_size = block_size_option(cli, logger);
    Patch patch = diff_binary(old_bin, new_bin, block_size);
    std::vector<uint8_t> data = serialize(patch);
    if (!write_file(cli.get_string("-o"), data, error_msg)) {
        logger.error("%s", error_msg.c_str());
        return 1;
    }

    PatchInfo info = describe_patch(patch);
    std::printf("from:        %s\n", format_token(info.from_hash).c_str());
    std::printf("to:          %s\n", format_token(info.to_hash).c_str());
    std::printf("block_size:  %u\n", block_size);
    std::printf("blocks:      %zu\n", info.block_count);
    std::printf("patch_size:  %zu (%s)\n", info.patch_size, format_size(info.patch_size).c_str());
    std::printf("target_size: %zu (%s)\n", info.target_size, format_size(info.target_size).c_str());
    std::printf("ratio:       %.2f\n", info.compression_ratio);
    return 0;
}

static int cmd_apply(const CliParser& cli, const Logger& logger) {
    if (!require_options(cli, {"-old", "-patch", "-o"})) return 1;

    std::vector<uint8_t> old_bin, patch_data;
    std::string error_msg;
    if (!read_file(cli.get_string("-old"), old_bin, error_msg) ||
        !read_file(cli.get_string("-patch"), patch_data, error_msg)) {
        logger.error("%s", error_msg.c_str());
        return 1;
    }

    std::vector<uint8_t> out;
    PatchStatus st = apply_patch(old_bin, patch_data.data(), patch_data.size(), out,
                                 block_size_option(cli, logger));
    if (st != PatchStatus::kOk) {
        logger.error("Patch rejected: %s", patch_status_name(st));
        return 1;
    }
    if (!write_file(cli.get_string("-o"), out, error_msg)) {
        logger.error("%s", error_msg.c_str());
        return 1;
    }
    std::printf("%s (%zu bytes)\n", format_token(hash_binary(out)).c_str(), out.size());
    return 0;
}

static int cmd_pack(const CliParser& cli, const Logger& logger) {
    if (!require_options(cli, {"-artifacts", "-o"})) return 1;

    ArtifactSections sections;
    std::string error_msg;
    if (!load_sections(cli.get_string("-artifacts"), sections, error_msg)) {
        logger.error("%s", error_msg.c_str());
        return 1;
    }

    StreamGenerator gen = StreamGenerator::full_stream(sections);
    std::vector<uint8_t> stream = gen.collect();
    if (!write_file(cli.get_string("-o"), stream, error_msg)) {
        logger.error("%s", error_msg.c_str());
        return 1;
    }

    VersionToken token = hash_binary(pack_sections(sections));
    std::printf("%s (%zu bytes, %zu chunks)\n", format_token(token).c_str(),
                stream.size(), gen.chunk_count());
    return 0;
}

static void print_chunk(size_t n, const Chunk& chunk, bool verbose) {
    std::printf("%4zu  %-6s  %10zu\n", n, chunk_type_name(chunk.type), chunk.body.size());
    if (chunk.type != ChunkType::kPatch) return;

    Patch patch;
    PatchStatus st = deserialize(chunk.body, patch);
    if (st != PatchStatus::kOk) {
        std::printf("      patch: %s\n", patch_status_name(st));
        return;
    }
    std::printf("      patch %s -> %s, target %u bytes, %zu blocks, %zu changed bytes\n",
                format_token(patch.header.base_hash).c_str(),
                format_token(patch.header.target_hash).c_str(),
                patch.target_length, patch.blocks.size(), patch.changed_bytes());
    if (verbose) {
        for (const auto& b : patch.blocks) {
            std::printf("        block %u: %zu bytes\n", b.index, b.xor_data.size());
        }
    }
}

static int cmd_inspect(const CliParser& cli, const Logger& logger) {
    if (!require_options(cli, {"-stream"})) return 1;

    std::vector<uint8_t> data;
    std::string error_msg;
    if (!read_file(cli.get_string("-stream"), data, error_msg)) {
        logger.error("%s", error_msg.c_str());
        return 1;
    }

    int fragment = cli.get_int("-fragment", 0);
    size_t step = fragment > 0 ? static_cast<size_t>(fragment) : std::max<size_t>(data.size(), 1);
    StreamReader reader(static_cast<uint32_t>(cli.get_size("-max_chunk_size", MAX_CHUNK_SIZE)));

    std::printf("   #  type    length\n");
    size_t n = 0;
    bool ok = true;
    for (size_t off = 0; off < data.size() && ok; off += step) {
        size_t ready = 0;
        ok = reader.feed(data.data() + off, std::min(step, data.size() - off), ready);
        while (auto chunk = reader.poll_chunk()) {
            print_chunk(n++, *chunk, logger.verbose());
        }
    }
    if (ok) ok = reader.finish_input();

    if (!ok) {
        logger.error("Stream rejected after %zu chunks: %s", n,
                     protocol_error_name(reader.error()));
        return 1;
    }
    std::printf("eof   %zu chunks, %zu bytes\n", n, data.size());
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2 || argv[1][0] == '-') {
        CliParser top(argc, argv, {"-v", "--verbose", "-h", "--help", "--version"});
        if (check_version(top, "dxsyncpatch")) return 0;
        print_usage(argv[0]);
        return (top.has("-h") || top.has("--help")) ? 0 : 1;
    }

    std::string command = argv[1];
    CliParser cli(argc - 1, argv + 1, {"-v", "--verbose", "-h", "--help", "--version"});
    if (check_version(cli, "dxsyncpatch")) return 0;
    if (cli.has("-h") || cli.has("--help")) {
        print_usage(argv[0]);
        return 0;
    }

    Logger logger = make_logger(cli, "dxsyncpatch");

    if (command == "diff") return cmd_diff(cli, logger);
    if (command == "apply") return cmd_apply(cli, logger);
    if (command == "pack") return cmd_pack(cli, logger);
    if (command == "inspect") return cmd_inspect(cli, logger);

    std::fprintf(stderr, "Error: unknown command '%s'\n", command.c_str());
    print_usage(argv[0]);
    return 1;
}
