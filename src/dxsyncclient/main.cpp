#include "dxsyncclient/artifact_cache.hpp"
#include "dxsyncclient/update_client.hpp"
#include "core/version.hpp"
#include "core/version_hash.hpp"
#include "io/artifact_loader.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/logger.hpp"
#include "util/size_parser.hpp"

#include <curl/curl.h>

#include <cstdio>
#include <string>

using namespace dxsync;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s -url <base_url> -cache <dir> [options]\n"
        "\n"
        "Required:\n"
        "  -url <base_url>             dxsyncserver base URL (e.g., http://host:8080/app)\n"
        "  -cache <dir>                Cache directory (artifact.bin, cache.json)\n"
        "\n"
        "Options:\n"
        "  -o <dir>                    Write header.bin, layout.bin, state.bin and\n"
        "                              code.bin of the current version to <dir>\n"
        "  -fragment <int>             Feed the stream parser in pieces of this size\n"
        "  -timeout <int>              Transfer timeout in seconds (default: 300)\n"
        "  -max_chunk_size <size>      Largest chunk accepted (default: 64M)\n"
        "  -v, --verbose               Verbose logging\n"
        "  --version                   Print version and exit\n",
        prog);
}

int main(int argc, char* argv[]) {
    CliParser cli(argc, argv, {"-v", "--verbose", "-h", "--help", "--version"});

    if (check_version(cli, "dxsyncclient")) return 0;

    if (cli.has("-h") || cli.has("--help")) {
        print_usage(argv[0]);
        return 0;
    }

    Logger logger = make_logger(cli, "dxsyncclient");

    if (!require_options(cli, {"-url", "-cache"})) {
        print_usage(argv[0]);
        return 1;
    }
    std::string url = cli.get_string("-url");
    std::string cache_dir = cli.get_string("-cache");

    int fragment = cli.get_int("-fragment", 0);
    if (fragment < 0) {
        std::fprintf(stderr, "Error: -fragment must not be negative\n");
        return 1;
    }

    UpdateOptions options;
    options.base_url = url;
    options.fragment = static_cast<size_t>(fragment);
    options.timeout_seconds = cli.get_int("-timeout", 300);
    options.max_chunk_size = static_cast<uint32_t>(
        cli.get_size("-max_chunk_size", MAX_CHUNK_SIZE));

    ArtifactCache cache(cache_dir);
    std::string error_msg;
    if (!cache.load(error_msg)) {
        logger.warn("Ignoring cache in %s: %s", cache_dir.c_str(), error_msg.c_str());
        error_msg.clear();
    }
    if (cache.has_artifact()) {
        logger.debug("Cached version: %s", format_token(cache.token()).c_str());
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);

    UpdateClient client(options, logger);
    UpdateResult result;
    bool ok = client.update(cache, result, error_msg);

    curl_global_cleanup();

    if (!ok) {
        logger.error("Update failed: %s", error_msg.c_str());
        return 1;
    }

    if (result.kind != UpdateKind::kUnchanged) {
        if (!cache.save(result.token, result.packed, error_msg)) {
            logger.error("Cannot save cache: %s", error_msg.c_str());
            return 1;
        }
    }

    std::string out_dir = cli.get_string("-o");
    if (!out_dir.empty()) {
        if (!write_sections(out_dir, result.sections, error_msg)) {
            logger.error("%s", error_msg.c_str());
            return 1;
        }
        logger.debug("Wrote sections to %s", out_dir.c_str());
    }

    logger.info("%s: version %s (%s received%s)",
                update_kind_name(result.kind), format_token(result.token).c_str(),
                format_size(result.bytes_received).c_str(),
                result.retried_full ? ", after full retry" : "");
    return 0;
}
