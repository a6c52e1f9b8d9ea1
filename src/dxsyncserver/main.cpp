#include "dxsyncserver/artifact_service.hpp"
#include "dxsyncserver/artifact_watcher.hpp"
#include "dxsyncserver/http_controller.hpp"
#include "core/config.hpp"
#include "core/version.hpp"
#include "core/version_hash.hpp"
#include "io/artifact_loader.hpp"
#include "store/version_store.hpp"
#include "util/address_parser.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/logger.hpp"

#include <drogon/HttpAppFramework.h>
#include <trantor/utils/Logger.h>
#include <tbb/global_control.h>

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>

#include <unistd.h>

using namespace dxsync;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s -artifacts <dir> [options]\n"
        "\n"
        "Required:\n"
        "  -artifacts <dir>            Artifact directory (header.bin, layout.bin,\n"
        "                              state.bin, code.bin, optional manifest.json)\n"
        "\n"
        "Options:\n"
        "  -listen <host>:<port>       HTTP listen address (default: 0.0.0.0:8080)\n"
        "  -path_prefix <prefix>       API path prefix (e.g., /app)\n"
        "  -threads <int>              I/O and diff threads (default: all cores)\n"
        "  -capacity <int>             Retained versions (default: %zu)\n"
        "  -block_size <int>           Patch block size (default: %u)\n"
        "  -max_chunk_size <size>      Largest section served (default: 64M)\n"
        "  -poll_interval <int>        Artifact poll interval in seconds, 0 = off\n"
        "                              (default: 2)\n"
        "  -pid <path>                 PID file path\n"
        "  -v, --verbose               Verbose logging\n"
        "  --version                   Print version and exit\n",
        prog, DEFAULT_STORE_CAPACITY, PATCH_BLOCK_SIZE);
}

int main(int argc, char* argv[]) {
    CliParser cli(argc, argv, {"-v", "--verbose", "-h", "--help", "--version"});

    if (check_version(cli, "dxsyncserver")) return 0;

    if (cli.has("-h") || cli.has("--help")) {
        print_usage(argv[0]);
        return 0;
    }

    Logger logger = make_logger(cli, "dxsyncserver");
    bool verbose = logger.verbose();

    if (!require_options(cli, {"-artifacts"})) {
        print_usage(argv[0]);
        return 1;
    }
    std::string artifacts = cli.get_string("-artifacts");

    int capacity = cli.get_int("-capacity", static_cast<int>(DEFAULT_STORE_CAPACITY));
    if (capacity <= 0) {
        std::fprintf(stderr, "Error: -capacity must be positive\n");
        return 1;
    }
    int block_size = cli.get_int("-block_size", static_cast<int>(PATCH_BLOCK_SIZE));
    if (block_size <= 0 || block_size > static_cast<int>(MAX_PATCH_BLOCK_SIZE)) {
        std::fprintf(stderr, "Error: -block_size must be in [1, %u]\n",
                     MAX_PATCH_BLOCK_SIZE);
        return 1;
    }
    if (block_size != static_cast<int>(PATCH_BLOCK_SIZE)) {
        logger.warn("Non-default block size %d: clients must use the same value",
                    block_size);
    }
    uint64_t max_chunk_size = cli.get_size("-max_chunk_size", MAX_CHUNK_SIZE);
    int poll_interval = cli.get_int("-poll_interval", 2);

    std::string listen_addr = cli.get_string("-listen", "0.0.0.0:8080");
    std::string host;
    uint16_t port;
    if (!parse_host_port(listen_addr, host, port)) {
        std::fprintf(stderr,
            "Error: invalid listen address '%s' (expected host:port)\n",
            listen_addr.c_str());
        return 1;
    }

    int threads = resolve_threads(cli);
    tbb::global_control tbb_limit(tbb::global_control::max_allowed_parallelism,
                                  static_cast<size_t>(threads));

    auto store = std::make_shared<VersionStore>(static_cast<size_t>(capacity),
                                                static_cast<uint32_t>(block_size));
    auto service = std::make_shared<ArtifactService>(store);
    service->set_max_chunk_size(max_chunk_size);

    ArtifactWatcher watcher(artifacts, *service, logger);
    watcher.set_max_section_size(max_chunk_size);
    if (!watcher.poll_once()) {
        std::string error_msg;
        ArtifactSections on_disk;
        if (!load_sections(artifacts, on_disk, error_msg)) {
            logger.warn("No artifact yet (%s); serving 503 until one appears",
                        error_msg.c_str());
        }
    }
    if (poll_interval > 0) {
        watcher.start(poll_interval);
    } else if (!service->has_artifact()) {
        std::fprintf(stderr,
            "Error: no artifact in %s and polling is disabled\n", artifacts.c_str());
        return 1;
    }

    HttpController controller(service, logger);
    std::string path_prefix = normalize_path_prefix(cli.get_string("-path_prefix"));
    controller.register_routes(path_prefix);

    drogon::app()
        .addListener(host, port)
        .setThreadNum(static_cast<size_t>(threads))
        .setLogLevel(verbose ? trantor::Logger::kDebug
                             : trantor::Logger::kWarn);

    std::string pid_file = cli.get_string("-pid");
    if (!pid_file.empty()) {
        FILE* f = std::fopen(pid_file.c_str(), "w");
        if (f) {
            std::fprintf(f, "%d\n", ::getpid());
            std::fclose(f);
        } else {
            logger.warn("Cannot write PID file %s", pid_file.c_str());
        }
    }

    logger.info("Starting HTTP server on %s:%u (threads: %d)",
                host.c_str(), port, threads);
    logger.info("Artifacts: %s, capacity: %d, block size: %d, poll: %d s",
                artifacts.c_str(), capacity, block_size, poll_interval);
    if (!path_prefix.empty()) {
        logger.info("API path prefix: %s", path_prefix.c_str());
    }
    auto token = service->current_token();
    if (token) {
        logger.info("Current version: %s", format_token(*token).c_str());
    }

    // Blocks until SIGTERM/SIGINT
    drogon::app().run();

    watcher.stop();

    if (!pid_file.empty()) {
        std::remove(pid_file.c_str());
    }

    return 0;
}
