#pragma once

#include "util/cli_parser.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <initializer_list>
#include <string>
#include <thread>

// DXSYNC_VERSION is defined in the generated core/version.hpp.
// Callers must include core/version.hpp before using check_version().

namespace dxsync {

// Print "<cmd_name> <version>" to stderr if --version is present.
// Returns true if --version was handled (caller should return 0).
inline bool check_version(const CliParser& cli, const char* cmd_name) {
    if (cli.has("--version")) {
        std::fprintf(stderr, "%s %s\n", cmd_name, DXSYNC_VERSION);
        return true;
    }
    return false;
}

// Logger from -v / --verbose, tagged with the command name.
inline Logger make_logger(const CliParser& cli, const char* cmd_name = "") {
    bool verbose = cli.has("-v") || cli.has("--verbose");
    return Logger(verbose ? Logger::kDebug : Logger::kInfo, cmd_name);
}

// Thread count from CLI (0 or negative means hardware_concurrency).
inline int resolve_threads(const CliParser& cli,
                           const std::string& key = "-threads") {
    int n = cli.get_int(key, 0);
    if (n <= 0) {
        n = static_cast<int>(std::thread::hardware_concurrency());
        if (n <= 0) n = 1;
    }
    return n;
}

// Report every key in `keys` that has no non-empty value.
// Returns true if all are present.
inline bool require_options(const CliParser& cli,
                            std::initializer_list<const char*> keys) {
    bool ok = true;
    for (const char* k : keys) {
        if (cli.get_string(k).empty()) {
            std::fprintf(stderr, "Error: %s is required\n", k);
            ok = false;
        }
    }
    return ok;
}

} // namespace dxsync
