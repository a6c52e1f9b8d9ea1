#include "util/cli_parser.hpp"
#include "util/size_parser.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>

namespace dxsync {

CliParser::CliParser(int argc, char* argv[],
                     std::initializer_list<const char*> flags) {
    if (argc > 0) {
        program_ = argv[0];
    }

    std::unordered_set<std::string> flag_set;
    for (const char* f : flags) flag_set.insert(f);

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.size() >= 2 && arg[0] == '-') {
            if (arg[1] == '-') {
                auto eq = arg.find('=');
                if (eq != std::string::npos) {
                    opts_[arg.substr(0, eq)].push_back(arg.substr(eq + 1));
                    continue;
                }
            }

            if (flag_set.count(arg) == 0 && i + 1 < argc && argv[i + 1][0] != '-') {
                opts_[arg].push_back(argv[i + 1]);
                i++;
            } else {
                opts_[arg].push_back("1");
            }
        } else {
            positional_.push_back(arg);
        }
    }
}

bool CliParser::has(const std::string& key) const {
    return opts_.count(key) > 0;
}

std::string CliParser::get_string(const std::string& key,
                                   const std::string& default_val) const {
    auto it = opts_.find(key);
    if (it != opts_.end() && !it->second.empty()) return it->second.back();
    return default_val;
}

std::vector<std::string> CliParser::get_strings(const std::string& key) const {
    auto it = opts_.find(key);
    if (it != opts_.end()) return it->second;
    return {};
}

int CliParser::get_int(const std::string& key, int default_val) const {
    auto it = opts_.find(key);
    if (it == opts_.end() || it->second.empty()) return default_val;

    const std::string& s = it->second.back();
    char* end = nullptr;
    errno = 0;
    long val = std::strtol(s.c_str(), &end, 10);
    if (end == s.c_str() || *end != '\0' || errno == ERANGE ||
        val < INT_MIN || val > INT_MAX) {
        return default_val;
    }
    return static_cast<int>(val);
}

double CliParser::get_double(const std::string& key, double default_val) const {
    auto it = opts_.find(key);
    if (it == opts_.end() || it->second.empty()) return default_val;

    const std::string& s = it->second.back();
    char* end = nullptr;
    double val = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || *end != '\0') return default_val;
    return val;
}

uint64_t CliParser::get_size(const std::string& key, uint64_t default_val) const {
    auto it = opts_.find(key);
    if (it == opts_.end() || it->second.empty()) return default_val;
    uint64_t val = parse_size_string(it->second.back());
    return val == 0 ? default_val : val;
}

} // namespace dxsync
