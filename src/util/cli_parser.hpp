#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace dxsync {

// Command-line parser for -key value style arguments.
// Keys listed in `flags` never consume the following argument.
// --key=value is accepted for double-dash options.
class CliParser {
public:
    CliParser(int argc, char* argv[],
              std::initializer_list<const char*> flags = {});

    bool has(const std::string& key) const;

    // Last value given for key, or default_val.
    std::string get_string(const std::string& key,
                           const std::string& default_val = {}) const;

    // Every value given for a repeated key, in order.
    std::vector<std::string> get_strings(const std::string& key) const;

    // Returns default_val if missing or not an integer.
    int get_int(const std::string& key, int default_val = 0) const;

    // Returns default_val if missing or not a number.
    double get_double(const std::string& key, double default_val = 0.0) const;

    // Byte count with optional K/M/G suffix. Returns default_val if missing
    // or unparsable.
    uint64_t get_size(const std::string& key, uint64_t default_val = 0) const;

    const std::string& program() const { return program_; }
    const std::vector<std::string>& positional() const { return positional_; }

private:
    std::string program_;
    std::unordered_map<std::string, std::vector<std::string>> opts_;
    std::vector<std::string> positional_;
};

} // namespace dxsync
