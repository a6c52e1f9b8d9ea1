#pragma once

#include <cstdint>
#include <cstdlib>
#include <string>

namespace dxsync {

// Split "host:port". Host may be empty (":8080") to mean all interfaces.
inline bool parse_host_port(const std::string& addr, std::string& host, uint16_t& port) {
    auto colon = addr.rfind(':');
    if (colon == std::string::npos) return false;

    host = addr.substr(0, colon);
    std::string port_str = addr.substr(colon + 1);
    if (port_str.empty()) return false;

    char* end = nullptr;
    long val = std::strtol(port_str.c_str(), &end, 10);
    if (*end != '\0' || val <= 0 || val > 65535) return false;
    port = static_cast<uint16_t>(val);
    if (host.empty()) host = "0.0.0.0";
    return true;
}

// Normalize an HTTP path prefix: leading '/', no trailing '/'. "" or "/" -> "".
inline std::string normalize_path_prefix(const std::string& prefix) {
    std::string p = prefix;
    while (!p.empty() && p.back() == '/') p.pop_back();
    if (!p.empty() && p.front() != '/') p.insert(p.begin(), '/');
    return p;
}

} // namespace dxsync
