#include "io/file_io.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace dxsync {

bool file_exists(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

bool dir_exists(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool make_dirs(const std::string& path, std::string& error_msg) {
    if (path.empty() || dir_exists(path)) return true;

    auto slash = path.find_last_of('/');
    if (slash != std::string::npos && slash > 0) {
        if (!make_dirs(path.substr(0, slash), error_msg)) return false;
    }
    if (::mkdir(path.c_str(), 0755) != 0 && errno != EEXIST) {
        error_msg = "Cannot create directory " + path + ": " + std::strerror(errno);
        return false;
    }
    return true;
}

static bool read_fd_all(const std::string& path, std::string& out,
                        std::string& error_msg) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        error_msg = "Cannot open " + path + ": " + std::strerror(errno);
        return false;
    }

    struct stat st;
    if (::fstat(fd, &st) == 0 && st.st_size > 0) {
        out.reserve(static_cast<size_t>(st.st_size));
    }

    char buf[65536];
    for (;;) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            error_msg = "Read error on " + path + ": " + std::strerror(errno);
            ::close(fd);
            return false;
        }
        if (n == 0) break;
        out.append(buf, static_cast<size_t>(n));
    }
    ::close(fd);
    return true;
}

bool read_file(const std::string& path, std::vector<uint8_t>& data,
               std::string& error_msg) {
    std::string raw;
    if (!read_fd_all(path, raw, error_msg)) return false;
    data.assign(raw.begin(), raw.end());
    return true;
}

bool read_file_string(const std::string& path, std::string& text,
                      std::string& error_msg) {
    text.clear();
    return read_fd_all(path, text, error_msg);
}

bool write_file(const std::string& path, const uint8_t* data, size_t size,
                std::string& error_msg) {
    std::string tmp = path + ".tmp." + std::to_string(::getpid());

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        error_msg = "Cannot create " + tmp + ": " + std::strerror(errno);
        return false;
    }

    size_t off = 0;
    while (off < size) {
        ssize_t n = ::write(fd, data + off, size - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            error_msg = "Write error on " + tmp + ": " + std::strerror(errno);
            ::close(fd);
            ::unlink(tmp.c_str());
            return false;
        }
        off += static_cast<size_t>(n);
    }

    if (::close(fd) != 0) {
        error_msg = "Close error on " + tmp + ": " + std::strerror(errno);
        ::unlink(tmp.c_str());
        return false;
    }
    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        error_msg = "Cannot rename " + tmp + " to " + path + ": " + std::strerror(errno);
        ::unlink(tmp.c_str());
        return false;
    }
    return true;
}

bool write_file_string(const std::string& path, const std::string& text,
                       std::string& error_msg) {
    return write_file(path, reinterpret_cast<const uint8_t*>(text.data()),
                      text.size(), error_msg);
}

int64_t file_mtime_ns(const std::string& path) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) return 0;
    return static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000LL + st.st_mtim.tv_nsec;
}

std::string join_path(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (!name.empty() && name.front() == '/') return name;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

void remove_recursive(const std::string& path) {
    struct stat st;
    if (::lstat(path.c_str(), &st) != 0) return;

    if (S_ISDIR(st.st_mode)) {
        DIR* d = ::opendir(path.c_str());
        if (d) {
            struct dirent* ent;
            while ((ent = ::readdir(d)) != nullptr) {
                if (std::strcmp(ent->d_name, ".") == 0 ||
                    std::strcmp(ent->d_name, "..") == 0) continue;
                remove_recursive(path + "/" + ent->d_name);
            }
            ::closedir(d);
        }
        ::rmdir(path.c_str());
    } else {
        ::unlink(path.c_str());
    }
}

} // namespace dxsync
