#include "utils/StorageUtils.hpp"
#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace VigilUtils {

    bool VERBOSE = false;

    namespace {
        std::atomic<uint64_t> tempCounter{0};

        bool writeAll(int fd, const std::string& content) {
            const char* data = content.data();
            size_t remaining = content.size();
            while (remaining > 0) {
                ssize_t n = ::write(fd, data, remaining);
                if (n < 0) {
                    if (errno == EINTR) continue;
                    return false;
                }
                data += n;
                remaining -= static_cast<size_t>(n);
            }
            return true;
        }
    }

    bool writeFileAtomic(const std::string& path, const std::string& content) {
        // Concurrent writers of the same target must not share a temp file
        std::string tmpPath = path + ".tmp." + std::to_string(::getpid()) + "." +
                              std::to_string(tempCounter.fetch_add(1));

        int fd = ::open(tmpPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
        if (fd == -1) {
            std::cerr << "[Storage] Cannot open " << tmpPath << ": " << std::strerror(errno) << std::endl;
            return false;
        }

        bool ok = writeAll(fd, content) && ::fsync(fd) == 0;
        if (::close(fd) != 0) ok = false;

        if (ok && std::rename(tmpPath.c_str(), path.c_str()) == 0) {
            if (VERBOSE) {
                std::cout << "[Storage] Wrote " << content.size() << " bytes to " << path << std::endl;
            }
            return true;
        }

        std::cerr << "[Storage] Atomic write failed for " << path << ": " << std::strerror(errno) << std::endl;
        ::unlink(tmpPath.c_str());
        return false;
    }

    bool ensureSecureDirectory(const std::string& path) {
        std::error_code ec;
        if (fs::exists(path, ec)) {
            return fs::is_directory(path, ec);
        }
        if (!fs::create_directories(path, ec)) {
            std::cerr << "[Storage] Cannot create " << path << ": " << ec.message() << std::endl;
            return false;
        }
        fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace, ec);
        return true;
    }

    bool readFile(const std::string& path, std::string& out) {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) return false;
        std::ostringstream ss;
        ss << file.rdbuf();
        out = ss.str();
        return true;
    }
}
