#include "platform.hpp"
#include <cstdlib>
#include <cerrno>
#ifdef _WIN32
#include <fstream>
#else
#include <fcntl.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
    if (!home) home = std::getenv("HOME");
#else
    const char* home = std::getenv("HOME");
#endif
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

const char* os_name() {
#if defined(_WIN32)
    return "windows";
#elif defined(__APPLE__)
    return "macos";
#else
    return "linux";
#endif
}

std::error_code write_private_file(const fs::path& path, const std::string& content) {
    fs::path tmp = path;
    tmp += ".tmp";
    std::error_code ec;
    fs::remove(tmp, ec);

#ifdef _WIN32
    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f) return std::make_error_code(std::errc::io_error);
        f << content;
        if (!f) {
            f.close();
            fs::remove(tmp, ec);
            return std::make_error_code(std::errc::io_error);
        }
    }
#else
    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_TRUNC, 0600);
    if (fd < 0) return std::error_code(errno, std::generic_category());

    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::error_code err(errno, std::generic_category());
            ::close(fd);
            fs::remove(tmp, ec);
            return err;
        }
        written += static_cast<size_t>(n);
    }
    if (::fsync(fd) != 0) {
        std::error_code err(errno, std::generic_category());
        ::close(fd);
        fs::remove(tmp, ec);
        return err;
    }
    if (::close(fd) != 0) {
        std::error_code err(errno, std::generic_category());
        fs::remove(tmp, ec);
        return err;
    }
#endif

    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return ec;
    }
    return {};
}

} // namespace platform
