#include "Virtualization/console/ConsoleLogger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <fmt/format.h>

#include "Virtualization/Utils/VmException.hpp"

namespace glidex {

namespace {

// Owns a read-only descriptor; -1 when the file does not exist.
struct ReadFd {
    int fd;
    explicit ReadFd(const std::string& path) : fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC)) {
        if (fd < 0 && errno != ENOENT) {
            throw ConsoleException(fmt::format("open {}: {}", path, std::strerror(errno)));
        }
    }
    ~ReadFd() { if (fd >= 0) ::close(fd); }
    ReadFd(const ReadFd&) = delete;
    ReadFd& operator=(const ReadFd&) = delete;
};

std::string readFrom(int fd, const std::string& path, off_t offset) {
    std::string out;
    char buf[16 * 1024];
    for (;;) {
        ssize_t n = ::pread(fd, buf, sizeof(buf), offset);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw ConsoleException(fmt::format("read {}: {}", path, std::strerror(errno)));
        }
        if (n == 0) break;
        out.append(buf, static_cast<std::size_t>(n));
        offset += n;
    }
    return out;
}

} // namespace

ConsoleLogger::ConsoleLogger(std::string path) : path_(std::move(path)) {
    fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw ConsoleException(fmt::format("open log {}: {}", path_, std::strerror(errno)));
    }
}

ConsoleLogger::~ConsoleLogger() {
    if (fd_ >= 0) ::close(fd_);
}

void ConsoleLogger::append(std::string_view bytes) {
    std::scoped_lock lock(mutex_);
    while (!bytes.empty()) {
        ssize_t n = ::write(fd_, bytes.data(), bytes.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            throw ConsoleException(fmt::format("write log {}: {}", path_, std::strerror(errno)));
        }
        bytes.remove_prefix(static_cast<std::size_t>(n));
    }
}

std::string ConsoleLogger::readAll(const std::string& path) {
    ReadFd file(path);
    if (file.fd < 0) return {};
    return readFrom(file.fd, path, 0);
}

std::string ConsoleLogger::tail(const std::string& path, std::size_t maxBytes) {
    if (maxBytes == 0) return {};
    ReadFd file(path);
    if (file.fd < 0) return {};

    struct stat st{};
    if (::fstat(file.fd, &st) < 0) {
        throw ConsoleException(fmt::format("stat {}: {}", path, std::strerror(errno)));
    }
    off_t size = st.st_size;
    off_t start = size > static_cast<off_t>(maxBytes) ? size - static_cast<off_t>(maxBytes) : 0;
    auto out = readFrom(file.fd, path, start);
    if (out.size() > maxBytes) out.erase(0, out.size() - maxBytes);
    return out;
}

} // namespace glidex
