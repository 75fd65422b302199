#pragma once
#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>

namespace glidex {

/**
 * @brief Append-only console log of one VM.
 *
 * The file is created on first open and never truncated or deleted here, so
 * it accumulates the output of every boot of the VM.
 */
class ConsoleLogger {
public:
    // @throws ConsoleException
    explicit ConsoleLogger(std::string path);
    ~ConsoleLogger();

    ConsoleLogger(const ConsoleLogger&) = delete;
    ConsoleLogger& operator=(const ConsoleLogger&) = delete;

    // @throws ConsoleException on a short or failed write
    void append(std::string_view bytes);

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    /// Whole file; empty if it does not exist. @throws ConsoleException
    [[nodiscard]] static std::string readAll(const std::string& path);
    /// Last @p maxBytes of the file; empty if it does not exist.
    [[nodiscard]] static std::string tail(const std::string& path, std::size_t maxBytes);

private:
    std::string path_;
    int fd_{-1};
    std::mutex mutex_;
};

} // namespace glidex
