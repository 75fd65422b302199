#pragma once
#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace glidex {

/**
 * @brief Blocking client end of a VM console socket.
 *
 * What Manager::consoleConnect() hands out. The first bytes read are the
 * replayed log tail, followed by live output.
 */
class ConsoleStream {
public:
    // @throws ConsoleException
    [[nodiscard]] static ConsoleStream connect(const std::string& socketPath);

    ConsoleStream(ConsoleStream&&) noexcept;
    ConsoleStream& operator=(ConsoleStream&&) noexcept;
    ~ConsoleStream();

    // @throws ConsoleException
    void write(std::string_view bytes);

    /// Whatever arrives within @p timeout; empty on timeout or after EOF.
    [[nodiscard]] std::string readSome(std::chrono::milliseconds timeout);

    /// Read until @p needle has been seen or @p timeout runs out. Returns
    /// everything read by this call.
    [[nodiscard]] std::string readUntil(std::string_view needle, std::chrono::milliseconds timeout);

    [[nodiscard]] bool isOpen() const noexcept;
    // true once the server closed the connection
    [[nodiscard]] bool eof() const noexcept;
    void close();

private:
    struct Impl;
    explicit ConsoleStream(std::unique_ptr<Impl> impl);
    std::unique_ptr<Impl> impl_;
};

} // namespace glidex
