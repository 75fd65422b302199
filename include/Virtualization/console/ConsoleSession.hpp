#pragma once
#include <array>
#include <atomic>
#include <boost/asio/local/stream_protocol.hpp>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>

namespace glidex {

/**
 * @brief One attached console client.
 *
 * Output is queued and written asynchronously so a slow reader never stalls
 * the producer; once the queue would exceed its bound the session gives up.
 * All member functions must run on the socket's executor.
 */
class ConsoleSession : public std::enable_shared_from_this<ConsoleSession> {
public:
    using Id = std::uint64_t;
    using Socket = boost::asio::local::stream_protocol::socket;
    using InputHandler = std::function<void(std::string)>;
    using CloseHandler = std::function<void(Id)>;

    ConsoleSession(Id id, Socket socket, std::size_t maxQueuedBytes);

    ConsoleSession(const ConsoleSession&) = delete;
    ConsoleSession& operator=(const ConsoleSession&) = delete;

    // Begin reading client input. onClosed fires once if the peer goes away
    // or a write fails, never after close().
    void start(InputHandler onInput, CloseHandler onClosed);

    // false when the session is closed or the chunk would overflow its queue;
    // in the latter case the session closes itself.
    bool enqueue(std::shared_ptr<const std::string> chunk);

    void close();

    [[nodiscard]] Id id() const noexcept { return id_; }
    [[nodiscard]] bool isOpen() const noexcept { return open_.load(); }
    [[nodiscard]] std::size_t queuedBytes() const noexcept { return queuedBytes_; }

private:
    void readNext();
    void writeNext();
    void fail(const boost::system::error_code& ec, const char* op);

    Id id_;
    Socket socket_;
    std::size_t maxQueuedBytes_;
    std::size_t queuedBytes_{0};
    std::deque<std::shared_ptr<const std::string>> outbox_;
    bool writing_{false};
    std::atomic<bool> open_{true};
    std::array<char, 4096> readBuf_{};

    InputHandler onInput_;
    CloseHandler onClosed_;
};

} // namespace glidex
