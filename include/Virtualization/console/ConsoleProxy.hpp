#pragma once
#include <array>
#include <atomic>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/strand.hpp>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <sys/types.h>

#include "Virtualization/console/BroadcastRegistry.hpp"
#include "Virtualization/console/ConsoleLogger.hpp"
#include "Virtualization/console/PseudoTerminal.hpp"
#include "Virtualization/vm/VmRecord.hpp"

namespace glidex {

struct ConsoleOptions {
    // log tail sent to a client before live output
    std::size_t replayBytes = 64 * 1024;
    // per-client output bound before the client is dropped
    std::size_t clientQueueBytes = 1024 * 1024;
    mode_t socketMode = 0600;
};

/**
 * @brief Serial console of one running VM.
 *
 * Owns the pseudo-terminal whose subordinate side is the hypervisor's stdio.
 * A pump copies everything the guest prints to the console log and to every
 * client attached on the console socket; client keystrokes go back to the
 * guest in arrival order. Everything runs on a strand of the executor
 * given to create().
 *
 * Lifecycle: create() → hand subordinateFd() to the child → releaseSubordinate()
 * → start() → ... → stop().
 */
class ConsoleProxy : public std::enable_shared_from_this<ConsoleProxy> {
public:
    // @throws ConsoleException
    [[nodiscard]] static std::shared_ptr<ConsoleProxy> create(boost::asio::any_io_executor executor,
                                                              std::string vmId, ConsolePaths paths,
                                                              ConsoleOptions options = {});
    ~ConsoleProxy();

    ConsoleProxy(const ConsoleProxy&) = delete;
    ConsoleProxy& operator=(const ConsoleProxy&) = delete;

    [[nodiscard]] int subordinateFd() const noexcept { return pty_.subordinate(); }
    void releaseSubordinate() noexcept { pty_.closeSubordinate(); }

    /// Bind the console socket and start the pump and the accept loop.
    /// @throws ConsoleException
    void start();

    /// Disconnect every client, close the terminal and the listener, remove
    /// the socket path. Blocks until done; safe to call more than once.
    /// Must not be called from the console executor.
    void stop();

    [[nodiscard]] std::size_t clientCount() const { return clients_.size(); }
    [[nodiscard]] const ConsolePaths& paths() const noexcept { return paths_; }
    [[nodiscard]] const std::string& vmId() const noexcept { return vmId_; }

private:
    using Strand = boost::asio::strand<boost::asio::any_io_executor>;

    ConsoleProxy(boost::asio::any_io_executor executor, std::string vmId, ConsolePaths paths,
                 ConsoleOptions options);

    void readConsole();
    void acceptNext();
    void attach(ConsoleSession::Socket socket);
    void writeInput(std::string bytes);
    void writeNextInput();
    void drainConsole();
    void closeAll();

    std::string vmId_;
    ConsolePaths paths_;
    ConsoleOptions options_;
    Strand strand_;

    PseudoTerminal pty_;
    ConsoleLogger logger_;
    boost::asio::posix::stream_descriptor terminal_;
    boost::asio::local::stream_protocol::acceptor acceptor_;
    BroadcastRegistry clients_;

    std::array<char, 4096> readBuf_{};
    std::deque<std::string> input_;
    bool writingInput_{false};
    ConsoleSession::Id nextSessionId_{0};
    std::atomic<bool> started_{false};
    std::atomic<bool> stopped_{false};
};

} // namespace glidex
