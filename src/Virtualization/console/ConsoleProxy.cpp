#include "Virtualization/console/ConsoleProxy.hpp"

#include <algorithm>
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <future>
#include <sys/stat.h>
#include <fmt/format.h>

#include "System/Logger.hpp"
#include "Virtualization/Utils/VmException.hpp"

namespace glidex {

namespace asio = boost::asio;
namespace fs = std::filesystem;
using local = asio::local::stream_protocol;

std::shared_ptr<ConsoleProxy> ConsoleProxy::create(asio::any_io_executor executor, std::string vmId,
                                                   ConsolePaths paths, ConsoleOptions options) {
    return std::shared_ptr<ConsoleProxy>(
        new ConsoleProxy(std::move(executor), std::move(vmId), std::move(paths), options));
}

ConsoleProxy::ConsoleProxy(asio::any_io_executor executor, std::string vmId, ConsolePaths paths,
                           ConsoleOptions options)
    : vmId_(std::move(vmId)),
      paths_(std::move(paths)),
      options_(options),
      strand_(asio::make_strand(executor)),
      logger_(paths_.logFile),
      terminal_(strand_),
      acceptor_(strand_) {}

ConsoleProxy::~ConsoleProxy() {
    if (started_ && !stopped_) {
        GXLOG_WARN("vm {}: console proxy destroyed without stop()", vmId_);
    }
}

void ConsoleProxy::start() {
    if (started_.exchange(true)) return;

    std::error_code fsEc;
    fs::remove(paths_.consoleSocket, fsEc);

    boost::system::error_code ec;
    local::endpoint endpoint(paths_.consoleSocket);
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (ec) {
        throw ConsoleException(fmt::format("vm {}: bind {}: {}", vmId_, paths_.consoleSocket, ec.message()));
    }
    if (::chmod(paths_.consoleSocket.c_str(), options_.socketMode) < 0) {
        int err = errno;
        acceptor_.close(ec);
        fs::remove(paths_.consoleSocket, fsEc);
        throw ConsoleException(fmt::format("vm {}: chmod {}: {}", vmId_, paths_.consoleSocket, std::strerror(err)));
    }
    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        acceptor_.close(ec);
        fs::remove(paths_.consoleSocket, fsEc);
        throw ConsoleException(fmt::format("vm {}: listen {}: {}", vmId_, paths_.consoleSocket, ec.message()));
    }

    terminal_.assign(pty_.releaseController(), ec);
    if (ec) {
        throw ConsoleException(fmt::format("vm {}: console terminal: {}", vmId_, ec.message()));
    }

    asio::post(strand_, [self = shared_from_this()] {
        self->readConsole();
        self->acceptNext();
    });
    GXLOG_DEBUG("vm {}: console listening on {}", vmId_, paths_.consoleSocket);
}

void ConsoleProxy::readConsole() {
    terminal_.async_read_some(asio::buffer(readBuf_),
        [self = shared_from_this()](const boost::system::error_code& ec, std::size_t n) {
            if (ec) {
                // EIO: the last holder of the subordinate side is gone
                if (ec != asio::error::operation_aborted && !self->stopped_) {
                    GXLOG_DEBUG("vm {}: console pump ended: {}", self->vmId_, ec.message());
                }
                return;
            }
            auto chunk = std::make_shared<const std::string>(self->readBuf_.data(), n);
            try {
                self->logger_.append(*chunk);
            } catch (const ConsoleException& e) {
                GXLOG_WARN("vm {}: {}", self->vmId_, e.what());
            }
            self->clients_.deliver(chunk);
            self->readConsole();
        });
}

void ConsoleProxy::acceptNext() {
    acceptor_.async_accept(
        [self = shared_from_this()](const boost::system::error_code& ec, ConsoleSession::Socket socket) {
            if (ec) {
                if (ec == asio::error::operation_aborted || !self->acceptor_.is_open()) return;
                GXLOG_WARN("vm {}: console accept failed: {}", self->vmId_, ec.message());
            } else {
                self->attach(std::move(socket));
            }
            self->acceptNext();
        });
}

void ConsoleProxy::attach(ConsoleSession::Socket socket) {
    auto session = std::make_shared<ConsoleSession>(++nextSessionId_, std::move(socket),
                                                    options_.clientQueueBytes);

    std::string history;
    try {
        history = ConsoleLogger::tail(paths_.logFile, std::min(options_.replayBytes, options_.clientQueueBytes));
    } catch (const ConsoleException& e) {
        GXLOG_WARN("vm {}: console replay skipped: {}", vmId_, e.what());
    }
    if (!history.empty()) session->enqueue(std::make_shared<const std::string>(std::move(history)));

    std::weak_ptr<ConsoleProxy> weak = weak_from_this();
    session->start(
        [weak](std::string bytes) {
            if (auto self = weak.lock()) self->writeInput(std::move(bytes));
        },
        [weak](ConsoleSession::Id id) {
            if (auto self = weak.lock()) self->clients_.remove(id);
        });
    clients_.add(session);
    GXLOG_DEBUG("vm {}: console client {} attached ({} total)", vmId_, session->id(), clients_.size());
}

void ConsoleProxy::writeInput(std::string bytes) {
    if (stopped_ || bytes.empty()) return;
    input_.push_back(std::move(bytes));
    if (!writingInput_) writeNextInput();
}

void ConsoleProxy::writeNextInput() {
    if (input_.empty() || !terminal_.is_open()) {
        writingInput_ = false;
        return;
    }
    writingInput_ = true;
    asio::async_write(terminal_, asio::buffer(input_.front()),
        [self = shared_from_this()](const boost::system::error_code& ec, std::size_t) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    GXLOG_DEBUG("vm {}: console input dropped: {}", self->vmId_, ec.message());
                }
                self->input_.clear();
                self->writingInput_ = false;
                return;
            }
            self->input_.pop_front();
            self->writeNextInput();
        });
}

void ConsoleProxy::drainConsole() {
    if (!terminal_.is_open()) return;
    boost::system::error_code ec;
    terminal_.non_blocking(true, ec);
    while (!ec) {
        auto n = terminal_.read_some(asio::buffer(readBuf_), ec);
        if (ec || n == 0) break;
        try {
            logger_.append(std::string_view(readBuf_.data(), n));
        } catch (const ConsoleException& e) {
            GXLOG_WARN("vm {}: {}", vmId_, e.what());
            break;
        }
    }
}

void ConsoleProxy::closeAll() {
    boost::system::error_code ignored;
    acceptor_.close(ignored);
    // what the guest printed last is still in the terminal buffer
    drainConsole();
    terminal_.close(ignored);
    clients_.closeAll();
    input_.clear();
}

void ConsoleProxy::stop() {
    if (stopped_.exchange(true)) return;

    std::promise<void> done;
    auto finished = done.get_future();
    asio::post(strand_, [self = shared_from_this(), &done] {
        self->closeAll();
        done.set_value();
    });
    finished.wait();

    std::error_code ec;
    fs::remove(paths_.consoleSocket, ec);
    GXLOG_DEBUG("vm {}: console detached", vmId_);
}

} // namespace glidex
