#include "Virtualization/console/ConsoleSession.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/write.hpp>

#include "System/Logger.hpp"

namespace glidex {

namespace asio = boost::asio;

ConsoleSession::ConsoleSession(Id id, Socket socket, std::size_t maxQueuedBytes)
    : id_(id), socket_(std::move(socket)), maxQueuedBytes_(maxQueuedBytes) {}

void ConsoleSession::start(InputHandler onInput, CloseHandler onClosed) {
    onInput_ = std::move(onInput);
    onClosed_ = std::move(onClosed);
    readNext();
}

void ConsoleSession::readNext() {
    if (!isOpen()) return;
    socket_.async_read_some(asio::buffer(readBuf_),
        [self = shared_from_this()](const boost::system::error_code& ec, std::size_t n) {
            if (ec) {
                self->fail(ec, "read");
                return;
            }
            if (self->onInput_) self->onInput_(std::string(self->readBuf_.data(), n));
            self->readNext();
        });
}

bool ConsoleSession::enqueue(std::shared_ptr<const std::string> chunk) {
    if (!isOpen()) return false;
    if (!chunk || chunk->empty()) return true;

    if (queuedBytes_ + chunk->size() > maxQueuedBytes_) {
        GXLOG_DEBUG("console client {}: {} bytes queued, dropping slow reader", id_, queuedBytes_);
        close();
        return false;
    }
    queuedBytes_ += chunk->size();
    outbox_.push_back(std::move(chunk));
    if (!writing_) writeNext();
    return true;
}

void ConsoleSession::writeNext() {
    if (outbox_.empty() || !isOpen()) {
        writing_ = false;
        return;
    }
    writing_ = true;
    auto chunk = outbox_.front();
    asio::async_write(socket_, asio::buffer(*chunk),
        [self = shared_from_this(), chunk](const boost::system::error_code& ec, std::size_t) {
            if (!self->isOpen()) return;
            if (ec) {
                self->writing_ = false;
                self->fail(ec, "write");
                return;
            }
            self->queuedBytes_ -= chunk->size();
            self->outbox_.pop_front();
            self->writeNext();
        });
}

void ConsoleSession::fail(const boost::system::error_code& ec, const char* op) {
    if (!isOpen()) return;
    if (ec == asio::error::eof || ec == asio::error::connection_reset || ec == asio::error::broken_pipe) {
        GXLOG_DEBUG("console client {} disconnected", id_);
    } else {
        GXLOG_DEBUG("console client {}: {} failed: {}", id_, op, ec.message());
    }
    close();
    if (onClosed_) {
        auto onClosed = std::move(onClosed_);
        onClosed(id_);
    }
}

void ConsoleSession::close() {
    if (!open_.exchange(false)) return;
    boost::system::error_code ignored;
    socket_.shutdown(Socket::shutdown_both, ignored);
    socket_.close(ignored);
    outbox_.clear();
    queuedBytes_ = 0;
    onInput_ = nullptr;
}

} // namespace glidex
