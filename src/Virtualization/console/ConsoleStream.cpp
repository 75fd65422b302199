#include "Virtualization/console/ConsoleStream.hpp"

#include <array>
#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <fmt/format.h>

#include "Virtualization/Utils/VmException.hpp"

namespace glidex {

namespace asio = boost::asio;
using local = asio::local::stream_protocol;

struct ConsoleStream::Impl {
    asio::io_context ioc;
    local::socket socket{ioc};
    std::string path;
    bool eof{false};
};

ConsoleStream::ConsoleStream(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}
ConsoleStream::ConsoleStream(ConsoleStream&&) noexcept = default;
ConsoleStream& ConsoleStream::operator=(ConsoleStream&&) noexcept = default;

ConsoleStream::~ConsoleStream() {
    if (impl_) close();
}

ConsoleStream ConsoleStream::connect(const std::string& socketPath) {
    auto impl = std::make_unique<Impl>();
    impl->path = socketPath;
    boost::system::error_code ec;
    impl->socket.connect(local::endpoint(socketPath), ec);
    if (ec) {
        throw ConsoleException(fmt::format("connect {}: {}", socketPath, ec.message()));
    }
    return ConsoleStream(std::move(impl));
}

void ConsoleStream::write(std::string_view bytes) {
    boost::system::error_code ec;
    asio::write(impl_->socket, asio::buffer(bytes.data(), bytes.size()), ec);
    if (ec) {
        throw ConsoleException(fmt::format("write {}: {}", impl_->path, ec.message()));
    }
}

std::string ConsoleStream::readSome(std::chrono::milliseconds timeout) {
    if (impl_->eof || !impl_->socket.is_open()) return {};

    std::array<char, 4096> buf;
    std::size_t got = 0;
    boost::system::error_code result = asio::error::would_block;

    impl_->ioc.restart();
    impl_->socket.async_read_some(asio::buffer(buf), [&](const boost::system::error_code& ec, std::size_t n) {
        result = ec;
        got = n;
    });
    impl_->ioc.run_for(timeout);
    if (!impl_->ioc.stopped()) {
        boost::system::error_code ignored;
        impl_->socket.cancel(ignored);
        impl_->ioc.run();
    }

    if (result == asio::error::eof) impl_->eof = true;
    if (result) return {};
    return std::string(buf.data(), got);
}

std::string ConsoleStream::readUntil(std::string_view needle, std::chrono::milliseconds timeout) {
    std::string out;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (out.find(needle) == std::string::npos && !impl_->eof) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) break;
        out += readSome(left);
    }
    return out;
}

bool ConsoleStream::isOpen() const noexcept {
    return impl_ && impl_->socket.is_open();
}

bool ConsoleStream::eof() const noexcept {
    return impl_ && impl_->eof;
}

void ConsoleStream::close() {
    if (!impl_) return;
    boost::system::error_code ignored;
    impl_->socket.shutdown(local::socket::shutdown_both, ignored);
    impl_->socket.close(ignored);
}

} // namespace glidex
