#pragma once
#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace glidex::CONCURRENCY {
namespace asio = boost::asio;

/// Pool of threads running one io_context.
class EventDispatcher {
public:
    explicit EventDispatcher(size_t threads = std::thread::hardware_concurrency(),
                             std::string name = "dispatcher");
    ~EventDispatcher();

    // Post immediate task
    void dispatch(std::function<void()> f);

    [[nodiscard]] asio::io_context::executor_type get_executor() noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;

    // Control lifecycle
    void start();
    void stop();

    // non-copyable
    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace glidex::CONCURRENCY
