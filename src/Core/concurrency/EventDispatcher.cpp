#include "Core/concurrency/EventDispatcher.hpp"
#include <atomic>
#include <vector>
#include "System/Logger.hpp"

namespace glidex::CONCURRENCY {

struct EventDispatcher::Impl {
    asio::io_context io_ctx;
    std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard;
    std::vector<std::thread> threads;
    size_t thread_count{1};
    std::string name;
    std::atomic<bool> running{false};

    Impl(size_t threads_count, std::string name_)
        : io_ctx(), thread_count(threads_count), name(std::move(name_))
    {}

    void run_threads() {
        if (running.exchange(true)) return;
        io_ctx.restart();
        work_guard = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
            asio::make_work_guard(io_ctx));
        for (size_t i = 0; i < thread_count; ++i) {
            threads.emplace_back([this]() {
                for (;;) {
                    try {
                        io_ctx.run();
                        return;
                    } catch (const std::exception& e) {
                        // a throwing handler must not take the pool down
                        GXLOG_ERROR("{}: handler threw: {}", name, e.what());
                    }
                }
            });
        }
    }

    void stop_threads() {
        if (!running.exchange(false)) return;
        work_guard.reset();
        io_ctx.stop();
        for (auto &t : threads) {
            if (t.joinable()) t.join();
        }
        threads.clear();
    }
};

EventDispatcher::EventDispatcher(size_t threads, std::string name)
    : impl_(std::make_unique<Impl>(threads == 0 ? 1 : threads, std::move(name)))
{
    impl_->run_threads();
}

EventDispatcher::~EventDispatcher() {
    stop();
}

void EventDispatcher::dispatch(std::function<void()> f) {
    if (!f) return;
    asio::post(impl_->io_ctx, std::move(f));
}

asio::io_context::executor_type EventDispatcher::get_executor() noexcept {
    return impl_->io_ctx.get_executor();
}

size_t EventDispatcher::thread_count() const noexcept {
    return impl_->thread_count;
}

void EventDispatcher::start() {
    impl_->run_threads();
}

void EventDispatcher::stop() {
    impl_->stop_threads();
}

} // namespace glidex::CONCURRENCY
