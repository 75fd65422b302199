#pragma once
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include "spdlog/spdlog.h"

namespace glidex {

struct LogConfig {
    std::string name = "glidex";
    std::string file_path = "logs/glidex.log";
    spdlog::level::level_enum level = spdlog::level::info;
    std::size_t rotation_size = 1024 * 1024 * 5;
    std::size_t max_files = 3;
    bool enable_console = true;
    bool enable_file = true;
};

class SafeLogger {
    static std::shared_ptr<spdlog::logger> instance;
    static std::mutex mtx;

public:
    // First call wins; later calls are ignored unless reset() was called.
    static void initialize(const LogConfig& config = LogConfig());
    static void reset();

    // Initializes with defaults on first use.
    static std::shared_ptr<spdlog::logger> get();
};

} // namespace glidex

#define GXLOG_TRACE(...)    ::glidex::SafeLogger::get()->trace(__VA_ARGS__)
#define GXLOG_DEBUG(...)    ::glidex::SafeLogger::get()->debug(__VA_ARGS__)
#define GXLOG_INFO(...)     ::glidex::SafeLogger::get()->info(__VA_ARGS__)
#define GXLOG_WARN(...)     ::glidex::SafeLogger::get()->warn(__VA_ARGS__)
#define GXLOG_ERROR(...)    ::glidex::SafeLogger::get()->error(__VA_ARGS__)
#define GXLOG_CRITICAL(...) ::glidex::SafeLogger::get()->critical(__VA_ARGS__)
