#include "System/Logger.hpp"

#include <filesystem>
#include <vector>
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"

namespace glidex {

std::shared_ptr<spdlog::logger> SafeLogger::instance = nullptr;
std::mutex SafeLogger::mtx;

void SafeLogger::initialize(const LogConfig& config) {
    std::lock_guard lock(mtx);
    if (instance) return;

    std::vector<spdlog::sink_ptr> sinks;
    std::string fileError;
    if (config.enable_console) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_level(config.level);
        sinks.push_back(console);
    }
    if (config.enable_file) {
        std::error_code ec;
        auto parent = std::filesystem::path(config.file_path).parent_path();
        if (!parent.empty()) std::filesystem::create_directories(parent, ec);
        try {
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file_path, config.rotation_size, config.max_files);
            file->set_level(config.level);
            sinks.push_back(file);
        } catch (const spdlog::spdlog_ex& e) {
            fileError = e.what();
        }
    }
    if (sinks.empty()) sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    instance = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
    instance->set_level(config.level);
    instance->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%t] [%^%l%$] %v");
    instance->flush_on(spdlog::level::info);
    spdlog::set_default_logger(instance);

    if (!fileError.empty()) instance->warn("log file {} disabled: {}", config.file_path, fileError);
}

std::shared_ptr<spdlog::logger> SafeLogger::get() {
    {
        std::lock_guard lock(mtx);
        if (instance) return instance;
    }
    initialize();
    std::lock_guard lock(mtx);
    return instance;
}

void SafeLogger::reset() {
    std::lock_guard lock(mtx);
    instance.reset();
}

} // namespace glidex
