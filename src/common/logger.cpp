#include "cliutil/common/logger.hpp"
#include "cliutil/common/constants.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <iostream>

namespace cliutil {
namespace common {

namespace {

constexpr const char* PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

// Returns nullptr when the file cannot be opened.
spdlog::sink_ptr rotatingFileSink(const DiagnosticsConfig& diagnostics) {
    std::filesystem::path path(diagnostics.log_file);
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }
    
    try {
        size_t max_bytes = diagnostics.rotation_size_mb * 1024 * 1024;
        return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            diagnostics.log_file, max_bytes, diagnostics.max_files);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "[Logger] Cannot open " << diagnostics.log_file << ": " << ex.what()
                  << ", using stderr" << std::endl;
        return nullptr;
    }
}

}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(LogMode mode, const DiagnosticsConfig& diagnostics) {
    if (logger_) {
        logger_->warn("[Logger] Already initialized");
        return;
    }
    
    spdlog::sink_ptr sink;
    if (mode == LogMode::FILE_ONLY && !diagnostics.log_file.empty()) {
        sink = rotatingFileSink(diagnostics);
    }
    if (!sink) {
        mode = LogMode::CONSOLE_ONLY;
        sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    }
    
    spdlog::drop(constants::system::LOGGER_NAME);
    
    logger_ = std::make_shared<spdlog::logger>(constants::system::LOGGER_NAME, sink);
    logger_->set_pattern(PATTERN);
    logger_->set_level(toSpdlogLevel(diagnostics.level));
    if (mode == LogMode::FILE_ONLY) {
        logger_->flush_on(spdlog::level::warn);
    }
    
    spdlog::register_logger(logger_);
    mode_ = mode;
}

void Logger::setLevel(LogLevel level) {
    if (logger_) {
        logger_->set_level(toSpdlogLevel(level));
    }
}

void Logger::flush() {
    if (logger_) {
        logger_->flush();
    }
}

void Logger::shutdown() {
    if (!logger_) {
        return;
    }
    logger_->flush();
    spdlog::drop(constants::system::LOGGER_NAME);
    logger_.reset();
}

spdlog::level::level_enum Logger::toSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::DEBUG: return spdlog::level::debug;
    }
    return spdlog::level::info;
}

}}
