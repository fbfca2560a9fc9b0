#pragma once

#include "config.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <memory>
#include <string>
#include <utility>

namespace cliutil {
namespace common {

enum class LogMode {
    CONSOLE_ONLY,
    FILE_ONLY
};

// Diagnostics channel of the toolkit, written to stderr or a rotating file.
// Script messages go through MessageLog instead. Calls made before
// initialize() are dropped.
class Logger {
public:
    static Logger& instance();
    
    void initialize(LogMode mode, const DiagnosticsConfig& diagnostics);
    void setLevel(LogLevel level);
    void flush();
    void shutdown();
    
    template<typename... Args>
    void log(LogLevel level, const std::string& format, Args&&... args) {
        if (!logger_) {
            return;
        }
        logger_->log(toSpdlogLevel(level), fmt::runtime(format), std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void error(const std::string& format, Args&&... args) {
        log(LogLevel::ERROR, format, std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void warn(const std::string& format, Args&&... args) {
        log(LogLevel::WARN, format, std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void info(const std::string& format, Args&&... args) {
        log(LogLevel::INFO, format, std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void debug(const std::string& format, Args&&... args) {
        log(LogLevel::DEBUG, format, std::forward<Args>(args)...);
    }
    
    bool isInitialized() const { return logger_ != nullptr; }
    LogMode mode() const { return mode_; }

private:
    Logger() = default;
    
    std::shared_ptr<spdlog::logger> logger_;
    LogMode mode_ = LogMode::CONSOLE_ONLY;
    
    static spdlog::level::level_enum toSpdlogLevel(LogLevel level);
};

}}
