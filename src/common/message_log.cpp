#include "cliutil/common/message_log.hpp"
#include "cliutil/common/constants.hpp"
#include "cliutil/common/error_codes.hpp"
#include "cliutil/common/logger.hpp"
#include "cliutil/format/time_format.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <filesystem>

namespace cliutil {
namespace common {

MessageLog::MessageLog(std::string path, bool overwrite)
    : path_(std::move(path)),
      overwrite_(overwrite) {
}

MessageLog::~MessageLog() {
    close();
}

bool MessageLog::open() {
    if (logger_) return true;
    if (open_failed_) return false;
    
    std::error_code ec;
    bool has_previous_log = !overwrite_ 
        && std::filesystem::exists(path_, ec) 
        && std::filesystem::file_size(path_, ec) > 0;
    
    try {
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path_, overwrite_);
        logger_ = std::make_shared<spdlog::logger>(constants::system::MESSAGE_LOG_NAME, sink);
        logger_->set_pattern("%v");
        logger_->set_level(spdlog::level::info);
        logger_->flush_on(spdlog::level::info);
    } catch (const spdlog::spdlog_ex& ex) {
        open_failed_ = true;
        Logger::instance().warn("[MessageLog] {} | path={} | error={}",
                                ErrorCodeHelper::getMessage(ErrorCode::LOG_OPEN_FAILED), path_, ex.what());
        return false;
    }
    
    start_time_ = std::chrono::steady_clock::now();
    
    if (has_previous_log) {
        logger_->info("\n---\n");
    }
    
    logger_->info("[Log started at {}]", 
                  format::formatCurrentTime(constants::config_defaults::STATUS_TIME_FORMAT));
    
    Logger::instance().debug("[MessageLog] Opened | path={} | overwrite={}", path_, overwrite_);
    return true;
}

void MessageLog::write(const std::string& message) {
    if (!open()) {
        return;
    }
    
    logger_->info("[+{:.3f}s] {}", secondsSinceStart(), message);
}

void MessageLog::close() {
    if (!logger_) {
        return;
    }
    
    logger_->info("[Log finished at {} (+ {:.3f}s)]",
                  format::formatCurrentTime(constants::config_defaults::STATUS_TIME_FORMAT),
                  secondsSinceStart());
    logger_->flush();
    logger_.reset();
}

double MessageLog::secondsSinceStart() const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time_).count();
}

}}
