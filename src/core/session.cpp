#include "cliutil/core/session.hpp"
#include "cliutil/common/constants.hpp"
#include "cliutil/common/logger.hpp"
#include "cliutil/format/string_utils.hpp"
#include "cliutil/format/time_format.hpp"

namespace cliutil {
namespace core {

SessionOptions SessionOptions::fromConfig(const common::Config& config,
                                          const std::string& script_name) {
    const common::GlobalConfig& global = config.global();
    
    SessionOptions options;
    options.script_name = script_name;
    options.verbosity = global.output.verbosity;
    options.logging = global.output.logging;
    options.log_file = global.output.log_file.empty()
        ? script_name + constants::files::LOG_SUFFIX
        : global.output.log_file;
    options.progress_file = global.output.progress_file.empty()
        ? script_name + constants::files::PROGRESS_SUFFIX
        : global.output.progress_file;
    options.status = global.status;
    options.progress = config.progressConfig();
    options.progress.operation_title = script_name;
    
    return options;
}

Session::Session(SessionOptions options, std::ostream& out,
                 progress::ProgressTracker::Clock clock)
    : options_(std::move(options)),
      verbosity_(VerbosityOptions::parse(options_.verbosity)),
      logging_(LoggingOptions::parse(options_.logging)),
      out_(out),
      clock_(std::move(clock)) {
    
    std::shared_ptr<progress::ConsoleSink> console_sink;
    if (verbosity_.progress) {
        console_sink = std::make_shared<progress::StreamConsoleSink>(out_);
    }
    
    std::shared_ptr<progress::FileSink> file_sink;
    if (logging_.progress && !options_.progress_file.empty()) {
        file_sink = std::make_shared<progress::PathFileSink>(options_.progress_file);
    }
    
    tracker_ = std::make_unique<progress::ProgressTracker>(console_sink, file_sink, clock_);
    
    if (logging_.messageLogEnabled() && !options_.log_file.empty()) {
        message_log_ = std::make_unique<common::MessageLog>(options_.log_file, logging_.overwrite);
    }
    
    time_started_ = clock_();
    
    common::Logger::instance().debug(
        "[Session] Created | script={} | verbosity={} | logging={}",
        options_.script_name, verbosity_.toString(), logging_.toString());
}

Session::~Session() {
    try {
        if (started_ && !ended_) {
            end();
        }
        if (message_log_) {
            message_log_->close();
        }
    } catch (const std::exception& e) {
        common::Logger::instance().error("[Session] Shutdown failed | error={}", e.what());
    }
}

void Session::start() {
    time_started_ = clock_();
    
    if (!options_.status.start_message.empty()) {
        status(format::replaceAll(options_.status.start_message,
                                  constants::tags::TIME_CURRENT,
                                  format::formatCurrentTime(options_.status.time_format)));
    }
    
    started_ = true;
}

void Session::end() {
    if (ended_) {
        return;
    }
    
    time_total_ = timePassed();
    tracker_->endSession();
    
    if (!options_.status.end_message.empty()) {
        std::string message = format::replaceAll(options_.status.end_message,
                                                  constants::tags::TIME_CURRENT,
                                                  format::formatCurrentTime(options_.status.time_format));
        message = format::replaceAll(message, constants::tags::TIME_PASSED, timePassedText());
        status(message);
    }
    
    ended_ = true;
}

void Session::status(const std::string& message) {
    out(MessageType::STATUS, message);
}

void Session::info(const std::string& message) {
    out(MessageType::INFORMATION, message);
}

void Session::error(const std::string& message) {
    out(MessageType::ERROR, message);
}

void Session::out(MessageType type, const std::string& message) {
    if (verbosity_.shows(type)) {
        tracker_->clearConsole();
        out_ << message << "\n" << std::flush;
    }
    
    if (logging_.logs(type) && message_log_) {
        message_log_->write(message);
    }
}

double Session::timePassed() const {
    if (ended_) {
        return time_total_;
    }
    return std::chrono::duration<double>(clock_() - time_started_).count();
}

std::string Session::timePassedText() const {
    return format::formatDuration(timePassed(), options_.status.time_precision, true, 1, true);
}

void Session::resetProgress(int64_t total_items, const std::optional<std::string>& title) {
    progress::ProgressConfig config = progress::ProgressConfigBuilder(options_.progress)
        .totalItems(total_items)
        .title(title.value_or(options_.script_name))
        .build();
    
    tracker_->resetProgress(config);
}

void Session::updateProgress(int64_t current_item) {
    tracker_->updateProgress(current_item);
}

}}
