#pragma once

#include "output_flags.hpp"
#include "cliutil/common/config.hpp"
#include "cliutil/common/message_log.hpp"
#include "cliutil/progress/progress_tracker.hpp"
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace cliutil {
namespace core {

struct SessionOptions {
    std::string script_name;
    std::string verbosity;
    std::string logging;
    std::string log_file;
    std::string progress_file;
    common::StatusConfig status;
    // Template for every progress session; total and title are set on reset.
    progress::ProgressConfig progress;
    
    // Empty log and progress file names default to "<script_name>.log" and
    // "<script_name>.progress".
    static SessionOptions fromConfig(const common::Config& config,
                                     const std::string& script_name);
};

// Lifecycle of one script run: start and end status messages, console and
// message log output, and the progress tracker.
class Session {
public:
    // Throws common::ConfigurationError on invalid verbosity or logging flags.
    explicit Session(SessionOptions options,
                     std::ostream& out = std::cout,
                     progress::ProgressTracker::Clock clock = progress::ProgressTracker::steadyClock());
    ~Session();
    
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
    
    void start();
    void end();
    
    void status(const std::string& message);
    void info(const std::string& message);
    void error(const std::string& message);
    void out(MessageType type, const std::string& message);
    
    // Seconds since start(), or since construction when start() was not called.
    // Frozen by end().
    double timePassed() const;
    std::string timePassedText() const;
    
    void resetProgress(int64_t total_items,
                       const std::optional<std::string>& title = std::nullopt);
    void updateProgress(int64_t current_item);
    
    bool started() const { return started_; }
    bool ended() const { return ended_; }
    const VerbosityOptions& verbosity() const { return verbosity_; }
    const LoggingOptions& logging() const { return logging_; }
    const SessionOptions& options() const { return options_; }
    const progress::ProgressTracker& tracker() const { return *tracker_; }

private:
    SessionOptions options_;
    VerbosityOptions verbosity_;
    LoggingOptions logging_;
    std::ostream& out_;
    progress::ProgressTracker::Clock clock_;
    std::unique_ptr<progress::ProgressTracker> tracker_;
    std::unique_ptr<common::MessageLog> message_log_;
    
    progress::TimePoint time_started_;
    double time_total_ = 0.0;
    bool started_ = false;
    bool ended_ = false;
};

}}
