#pragma once

#include "estimator.hpp"
#include "progress_config.hpp"
#include "progress_renderer.hpp"
#include "progress_sink.hpp"
#include "progress_state.hpp"
#include "refresh_scheduler.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace cliutil {
namespace progress {

// Turns "current item of total" updates into throttled console and file
// progress output. A missing sink disables that output; with neither sink
// the tracker does nothing.
//
// Not thread-safe. All calls must come from the loop that drives the job;
// calling updateProgress() from several threads is a misuse.
class ProgressTracker {
public:
    using Clock = std::function<TimePoint()>;
    
    static Clock steadyClock();
    
    ProgressTracker(std::shared_ptr<ConsoleSink> console_sink,
                    std::shared_ptr<FileSink> file_sink,
                    Clock clock = steadyClock());
    
    ProgressTracker(const ProgressTracker&) = delete;
    ProgressTracker& operator=(const ProgressTracker&) = delete;
    
    // Starts a new progress session. Throws common::ConfigurationError and
    // leaves the tracker untouched when the configuration is invalid.
    void resetProgress(const ProgressConfig& config);
    
    void updateProgress(int64_t current_item);
    
    // Erases outstanding console text. Further updates are ignored.
    void endSession();
    
    // Erases outstanding console text so other output can use the line.
    // The next processed tick draws again.
    void clearConsole();
    
    SessionPhase phase() const { return state_.phase; }
    bool isActive() const { return state_.active; }
    size_t rotatorIndex() const { return state_.rotator_index; }
    const TagValues& tagValues() const { return state_.tag_values; }
    const std::optional<std::string>& lastConsoleText() const { return state_.last_console_text; }
    const std::string& lastFileText() const { return state_.last_file_text; }
    const ProgressConfig& config() const { return config_; }
    const RefreshScheduler& scheduler() const { return scheduler_; }

private:
    std::shared_ptr<ConsoleSink> console_sink_;
    std::shared_ptr<FileSink> file_sink_;
    Clock clock_;
    
    ProgressConfig config_;
    ProgressState state_;
    RefreshScheduler scheduler_;
    Estimator estimator_;
    
    void updateTags(int64_t current_item, const Estimate& estimate,
                    std::optional<double> done_part);
    void drawConsole(std::optional<double> done_part);
    void writeFile(std::optional<double> done_part);
    std::string formatTime(std::optional<double> seconds) const;
    std::string formatSpeed(std::optional<double> speed) const;
};

}}
