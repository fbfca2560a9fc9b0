#include "cliutil/progress/progress_tracker.hpp"
#include "cliutil/common/error_codes.hpp"
#include "cliutil/common/logger.hpp"
#include "cliutil/format/time_format.hpp"
#include <spdlog/fmt/fmt.h>

namespace cliutil {
namespace progress {

ProgressTracker::Clock ProgressTracker::steadyClock() {
    return [] { return std::chrono::steady_clock::now(); };
}

ProgressTracker::ProgressTracker(std::shared_ptr<ConsoleSink> console_sink,
                                 std::shared_ptr<FileSink> file_sink,
                                 Clock clock)
    : console_sink_(std::move(console_sink)),
      file_sink_(std::move(file_sink)),
      clock_(std::move(clock)) {
}

void ProgressTracker::resetProgress(const ProgressConfig& config) {
    config.validate();
    
    if (state_.phase == SessionPhase::ENDED) {
        common::Logger::instance().debug("[Progress] Reset ignored | reason=session_ended");
        return;
    }
    
    clearConsole();
    
    config_ = config;
    
    state_.tag_values.clear();
    state_.tag_values.set(ProgressTag::TOTAL, std::to_string(config_.total_items));
    state_.tag_values.set(ProgressTag::TITLE, config_.operation_title);
    state_.last_file_text.clear();
    state_.rotator_index = 0;
    
    estimator_.reset();
    scheduler_.configure(config_.console_refresh_interval,
                         config_.file_refresh_interval,
                         console_sink_ != nullptr,
                         file_sink_ != nullptr);
    
    state_.active = scheduler_.enabled();
    state_.phase = SessionPhase::RESET;
    
    common::Logger::instance().debug(
        "[Progress] Reset | total={} | interval={:.3f} | active={}",
        config_.total_items, scheduler_.effectiveInterval(), state_.active);
}

void ProgressTracker::updateProgress(int64_t current_item) {
    if (state_.phase == SessionPhase::UNINITIALIZED ||
        state_.phase == SessionPhase::ENDED ||
        !state_.active) {
        return;
    }
    
    Tick tick;
    tick.current_item = current_item;
    tick.now = clock_();
    tick.is_first_call = !estimator_.started();
    tick.delta_time = estimator_.secondsSinceLastUpdate(tick.now);
    tick.delta_items = current_item - estimator_.lastItem();
    tick.is_last_item = current_item >= config_.total_items;
    
    if (!scheduler_.shouldProcess(tick)) {
        return;
    }
    
    Estimate estimate = estimator_.update(current_item, config_.total_items, tick.now);
    state_.phase = SessionPhase::ACTIVE;
    
    std::optional<double> done_part;
    if (config_.total_items > 0) {
        done_part = static_cast<double>(current_item) / static_cast<double>(config_.total_items);
    }
    
    updateTags(current_item, estimate, done_part);
    
    if (scheduler_.consoleDue(estimate.time_passed)) {
        drawConsole(done_part);
    }
    if (scheduler_.fileDue(estimate.time_passed)) {
        writeFile(done_part);
    }
}

void ProgressTracker::endSession() {
    if (state_.phase == SessionPhase::ENDED) {
        return;
    }
    
    clearConsole();
    state_.phase = SessionPhase::ENDED;
    state_.active = false;
}

void ProgressTracker::clearConsole() {
    if (!state_.last_console_text) {
        return;
    }
    
    size_t length = state_.last_console_text->size();
    state_.last_console_text.reset();
    
    if (!console_sink_) {
        return;
    }
    
    try {
        console_sink_->erase(length);
    } catch (const common::SinkWriteError& e) {
        common::Logger::instance().warn("[Progress] Console erase failed | error={}", e.what());
    }
}

void ProgressTracker::updateTags(int64_t current_item, const Estimate& estimate,
                                 std::optional<double> done_part) {
    TagValues& tags = state_.tag_values;
    
    if (done_part) {
        tags.set(ProgressTag::PERCENT,
                 fmt::format("{:.{}f}%", *done_part * 100.0, config_.percent_precision));
    } else {
        tags.set(ProgressTag::PERCENT, UNKNOWN_VALUE);
    }
    
    tags.set(ProgressTag::ETA, formatTime(estimate.eta));
    tags.set(ProgressTag::TIME_PASSED, formatTime(estimate.time_passed));
    tags.set(ProgressTag::ITEM, std::to_string(current_item));
    tags.set(ProgressTag::SPEED_AVG, formatSpeed(estimate.avg_speed));
    tags.set(ProgressTag::SPEED_CUR, formatSpeed(estimate.cur_speed));
    
    tags.set(ProgressTag::ROTATOR, config_.rotator_sequence[state_.rotator_index]);
    state_.rotator_index = (state_.rotator_index + 1) % config_.rotator_sequence.size();
}

void ProgressTracker::drawConsole(std::optional<double> done_part) {
    std::string text = renderProgress(config_.console_format, state_.tag_values, done_part,
                                      config_.max_output_width, RenderTarget::CONSOLE);
    
    if (state_.last_console_text && *state_.last_console_text == text) {
        return;
    }
    
    clearConsole();
    
    try {
        console_sink_->draw(text);
        state_.last_console_text = std::move(text);
    } catch (const common::SinkWriteError& e) {
        common::Logger::instance().warn("[Progress] Console write failed | error={}", e.what());
    }
}

void ProgressTracker::writeFile(std::optional<double> done_part) {
    std::string text = renderProgress(config_.file_format, state_.tag_values, done_part,
                                      config_.max_output_width, RenderTarget::FILE);
    
    try {
        file_sink_->overwrite(text);
        state_.last_file_text = std::move(text);
    } catch (const common::SinkWriteError& e) {
        common::Logger::instance().warn("[Progress] File write failed | error={}", e.what());
    }
}

std::string ProgressTracker::formatTime(std::optional<double> seconds) const {
    if (!seconds) {
        return UNKNOWN_VALUE;
    }
    return format::formatDuration(*seconds, config_.time_precision, true, 1, true);
}

std::string ProgressTracker::formatSpeed(std::optional<double> speed) const {
    if (!speed) {
        return UNKNOWN_VALUE;
    }
    return fmt::format("{:.{}f}/s", *speed, config_.speed_precision);
}

}}
