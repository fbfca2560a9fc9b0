#include "cliutil/progress/refresh_scheduler.hpp"
#include <algorithm>

namespace cliutil {
namespace progress {

void RefreshScheduler::configure(double console_interval, double file_interval,
                                 bool console_enabled, bool file_enabled) {
    console_interval_ = console_interval;
    file_interval_ = file_interval;
    console_enabled_ = console_enabled;
    file_enabled_ = file_enabled;
    
    if (console_enabled_ && file_enabled_) {
        effective_interval_ = std::min(console_interval_, file_interval_);
    } else if (file_enabled_) {
        effective_interval_ = file_interval_;
    } else if (console_enabled_) {
        effective_interval_ = console_interval_;
    } else {
        effective_interval_ = 0.0;
    }
}

bool RefreshScheduler::shouldProcess(const Tick& tick) const {
    if (!enabled()) {
        return false;
    }
    if (tick.is_first_call || !tick.delta_time) {
        return true;
    }
    return *tick.delta_time >= effective_interval_ || tick.is_last_item;
}

bool RefreshScheduler::consoleDue(std::optional<double> time_passed) const {
    return console_enabled_ && time_passed && *time_passed >= console_interval_;
}

bool RefreshScheduler::fileDue(std::optional<double> time_passed) const {
    return file_enabled_ && time_passed && *time_passed >= file_interval_;
}

}}
