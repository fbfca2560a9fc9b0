#pragma once

#include "progress_state.hpp"
#include <optional>

namespace cliutil {
namespace progress {

// Gates updateProgress() calls. A tick is processed when the smallest interval
// of the enabled sinks has passed since the previous processed tick, or when
// the last item is reached. Each sink then redraws once its own interval has
// passed since the session started.
class RefreshScheduler {
public:
    void configure(double console_interval, double file_interval,
                   bool console_enabled, bool file_enabled);
    
    bool enabled() const { return console_enabled_ || file_enabled_; }
    double effectiveInterval() const { return effective_interval_; }
    
    bool shouldProcess(const Tick& tick) const;
    bool consoleDue(std::optional<double> time_passed) const;
    bool fileDue(std::optional<double> time_passed) const;

private:
    double console_interval_ = 0.0;
    double file_interval_ = 0.0;
    double effective_interval_ = 0.0;
    bool console_enabled_ = false;
    bool file_enabled_ = false;
};

}}
