#pragma once

#include "progress_state.hpp"
#include <cstdint>
#include <optional>

namespace cliutil {
namespace progress {

// Values that cannot be computed yet (first tick, zero elapsed time, zero
// average speed) are left empty and rendered as unknown.
struct Estimate {
    std::optional<double> time_passed;
    std::optional<double> avg_speed;
    std::optional<double> cur_speed;
    std::optional<double> eta;
};

class Estimator {
public:
    void reset();
    
    bool started() const { return started_; }
    int64_t lastItem() const { return last_item_; }
    TimePoint startTime() const { return start_time_; }
    TimePoint lastUpdateTime() const { return last_update_time_; }
    
    std::optional<double> secondsSinceLastUpdate(TimePoint now) const;
    
    // Records an accepted tick. Deltas use the values of the previous tick.
    Estimate update(int64_t current_item, int64_t total_items, TimePoint now);

private:
    bool started_ = false;
    int64_t last_item_ = 0;
    TimePoint start_time_;
    TimePoint last_update_time_;
};

}}
