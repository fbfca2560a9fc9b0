#include "cliutil/progress/estimator.hpp"

namespace cliutil {
namespace progress {

namespace {

double secondsBetween(TimePoint from, TimePoint to) {
    return std::chrono::duration<double>(to - from).count();
}

}

void Estimator::reset() {
    started_ = false;
    last_item_ = 0;
    start_time_ = TimePoint{};
    last_update_time_ = TimePoint{};
}

std::optional<double> Estimator::secondsSinceLastUpdate(TimePoint now) const {
    if (!started_) {
        return std::nullopt;
    }
    return secondsBetween(last_update_time_, now);
}

Estimate Estimator::update(int64_t current_item, int64_t total_items, TimePoint now) {
    Estimate estimate;
    
    if (!started_) {
        start_time_ = now;
        last_update_time_ = now;
        last_item_ = current_item;
        started_ = true;
        return estimate;
    }
    
    double delta_time = secondsBetween(last_update_time_, now);
    int64_t delta_items = current_item - last_item_;
    double time_passed = secondsBetween(start_time_, now);
    
    estimate.time_passed = time_passed;
    
    if (time_passed > 0) {
        double avg_speed = static_cast<double>(current_item) / time_passed;
        estimate.avg_speed = avg_speed;
        
        if (avg_speed != 0) {
            estimate.eta = static_cast<double>(total_items - current_item) / avg_speed;
        }
    }
    
    if (delta_time > 0) {
        estimate.cur_speed = static_cast<double>(delta_items) / delta_time;
    }
    
    last_update_time_ = now;
    last_item_ = current_item;
    
    return estimate;
}

}}
