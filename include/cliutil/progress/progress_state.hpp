#pragma once

#include "progress_tags.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace cliutil {
namespace progress {

using TimePoint = std::chrono::steady_clock::time_point;

enum class SessionPhase {
    UNINITIALIZED,
    RESET,
    ACTIVE,
    ENDED
};

std::string to_string(SessionPhase phase);

// One updateProgress() call, before the scheduler decides whether to process it.
struct Tick {
    int64_t current_item = 0;
    TimePoint now;
    // Seconds since the previous accepted tick; empty on the first call.
    std::optional<double> delta_time;
    int64_t delta_items = 0;
    bool is_first_call = true;
    bool is_last_item = false;
};

struct ProgressState {
    SessionPhase phase = SessionPhase::UNINITIALIZED;
    // At least one sink is enabled for the current session.
    bool active = false;
    size_t rotator_index = 0;
    TagValues tag_values;
    // Text currently shown on the console, if any.
    std::optional<std::string> last_console_text;
    std::string last_file_text;
};

}}
