#include "cliutil/progress/progress_config.hpp"
#include "cliutil/common/constants.hpp"
#include "cliutil/common/error_codes.hpp"
#include <cmath>

namespace cliutil {
namespace progress {

using common::ConfigurationError;
using common::ErrorCode;
using common::makeContext;

void ProgressConfig::validate() const {
    if (total_items < 0) {
        throw ConfigurationError(ErrorCode::CONFIG_INVALID_TOTAL,
            makeContext("Progress", {{"total_items", std::to_string(total_items)}}));
    }
    
    if (!(console_refresh_interval >= 0) || std::isinf(console_refresh_interval)) {
        throw ConfigurationError(ErrorCode::CONFIG_INVALID_INTERVAL,
            makeContext("Progress", {{"console_refresh_interval", std::to_string(console_refresh_interval)}}));
    }
    
    if (!(file_refresh_interval >= 0) || std::isinf(file_refresh_interval)) {
        throw ConfigurationError(ErrorCode::CONFIG_INVALID_INTERVAL,
            makeContext("Progress", {{"file_refresh_interval", std::to_string(file_refresh_interval)}}));
    }
    
    if (rotator_sequence.empty()) {
        throw ConfigurationError(ErrorCode::CONFIG_EMPTY_ROTATOR, makeContext("Progress"));
    }
    
    for (size_t i = 0; i < rotator_sequence.size(); ++i) {
        if (rotator_sequence[i].empty()) {
            throw ConfigurationError(ErrorCode::CONFIG_INVALID_ROTATOR_GLYPH,
                makeContext("Progress", {{"index", std::to_string(i)}}));
        }
    }
    
    if (max_output_width <= 0) {
        throw ConfigurationError(ErrorCode::CONFIG_INVALID_WIDTH,
            makeContext("Progress", {{"max_output_width", std::to_string(max_output_width)}}));
    }
    
    if (percent_precision < 0 || speed_precision < 0 || time_precision < 0) {
        throw ConfigurationError(ErrorCode::CONFIG_INVALID_PRECISION,
            makeContext("Progress", {
                {"percent_precision", std::to_string(percent_precision)},
                {"speed_precision", std::to_string(speed_precision)},
                {"time_precision", std::to_string(time_precision)}
            }));
    }
}

ProgressConfigBuilder::ProgressConfigBuilder() {
    using namespace constants::config_defaults;
    
    config_.console_refresh_interval = PROGRESS_CONSOLE_REFRESH_INTERVAL;
    config_.file_refresh_interval = PROGRESS_FILE_REFRESH_INTERVAL;
    config_.console_format = PROGRESS_CONSOLE_FORMAT;
    config_.file_format = PROGRESS_FILE_FORMAT;
    config_.max_output_width = MAX_OUTPUT_WIDTH;
    config_.rotator_sequence = getRotator();
    config_.percent_precision = PROGRESS_PERCENT_PRECISION;
    config_.speed_precision = PROGRESS_SPEED_PRECISION;
    config_.time_precision = PROGRESS_TIME_PRECISION;
}

ProgressConfigBuilder::ProgressConfigBuilder(ProgressConfig base)
    : config_(std::move(base)) {
}

ProgressConfigBuilder& ProgressConfigBuilder::totalItems(int64_t total) {
    config_.total_items = total;
    return *this;
}

ProgressConfigBuilder& ProgressConfigBuilder::refreshIntervals(double console_seconds, double file_seconds) {
    config_.console_refresh_interval = console_seconds;
    config_.file_refresh_interval = file_seconds;
    return *this;
}

ProgressConfigBuilder& ProgressConfigBuilder::consoleFormat(std::string format) {
    config_.console_format = std::move(format);
    return *this;
}

ProgressConfigBuilder& ProgressConfigBuilder::fileFormat(std::string format) {
    config_.file_format = std::move(format);
    return *this;
}

ProgressConfigBuilder& ProgressConfigBuilder::maxOutputWidth(int width) {
    config_.max_output_width = width;
    return *this;
}

ProgressConfigBuilder& ProgressConfigBuilder::rotator(std::vector<std::string> glyphs) {
    config_.rotator_sequence = std::move(glyphs);
    return *this;
}

ProgressConfigBuilder& ProgressConfigBuilder::precisions(int percent, int speed, int time) {
    config_.percent_precision = percent;
    config_.speed_precision = speed;
    config_.time_precision = time;
    return *this;
}

ProgressConfigBuilder& ProgressConfigBuilder::title(std::string title) {
    config_.operation_title = std::move(title);
    return *this;
}

ProgressConfig ProgressConfigBuilder::build() const {
    config_.validate();
    return config_;
}

}}
