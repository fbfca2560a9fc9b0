#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace cliutil {
namespace progress {

// Settings of one progress session. Fixed between two resetProgress() calls.
struct ProgressConfig {
    int64_t total_items = 0;
    double console_refresh_interval = 0.5;
    double file_refresh_interval = 5.0;
    std::string console_format;
    std::string file_format;
    int max_output_width = 80;
    std::vector<std::string> rotator_sequence;
    int percent_precision = 1;
    int speed_precision = 2;
    int time_precision = 0;
    std::string operation_title;
    
    // Throws common::ConfigurationError naming the first violated constraint.
    void validate() const;
};

class ProgressConfigBuilder {
public:
    ProgressConfigBuilder();
    explicit ProgressConfigBuilder(ProgressConfig base);
    
    ProgressConfigBuilder& totalItems(int64_t total);
    ProgressConfigBuilder& refreshIntervals(double console_seconds, double file_seconds);
    ProgressConfigBuilder& consoleFormat(std::string format);
    ProgressConfigBuilder& fileFormat(std::string format);
    ProgressConfigBuilder& maxOutputWidth(int width);
    ProgressConfigBuilder& rotator(std::vector<std::string> glyphs);
    ProgressConfigBuilder& precisions(int percent, int speed, int time);
    ProgressConfigBuilder& title(std::string title);
    
    ProgressConfig build() const;

private:
    ProgressConfig config_;
};

}}
