#pragma once

#include "cliutil/progress/progress_config.hpp"
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>

namespace cliutil {
namespace common {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

LogLevel parseLogLevel(const std::string& level, LogLevel fallback);
std::string to_string(LogLevel level);

struct OutputConfig {
    int max_output_width;
    std::string verbosity;
    std::string logging;
    std::string log_file;
    std::string progress_file;
};

struct ProgressSection {
    std::string console_format;
    std::string file_format;
    int percent_precision;
    int speed_precision;
    int time_precision;
    double console_refresh_interval;
    double file_refresh_interval;
    std::vector<std::string> rotator;
};

struct StatusConfig {
    std::string start_message;
    std::string end_message;
    std::string time_format;
    int time_precision;
};

struct DiagnosticsConfig {
    LogLevel level;
    std::string log_file;
    size_t rotation_size_mb;
    size_t max_files;
};

struct GlobalConfig {
    OutputConfig output;
    ProgressSection progress;
    StatusConfig status;
    DiagnosticsConfig diagnostics;
};

class Config {
public:
    static Config& instance();
    
    bool load(const std::string& config_file);
    bool save(const std::string& config_file) const;
    void reset();
    
    const GlobalConfig& global() const { return global_; }
    GlobalConfig& global() { return global_; }
    
    void setValue(const std::string& key, const std::string& value);
    std::optional<std::string> getValue(const std::string& key) const;
    std::vector<std::string> keys() const;
    
    // Session template for the progress engine; total and title are set per run.
    progress::ProgressConfig progressConfig() const;
    
    const std::string& currentPath() const { return current_config_path_; }
    
    static GlobalConfig createDefaultConfig();

private:
    Config();
    GlobalConfig global_;
    std::string current_config_path_;
};

}}
