#include "cliutil/common/config.hpp"
#include "cliutil/common/constants.hpp"
#include "cliutil/common/error_codes.hpp"
#include "cliutil/common/logger.hpp"
#include <toml.hpp>
#include <fstream>
#include <filesystem>
#include <sstream>

namespace cliutil {
namespace common {

namespace {

std::string formatDouble(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

int parseInt(const std::string& key, const std::string& value) {
    try {
        size_t pos = 0;
        int result = std::stoi(value, &pos);
        if (pos == value.size()) {
            return result;
        }
    } catch (const std::exception&) {
    }
    throw ConfigurationError(ErrorCode::CONFIG_PARSE_FAILED,
                             makeContext("Config", {{"key", key}, {"value", value}}));
}

double parseDouble(const std::string& key, const std::string& value) {
    try {
        size_t pos = 0;
        double result = std::stod(value, &pos);
        if (pos == value.size()) {
            return result;
        }
    } catch (const std::exception&) {
    }
    throw ConfigurationError(ErrorCode::CONFIG_PARSE_FAILED,
                             makeContext("Config", {{"key", key}, {"value", value}}));
}

std::string joinRotator(const std::vector<std::string>& rotator) {
    std::string result;
    for (const auto& glyph : rotator) {
        result += glyph;
    }
    return result;
}

std::vector<std::string> splitRotator(const std::string& value) {
    std::vector<std::string> result;
    for (char c : value) {
        result.emplace_back(1, c);
    }
    return result;
}

}

LogLevel parseLogLevel(const std::string& level, LogLevel fallback) {
    if (level == "DEBUG") return LogLevel::DEBUG;
    if (level == "INFO") return LogLevel::INFO;
    if (level == "WARN") return LogLevel::WARN;
    if (level == "ERROR") return LogLevel::ERROR;
    return fallback;
}

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN: return "WARN";
        case LogLevel::INFO: return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
    }
    return "INFO";
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    global_ = createDefaultConfig();
}

GlobalConfig Config::createDefaultConfig() {
    using namespace constants::config_defaults;
    
    GlobalConfig config;
    
    config.output.max_output_width = MAX_OUTPUT_WIDTH;
    config.output.verbosity = VERBOSITY;
    config.output.logging = LOGGING;
    config.output.log_file = "";
    config.output.progress_file = "";
    
    config.progress.console_format = PROGRESS_CONSOLE_FORMAT;
    config.progress.file_format = PROGRESS_FILE_FORMAT;
    config.progress.percent_precision = PROGRESS_PERCENT_PRECISION;
    config.progress.speed_precision = PROGRESS_SPEED_PRECISION;
    config.progress.time_precision = PROGRESS_TIME_PRECISION;
    config.progress.console_refresh_interval = PROGRESS_CONSOLE_REFRESH_INTERVAL;
    config.progress.file_refresh_interval = PROGRESS_FILE_REFRESH_INTERVAL;
    config.progress.rotator = getRotator();
    
    config.status.start_message = STATUS_START_MESSAGE;
    config.status.end_message = STATUS_END_MESSAGE;
    config.status.time_format = STATUS_TIME_FORMAT;
    config.status.time_precision = STATUS_TIME_PRECISION;
    
    config.diagnostics.level = LogLevel::WARN;
    config.diagnostics.log_file = "";
    config.diagnostics.rotation_size_mb = LOG_ROTATION_SIZE_MB;
    config.diagnostics.max_files = LOG_MAX_FILES;
    
    return config;
}

void Config::reset() {
    global_ = createDefaultConfig();
    current_config_path_.clear();
}

bool Config::load(const std::string& config_file) {
    if (!std::filesystem::exists(config_file)) {
        Logger::instance().debug("[Config] Not found | path={}", config_file);
        return false;
    }
    
    try {
        auto data = toml::parse(config_file);
        GlobalConfig loaded = createDefaultConfig();
        
        if (data.contains("output")) {
            auto output_section = data.at("output");
            
            if (output_section.contains("max_output_width")) {
                loaded.output.max_output_width = toml::find<int>(output_section, "max_output_width");
            }
            if (output_section.contains("verbosity")) {
                loaded.output.verbosity = toml::find<std::string>(output_section, "verbosity");
            }
            if (output_section.contains("logging")) {
                loaded.output.logging = toml::find<std::string>(output_section, "logging");
            }
            if (output_section.contains("log_file")) {
                loaded.output.log_file = toml::find<std::string>(output_section, "log_file");
            }
            if (output_section.contains("progress_file")) {
                loaded.output.progress_file = toml::find<std::string>(output_section, "progress_file");
            }
        }
        
        if (data.contains("progress")) {
            auto progress_section = data.at("progress");
            
            if (progress_section.contains("console_format")) {
                loaded.progress.console_format = toml::find<std::string>(progress_section, "console_format");
            }
            if (progress_section.contains("file_format")) {
                loaded.progress.file_format = toml::find<std::string>(progress_section, "file_format");
            }
            if (progress_section.contains("percent_precision")) {
                loaded.progress.percent_precision = toml::find<int>(progress_section, "percent_precision");
            }
            if (progress_section.contains("speed_precision")) {
                loaded.progress.speed_precision = toml::find<int>(progress_section, "speed_precision");
            }
            if (progress_section.contains("time_precision")) {
                loaded.progress.time_precision = toml::find<int>(progress_section, "time_precision");
            }
            if (progress_section.contains("console_refresh_interval")) {
                loaded.progress.console_refresh_interval = 
                    toml::find<double>(progress_section, "console_refresh_interval");
            }
            if (progress_section.contains("file_refresh_interval")) {
                loaded.progress.file_refresh_interval = 
                    toml::find<double>(progress_section, "file_refresh_interval");
            }
            if (progress_section.contains("rotator")) {
                loaded.progress.rotator = 
                    toml::find<std::vector<std::string>>(progress_section, "rotator");
            }
        }
        
        if (data.contains("status")) {
            auto status_section = data.at("status");
            
            if (status_section.contains("start_message")) {
                loaded.status.start_message = toml::find<std::string>(status_section, "start_message");
            }
            if (status_section.contains("end_message")) {
                loaded.status.end_message = toml::find<std::string>(status_section, "end_message");
            }
            if (status_section.contains("time_format")) {
                loaded.status.time_format = toml::find<std::string>(status_section, "time_format");
            }
            if (status_section.contains("time_precision")) {
                loaded.status.time_precision = toml::find<int>(status_section, "time_precision");
            }
        }
        
        if (data.contains("diagnostics")) {
            auto diagnostics_section = data.at("diagnostics");
            
            if (diagnostics_section.contains("level")) {
                loaded.diagnostics.level = parseLogLevel(
                    toml::find<std::string>(diagnostics_section, "level"), loaded.diagnostics.level);
            }
            if (diagnostics_section.contains("log_file")) {
                loaded.diagnostics.log_file = toml::find<std::string>(diagnostics_section, "log_file");
            }
            if (diagnostics_section.contains("rotation_size_mb")) {
                loaded.diagnostics.rotation_size_mb = 
                    toml::find<size_t>(diagnostics_section, "rotation_size_mb");
            }
            if (diagnostics_section.contains("max_files")) {
                loaded.diagnostics.max_files = toml::find<size_t>(diagnostics_section, "max_files");
            }
        }
        
        global_ = std::move(loaded);
        current_config_path_ = config_file;
        
        Logger::instance().info("[Config] Loaded | path={}", config_file);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Parse failed | path={} | error={}", config_file, e.what());
        return false;
    }
}

bool Config::save(const std::string& config_file) const {
    try {
        toml::value data = toml::table{
            {"output", toml::table{
                {"max_output_width", global_.output.max_output_width},
                {"verbosity", global_.output.verbosity},
                {"logging", global_.output.logging},
                {"log_file", global_.output.log_file},
                {"progress_file", global_.output.progress_file}
            }},
            {"progress", toml::table{
                {"console_format", global_.progress.console_format},
                {"file_format", global_.progress.file_format},
                {"percent_precision", global_.progress.percent_precision},
                {"speed_precision", global_.progress.speed_precision},
                {"time_precision", global_.progress.time_precision},
                {"console_refresh_interval", global_.progress.console_refresh_interval},
                {"file_refresh_interval", global_.progress.file_refresh_interval},
                {"rotator", global_.progress.rotator}
            }},
            {"status", toml::table{
                {"start_message", global_.status.start_message},
                {"end_message", global_.status.end_message},
                {"time_format", global_.status.time_format},
                {"time_precision", global_.status.time_precision}
            }},
            {"diagnostics", toml::table{
                {"level", to_string(global_.diagnostics.level)},
                {"log_file", global_.diagnostics.log_file},
                {"rotation_size_mb", static_cast<int64_t>(global_.diagnostics.rotation_size_mb)},
                {"max_files", static_cast<int64_t>(global_.diagnostics.max_files)}
            }}
        };
        
        std::filesystem::path path(config_file);
        if (path.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
        }
        
        std::ofstream file(config_file);
        if (!file) {
            Logger::instance().error("[Config] Save failed | path={}", config_file);
            return false;
        }
        
        file << toml::format(data);
        
        Logger::instance().info("[Config] Saved | path={}", config_file);
        return static_cast<bool>(file);
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Save failed | path={} | error={}", config_file, e.what());
        return false;
    }
}

void Config::setValue(const std::string& key, const std::string& value) {
    if (key == "output.max_output_width") {
        global_.output.max_output_width = parseInt(key, value);
    } else if (key == "output.verbosity") {
        global_.output.verbosity = value;
    } else if (key == "output.logging") {
        global_.output.logging = value;
    } else if (key == "output.log_file") {
        global_.output.log_file = value;
    } else if (key == "output.progress_file") {
        global_.output.progress_file = value;
    } else if (key == "progress.console_format") {
        global_.progress.console_format = value;
    } else if (key == "progress.file_format") {
        global_.progress.file_format = value;
    } else if (key == "progress.percent_precision") {
        global_.progress.percent_precision = parseInt(key, value);
    } else if (key == "progress.speed_precision") {
        global_.progress.speed_precision = parseInt(key, value);
    } else if (key == "progress.time_precision") {
        global_.progress.time_precision = parseInt(key, value);
    } else if (key == "progress.console_refresh_interval") {
        global_.progress.console_refresh_interval = parseDouble(key, value);
    } else if (key == "progress.file_refresh_interval") {
        global_.progress.file_refresh_interval = parseDouble(key, value);
    } else if (key == "progress.rotator") {
        global_.progress.rotator = splitRotator(value);
    } else if (key == "status.start_message") {
        global_.status.start_message = value;
    } else if (key == "status.end_message") {
        global_.status.end_message = value;
    } else if (key == "status.time_format") {
        global_.status.time_format = value;
    } else if (key == "status.time_precision") {
        global_.status.time_precision = parseInt(key, value);
    } else if (key == "diagnostics.level") {
        global_.diagnostics.level = parseLogLevel(value, global_.diagnostics.level);
    } else if (key == "diagnostics.log_file") {
        global_.diagnostics.log_file = value;
    } else {
        throw ConfigurationError(ErrorCode::CONFIG_PARSE_FAILED,
                                 makeContext("Config", {{"key", key}, {"reason", "unknown key"}}));
    }
}

std::optional<std::string> Config::getValue(const std::string& key) const {
    if (key == "output.max_output_width") return std::to_string(global_.output.max_output_width);
    if (key == "output.verbosity") return global_.output.verbosity;
    if (key == "output.logging") return global_.output.logging;
    if (key == "output.log_file") return global_.output.log_file;
    if (key == "output.progress_file") return global_.output.progress_file;
    if (key == "progress.console_format") return global_.progress.console_format;
    if (key == "progress.file_format") return global_.progress.file_format;
    if (key == "progress.percent_precision") return std::to_string(global_.progress.percent_precision);
    if (key == "progress.speed_precision") return std::to_string(global_.progress.speed_precision);
    if (key == "progress.time_precision") return std::to_string(global_.progress.time_precision);
    if (key == "progress.console_refresh_interval") return formatDouble(global_.progress.console_refresh_interval);
    if (key == "progress.file_refresh_interval") return formatDouble(global_.progress.file_refresh_interval);
    if (key == "progress.rotator") return joinRotator(global_.progress.rotator);
    if (key == "status.start_message") return global_.status.start_message;
    if (key == "status.end_message") return global_.status.end_message;
    if (key == "status.time_format") return global_.status.time_format;
    if (key == "status.time_precision") return std::to_string(global_.status.time_precision);
    if (key == "diagnostics.level") return to_string(global_.diagnostics.level);
    if (key == "diagnostics.log_file") return global_.diagnostics.log_file;
    return std::nullopt;
}

std::vector<std::string> Config::keys() const {
    return {
        "output.max_output_width", "output.verbosity", "output.logging",
        "output.log_file", "output.progress_file",
        "progress.console_format", "progress.file_format",
        "progress.percent_precision", "progress.speed_precision", "progress.time_precision",
        "progress.console_refresh_interval", "progress.file_refresh_interval", "progress.rotator",
        "status.start_message", "status.end_message", "status.time_format", "status.time_precision",
        "diagnostics.level", "diagnostics.log_file"
    };
}

progress::ProgressConfig Config::progressConfig() const {
    progress::ProgressConfig config;
    config.console_refresh_interval = global_.progress.console_refresh_interval;
    config.file_refresh_interval = global_.progress.file_refresh_interval;
    config.console_format = global_.progress.console_format;
    config.file_format = global_.progress.file_format;
    config.max_output_width = global_.output.max_output_width;
    config.rotator_sequence = global_.progress.rotator;
    config.percent_precision = global_.progress.percent_precision;
    config.speed_precision = global_.progress.speed_precision;
    config.time_precision = global_.progress.time_precision;
    return config;
}

}}
