#pragma once

#include <string>
#include <vector>
#include <array>
#include <cstdint>

namespace cliutil {
namespace constants {

namespace version {
    constexpr const char* CLI_VERSION = "1.0.0";
    
    inline std::string getFullVersion() {
        return std::string("cliutil v") + CLI_VERSION;
    }
}

namespace system {
    constexpr const char* LOGGER_NAME = "cliutil";
    constexpr const char* MESSAGE_LOG_NAME = "cliutil-messages";
}

namespace tags {
    constexpr const char* BAR = "%bar%";
    constexpr const char* TIME_CURRENT = "%time_current%";
    constexpr const char* TIME_PASSED = "%time_passed%";
}

namespace glyphs {
    constexpr char BAR_FILL = '#';
    constexpr char BAR_TRACK = '-';
    constexpr char CARRIAGE_RETURN = '\x0D';
}

namespace flags {
    constexpr char MESSAGE_ERROR = 'e';
    constexpr char MESSAGE_STATUS = 's';
    constexpr char MESSAGE_INFORMATION = 'i';
    constexpr char PROGRESS = 'p';
    constexpr char LOG_OVERWRITE = 'o';
    constexpr char DISABLE = '-';
}

namespace config_defaults {
    constexpr int MAX_OUTPUT_WIDTH = 80;
    constexpr const char* VERBOSITY = "sep";
    constexpr const char* LOGGING = "seio";
    
    constexpr const char* PROGRESS_CONSOLE_FORMAT = "%percent% done [%bar%] left: %eta% %rotator%";
    constexpr const char* PROGRESS_FILE_FORMAT =
        "%title%\n\n%item%/%total% [%bar%] %percent%\n\n"
        "Speed (cur):  %speed_cur%\nSpeed (avg):  %speed_avg%\n"
        "Time elapsed:\t%time_passed%\nTime left:    ~ %eta%";
    constexpr int PROGRESS_PERCENT_PRECISION = 1;
    constexpr int PROGRESS_SPEED_PRECISION = 2;
    constexpr int PROGRESS_TIME_PRECISION = 0;
    constexpr double PROGRESS_CONSOLE_REFRESH_INTERVAL = 0.5;
    constexpr double PROGRESS_FILE_REFRESH_INTERVAL = 5.0;
    constexpr std::array<const char*, 4> PROGRESS_ROTATOR = {"|", "/", "-", "\\"};
    
    inline std::vector<std::string> getRotator() {
        return std::vector<std::string>(PROGRESS_ROTATOR.begin(), PROGRESS_ROTATOR.end());
    }
    
    constexpr const char* STATUS_START_MESSAGE = "Started at %time_current%";
    constexpr const char* STATUS_END_MESSAGE = "Finished at %time_current% (+%time_passed%)";
    constexpr const char* STATUS_TIME_FORMAT = "%a, %d %b %Y %H:%M:%S %z";
    constexpr int STATUS_TIME_PRECISION = 3;
    
    constexpr size_t LOG_ROTATION_SIZE_MB = 10;
    constexpr size_t LOG_MAX_FILES = 3;
}

namespace files {
    constexpr const char* LOG_SUFFIX = ".log";
    constexpr const char* PROGRESS_SUFFIX = ".progress";
    constexpr const char* CONFIG_FILE = "cliutil.toml";
}

}}
