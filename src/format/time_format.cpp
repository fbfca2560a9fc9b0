#include "cliutil/format/time_format.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <ctime>

namespace cliutil {
namespace format {

namespace {

struct UnitNames {
    const char* second;
    const char* seconds;
    const char* minute;
    const char* minutes;
    const char* hour;
    const char* hours;
    const char* day;
    const char* days;
    const char* week;
    const char* weeks;
};

const UnitNames& unitNames(int level) {
    static const UnitNames NAMES[] = {
        {"", "", "", "", "", "", "d", "d", "w", "w"},
        {"s", "s", "m", "m", "h", "h", "d", "d", "w", "w"},
        {" sec", " sec", " min", " min", " hr", " hr", " dy", " dy", " wk", " wk"},
        {" second", " seconds", " minute", " minutes", " hour", " hours",
         " day", " days", " week", " weeks"}
    };
    return NAMES[std::clamp(level, 0, 3)];
}

double roundTo(double value, int precision) {
    double factor = std::pow(10.0, precision);
    return std::round(value * factor) / factor;
}

long long wholeUnits(double value) {
    return static_cast<long long>(std::floor(value));
}

const char* pick(long long count, const char* singular, const char* plural) {
    return count % 10 != 1 ? plural : singular;
}

}

std::string formatDuration(double seconds, int precision, bool strip_empty_units,
                           int units_naming_level, bool two_digit_hms) {
    precision = std::max(precision, 0);
    seconds = roundTo(seconds, precision);
    
    const UnitNames& names = unitNames(units_naming_level);
    const bool named = units_naming_level > 0;
    const bool keep_all = !strip_empty_units;
    const double whole = std::max(seconds, 0.0);
    
    std::string result;
    
    double seconds_fraction = std::fmod(seconds, 60.0);
    if (named) {
        bool pad = two_digit_hms && seconds_fraction < 10 && (seconds >= 60 || keep_all);
        bool plural = wholeUnits(seconds_fraction) % 10 != 1 || precision > 0;
        result = (pad ? "0" : "") 
               + fmt::format("{:.{}f}{}", seconds_fraction, precision, 
                             plural ? names.seconds : names.second);
    } else {
        bool pad = (two_digit_hms || seconds_fraction < 10) && (seconds >= 60 || keep_all);
        result = (pad ? "0" : "") + fmt::format("{:.{}f}", seconds_fraction, precision);
    }
    
    if (seconds >= 60 || keep_all) {
        long long minutes = wholeUnits(whole / 60) % 60;
        if (named) {
            bool pad = two_digit_hms && (seconds >= 3600 || keep_all);
            result = fmt::format(fmt::runtime(pad ? "{:02d}{}" : "{:d}{}"), minutes,
                                 pick(minutes, names.minute, names.minutes)) + " " + result;
        } else {
            result = fmt::format("{:02d}", minutes) + ":" + result;
        }
    }
    
    if (seconds >= 3600 || keep_all) {
        long long hours = wholeUnits(whole / 3600) % 24;
        if (named) {
            bool pad = two_digit_hms && (seconds >= 86400 || keep_all);
            result = fmt::format(fmt::runtime(pad ? "{:02d}{}" : "{:d}{}"), hours,
                                 pick(hours, names.hour, names.hours)) + " " + result;
        } else {
            result = fmt::format("{:02d}", hours) + ":" + result;
        }
    }
    
    if (seconds >= 86400 || keep_all) {
        long long days = wholeUnits(whole / 86400) % 7;
        result = fmt::format("{:d}{}", days, pick(days, names.day, names.days)) + " " + result;
    }
    
    if (seconds >= 604800 || keep_all) {
        long long weeks = wholeUnits(whole / 604800);
        result = fmt::format("{:d}{}", weeks, pick(weeks, names.week, names.weeks)) + " " + result;
    }
    
    return result;
}

std::string formatTimestamp(std::chrono::system_clock::time_point when, const std::string& format) {
    std::time_t time = std::chrono::system_clock::to_time_t(when);
    std::tm tm_buf{};
    localtime_r(&time, &tm_buf);
    
    char buffer[256];
    size_t length = std::strftime(buffer, sizeof(buffer), format.c_str(), &tm_buf);
    return std::string(buffer, length);
}

std::string formatCurrentTime(const std::string& format) {
    return formatTimestamp(std::chrono::system_clock::now(), format);
}

}}
