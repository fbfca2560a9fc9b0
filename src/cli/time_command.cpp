#include "time_command.hpp"
#include "cliutil/common/error_codes.hpp"
#include "cliutil/format/string_utils.hpp"
#include "cliutil/format/time_format.hpp"
#include <cstdlib>
#include <iostream>

namespace cliutil {
namespace cli {

namespace {

// Plain number of seconds (fractions allowed) or "<integer><unit>".
double parseDuration(const std::string& text) {
    char* end = nullptr;
    double seconds = std::strtod(text.c_str(), &end);
    if (end != text.c_str() && *end == '\0') {
        return seconds;
    }
    return static_cast<double>(format::parseTimeSeconds(text));
}

}

TimeCommand::TimeCommand()
    : MainCommand("time", "Format a duration") {
}

void TimeCommand::setup() {
    subcommand_->add_option("duration", duration_, "Seconds, or an integer with unit s, m, h, d or w")
        ->required();
    subcommand_->add_option("-p,--precision", precision_, "Digits after the decimal point of seconds")
        ->check(CLI::NonNegativeNumber);
    subcommand_->add_option("-n,--naming", naming_level_,
                           "Unit naming: 0 clock, 1 short, 2 abbreviated, 3 full")
        ->check(CLI::Range(0, 3));
    subcommand_->add_flag("-k,--keep-empty", keep_empty_units_, "Keep leading units that are zero");
    subcommand_->add_flag("-z,--two-digit", two_digit_, "Zero-pad hours, minutes and seconds");
}

int TimeCommand::execute() {
    try {
        double seconds = parseDuration(duration_);
        std::cout << format::formatDuration(seconds, precision_, !keep_empty_units_,
                                            naming_level_, two_digit_) << "\n";
        return 0;
    } catch (const common::ParameterError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}}
