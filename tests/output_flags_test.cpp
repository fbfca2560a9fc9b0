#include <gtest/gtest.h>
#include "cliutil/common/error_codes.hpp"
#include "cliutil/core/output_flags.hpp"

using namespace cliutil::core;
using cliutil::common::ConfigurationError;

TEST(VerbosityOptions, parses_flags) {
    VerbosityOptions options = VerbosityOptions::parse("sep");
    
    EXPECT_TRUE(options.status);
    EXPECT_TRUE(options.error);
    EXPECT_FALSE(options.information);
    EXPECT_TRUE(options.progress);
    EXPECT_TRUE(options.shows(MessageType::ERROR));
    EXPECT_FALSE(options.shows(MessageType::INFORMATION));
}

TEST(VerbosityOptions, dash_disables_everything) {
    VerbosityOptions options = VerbosityOptions::parse("-");
    EXPECT_FALSE(options.status || options.error || options.information || options.progress);
    EXPECT_EQ("-", options.toString());
}

TEST(VerbosityOptions, overwrite_flag_is_unknown) {
    EXPECT_THROW(VerbosityOptions::parse("so"), ConfigurationError);
}

TEST(LoggingOptions, parses_flags) {
    LoggingOptions options = LoggingOptions::parse("seio");
    
    EXPECT_TRUE(options.messageLogEnabled());
    EXPECT_TRUE(options.overwrite);
    EXPECT_FALSE(options.progress);
    EXPECT_TRUE(options.logs(MessageType::INFORMATION));
    EXPECT_EQ("seio", options.toString());
}

TEST(LoggingOptions, progress_only_has_no_message_log) {
    LoggingOptions options = LoggingOptions::parse("p");
    EXPECT_TRUE(options.progress);
    EXPECT_FALSE(options.messageLogEnabled());
}

TEST(LoggingOptions, unknown_flag_raises) {
    EXPECT_THROW(LoggingOptions::parse("sx"), ConfigurationError);
}
