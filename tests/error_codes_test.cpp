#include "test_utils.hpp"
#include "cliutil/common/error_codes.hpp"

using namespace cliutil::common;

TEST(ErrorCodeHelper, known_code) {
    EXPECT_STREQ("CONFIG_EMPTY_ROTATOR", ErrorCodeHelper::toString(ErrorCode::CONFIG_EMPTY_ROTATOR));
    EXPECT_STREQ("Rotator sequence must not be empty",
                 ErrorCodeHelper::getMessage(ErrorCode::CONFIG_EMPTY_ROTATOR));
}

TEST(CliUtilError, message_contains_code_and_details) {
    ConfigurationError error(ErrorCode::CONFIG_INVALID_WIDTH,
                             makeContext("Progress", {{"max_output_width", "0"}}));
    
    EXPECT_EQ(ErrorCode::CONFIG_INVALID_WIDTH, error.code());
    EXPECT_EQ("Progress", error.context().component);
    EXPECT_THAT(error.what(), StartsWith("CONFIG_INVALID_WIDTH: Maximum output width must be positive"));
    EXPECT_THAT(error.what(), HasSubstr("max_output_width=0"));
}

TEST(CliUtilError, subclasses_are_catchable_as_base) {
    try {
        throw SinkWriteError(ErrorCode::SINK_FILE_WRITE_FAILED, makeContext("PathFileSink"));
    } catch (const CliUtilError& e) {
        EXPECT_EQ(ErrorCode::SINK_FILE_WRITE_FAILED, e.code());
    }
}

TEST(ErrorCodeHelper, unknown_code_falls_back) {
    EXPECT_STREQ("UNKNOWN_ERROR", ErrorCodeHelper::toString(static_cast<ErrorCode>(999)));
}

TEST(formatContext, component_then_details) {
    EXPECT_EQ("Session: flags=x, kind=verbosity",
              formatContext(makeContext("Session", {{"kind", "verbosity"}, {"flags", "x"}})));
    EXPECT_EQ("Session", formatContext(makeContext("Session")));
}
