#include <gtest/gtest.h>
#include "cliutil/common/error_codes.hpp"
#include "cliutil/progress/progress_config.hpp"
#include <limits>

using namespace cliutil::progress;
using cliutil::common::ConfigurationError;
using cliutil::common::ErrorCode;

namespace {

ErrorCode code_of(const ProgressConfig& config) {
    try {
        config.validate();
    } catch (const ConfigurationError& e) {
        return e.code();
    }
    ADD_FAILURE() << "validate() did not throw";
    return ErrorCode::CONFIG_PARSE_FAILED;
}

}

TEST(ProgressConfigBuilder, defaults_are_valid) {
    ProgressConfig config = ProgressConfigBuilder().build();
    
    EXPECT_EQ(0, config.total_items);
    EXPECT_DOUBLE_EQ(0.5, config.console_refresh_interval);
    EXPECT_DOUBLE_EQ(5.0, config.file_refresh_interval);
    EXPECT_EQ(80, config.max_output_width);
    EXPECT_EQ((std::vector<std::string>{"|", "/", "-", "\\"}), config.rotator_sequence);
    EXPECT_EQ("%percent% done [%bar%] left: %eta% %rotator%", config.console_format);
}

TEST(ProgressConfigBuilder, setters_chain) {
    ProgressConfig config = ProgressConfigBuilder()
        .totalItems(50)
        .refreshIntervals(1.0, 2.0)
        .maxOutputWidth(60)
        .precisions(2, 3, 1)
        .title("Copy")
        .build();
    
    EXPECT_EQ(50, config.total_items);
    EXPECT_DOUBLE_EQ(2.0, config.file_refresh_interval);
    EXPECT_EQ(60, config.max_output_width);
    EXPECT_EQ(3, config.speed_precision);
    EXPECT_EQ("Copy", config.operation_title);
}

TEST(ProgressConfigBuilder, build_validates) {
    EXPECT_THROW(ProgressConfigBuilder().totalItems(-1).build(), ConfigurationError);
}

TEST(ProgressConfig, validation_codes) {
    ProgressConfig base = ProgressConfigBuilder().totalItems(10).build();
    
    ProgressConfig config = base;
    config.total_items = -5;
    EXPECT_EQ(ErrorCode::CONFIG_INVALID_TOTAL, code_of(config));
    
    config = base;
    config.file_refresh_interval = -1;
    EXPECT_EQ(ErrorCode::CONFIG_INVALID_INTERVAL, code_of(config));
    
    config = base;
    config.console_refresh_interval = std::numeric_limits<double>::quiet_NaN();
    EXPECT_EQ(ErrorCode::CONFIG_INVALID_INTERVAL, code_of(config));
    
    config = base;
    config.rotator_sequence.clear();
    EXPECT_EQ(ErrorCode::CONFIG_EMPTY_ROTATOR, code_of(config));
    
    config = base;
    config.rotator_sequence = {"|", ""};
    EXPECT_EQ(ErrorCode::CONFIG_INVALID_ROTATOR_GLYPH, code_of(config));
    
    config = base;
    config.max_output_width = 0;
    EXPECT_EQ(ErrorCode::CONFIG_INVALID_WIDTH, code_of(config));
    
    config = base;
    config.time_precision = -1;
    EXPECT_EQ(ErrorCode::CONFIG_INVALID_PRECISION, code_of(config));
}

TEST(ProgressConfig, zero_intervals_are_allowed) {
    ProgressConfig config = ProgressConfigBuilder().refreshIntervals(0.0, 0.0).build();
    EXPECT_NO_THROW(config.validate());
}
