#include "test_utils.hpp"
#include "cliutil/common/config.hpp"
#include "cliutil/common/error_codes.hpp"
#include "cliutil/core/session.hpp"
#include <sstream>

using namespace cliutil;
using cliutil::core::Session;
using cliutil::core::SessionOptions;

class SessionTest : public ::testing::Test {
protected:
    TempDir dir;
    FakeClock clock;
    std::ostringstream out;
    
    SessionOptions options(const std::string& verbosity, const std::string& logging) {
        SessionOptions result;
        result.script_name = "job";
        result.verbosity = verbosity;
        result.logging = logging;
        result.log_file = dir.file("job.log");
        result.progress_file = dir.file("job.progress");
        result.status.start_message = "Started";
        result.status.end_message = "Finished (+%time_passed%)";
        result.status.time_format = "%Y";
        result.status.time_precision = 3;
        result.progress = make_progress_config(0);
        return result;
    }
    
    std::unique_ptr<Session> session(const std::string& verbosity, const std::string& logging) {
        return std::make_unique<Session>(options(verbosity, logging), out, clock.clock());
    }
};

TEST_F(SessionTest, prints_status_and_messages) {
    auto s = session("sei", "-");
    s->start();
    s->info("hello");
    s->error("oops");
    s->end();
    
    EXPECT_EQ("Started\nhello\noops\nFinished (+0.000s)\n", out.str());
}

TEST_F(SessionTest, end_message_reports_time_passed) {
    auto s = session("s", "-");
    s->start();
    clock.advance(65.0);
    s->end();
    
    EXPECT_THAT(out.str(), HasSubstr("Finished (+1m 05.000s)\n"));
}

TEST_F(SessionTest, verbosity_filters_console_messages) {
    auto s = session("s", "-");
    s->info("hidden");
    s->status("shown");
    
    EXPECT_EQ("shown\n", out.str());
}

TEST_F(SessionTest, time_passed_freezes_at_end) {
    auto s = session("-", "-");
    s->start();
    clock.advance(5.0);
    s->end();
    clock.advance(5.0);
    
    EXPECT_DOUBLE_EQ(5.0, s->timePassed());
    EXPECT_EQ("5.000s", s->timePassedText());
}

TEST_F(SessionTest, end_is_idempotent) {
    auto s = session("s", "-");
    s->start();
    s->end();
    s->end();
    
    EXPECT_EQ("Started\nFinished (+0.000s)\n", out.str());
}

TEST_F(SessionTest, destructor_ends_started_session) {
    {
        auto s = session("s", "-");
        s->start();
    }
    EXPECT_THAT(out.str(), HasSubstr("Finished"));
}

TEST_F(SessionTest, destructor_without_start_prints_nothing) {
    {
        auto s = session("s", "-");
    }
    EXPECT_EQ("", out.str());
}

TEST_F(SessionTest, invalid_flags_raise) {
    EXPECT_THROW(session("sx", "-"), common::ConfigurationError);
    EXPECT_THROW(session("s", "sq"), common::ConfigurationError);
}

TEST_F(SessionTest, logged_messages_go_to_message_log) {
    {
        auto s = session("-", "io");
        s->start();
        s->info("in the log");
        s->status("not in the log");
    }
    
    std::string content = read_file(dir.file("job.log"));
    EXPECT_THAT(content, StartsWith("[Log started at "));
    EXPECT_THAT(content, HasSubstr("s] in the log\n"));
    EXPECT_EQ(std::string::npos, content.find("not in the log"));
    EXPECT_THAT(content, HasSubstr("[Log finished at "));
}

TEST_F(SessionTest, progress_is_drawn_and_erased_before_messages) {
    auto s = session("pi", "-");
    s->resetProgress(10);
    s->updateProgress(1);
    clock.advance(1.0);
    s->updateProgress(2);
    
    EXPECT_THAT(out.str(), StartsWith("2/10"));
    
    s->info("note");
    EXPECT_THAT(out.str(), HasSubstr("\r" + std::string(40, ' ') + "\rnote\n"));
}

TEST_F(SessionTest, progress_file_is_written) {
    auto s = session("-", "p");
    s->resetProgress(10, std::string("Copy"));
    s->updateProgress(1);
    clock.advance(1.0);
    s->updateProgress(2);
    
    EXPECT_EQ("2", read_file(dir.file("job.progress")));
    EXPECT_EQ("Copy", s->tracker().tagValues().get(progress::ProgressTag::TITLE));
}

TEST_F(SessionTest, progress_title_defaults_to_script_name) {
    auto s = session("p", "-");
    s->resetProgress(10);
    EXPECT_EQ("job", s->tracker().tagValues().get(progress::ProgressTag::TITLE));
}

TEST_F(SessionTest, progress_disabled_without_flags) {
    auto s = session("se", "se");
    s->resetProgress(10);
    EXPECT_FALSE(s->tracker().isActive());
}

TEST(SessionOptions, from_config_derives_file_names) {
    common::Config::instance().reset();
    SessionOptions options = SessionOptions::fromConfig(common::Config::instance(), "job");
    
    EXPECT_EQ("job.log", options.log_file);
    EXPECT_EQ("job.progress", options.progress_file);
    EXPECT_EQ("sep", options.verbosity);
    EXPECT_EQ("job", options.progress.operation_title);
    EXPECT_EQ(80, options.progress.max_output_width);
}
