#include "test_utils.hpp"
#include "cliutil/common/message_log.hpp"
#include <filesystem>

using cliutil::common::MessageLog;

namespace {

size_t count_lines(const std::string& text) {
    size_t lines = 0;
    for (char c : text) {
        if (c == '\n') ++lines;
    }
    return lines;
}

}

TEST(MessageLog, opens_on_first_message) {
    TempDir dir;
    std::string path = dir.file("job.log");
    MessageLog log(path, true);
    
    EXPECT_FALSE(log.isOpen());
    EXPECT_FALSE(std::filesystem::exists(path));
    
    log.write("hello");
    EXPECT_TRUE(log.isOpen());
}

TEST(MessageLog, writes_header_entries_and_footer) {
    TempDir dir;
    std::string path = dir.file("job.log");
    {
        MessageLog log(path, true);
        log.write("first");
        log.write("second");
        log.close();
    }
    
    std::string content = read_file(path);
    EXPECT_THAT(content, StartsWith("[Log started at "));
    EXPECT_THAT(content, HasSubstr("s] first\n"));
    EXPECT_THAT(content, HasSubstr("s] second\n"));
    EXPECT_THAT(content, HasSubstr("[Log finished at "));
    EXPECT_EQ(4u, count_lines(content));
}

TEST(MessageLog, append_adds_separator) {
    TempDir dir;
    std::string path = dir.file("job.log");
    write_file(path, "previous run\n");
    {
        MessageLog log(path, false);
        log.write("again");
    }
    
    EXPECT_THAT(read_file(path), StartsWith("previous run\n\n---\n\n[Log started at "));
}

TEST(MessageLog, overwrite_discards_previous_content) {
    TempDir dir;
    std::string path = dir.file("job.log");
    write_file(path, "previous run\n");
    {
        MessageLog log(path, true);
        log.write("fresh");
    }
    
    std::string content = read_file(path);
    EXPECT_THAT(content, StartsWith("[Log started at "));
    EXPECT_EQ(std::string::npos, content.find("previous run"));
}

TEST(MessageLog, failed_open_is_not_retried) {
    TempDir dir;
    MessageLog log(dir.path().string(), false);
    
    EXPECT_NO_THROW(log.write("lost"));
    EXPECT_TRUE(log.hasFailed());
    EXPECT_FALSE(log.isOpen());
    EXPECT_NO_THROW(log.write("lost again"));
    EXPECT_NO_THROW(log.close());
}
