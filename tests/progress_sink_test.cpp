#include "test_utils.hpp"
#include "cliutil/common/error_codes.hpp"
#include "cliutil/progress/progress_sink.hpp"
#include <sstream>

using namespace cliutil::progress;
using cliutil::common::SinkWriteError;

TEST(StreamConsoleSink, draws_without_newline) {
    std::ostringstream out;
    StreamConsoleSink sink(out);
    sink.draw("50% done");
    EXPECT_EQ("50% done", out.str());
}

TEST(StreamConsoleSink, erase_blanks_the_line) {
    std::ostringstream out;
    StreamConsoleSink sink(out);
    sink.draw("abc");
    sink.erase(3);
    EXPECT_EQ("abc\r   \r", out.str());
}

TEST(StreamConsoleSink, failed_stream_raises) {
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    StreamConsoleSink sink(out);
    EXPECT_THROW(sink.draw("x"), SinkWriteError);
}

TEST(PathFileSink, overwrites_previous_content) {
    TempDir dir;
    PathFileSink sink(dir.file("job.progress"));
    
    sink.overwrite("first, longer text");
    sink.overwrite("second");
    
    EXPECT_EQ("second", read_file(dir.file("job.progress")));
}

TEST(PathFileSink, unwritable_path_raises) {
    TempDir dir;
    PathFileSink sink(dir.path().string());
    EXPECT_THROW(sink.overwrite("x"), SinkWriteError);
}
