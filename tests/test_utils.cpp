#include "test_utils.hpp"
#include "cliutil/common/error_codes.hpp"
#include <fstream>
#include <random>
#include <sstream>

namespace fs = std::filesystem;

void FakeClock::advance(double seconds) {
    now_ += std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(seconds));
}

cliutil::progress::ProgressTracker::Clock FakeClock::clock() {
    return [this] { return now_; };
}

void RecordingConsoleSink::draw(const std::string& text) {
    if (fail) {
        throw cliutil::common::SinkWriteError(
            cliutil::common::ErrorCode::SINK_CONSOLE_WRITE_FAILED,
            cliutil::common::makeContext("RecordingConsoleSink"));
    }
    draws.push_back(text);
}

void RecordingConsoleSink::erase(size_t length) {
    if (fail) {
        throw cliutil::common::SinkWriteError(
            cliutil::common::ErrorCode::SINK_CONSOLE_WRITE_FAILED,
            cliutil::common::makeContext("RecordingConsoleSink"));
    }
    erases.push_back(length);
}

void RecordingFileSink::overwrite(const std::string& text) {
    ++attempts;
    if (fail) {
        throw cliutil::common::SinkWriteError(
            cliutil::common::ErrorCode::SINK_FILE_WRITE_FAILED,
            cliutil::common::makeContext("RecordingFileSink"));
    }
    writes.push_back(text);
}

TempDir::TempDir() {
    std::random_device rd;
    path_ = fs::temp_directory_path() / ("cliutil_test_" + std::to_string(rd()));
    fs::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

std::string read_file(const fs::path& path) {
    std::ifstream f(path, std::ios::binary);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

void write_file(const fs::path& path, const std::string& content) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    f << content;
}

cliutil::progress::ProgressConfig make_progress_config(int64_t total,
                                                       double console_interval,
                                                       double file_interval,
                                                       const std::string& console_format,
                                                       const std::string& file_format) {
    return cliutil::progress::ProgressConfigBuilder()
        .totalItems(total)
        .refreshIntervals(console_interval, file_interval)
        .consoleFormat(console_format)
        .fileFormat(file_format)
        .maxOutputWidth(40)
        .rotator({"a", "b", "c"})
        .precisions(1, 2, 0)
        .title("Test")
        .build();
}
