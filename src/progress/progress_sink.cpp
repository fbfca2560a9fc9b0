#include "cliutil/progress/progress_sink.hpp"
#include "cliutil/common/constants.hpp"
#include "cliutil/common/error_codes.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>

namespace cliutil {
namespace progress {

void StreamConsoleSink::draw(const std::string& text) {
    out_ << text << std::flush;
    checkStream();
}

void StreamConsoleSink::erase(size_t length) {
    out_ << constants::glyphs::CARRIAGE_RETURN
         << std::string(length, ' ')
         << constants::glyphs::CARRIAGE_RETURN
         << std::flush;
    checkStream();
}

void StreamConsoleSink::checkStream() {
    if (out_) {
        return;
    }
    out_.clear();
    throw common::SinkWriteError(
        common::ErrorCode::SINK_CONSOLE_WRITE_FAILED,
        common::makeContext("StreamConsoleSink"));
}

void PathFileSink::overwrite(const std::string& text) {
    std::ofstream file(path_, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!file) {
        throw common::SinkWriteError(
            common::ErrorCode::SINK_FILE_WRITE_FAILED,
            common::makeContext("PathFileSink", {
                {"path", path_},
                {"reason", std::strerror(errno)}
            }));
    }
    
    file << text;
    file.flush();
    
    if (!file) {
        throw common::SinkWriteError(
            common::ErrorCode::SINK_FILE_WRITE_FAILED,
            common::makeContext("PathFileSink", {{"path", path_}}));
    }
}

}}
