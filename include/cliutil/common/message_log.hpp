#pragma once

#include <spdlog/spdlog.h>
#include <chrono>
#include <memory>
#include <string>

namespace cliutil {
namespace common {

// Script message log. Opened on the first message, closed with a footer.
// A failed open is reported once and never retried.
class MessageLog {
public:
    MessageLog(std::string path, bool overwrite);
    ~MessageLog();
    
    MessageLog(const MessageLog&) = delete;
    MessageLog& operator=(const MessageLog&) = delete;
    
    void write(const std::string& message);
    void close();
    
    bool isOpen() const { return logger_ != nullptr; }
    bool hasFailed() const { return open_failed_; }
    const std::string& path() const { return path_; }

private:
    std::string path_;
    bool overwrite_;
    bool open_failed_ = false;
    std::shared_ptr<spdlog::logger> logger_;
    std::chrono::steady_clock::time_point start_time_;
    
    bool open();
    double secondsSinceStart() const;
};

}}
