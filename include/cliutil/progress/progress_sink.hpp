#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <utility>

namespace cliutil {
namespace progress {

// Writers throw common::SinkWriteError. The tracker reports and survives them.

class ConsoleSink {
public:
    virtual ~ConsoleSink() = default;
    
    // Writes text in place, without a trailing newline.
    virtual void draw(const std::string& text) = 0;
    
    // Blanks `length` characters of the current line and returns to its start.
    virtual void erase(size_t length) = 0;
};

class FileSink {
public:
    virtual ~FileSink() = default;
    
    virtual void overwrite(const std::string& text) = 0;
};

class StreamConsoleSink : public ConsoleSink {
public:
    explicit StreamConsoleSink(std::ostream& out) : out_(out) {}
    
    void draw(const std::string& text) override;
    void erase(size_t length) override;

private:
    std::ostream& out_;
    
    void checkStream();
};

class PathFileSink : public FileSink {
public:
    explicit PathFileSink(std::string path) : path_(std::move(path)) {}
    
    void overwrite(const std::string& text) override;
    
    const std::string& path() const { return path_; }

private:
    std::string path_;
};

}}
