#pragma once

#include <string>

namespace cliutil {
namespace core {

enum class MessageType {
    STATUS,
    ERROR,
    INFORMATION
};

std::string to_string(MessageType type);

// Console output switches, e.g. "sep". A string made only of '-' disables all.
struct VerbosityOptions {
    bool status = false;
    bool error = false;
    bool information = false;
    bool progress = false;
    
    // Throws common::ConfigurationError on an unknown flag character.
    static VerbosityOptions parse(const std::string& flags);
    
    bool shows(MessageType type) const;
    std::string toString() const;
};

// Message log and progress file switches, e.g. "seio".
struct LoggingOptions {
    bool status = false;
    bool error = false;
    bool information = false;
    bool progress = false;
    bool overwrite = false;
    
    static LoggingOptions parse(const std::string& flags);
    
    bool logs(MessageType type) const;
    bool messageLogEnabled() const { return status || error || information; }
    std::string toString() const;
};

}}
