#pragma once

#include "error_framework.hpp"
#include <stdexcept>
#include <string>

namespace cliutil {
namespace common {

enum class ErrorCode {
    CONFIG_INVALID_TOTAL = 100,
    CONFIG_INVALID_INTERVAL = 101,
    CONFIG_EMPTY_ROTATOR = 102,
    CONFIG_INVALID_ROTATOR_GLYPH = 103,
    CONFIG_INVALID_WIDTH = 104,
    CONFIG_INVALID_PRECISION = 105,
    CONFIG_INVALID_FLAGS = 106,
    CONFIG_PARSE_FAILED = 107,
    
    PARAMETER_NOT_DECLARED = 200,
    PARAMETER_TYPE_MISMATCH = 201,
    PARAMETER_INVALID_VALUE = 202,
    
    SINK_CONSOLE_WRITE_FAILED = 300,
    SINK_FILE_WRITE_FAILED = 301,
    LOG_OPEN_FAILED = 302
};

using ErrorCodeHelper = ErrorRegistry<ErrorCode>;

class CliUtilError : public std::runtime_error {
public:
    CliUtilError(ErrorCode code, ErrorContext context);
    
    ErrorCode code() const { return code_; }
    const ErrorContext& context() const { return context_; }

private:
    ErrorCode code_;
    ErrorContext context_;
    
    static std::string buildMessage(ErrorCode code, const ErrorContext& context);
};

// Invalid session, output or program configuration. Raised before any work starts.
class ConfigurationError : public CliUtilError {
public:
    using CliUtilError::CliUtilError;
};

// A progress sink could not be written. Recoverable: callers log and continue.
class SinkWriteError : public CliUtilError {
public:
    using CliUtilError::CliUtilError;
};

class ParameterError : public CliUtilError {
public:
    using CliUtilError::CliUtilError;
};

ErrorContext makeContext(const std::string& component,
                         std::map<std::string, std::string> details = {});

template<>
const ErrorRegistry<ErrorCode>::Table& ErrorRegistry<ErrorCode>::table();

}}
