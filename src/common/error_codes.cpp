#include "cliutil/common/error_codes.hpp"
#include <utility>

namespace cliutil {
namespace common {

template<>
const ErrorRegistry<ErrorCode>::Table& ErrorRegistry<ErrorCode>::table() {
    static const Table entries = {
        {ErrorCode::CONFIG_INVALID_TOTAL, {"CONFIG_INVALID_TOTAL", "Total number of items must not be negative"}},
        {ErrorCode::CONFIG_INVALID_INTERVAL, {"CONFIG_INVALID_INTERVAL", "Refresh interval must not be negative"}},
        {ErrorCode::CONFIG_EMPTY_ROTATOR, {"CONFIG_EMPTY_ROTATOR", "Rotator sequence must not be empty"}},
        {ErrorCode::CONFIG_INVALID_ROTATOR_GLYPH, {"CONFIG_INVALID_ROTATOR_GLYPH", "Rotator glyphs must not be empty"}},
        {ErrorCode::CONFIG_INVALID_WIDTH, {"CONFIG_INVALID_WIDTH", "Maximum output width must be positive"}},
        {ErrorCode::CONFIG_INVALID_PRECISION, {"CONFIG_INVALID_PRECISION", "Precision must not be negative"}},
        {ErrorCode::CONFIG_INVALID_FLAGS, {"CONFIG_INVALID_FLAGS", "Unknown output flag"}},
        {ErrorCode::CONFIG_PARSE_FAILED, {"CONFIG_PARSE_FAILED", "Configuration file could not be parsed"}},
        
        {ErrorCode::PARAMETER_NOT_DECLARED, {"PARAMETER_NOT_DECLARED", "Parameter is not declared"}},
        {ErrorCode::PARAMETER_TYPE_MISMATCH, {"PARAMETER_TYPE_MISMATCH", "Parameter value does not match its declared type"}},
        {ErrorCode::PARAMETER_INVALID_VALUE, {"PARAMETER_INVALID_VALUE", "Invalid parameter value"}},
        
        {ErrorCode::SINK_CONSOLE_WRITE_FAILED, {"SINK_CONSOLE_WRITE_FAILED", "Failed to write progress to console"}},
        {ErrorCode::SINK_FILE_WRITE_FAILED, {"SINK_FILE_WRITE_FAILED", "Failed to write progress file"}},
        {ErrorCode::LOG_OPEN_FAILED, {"LOG_OPEN_FAILED", "Failed to open log file for writing"}}
    };
    return entries;
}

std::string formatContext(const ErrorContext& context) {
    std::string details;
    for (const auto& [key, value] : context.details) {
        if (!details.empty()) {
            details += ", ";
        }
        details += key + "=" + value;
    }
    
    if (context.component.empty()) {
        return details;
    }
    return details.empty() ? context.component : context.component + ": " + details;
}

CliUtilError::CliUtilError(ErrorCode code, ErrorContext context)
    : std::runtime_error(buildMessage(code, context)),
      code_(code),
      context_(std::move(context)) {
}

std::string CliUtilError::buildMessage(ErrorCode code, const ErrorContext& context) {
    std::string message = std::string(ErrorCodeHelper::toString(code)) + ": " 
                        + ErrorCodeHelper::getMessage(code);
    
    std::string where = formatContext(context);
    if (!where.empty()) {
        message += " [" + where + "]";
    }
    return message;
}

ErrorContext makeContext(const std::string& component,
                         std::map<std::string, std::string> details) {
    ErrorContext context;
    context.component = component;
    context.details = std::move(details);
    context.raised_at = std::chrono::system_clock::now();
    return context;
}

}}
