#include "cliutil/core/output_flags.hpp"
#include "cliutil/common/constants.hpp"
#include "cliutil/common/error_codes.hpp"

namespace cliutil {
namespace core {

namespace flags = constants::flags;

namespace {

[[noreturn]] void throwUnknownFlag(const std::string& component,
                                   const std::string& flags_text, char flag) {
    throw common::ConfigurationError(
        common::ErrorCode::CONFIG_INVALID_FLAGS,
        common::makeContext(component, {
            {"flags", flags_text},
            {"flag", std::string(1, flag)}
        }));
}

}

std::string to_string(MessageType type) {
    switch (type) {
        case MessageType::STATUS: return "status";
        case MessageType::ERROR: return "error";
        case MessageType::INFORMATION: return "information";
    }
    return "unknown";
}

VerbosityOptions VerbosityOptions::parse(const std::string& flags_text) {
    VerbosityOptions options;
    
    for (char flag : flags_text) {
        switch (flag) {
            case flags::MESSAGE_STATUS: options.status = true; break;
            case flags::MESSAGE_ERROR: options.error = true; break;
            case flags::MESSAGE_INFORMATION: options.information = true; break;
            case flags::PROGRESS: options.progress = true; break;
            case flags::DISABLE: break;
            default:
                throwUnknownFlag("VerbosityOptions", flags_text, flag);
        }
    }
    
    return options;
}

bool VerbosityOptions::shows(MessageType type) const {
    switch (type) {
        case MessageType::STATUS: return status;
        case MessageType::ERROR: return error;
        case MessageType::INFORMATION: return information;
    }
    return false;
}

std::string VerbosityOptions::toString() const {
    std::string result;
    if (status) result += flags::MESSAGE_STATUS;
    if (error) result += flags::MESSAGE_ERROR;
    if (information) result += flags::MESSAGE_INFORMATION;
    if (progress) result += flags::PROGRESS;
    return result.empty() ? std::string(1, flags::DISABLE) : result;
}

LoggingOptions LoggingOptions::parse(const std::string& flags_text) {
    LoggingOptions options;
    
    for (char flag : flags_text) {
        switch (flag) {
            case flags::MESSAGE_STATUS: options.status = true; break;
            case flags::MESSAGE_ERROR: options.error = true; break;
            case flags::MESSAGE_INFORMATION: options.information = true; break;
            case flags::PROGRESS: options.progress = true; break;
            case flags::LOG_OVERWRITE: options.overwrite = true; break;
            case flags::DISABLE: break;
            default:
                throwUnknownFlag("LoggingOptions", flags_text, flag);
        }
    }
    
    return options;
}

bool LoggingOptions::logs(MessageType type) const {
    switch (type) {
        case MessageType::STATUS: return status;
        case MessageType::ERROR: return error;
        case MessageType::INFORMATION: return information;
    }
    return false;
}

std::string LoggingOptions::toString() const {
    std::string result;
    if (status) result += flags::MESSAGE_STATUS;
    if (error) result += flags::MESSAGE_ERROR;
    if (information) result += flags::MESSAGE_INFORMATION;
    if (progress) result += flags::PROGRESS;
    if (overwrite) result += flags::LOG_OVERWRITE;
    return result.empty() ? std::string(1, flags::DISABLE) : result;
}

}}
