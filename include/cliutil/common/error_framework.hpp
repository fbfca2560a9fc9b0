#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>

namespace cliutil {
namespace common {

struct ErrorDescription {
    const char* name;
    const char* text;
};

// Where an error was raised. Details end up in the exception message.
struct ErrorContext {
    std::string component;
    std::map<std::string, std::string> details;
    std::optional<std::chrono::system_clock::time_point> raised_at;
};

// Name and default text per code. Every enum used with it defines table().
template<typename Code>
class ErrorRegistry {
public:
    using Table = std::unordered_map<Code, ErrorDescription>;
    
    static const ErrorDescription& describe(Code code) {
        static const ErrorDescription unknown{"UNKNOWN_ERROR", "Unknown error"};
        const Table& entries = table();
        auto it = entries.find(code);
        return it == entries.end() ? unknown : it->second;
    }
    
    static const char* toString(Code code) { return describe(code).name; }
    static const char* getMessage(Code code) { return describe(code).text; }
    
    static const Table& table();
};

// "component: key=value, key=value"
std::string formatContext(const ErrorContext& context);

}}
