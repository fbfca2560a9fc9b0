#include "cliutil/format/string_utils.hpp"
#include "cliutil/common/error_codes.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace cliutil {
namespace format {

namespace {

std::string trimChar(const std::string& text, char c) {
    size_t begin = text.find_first_not_of(c);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(c);
    return text.substr(begin, end - begin + 1);
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool isNumeric(const std::string& text, double& value) {
    if (text.empty()) {
        return false;
    }
    const char* begin = text.c_str();
    char* end = nullptr;
    value = std::strtod(begin, &end);
    if (end == begin) {
        return false;
    }
    while (*end != '\0' && std::isspace(static_cast<unsigned char>(*end))) {
        ++end;
    }
    return *end == '\0';
}

}

std::vector<std::string> explodeString(const std::string& input, char delimiter) {
    std::vector<std::string> parts;
    
    bool single_quoted = false;
    bool double_quoted = false;
    bool next_word = false;
    std::string word;
    
    for (size_t i = 0; i < input.size(); ++i) {
        char c = input[i];
        bool keep = true;
        
        if (c == '\'') {
            if (!double_quoted) {
                single_quoted = !single_quoted;
            }
        } else if (c == '"') {
            if (!single_quoted) {
                double_quoted = !double_quoted;
            }
        } else if (c == delimiter) {
            if (!(single_quoted || double_quoted)) {
                next_word = true;
                keep = false;
            }
        }
        
        if (keep) {
            word += c;
        }
        
        if (next_word || i == input.size() - 1) {
            if (!word.empty() && (word[0] == '\'' || word[0] == '"')) {
                word = trimChar(word, word[0]);
            }
            parts.push_back(word);
            word.clear();
            next_word = false;
        }
    }
    
    return parts;
}

bool str2Bool(const std::string& text) {
    std::string value = toLower(text);
    
    if (value == "y" || value == "yes" || value == "t" || value == "true") {
        return true;
    }
    if (value == "n" || value == "no" || value == "f" || value == "false") {
        return false;
    }
    
    double number = 0.0;
    if (isNumeric(value, number)) {
        return number != 0.0;
    }
    return false;
}

long long parseTimeSeconds(const std::string& text) {
    const char* begin = text.c_str();
    char* end = nullptr;
    long long value = std::strtoll(begin, &end, 10);
    
    if (end == begin) {
        throw common::ParameterError(common::ErrorCode::PARAMETER_INVALID_VALUE,
            common::makeContext("TimeParser", {{"value", text}, {"reason", "missing number"}}));
    }
    
    std::string unit(end);
    unit.erase(std::remove_if(unit.begin(), unit.end(),
                              [](unsigned char c) { return std::isspace(c); }), unit.end());
    unit = toLower(unit);
    
    if (unit.empty() || unit == "s") return value;
    if (unit == "m") return value * 60;
    if (unit == "h") return value * 60 * 60;
    if (unit == "d") return value * 60 * 60 * 24;
    if (unit == "w") return value * 60 * 60 * 24 * 7;
    
    throw common::ParameterError(common::ErrorCode::PARAMETER_INVALID_VALUE,
        common::makeContext("TimeParser", {{"value", text}, {"reason", "unknown unit"}}));
}

long long parseLeadingInteger(const std::string& text) {
    return std::strtoll(text.c_str(), nullptr, 10);
}

std::vector<std::string> splitString(const std::string& text, const std::string& separator) {
    std::vector<std::string> parts;
    if (separator.empty()) {
        parts.push_back(text);
        return parts;
    }
    
    size_t start = 0;
    size_t pos;
    while ((pos = text.find(separator, start)) != std::string::npos) {
        parts.push_back(text.substr(start, pos - start));
        start = pos + separator.size();
    }
    parts.push_back(text.substr(start));
    return parts;
}

std::string joinStrings(const std::vector<std::string>& parts, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += separator;
        result += parts[i];
    }
    return result;
}

std::string replaceAll(std::string text, const std::string& from, const std::string& to) {
    if (from.empty()) {
        return text;
    }
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

std::string repeatString(const std::string& text, int count) {
    std::string result;
    for (int i = 0; i < count; ++i) {
        result += text;
    }
    return result;
}

}}
