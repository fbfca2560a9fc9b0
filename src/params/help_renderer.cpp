#include "cliutil/params/help_renderer.hpp"
#include "cliutil/format/string_utils.hpp"
#include "cliutil/format/text_align.hpp"
#include "cliutil/format/time_format.hpp"
#include <sstream>

namespace cliutil {
namespace params {

namespace {

constexpr const char* INDENT = "  ";

std::string underlined(const std::string& text) {
    return text + "\n" + std::string(text.size(), '-');
}

format::AlignOptions leftAligned(int width) {
    format::AlignOptions options;
    options.align = format::TextAlign::LEFT;
    options.width = width;
    options.newline = "\n";
    options.cut_words = true;
    options.paragraph_separator_lines = 1;
    options.paragraph_indent = 0;
    return options;
}

}

std::string HelpRenderer::render(const ParameterSet& parameters) const {
    std::ostringstream oss;
    
    std::string title = info_.script_name + " v. " + info_.script_version;
    std::string rule(title.size(), '-');
    oss << rule << "\n" << title << "\n" << rule;
    
    if (!info_.description.empty()) {
        std::string text = format::textAlign(info_.description, leftAligned(info_.width - 2));
        oss << "\n\n" << format::textIndent(text, INDENT, 1);
    }
    
    if (!parameters.declarations().empty()) {
        oss << "\n\n" << underlined("Parameters");
        for (const auto& declaration : parameters.declarations()) {
            oss << renderParameter(declaration);
        }
    }
    
    oss << "\n";
    return oss.str();
}

std::string HelpRenderer::renderParameter(const ParameterDeclaration& declaration) const {
    std::string usage = "  * " + declaration.name + " (" + declaration.alias + ") [" +
                        to_string(declaration.type) + "]; default: " + defaultText(declaration);
    
    std::string result = "\n\n" + usage;
    
    if (!declaration.description.empty()) {
        std::string text = format::textAlign(declaration.description, leftAligned(info_.width - 4));
        result += "\n\n" + format::textIndent(text, INDENT, 2);
    }
    
    return result;
}

std::string HelpRenderer::defaultText(const ParameterDeclaration& declaration) {
    const ParameterValue& value = declaration.default_value;
    
    switch (declaration.type) {
        case ParameterType::INTEGER:
            return std::to_string(std::get<long long>(value));
        case ParameterType::STRING:
            return "\"" + std::get<std::string>(value) + "\"";
        case ParameterType::BOOLEAN:
            return std::get<bool>(value) ? "true" : "false";
        case ParameterType::ARRAY:
            return format::joinStrings(std::get<std::vector<std::string>>(value), "+");
        case ParameterType::TIME_SECONDS: {
            const std::string& raw = std::get<std::string>(value);
            return raw + " (" + format::formatDuration(
                static_cast<double>(format::parseTimeSeconds(raw))) + ")";
        }
    }
    return "";
}

}}
