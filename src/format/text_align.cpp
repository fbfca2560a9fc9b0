#include "cliutil/format/text_align.hpp"
#include "cliutil/format/string_utils.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

namespace cliutil {
namespace format {

namespace {

std::string collapseSpaces(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        if (c == ' ' && !result.empty() && result.back() == ' ') {
            continue;
        }
        result += c;
    }
    return result;
}

std::string trim(const std::string& text) {
    static const std::string WHITESPACE(" \t\n\r\v\0", 6);
    size_t begin = text.find_first_not_of(WHITESPACE);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(WHITESPACE);
    return text.substr(begin, end - begin + 1);
}

std::string padLine(const std::string& line, int width, TextAlign align) {
    int add = width - static_cast<int>(line.size());
    if (line.empty() || add <= 0) {
        return line;
    }
    if (align == TextAlign::RIGHT) {
        return std::string(add, ' ') + line;
    }
    int left = add / 2;
    return std::string(left, ' ') + line + std::string(add - left, ' ');
}

std::string justifyLine(const std::string& line, int width) {
    int spaces_to_add = width - static_cast<int>(line.size());
    std::vector<std::string> words = splitString(line, " ");
    size_t word_count = words.size();
    
    if (word_count > 1 && spaces_to_add > 0) {
        double spaces_per_gap = static_cast<double>(spaces_to_add) / (word_count - 1);
        double pending = 0.0;
        
        for (size_t w = 0; w + 1 < word_count; ++w) {
            pending += spaces_per_gap;
            int spaces = static_cast<int>(std::round(pending));
            if (spaces > 0) {
                words[w] += std::string(spaces, ' ');
                pending -= spaces;
            }
        }
    }
    
    return joinStrings(words, " ");
}

}

std::string wordWrap(const std::string& text, int width, const std::string& line_break, bool cut_words) {
    if (text.empty() || line_break.empty()) {
        return text;
    }
    if (width <= 0) {
        cut_words = false;
    }
    
    const long long length = static_cast<long long>(text.size());
    const long long break_length = static_cast<long long>(line_break.size());
    
    std::string result;
    long long last_start = 0;
    long long last_space = 0;
    long long current = 0;
    
    for (current = 0; current < length; ++current) {
        if (text[current] == line_break[0]
            && current + break_length < length
            && text.compare(current, break_length, line_break) == 0) {
            result.append(text, last_start, current - last_start + break_length);
            current += break_length - 1;
            last_start = last_space = current + 1;
        } else if (text[current] == ' ') {
            if (current - last_start >= width) {
                result.append(text, last_start, current - last_start);
                result += line_break;
                last_start = current + 1;
            }
            last_space = current;
        } else if (current - last_start >= width && cut_words && last_start >= last_space) {
            result.append(text, last_start, current - last_start);
            result += line_break;
            last_start = last_space = current;
        } else if (current - last_start >= width && last_start < last_space) {
            result.append(text, last_start, last_space - last_start);
            result += line_break;
            last_start = last_space = last_space + 1;
        }
    }
    
    if (last_start != current) {
        result.append(text, last_start, current - last_start);
    }
    
    return result;
}

std::string textAlign(const std::string& text, const AlignOptions& options) {
    const std::string& nl = options.newline;
    const std::string paragraph_break = repeatString(nl, options.paragraph_separator_lines + 1);
    const std::string indent(static_cast<size_t>(std::max(options.paragraph_indent, 0)), '\0');
    
    std::string source = trim(collapseSpaces(text));
    
    switch (options.align) {
        case TextAlign::LEFT: {
            if (!indent.empty()) {
                source = indent + replaceAll(source, nl, nl + indent);
            }
            source = replaceAll(source, nl, paragraph_break);
            source = wordWrap(source, options.width, nl, options.cut_words);
            return replaceAll(source, std::string(1, '\0'), " ");
        }
        
        case TextAlign::CENTER:
        case TextAlign::RIGHT: {
            source = replaceAll(source, nl, paragraph_break);
            source = wordWrap(source, options.width, nl, options.cut_words);
            std::vector<std::string> lines = splitString(source, nl);
            for (auto& line : lines) {
                line = padLine(line, options.width, options.align);
            }
            return joinStrings(lines, nl);
        }
        
        case TextAlign::JUSTIFY: {
            std::vector<std::string> paragraphs = splitString(source, nl);
            
            for (auto& paragraph : paragraphs) {
                paragraph = trim(paragraph);
                
                if (!indent.empty()) {
                    paragraph = indent + paragraph;
                }
                
                paragraph = wordWrap(paragraph, options.width, nl, options.cut_words);
                std::vector<std::string> lines = splitString(paragraph, nl);
                
                size_t justified = options.justify_all_lines ? lines.size() : lines.size() - 1;
                for (size_t l = 0; l < justified; ++l) {
                    lines[l] = justifyLine(lines[l], options.width);
                }
                
                if (!indent.empty()) {
                    lines[0] = replaceAll(lines[0], std::string(1, '\0'), " ");
                }
                
                paragraph = joinStrings(lines, nl);
            }
            
            return joinStrings(paragraphs, paragraph_break);
        }
    }
    
    return source;
}

std::string textIndent(const std::string& text, const std::string& indent, int levels,
                       const std::string& newline) {
    if (levels == 0 || indent.empty()) {
        return text;
    }
    
    std::vector<std::string> lines = splitString(text, newline);
    
    if (levels < 0) {
        for (auto& line : lines) {
            int remove = 0;
            for (size_t pos = 0; pos < line.size(); pos += indent.size()) {
                if (line.compare(pos, indent.size(), indent) != 0) {
                    break;
                }
                if (remove >= -levels) {
                    break;
                }
                ++remove;
            }
            line = line.substr(remove * indent.size());
        }
    } else {
        std::string prefix = repeatString(indent, levels);
        for (auto& line : lines) {
            line = prefix + line;
        }
    }
    
    return joinStrings(lines, newline);
}

}}
