#pragma once

#include <string>

namespace cliutil {
namespace format {

enum class TextAlign {
    LEFT,
    RIGHT,
    CENTER,
    JUSTIFY
};

struct AlignOptions {
    TextAlign align = TextAlign::LEFT;
    // Justify the last line of every paragraph too.
    bool justify_all_lines = false;
    int width = 76;
    std::string newline = "\n";
    bool cut_words = true;
    int paragraph_separator_lines = 1;
    int paragraph_indent = 0;
};

// Collapses runs of spaces, then wraps and aligns every paragraph
// (newline-separated) to options.width.
std::string textAlign(const std::string& text, const AlignOptions& options = AlignOptions{});

// Breaks text at spaces so lines do not exceed width. Words longer than width
// are cut when cut_words is set. Existing line breaks are kept.
std::string wordWrap(const std::string& text, int width, const std::string& line_break, bool cut_words);

// Positive levels prepend indent to every line, negative levels strip up to
// that many leading indents.
std::string textIndent(const std::string& text, const std::string& indent, int levels,
                       const std::string& newline = "\n");

}}
