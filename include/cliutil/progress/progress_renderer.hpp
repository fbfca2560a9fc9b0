#pragma once

#include "progress_tags.hpp"
#include <optional>
#include <string>

namespace cliutil {
namespace progress {

enum class RenderTarget {
    CONSOLE,
    FILE
};

// Fill glyphs for round(done_part * length) cells, track glyphs for the rest.
// An unknown done part draws an empty track, a non-positive length draws nothing.
std::string createProgressBar(std::optional<double> done_part, int length);

// Expands the tags of a template and sizes "%bar%" so the line fits max_width.
// For files the bar length is measured on the first line holding "%bar%".
// Console text without a bar is right-padded to max_width.
std::string renderProgress(const std::string& format,
                           const TagValues& values,
                           std::optional<double> done_part,
                           int max_width,
                           RenderTarget target);

}}
