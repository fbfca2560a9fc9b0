#pragma once

#include <string>
#include <vector>

namespace cliutil {
namespace format {

// Splits on delimiter, keeping delimiters that appear inside single or double
// quotes. A part that starts with a quote has that quote trimmed from both ends.
std::vector<std::string> explodeString(const std::string& input, char delimiter = ' ');

// y/yes/t/true and n/no/f/false (any case), numbers are true when non-zero.
bool str2Bool(const std::string& text);

// "<integer><unit>" with unit one of s, m, h, d, w (case-insensitive) or none.
// Throws common::ParameterError on malformed input.
long long parseTimeSeconds(const std::string& text);

// Leading integer of text, 0 if there is none.
long long parseLeadingInteger(const std::string& text);

std::vector<std::string> splitString(const std::string& text, const std::string& separator);
std::string joinStrings(const std::vector<std::string>& parts, const std::string& separator);
std::string replaceAll(std::string text, const std::string& from, const std::string& to);
std::string repeatString(const std::string& text, int count);

}}
