#include "cliutil/progress/progress_renderer.hpp"
#include "cliutil/common/constants.hpp"
#include "cliutil/format/string_utils.hpp"
#include <algorithm>
#include <cmath>

namespace cliutil {
namespace progress {

namespace {

constexpr int BAR_TAG_LENGTH = 5;

std::string barLine(const std::string& text) {
    size_t pos = text.find(constants::tags::BAR);
    size_t begin = text.rfind('\n', pos);
    begin = (begin == std::string::npos) ? 0 : begin + 1;
    size_t end = text.find('\n', pos);
    if (end == std::string::npos) {
        end = text.size();
    }
    return text.substr(begin, end - begin);
}

}

std::string createProgressBar(std::optional<double> done_part, int length) {
    if (length <= 0) {
        return "";
    }
    
    long long filled = 0;
    if (done_part && std::isfinite(*done_part)) {
        filled = std::llround(*done_part * length);
        filled = std::clamp<long long>(filled, 0, length);
    }
    
    return std::string(static_cast<size_t>(filled), constants::glyphs::BAR_FILL) +
           std::string(static_cast<size_t>(length - filled), constants::glyphs::BAR_TRACK);
}

std::string renderProgress(const std::string& format,
                           const TagValues& values,
                           std::optional<double> done_part,
                           int max_width,
                           RenderTarget target) {
    std::string text = expandTags(format, values);
    
    if (text.find(constants::tags::BAR) != std::string::npos) {
        const std::string measured = (target == RenderTarget::FILE) ? barLine(text) : text;
        int bar_length = max_width - static_cast<int>(measured.size()) - BAR_TAG_LENGTH;
        return format::replaceAll(text, constants::tags::BAR,
                                  createProgressBar(done_part, bar_length));
    }
    
    if (target == RenderTarget::CONSOLE && static_cast<int>(text.size()) < max_width) {
        text.append(static_cast<size_t>(max_width) - text.size(), ' ');
    }
    
    return text;
}

}}
