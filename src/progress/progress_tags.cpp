#include "cliutil/progress/progress_tags.hpp"

namespace cliutil {
namespace progress {

namespace {

struct TagEntry {
    ProgressTag tag;
    const char* name;
    const char* placeholder;
};

constexpr std::array<TagEntry, PROGRESS_TAG_COUNT> TAGS = {{
    {ProgressTag::PERCENT, "percent", "%percent%"},
    {ProgressTag::ETA, "eta", "%eta%"},
    {ProgressTag::TIME_PASSED, "time_passed", "%time_passed%"},
    {ProgressTag::ITEM, "item", "%item%"},
    {ProgressTag::TOTAL, "total", "%total%"},
    {ProgressTag::SPEED_AVG, "speed_avg", "%speed_avg%"},
    {ProgressTag::SPEED_CUR, "speed_cur", "%speed_cur%"},
    {ProgressTag::ROTATOR, "rotator", "%rotator%"},
    {ProgressTag::TITLE, "title", "%title%"}
}};

}

const char* tagPlaceholder(ProgressTag tag) {
    return TAGS[static_cast<size_t>(tag)].placeholder;
}

std::optional<ProgressTag> findTag(const std::string& name) {
    for (const auto& entry : TAGS) {
        if (name == entry.name) {
            return entry.tag;
        }
    }
    return std::nullopt;
}

std::string expandTags(const std::string& format, const TagValues& values) {
    std::string result;
    result.reserve(format.size() + 32);
    
    size_t pos = 0;
    while (pos < format.size()) {
        size_t open = format.find('%', pos);
        if (open == std::string::npos) {
            result.append(format, pos, std::string::npos);
            break;
        }
        
        result.append(format, pos, open - pos);
        
        size_t close = format.find('%', open + 1);
        if (close == std::string::npos) {
            result.append(format, open, std::string::npos);
            break;
        }
        
        auto tag = findTag(format.substr(open + 1, close - open - 1));
        if (tag) {
            result += values.get(*tag);
            pos = close + 1;
        } else {
            // The closing '%' may open the next placeholder.
            result += '%';
            pos = open + 1;
        }
    }
    
    return result;
}

}}
