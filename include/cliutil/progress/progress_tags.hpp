#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>

namespace cliutil {
namespace progress {

enum class ProgressTag {
    PERCENT,
    ETA,
    TIME_PASSED,
    ITEM,
    TOTAL,
    SPEED_AVG,
    SPEED_CUR,
    ROTATOR,
    TITLE
};

constexpr size_t PROGRESS_TAG_COUNT = 9;

constexpr const char* UNKNOWN_VALUE = "?";

// Placeholder text of a tag, e.g. "%percent%".
const char* tagPlaceholder(ProgressTag tag);

// Looks up a tag by its name without the surrounding percent signs.
std::optional<ProgressTag> findTag(const std::string& name);

class TagValues {
public:
    void set(ProgressTag tag, std::string value) {
        values_[static_cast<size_t>(tag)] = std::move(value);
    }
    
    const std::string& get(ProgressTag tag) const {
        return values_[static_cast<size_t>(tag)];
    }
    
    void clear() {
        values_.fill(std::string());
    }

private:
    std::array<std::string, PROGRESS_TAG_COUNT> values_;
};

// Substitutes recognized tags. "%bar%" and unrecognized placeholders are
// copied through unchanged, substituted values are not rescanned.
std::string expandTags(const std::string& format, const TagValues& values);

}}
