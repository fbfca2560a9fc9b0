#include "cliutil/params/parameter_set.hpp"
#include "cliutil/common/logger.hpp"
#include "cliutil/format/string_utils.hpp"
#include <algorithm>

namespace cliutil {
namespace params {

namespace {

constexpr char ARRAY_DELIMITER = '+';

bool defaultMatches(ParameterType type, const ParameterValue& value) {
    switch (type) {
        case ParameterType::INTEGER:
            return std::holds_alternative<long long>(value);
        case ParameterType::STRING:
        case ParameterType::TIME_SECONDS:
            return std::holds_alternative<std::string>(value);
        case ParameterType::BOOLEAN:
            return std::holds_alternative<bool>(value);
        case ParameterType::ARRAY:
            return std::holds_alternative<std::vector<std::string>>(value);
    }
    return false;
}

std::string optionNames(const ParameterDeclaration& declaration) {
    std::string names = "--" + declaration.name;
    if (declaration.alias.size() == 1) {
        names = "-" + declaration.alias + "," + names;
    } else if (!declaration.alias.empty()) {
        names += ",--" + declaration.alias;
    }
    return names;
}

}

std::string to_string(ParameterType type) {
    switch (type) {
        case ParameterType::INTEGER: return "integer";
        case ParameterType::STRING: return "string";
        case ParameterType::BOOLEAN: return "boolean";
        case ParameterType::ARRAY: return "array";
        case ParameterType::TIME_SECONDS: return "time in seconds";
    }
    return "unknown";
}

void ParameterSet::declare(const std::string& name,
                           const std::string& alias,
                           ParameterType type,
                           ParameterValue default_value,
                           const std::string& description) {
    if (!defaultMatches(type, default_value)) {
        throw common::ParameterError(
            common::ErrorCode::PARAMETER_TYPE_MISMATCH,
            common::makeContext("ParameterSet", {
                {"parameter", name},
                {"type", to_string(type)}
            }));
    }
    
    ParameterDeclaration declaration{name, alias, type, std::move(default_value), description};
    ParameterValue initial = defaultValue(declaration);
    
    auto it = std::find_if(declarations_.begin(), declarations_.end(),
                           [&name](const ParameterDeclaration& d) { return d.name == name; });
    if (it != declarations_.end()) {
        *it = std::move(declaration);
    } else {
        declarations_.push_back(std::move(declaration));
    }
    
    values_[name] = std::move(initial);
}

void ParameterSet::bind(CLI::App* app) {
    for (const auto& declaration : declarations_) {
        std::string& target = raw_values_[declaration.name];
        CLI::Option* option = nullptr;
        
        if (declaration.type == ParameterType::BOOLEAN) {
            option = app->add_flag(optionNames(declaration), target, declaration.description);
        } else {
            option = app->add_option(optionNames(declaration), target, declaration.description);
        }
        
        options_[declaration.name] = option;
    }
}

void ParameterSet::resolve() {
    for (const auto& declaration : declarations_) {
        auto option = options_.find(declaration.name);
        bool given = option != options_.end() && option->second->count() > 0;
        
        if (given) {
            values_[declaration.name] = convert(declaration, raw_values_[declaration.name]);
        } else {
            values_[declaration.name] = defaultValue(declaration);
        }
        
        common::Logger::instance().debug("[ParameterSet] Resolved | name={} | given={}",
                                         declaration.name, given);
    }
}

bool ParameterSet::isDeclared(const std::string& name_or_alias) const {
    return find(name_or_alias) != nullptr;
}

const ParameterDeclaration* ParameterSet::find(const std::string& name_or_alias) const {
    for (const auto& declaration : declarations_) {
        if (declaration.name == name_or_alias) {
            return &declaration;
        }
    }
    for (const auto& declaration : declarations_) {
        if (!declaration.alias.empty() && declaration.alias == name_or_alias) {
            return &declaration;
        }
    }
    return nullptr;
}

const ParameterValue& ParameterSet::valueOf(const std::string& name_or_alias) const {
    const ParameterDeclaration* declaration = find(name_or_alias);
    if (!declaration) {
        throw common::ParameterError(
            common::ErrorCode::PARAMETER_NOT_DECLARED,
            common::makeContext("ParameterSet", {{"parameter", name_or_alias}}));
    }
    return values_.at(declaration->name);
}

ParameterValue ParameterSet::defaultValue(const ParameterDeclaration& declaration) {
    if (declaration.type == ParameterType::TIME_SECONDS) {
        return format::parseTimeSeconds(std::get<std::string>(declaration.default_value));
    }
    return declaration.default_value;
}

ParameterValue ParameterSet::convert(const ParameterDeclaration& declaration, const std::string& raw) {
    switch (declaration.type) {
        case ParameterType::INTEGER:
            return format::parseLeadingInteger(raw);
        case ParameterType::STRING:
            return raw;
        case ParameterType::BOOLEAN:
            return raw.empty() ? true : format::str2Bool(raw);
        case ParameterType::ARRAY:
            return format::explodeString(raw, ARRAY_DELIMITER);
        case ParameterType::TIME_SECONDS:
            return format::parseTimeSeconds(raw);
    }
    throw common::ParameterError(
        common::ErrorCode::PARAMETER_TYPE_MISMATCH,
        common::makeContext("ParameterSet", {{"parameter", declaration.name}}));
}

}}
