#pragma once

#include "cliutil/common/error_codes.hpp"
#include <CLI/CLI.hpp>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace cliutil {
namespace params {

enum class ParameterType {
    INTEGER,
    STRING,
    BOOLEAN,
    ARRAY,
    TIME_SECONDS
};

std::string to_string(ParameterType type);

// INTEGER and TIME_SECONDS resolve to long long, STRING to std::string,
// BOOLEAN to bool and ARRAY to std::vector<std::string>. A TIME_SECONDS
// default is given in its text form, e.g. "90s" or "2h".
using ParameterValue = std::variant<long long, std::string, bool, std::vector<std::string>>;

struct ParameterDeclaration {
    std::string name;
    std::string alias;
    ParameterType type;
    ParameterValue default_value;
    std::string description;
};

class ParameterSet {
public:
    // Throws common::ParameterError when the default does not match the type.
    // Declaring an existing name replaces the earlier declaration.
    void declare(const std::string& name,
                 const std::string& alias,
                 ParameterType type,
                 ParameterValue default_value,
                 const std::string& description = "");
    
    // Registers "--name" and "-a" (single character alias) or "--alias".
    void bind(CLI::App* app);
    
    // Converts what was captured on the command line, defaults elsewhere.
    void resolve();
    
    // Throws common::ParameterError if undeclared or of another type.
    template<typename T>
    const T& get(const std::string& name_or_alias) const {
        const ParameterValue& value = valueOf(name_or_alias);
        const T* typed = std::get_if<T>(&value);
        if (!typed) {
            throw common::ParameterError(
                common::ErrorCode::PARAMETER_TYPE_MISMATCH,
                common::makeContext("ParameterSet", {{"parameter", name_or_alias}}));
        }
        return *typed;
    }
    
    bool isDeclared(const std::string& name_or_alias) const;
    const std::vector<ParameterDeclaration>& declarations() const { return declarations_; }

private:
    std::vector<ParameterDeclaration> declarations_;
    std::map<std::string, std::string> raw_values_;
    std::map<std::string, CLI::Option*> options_;
    std::map<std::string, ParameterValue> values_;
    
    const ParameterDeclaration* find(const std::string& name_or_alias) const;
    const ParameterValue& valueOf(const std::string& name_or_alias) const;
    static ParameterValue defaultValue(const ParameterDeclaration& declaration);
    static ParameterValue convert(const ParameterDeclaration& declaration, const std::string& raw);
};

}}
