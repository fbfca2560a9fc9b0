#pragma once

#include "parameter_set.hpp"
#include <string>
#include <utility>

namespace cliutil {
namespace params {

struct HelpInfo {
    std::string script_name;
    std::string script_version;
    std::string description;
    int width = 80;
};

// Plain text help: underlined name and version, the description, then one
// entry per declared parameter.
class HelpRenderer {
public:
    explicit HelpRenderer(HelpInfo info) : info_(std::move(info)) {}
    
    std::string render(const ParameterSet& parameters) const;
    
    static std::string defaultText(const ParameterDeclaration& declaration);

private:
    HelpInfo info_;
    
    std::string renderParameter(const ParameterDeclaration& declaration) const;
};

}}
