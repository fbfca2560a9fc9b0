#pragma once

#include "main_command.hpp"
#include "cliutil/params/parameter_set.hpp"

namespace cliutil {
namespace cli {

// Demonstration job: processes a number of items with random delays and
// reports progress, information messages and an optional time limit.
class RunCommand : public MainCommand {
public:
    RunCommand();
    int execute() override;
    
    const params::ParameterSet& parameters() const { return parameters_; }

protected:
    void setup() override;

private:
    params::ParameterSet parameters_;
    
    void declareParameters();
};

}}
