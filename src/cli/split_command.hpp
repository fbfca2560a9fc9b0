#pragma once

#include "main_command.hpp"
#include <string>

namespace cliutil {
namespace cli {

class SplitCommand : public MainCommand {
public:
    SplitCommand();
    int execute() override;

protected:
    void setup() override;

private:
    std::string input_;
    char delimiter_ = ' ';
};

}}
