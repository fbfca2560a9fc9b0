#pragma once

#include "main_command.hpp"
#include <string>

namespace cliutil {
namespace cli {

class TimeCommand : public MainCommand {
public:
    TimeCommand();
    int execute() override;

protected:
    void setup() override;

private:
    std::string duration_;
    int precision_ = 0;
    int naming_level_ = 3;
    bool keep_empty_units_ = false;
    bool two_digit_ = false;
};

}}
