#pragma once

#include "main_command.hpp"
#include <string>

namespace cliutil {
namespace cli {

class AlignCommand : public MainCommand {
public:
    AlignCommand();
    int execute() override;

protected:
    void setup() override;

private:
    std::string input_file_;
    std::string align_ = "left";
    int width_ = 0;
    bool justify_all_ = false;
    bool keep_words_ = false;
    int paragraph_lines_ = 1;
    int paragraph_indent_ = 0;
    int indent_levels_ = 0;
    std::string indent_ = "  ";
    
    bool readInput(std::string& text) const;
};

}}
