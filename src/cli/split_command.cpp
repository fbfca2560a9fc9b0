#include "split_command.hpp"
#include "cliutil/format/string_utils.hpp"
#include <iostream>

namespace cliutil {
namespace cli {

SplitCommand::SplitCommand()
    : MainCommand("split", "Split text, keeping quoted parts together") {
}

void SplitCommand::setup() {
    subcommand_->add_option("input", input_, "Text to split; quoted parts are kept together")
        ->required();
    subcommand_->add_option("-d,--delimiter", delimiter_, "Delimiter character");
}

int SplitCommand::execute() {
    for (const auto& part : format::explodeString(input_, delimiter_)) {
        std::cout << part << "\n";
    }
    return 0;
}

}}
