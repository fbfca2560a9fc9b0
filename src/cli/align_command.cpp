#include "align_command.hpp"
#include "cliutil/common/config.hpp"
#include "cliutil/common/logger.hpp"
#include "cliutil/format/text_align.hpp"
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>

namespace cliutil {
namespace cli {

namespace {

const std::map<std::string, format::TextAlign> ALIGNMENTS = {
    {"left", format::TextAlign::LEFT},
    {"right", format::TextAlign::RIGHT},
    {"center", format::TextAlign::CENTER},
    {"justify", format::TextAlign::JUSTIFY}
};

}

AlignCommand::AlignCommand()
    : MainCommand("align", "Wrap and align text") {
}

void AlignCommand::setup() {
    subcommand_->add_option("file", input_file_, "Text file, standard input when omitted");
    subcommand_->add_option("-a,--align", align_, "left, right, center or justify")
        ->check(CLI::IsMember({"left", "right", "center", "justify"}));
    subcommand_->add_option("-w,--width", width_, "Line width, the configured width when omitted")
        ->check(CLI::PositiveNumber);
    subcommand_->add_flag("-j,--justify-all", justify_all_, "Justify the last line of paragraphs too");
    subcommand_->add_flag("-k,--keep-words", keep_words_, "Do not cut words longer than the width");
    subcommand_->add_option("--paragraph-lines", paragraph_lines_, "Empty lines between paragraphs")
        ->check(CLI::NonNegativeNumber);
    subcommand_->add_option("--paragraph-indent", paragraph_indent_, "Indent of first paragraph lines")
        ->check(CLI::NonNegativeNumber);
    subcommand_->add_option("-i,--indent", indent_levels_,
                           "Indent levels to add, negative values remove indents");
    subcommand_->add_option("--indent-text", indent_, "Text of one indent level");
}

bool AlignCommand::readInput(std::string& text) const {
    if (input_file_.empty()) {
        text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        return true;
    }
    
    std::ifstream file(input_file_, std::ios::binary);
    if (!file) {
        common::Logger::instance().error("[AlignCommand] Cannot open input | path={}", input_file_);
        std::cerr << "Error: cannot open " << input_file_ << "\n";
        return false;
    }
    
    text.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return true;
}

int AlignCommand::execute() {
    std::string text;
    if (!readInput(text)) {
        return 1;
    }
    
    format::AlignOptions options;
    options.align = ALIGNMENTS.at(align_);
    options.justify_all_lines = justify_all_;
    options.width = width_ > 0 ? width_ : common::Config::instance().global().output.max_output_width;
    options.cut_words = !keep_words_;
    options.paragraph_separator_lines = paragraph_lines_;
    options.paragraph_indent = paragraph_indent_;
    
    std::string aligned = format::textAlign(text, options);
    if (indent_levels_ != 0) {
        aligned = format::textIndent(aligned, indent_, indent_levels_);
    }
    
    std::cout << aligned << "\n";
    return 0;
}

}}
