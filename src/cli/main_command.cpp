#include "main_command.hpp"
#include "cliutil/common/logger.hpp"
#include <utility>

namespace cliutil {
namespace cli {

MainCommand::MainCommand(std::string name, std::string description)
    : name_(std::move(name)), description_(std::move(description)) {
}

MainCommand::~MainCommand() = default;

void MainCommand::attach(CLI::App& app) {
    subcommand_ = app.add_subcommand(name_, description_);
    setup();
    common::Logger::instance().debug("[Command] Attached | name={}", name_);
}

bool MainCommand::selected() const {
    return subcommand_ != nullptr && subcommand_->parsed();
}

}}
