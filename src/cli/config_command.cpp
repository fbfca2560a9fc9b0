#include "config_command.hpp"
#include "cliutil/common/config.hpp"
#include "cliutil/common/constants.hpp"
#include "cliutil/common/error_codes.hpp"
#include "cliutil/common/logger.hpp"
#include <filesystem>
#include <iostream>

namespace cliutil {
namespace cli {

ConfigCommand::ConfigCommand()
    : MainCommand("config", "Manage configuration") {
}

void ConfigCommand::setup() {
    init_cmd_ = subcommand_->add_subcommand("init", "Write a configuration file with default values");
    init_cmd_->add_option("path", init_path_, "Target file, ./cliutil.toml when omitted");
    init_cmd_->add_flag("-f,--force", init_force_, "Overwrite an existing file");
    
    show_cmd_ = subcommand_->add_subcommand("show", "Show the effective configuration");
    
    get_cmd_ = subcommand_->add_subcommand("get", "Get one configuration value");
    get_cmd_->add_option("key", get_key_, "Key as section.name")->required();
    
    set_cmd_ = subcommand_->add_subcommand("set", "Set one value in the configuration file");
    set_cmd_->add_option("key", set_key_, "Key as section.name")->required();
    set_cmd_->add_option("value", set_value_, "New value")->required();
}

int ConfigCommand::execute() {
    if (init_cmd_->parsed()) {
        return executeInit();
    } else if (show_cmd_->parsed()) {
        return executeShow();
    } else if (get_cmd_->parsed()) {
        return executeGet();
    } else if (set_cmd_->parsed()) {
        return executeSet();
    }
    
    std::cout << subcommand_->help() << std::endl;
    return 0;
}

std::string ConfigCommand::targetPath() const {
    const std::string& current = common::Config::instance().currentPath();
    return current.empty() ? std::string(constants::files::CONFIG_FILE) : current;
}

int ConfigCommand::executeInit() {
    std::string path = init_path_.empty() ? std::string(constants::files::CONFIG_FILE) : init_path_;
    
    std::error_code ec;
    if (std::filesystem::exists(path, ec) && !init_force_) {
        std::cerr << "Configuration file already exists: " << path << "\n";
        std::cerr << "Use --force to overwrite it.\n";
        return 1;
    }
    
    auto& config = common::Config::instance();
    config.reset();
    
    if (!config.save(path)) {
        std::cerr << "Failed to write configuration: " << path << "\n";
        return 1;
    }
    
    std::cout << "Configuration written to " << path << "\n";
    return 0;
}

int ConfigCommand::executeShow() {
    auto& config = common::Config::instance();
    
    if (config.currentPath().empty()) {
        std::cout << "# defaults (no configuration file loaded)\n";
    } else {
        std::cout << "# " << config.currentPath() << "\n";
    }
    
    for (const auto& key : config.keys()) {
        std::cout << key << " = " << config.getValue(key).value_or("") << "\n";
    }
    return 0;
}

int ConfigCommand::executeGet() {
    auto value = common::Config::instance().getValue(get_key_);
    if (!value) {
        std::cerr << "Unknown configuration key: " << get_key_ << "\n";
        return 1;
    }
    
    std::cout << *value << "\n";
    return 0;
}

int ConfigCommand::executeSet() {
    auto& config = common::Config::instance();
    std::string path = targetPath();
    
    try {
        config.setValue(set_key_, set_value_);
    } catch (const common::ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    
    if (!config.save(path)) {
        std::cerr << "Failed to write configuration: " << path << "\n";
        return 1;
    }
    
    common::Logger::instance().info("[ConfigCommand] Value set | key={} | path={}", set_key_, path);
    std::cout << set_key_ << " = " << config.getValue(set_key_).value_or("") << "\n";
    return 0;
}

}}
