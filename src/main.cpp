#include <CLI/CLI.hpp>
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <vector>

#include "cliutil/common/config.hpp"
#include "cliutil/common/constants.hpp"
#include "cliutil/common/logger.hpp"
#include "cli/main_command.hpp"
#include "cli/run_command.hpp"
#include "cli/time_command.hpp"
#include "cli/align_command.hpp"
#include "cli/split_command.hpp"
#include "cli/config_command.hpp"

// The configuration is loaded before the subcommands are set up so that
// their declared defaults come from it.
std::optional<std::string> find_config_argument(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            return std::string(argv[i + 1]);
        }
        if (arg.rfind("--config=", 0) == 0) {
            return arg.substr(9);
        }
    }
    return std::nullopt;
}

bool load_configuration(const std::optional<std::string>& explicit_path) {
    auto& config = cliutil::common::Config::instance();
    
    if (explicit_path) {
        if (!config.load(*explicit_path)) {
            std::cerr << "Error: cannot load configuration " << *explicit_path << "\n";
            return false;
        }
        return true;
    }
    
    std::error_code ec;
    if (std::filesystem::exists(cliutil::constants::files::CONFIG_FILE, ec)) {
        if (!config.load(cliutil::constants::files::CONFIG_FILE)) {
            std::cerr << "Warning: ignoring unreadable " << cliutil::constants::files::CONFIG_FILE << "\n";
        }
    }
    return true;
}

int main(int argc, char** argv) {
    try {
        CLI::App app{"Progress reporting and text utilities for command-line scripts", "cliutil"};
        app.set_version_flag("--version", cliutil::constants::version::getFullVersion());
        app.require_subcommand(0, 1);
        
        std::string config_path;
        int width = 0;
        app.add_option("-c,--config", config_path, "Configuration file (TOML)");
        app.add_option("-w,--width", width, "Maximum output width")->check(CLI::PositiveNumber);
        
        if (!load_configuration(find_config_argument(argc, argv))) {
            return 1;
        }
        
        auto& config = cliutil::common::Config::instance();
        const auto& diagnostics = config.global().diagnostics;
        
        cliutil::common::Logger::instance().initialize(
            diagnostics.log_file.empty()
                ? cliutil::common::LogMode::CONSOLE_ONLY
                : cliutil::common::LogMode::FILE_ONLY,
            diagnostics);
        
        std::vector<std::unique_ptr<cliutil::cli::MainCommand>> commands;
        commands.push_back(std::make_unique<cliutil::cli::RunCommand>());
        commands.push_back(std::make_unique<cliutil::cli::TimeCommand>());
        commands.push_back(std::make_unique<cliutil::cli::AlignCommand>());
        commands.push_back(std::make_unique<cliutil::cli::SplitCommand>());
        commands.push_back(std::make_unique<cliutil::cli::ConfigCommand>());
        
        for (auto& command : commands) {
            command->attach(app);
        }
        
        CLI11_PARSE(app, argc, argv);
        
        if (width > 0) {
            config.global().output.max_output_width = width;
        }
        
        int result = 0;
        auto selected = std::find_if(commands.begin(), commands.end(),
                                     [](const auto& command) { return command->selected(); });
        if (selected != commands.end()) {
            result = (*selected)->execute();
        } else {
            std::cout << app.help() << std::endl;
        }
        
        cliutil::common::Logger::instance().shutdown();
        return result;
        
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
