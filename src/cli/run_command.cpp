#include "run_command.hpp"
#include "cliutil/common/config.hpp"
#include "cliutil/common/constants.hpp"
#include "cliutil/common/logger.hpp"
#include "cliutil/core/session.hpp"
#include "cliutil/format/time_format.hpp"
#include "cliutil/params/help_renderer.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <chrono>
#include <random>
#include <thread>

namespace cliutil {
namespace cli {

namespace {

constexpr const char* SCRIPT_NAME = "cliutil-run";
constexpr const char* SCRIPT_DESCRIPTION =
    "Runs a demonstration job that processes items one by one with a random "
    "delay, showing progress on the console and in the progress file, and "
    "writing status and information messages to the message log.";

}

RunCommand::RunCommand()
    : MainCommand("run", "Run a demonstration job with progress output") {
}

void RunCommand::declareParameters() {
    const auto& config = common::Config::instance().global();
    
    parameters_.declare("items", "n", params::ParameterType::INTEGER, 1000LL,
                        "Number of items to process");
    parameters_.declare("delay", "d", params::ParameterType::INTEGER, 15LL,
                        "Maximum delay per item in milliseconds");
    parameters_.declare("info", "i", params::ParameterType::INTEGER, 100LL,
                        "Print an information message every N items, 0 disables");
    parameters_.declare("title", "t", params::ParameterType::STRING, std::string("Demo job"),
                        "Progress title");
    parameters_.declare("rotator", "r", params::ParameterType::ARRAY, config.progress.rotator,
                        "Rotator glyphs separated by '+'");
    parameters_.declare("limit", "T", params::ParameterType::TIME_SECONDS, std::string("0s"),
                        "Stop after this much time, e.g. 30s, 5m or 1h. 0 means no limit");
    parameters_.declare("quiet", "q", params::ParameterType::BOOLEAN, false,
                        "Do not print anything on the console");
    parameters_.declare("verbosity", "v", params::ParameterType::STRING, config.output.verbosity,
                        "Console output flags: s status, e errors, i information, p progress");
    parameters_.declare("logging", "l", params::ParameterType::STRING, config.output.logging,
                        "Log flags: s status, e errors, i information, p progress file, "
                        "o overwrite the message log");
}

void RunCommand::setup() {
    declareParameters();
    parameters_.bind(subcommand_);
    
    subcommand_->formatter_fn([this](const CLI::App*, std::string, CLI::AppFormatMode) {
        params::HelpInfo info;
        info.script_name = SCRIPT_NAME;
        info.script_version = constants::version::CLI_VERSION;
        info.description = SCRIPT_DESCRIPTION;
        info.width = common::Config::instance().global().output.max_output_width;
        return params::HelpRenderer(info).render(parameters_);
    });
}

int RunCommand::execute() {
    parameters_.resolve();
    
    core::SessionOptions options =
        core::SessionOptions::fromConfig(common::Config::instance(), SCRIPT_NAME);
    options.verbosity = parameters_.get<bool>("quiet")
        ? std::string(1, constants::flags::DISABLE)
        : parameters_.get<std::string>("verbosity");
    options.logging = parameters_.get<std::string>("logging");
    options.progress.rotator_sequence = parameters_.get<std::vector<std::string>>("rotator");
    
    long long items = parameters_.get<long long>("items");
    long long max_delay = parameters_.get<long long>("delay");
    long long info_every = parameters_.get<long long>("info");
    long long limit = parameters_.get<long long>("limit");
    
    core::Session session(options);
    session.start();
    session.resetProgress(items, parameters_.get<std::string>("title"));
    
    std::mt19937 generator(std::random_device{}());
    std::uniform_int_distribution<long long> delay(0, std::max(0LL, max_delay));
    
    for (long long i = 1; i <= items; ++i) {
        session.updateProgress(i);
        std::this_thread::sleep_for(std::chrono::milliseconds(delay(generator)));
        
        if (info_every > 0 && i % info_every == 0) {
            session.info(fmt::format("Processed {} of {} items", i, items));
        }
        
        if (limit > 0 && session.timePassed() >= static_cast<double>(limit)) {
            session.error(fmt::format("Time limit of {} reached after {} items",
                                      format::formatDuration(static_cast<double>(limit)), i));
            break;
        }
    }
    
    session.end();
    
    common::Logger::instance().debug("[RunCommand] Finished | items={} | seconds={:.3f}",
                                     items, session.timePassed());
    return 0;
}

}}
