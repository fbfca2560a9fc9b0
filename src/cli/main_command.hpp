#pragma once

#include <CLI/CLI.hpp>
#include <string>

namespace cliutil {
namespace cli {

// One cliutil subcommand. attach() registers it with the application,
// execute() runs it after parsing when it was selected.
class MainCommand {
public:
    MainCommand(std::string name, std::string description);
    virtual ~MainCommand();
    
    void attach(CLI::App& app);
    virtual int execute() = 0;
    
    bool selected() const;
    const std::string& name() const { return name_; }

protected:
    CLI::App* subcommand_ = nullptr;
    
    // Adds options to subcommand_.
    virtual void setup() = 0;

private:
    std::string name_;
    std::string description_;
};

}}
