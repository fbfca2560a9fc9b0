#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace cliutil {
namespace cli {

class ConfigCommand : public MainCommand {
public:
    ConfigCommand();
    int execute() override;

protected:
    void setup() override;

private:
    CLI::App* init_cmd_ = nullptr;
    std::string init_path_;
    bool init_force_ = false;
    
    CLI::App* show_cmd_ = nullptr;
    
    CLI::App* get_cmd_ = nullptr;
    std::string get_key_;
    
    CLI::App* set_cmd_ = nullptr;
    std::string set_key_;
    std::string set_value_;
    
    int executeInit();
    int executeShow();
    int executeGet();
    int executeSet();
    
    std::string targetPath() const;
};

}}
