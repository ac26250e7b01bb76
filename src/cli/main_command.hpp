#pragma once

#include <CLI/CLI.hpp>
#include <string>

namespace livebar {
namespace cli {

class MainCommand {
public:
    MainCommand();
    virtual ~MainCommand();
    
    virtual bool validateArguments() const;

protected:
    CLI::App* subcommand_ = nullptr;
};

}}
