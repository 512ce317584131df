#pragma once
#include "pgshift/cli/command.hpp"

namespace pgshift::commands {

// Copies one database of an application directly into another
class TransferCommand : public cli::Command {
public:
    TransferCommand();
    int run(cli::CommandContext& ctx) override;
};

}  // namespace pgshift::commands
