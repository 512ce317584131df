#pragma once
#include <memory>

#include "pgshift/cli/command.hpp"

namespace pgshift::cli {

// Top of the command tree; owns the global flags
class RootCommand : public Command {
public:
    RootCommand();

    int run(CommandContext& ctx) override;
};

// Builds the root with migrate, transfer and config attached
std::shared_ptr<RootCommand> make_root_command();

}  // namespace pgshift::cli
