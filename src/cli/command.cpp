#include "pgshift/cli/command.hpp"

#include <algorithm>
#include <boost/program_options.hpp>
#include <iomanip>
#include <iostream>

namespace po = boost::program_options;

namespace pgshift::cli {

namespace {

constexpr int kFailure = 1;

po::options_description build_options(const std::vector<FlagSpec>& flags) {
    po::options_description options("Options");
    options.add_options()("help,h", "Show help message");

    for (const auto& flag : flags) {
        const std::string spec = flag.short_name.empty()
                                     ? flag.name
                                     : flag.name + "," + flag.short_name;
        switch (flag.kind) {
            case FlagKind::toggle:
                options.add_options()(spec.c_str(), flag.description.c_str());
                break;
            case FlagKind::number:
                options.add_options()(spec.c_str(), po::value<int>(),
                                      flag.description.c_str());
                break;
            case FlagKind::text:
                options.add_options()(spec.c_str(), po::value<std::string>(),
                                      flag.description.c_str());
                break;
        }
    }
    return options;
}

std::string flag_value(const FlagSpec& flag, const po::variable_value& value) {
    switch (flag.kind) {
        case FlagKind::toggle:
            return "true";
        case FlagKind::number:
            return std::to_string(value.as<int>());
        default:
            return value.as<std::string>();
    }
}

std::string flag_label(const FlagSpec& flag) {
    std::string label = flag.short_name.empty() ? "    "
                                                : "-" + flag.short_name + ", ";
    label += "--" + flag.name;
    if (flag.kind != FlagKind::toggle) {
        label += " <value>";
    }
    return label;
}

}  // namespace

void CommandContext::set_default(const std::string& name,
                                 const std::string& value) {
    if (!is_user_provided(name)) {
        values_[name] = value;
    }
}

void CommandContext::set_explicit(const std::string& name,
                                  const std::string& value) {
    values_[name] = value;
    explicit_.insert(name);
}

std::string CommandContext::get_flag(const std::string& name) const {
    auto it = values_.find(name);
    return it != values_.end() ? it->second : "";
}

bool CommandContext::get_bool_flag(const std::string& name) const {
    const auto value = get_flag(name);
    return value == "true" || value == "1";
}

int CommandContext::get_int_flag(const std::string& name) const {
    return std::stoi(get_flag(name));
}

Command::Command(std::string name, std::string summary)
    : name_(std::move(name)), summary_(std::move(summary)) {}

void Command::add_command(std::shared_ptr<Command> command) {
    subcommands_.push_back(std::move(command));
}

std::shared_ptr<Command> Command::find_command(const std::string& name) const {
    for (const auto& command : subcommands_) {
        if (command->name() == name) {
            return command;
        }
    }
    return nullptr;
}

void Command::add_flag(const std::string& name, const std::string& short_name,
                       const std::string& description,
                       const std::string& default_value) {
    flags_.push_back(
        {name, short_name, description, default_value, FlagKind::text});
}

void Command::add_switch(const std::string& name,
                         const std::string& short_name,
                         const std::string& description) {
    flags_.push_back({name, short_name, description, "false", FlagKind::toggle});
}

void Command::add_number_flag(const std::string& name,
                              const std::string& description,
                              int default_value) {
    flags_.push_back({name, "", description, std::to_string(default_value),
                      FlagKind::number});
}

int Command::execute(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    try {
        return dispatch(args, CommandContext{});
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        print_usage();
        return kUsageError;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kFailure;
    }
}

int Command::dispatch(const std::vector<std::string>& args,
                      const CommandContext& inherited) {
    CommandContext ctx = inherited;
    ctx.clear_args();

    const auto options = build_options(flags_);
    // Unknown flags pass through so subcommands can parse their own
    auto parsed = po::command_line_parser(args)
                      .options(options)
                      .allow_unregistered()
                      .run();
    po::variables_map vm;
    po::store(parsed, vm);
    po::notify(vm);

    for (const auto& flag : flags_) {
        if (vm.count(flag.name)) {
            ctx.set_explicit(flag.name, flag_value(flag, vm[flag.name]));
        } else {
            ctx.set_default(flag.name, flag.default_value);
        }
    }

    const bool help = vm.count("help") > 0;
    auto rest = po::collect_unrecognized(parsed.options, po::include_positional);

    if (!rest.empty()) {
        if (auto subcommand = find_command(rest.front())) {
            std::vector<std::string> sub_args(rest.begin() + 1, rest.end());
            if (help) {
                sub_args.emplace_back("--help");
            }
            return subcommand->dispatch(sub_args, ctx);
        }
    }

    if (help) {
        print_help();
        return 0;
    }

    for (const auto& token : rest) {
        if (token.size() > 1 && token.front() == '-') {
            throw po::unknown_option(token);
        }
        ctx.add_arg(token);
    }
    return run(ctx);
}

void Command::print_usage() const {
    std::cout << "Usage: ";
    if (!usage_.empty()) {
        std::cout << usage_ << std::endl;
        return;
    }
    std::cout << name_ << (flags_.empty() ? "" : " [OPTIONS]")
              << (subcommands_.empty() ? "" : " <COMMAND>") << std::endl;
}

void Command::print_help() const {
    std::cout << name_ << ": " << summary_ << "\n\n";
    if (!details_.empty()) {
        std::cout << details_ << "\n\n";
    }
    print_usage();

    if (!subcommands_.empty()) {
        size_t width = 0;
        for (const auto& command : subcommands_) {
            width = std::max(width, command->name().size());
        }
        std::cout << "\nCommands:\n";
        for (const auto& command : subcommands_) {
            std::cout << "  " << std::left << std::setw(width + 2)
                      << command->name() << command->summary() << "\n";
        }
    }

    std::cout << "\nOptions:\n";
    std::cout << "  " << std::left << std::setw(28) << "-h, --help"
              << "Show help message\n";
    for (const auto& flag : flags_) {
        std::cout << "  " << std::left << std::setw(28) << flag_label(flag)
                  << flag.description;
        if (flag.kind != FlagKind::toggle && !flag.default_value.empty()) {
            std::cout << " [default: " << flag.default_value << "]";
        }
        std::cout << "\n";
    }

    if (!examples_.empty()) {
        std::cout << "\nExamples:\n" << examples_ << "\n";
    }
    if (!subcommands_.empty()) {
        std::cout << "\nRun '" << name_
                  << " <command> --help' for details on a command.\n";
    }
    std::cout << std::flush;
}

}  // namespace pgshift::cli
