#pragma once

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace pgshift::cli {

// Exit code for malformed command lines
inline constexpr int kUsageError = 2;

// Flag values and positional arguments handed to Command::run
class CommandContext {
public:
    // Ignored when the flag was already given on the command line
    void set_default(const std::string& name, const std::string& value);
    void set_explicit(const std::string& name, const std::string& value);

    bool is_user_provided(const std::string& name) const {
        return explicit_.count(name) > 0;
    }

    std::string get_flag(const std::string& name) const;
    bool get_bool_flag(const std::string& name) const;
    // @throws std::invalid_argument if the value is not a number
    int get_int_flag(const std::string& name) const;

    void add_arg(const std::string& arg) { args_.push_back(arg); }
    void clear_args() { args_.clear(); }
    const std::vector<std::string>& args() const { return args_; }
    std::string arg(size_t index) const {
        return index < args_.size() ? args_[index] : "";
    }

private:
    std::map<std::string, std::string> values_;
    std::set<std::string> explicit_;
    std::vector<std::string> args_;
};

enum class FlagKind { text, toggle, number };

struct FlagSpec {
    std::string name;
    std::string short_name;  // may be empty
    std::string description;
    std::string default_value;
    FlagKind kind = FlagKind::text;
};

/**
 * @brief Node of the command tree.
 *
 * Flags declared on a command are visible to all of its subcommands. The
 * first positional token naming a subcommand hands the remaining tokens to
 * it; otherwise the command runs with the positionals as arguments.
 */
class Command {
public:
    Command(std::string name, std::string summary);
    virtual ~Command() = default;

    const std::string& name() const { return name_; }
    const std::string& summary() const { return summary_; }

    void add_command(std::shared_ptr<Command> command);
    std::shared_ptr<Command> find_command(const std::string& name) const;
    const std::vector<std::shared_ptr<Command>>& subcommands() const {
        return subcommands_;
    }

    void add_flag(const std::string& name, const std::string& short_name,
                  const std::string& description,
                  const std::string& default_value = "");
    void add_switch(const std::string& name, const std::string& short_name,
                    const std::string& description);
    void add_number_flag(const std::string& name,
                         const std::string& description, int default_value);

    // Returns the process exit code
    virtual int run(CommandContext& ctx) = 0;

    /// @brief Parses argv (program name first) and runs the selected
    /// command. Usage errors exit with 2, failures with 1.
    int execute(int argc, char* argv[]);

    void print_help() const;
    void print_usage() const;

    Command& set_details(const std::string& details) {
        details_ = details;
        return *this;
    }
    Command& set_usage(const std::string& usage) {
        usage_ = usage;
        return *this;
    }
    Command& set_examples(const std::string& examples) {
        examples_ = examples;
        return *this;
    }

private:
    int dispatch(const std::vector<std::string>& args,
                 const CommandContext& inherited);

    std::string name_;
    std::string summary_;
    std::string details_;
    std::string usage_;
    std::string examples_;
    std::vector<FlagSpec> flags_;
    std::vector<std::shared_ptr<Command>> subcommands_;
};

}  // namespace pgshift::cli
