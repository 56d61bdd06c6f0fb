#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace wdi {

/**
 * @brief Raised when a command line cannot be parsed
 */
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class OptionKind {
    Value,   ///< --name <value> or --name=<value>
    Flag     ///< presence only
};

struct OptionSpec {
    std::string name;
    char short_name = '\0';
    std::string help;
    OptionKind kind = OptionKind::Value;
    bool required = false;
};

/**
 * @brief Options collected for one command invocation
 */
class ParsedArgs {
public:
    bool has(const std::string& name) const {
        return values_.count(name) > 0;
    }

    /// Value of a required option
    const std::string& value(const std::string& name) const {
        auto it = values_.find(name);
        if (it == values_.end()) {
            throw UsageError("Missing required option --" + name);
        }
        return it->second;
    }

    std::string value_or(const std::string& name, const std::string& fallback) const {
        auto it = values_.find(name);
        return it == values_.end() ? fallback : it->second;
    }

    /**
     * @brief Parse an option as a strictly positive count
     * @throws UsageError if the text is not a whole number above zero
     */
    std::size_t positive(const std::string& name) const {
        const std::string& text = value(name);
        bool digits = !text.empty();
        for (char c : text) {
            if (c < '0' || c > '9') digits = false;
        }
        std::size_t parsed = 0;
        if (digits) {
            try {
                parsed = static_cast<std::size_t>(std::stoull(text));
            } catch (const std::out_of_range&) {
                digits = false;
            }
        }
        if (!digits || parsed == 0) {
            throw UsageError("--" + name + " expects a positive integer, got '" + text + "'");
        }
        return parsed;
    }

    void set(const std::string& name, const std::string& value) {
        values_[name] = value;
    }

private:
    std::map<std::string, std::string> values_;
};

struct CommandSpec {
    std::string name;
    std::string summary;
    std::vector<OptionSpec> options;
    std::function<int(const ParsedArgs&)> handler;
};

/**
 * @brief Subcommand dispatcher
 *
 * Options registered with add_common_option() are accepted by every
 * command. Handler exceptions are reported on stderr and map to exit
 * status 1.
 */
class CommandLine {
public:
    CommandLine(std::string program, std::string version, std::string description)
        : program_(std::move(program))
        , version_(std::move(version))
        , description_(std::move(description)) {}

    void add_common_option(OptionSpec option) {
        common_.push_back(std::move(option));
    }

    void add_command(CommandSpec command) {
        std::string name = command.name;
        commands_[name] = std::move(command);
    }

    const CommandSpec* find(const std::string& name) const {
        auto it = commands_.find(name);
        return it == commands_.end() ? nullptr : &it->second;
    }

    int dispatch(int argc, char** argv) const {
        if (argc < 2) {
            print_usage(std::cerr);
            return 1;
        }

        std::string first = argv[1];
        if (first == "--help" || first == "-h") {
            print_usage(std::cout);
            return 0;
        }
        if (first == "--version") {
            std::cout << program_ << " " << version_ << "\n";
            return 0;
        }

        const CommandSpec* command = find(first);
        if (command == nullptr) {
            std::cerr << "Unknown command '" << first << "'. Try '" << program_ << " --help'.\n";
            return 1;
        }

        std::vector<std::string> tokens(argv + 2, argv + argc);
        for (const auto& token : tokens) {
            if (token == "--") break;
            if (token == "--help" || token == "-h") {
                print_command_usage(*command, std::cout);
                return 0;
            }
        }

        ParsedArgs args;
        try {
            args = parse(*command, tokens);
        } catch (const UsageError& e) {
            std::cerr << "Error: " << e.what() << "\n";
            print_command_usage(*command, std::cerr);
            return 1;
        }

        try {
            return command->handler(args);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
    }

    /**
     * @brief Match tokens against a command's options
     * @throws UsageError on unknown, repeated or incomplete options
     */
    ParsedArgs parse(const CommandSpec& command, const std::vector<std::string>& tokens) const {
        std::vector<OptionSpec> accepted = options_for(command);
        ParsedArgs args;

        auto lookup = [&accepted](const std::string& token) -> const OptionSpec* {
            for (const auto& option : accepted) {
                if (token == "--" + option.name) return &option;
                if (option.short_name != '\0' && token.size() == 2 && token[0] == '-' &&
                    token[1] == option.short_name) {
                    return &option;
                }
            }
            return nullptr;
        };

        for (std::size_t i = 0; i < tokens.size(); ++i) {
            const std::string& token = tokens[i];
            if (token == "--") {
                if (i + 1 < tokens.size()) {
                    throw UsageError("Unexpected argument '" + tokens[i + 1] + "'");
                }
                break;
            }
            if (token.empty() || token[0] != '-') {
                throw UsageError("Unexpected argument '" + token + "'");
            }

            std::string key = token;
            std::string inline_value;
            bool has_inline = false;
            auto eq = token.find('=');
            if (token.rfind("--", 0) == 0 && eq != std::string::npos) {
                key = token.substr(0, eq);
                inline_value = token.substr(eq + 1);
                has_inline = true;
            }

            const OptionSpec* option = lookup(key);
            if (option == nullptr) {
                throw UsageError("Unknown option '" + key + "' for command " + command.name);
            }
            if (args.has(option->name)) {
                throw UsageError("Option --" + option->name + " given more than once");
            }

            if (option->kind == OptionKind::Flag) {
                if (has_inline) {
                    throw UsageError("Option --" + option->name + " takes no value");
                }
                args.set(option->name, "true");
            } else if (has_inline) {
                args.set(option->name, inline_value);
            } else {
                if (i + 1 >= tokens.size()) {
                    throw UsageError("Option --" + option->name + " needs a value");
                }
                args.set(option->name, tokens[++i]);
            }
        }

        for (const auto& option : accepted) {
            if (option.required && !args.has(option.name)) {
                throw UsageError("Missing required option --" + option.name);
            }
        }
        return args;
    }

    void print_usage(std::ostream& out) const {
        out << program_ << " " << version_ << " - " << description_ << "\n\n";
        out << "Usage: " << program_ << " <command> [options]\n\nCommands:\n";
        for (const auto& entry : commands_) {
            std::string padded = entry.first;
            padded.resize(std::max<std::size_t>(padded.size() + 2, 16), ' ');
            out << "  " << padded << entry.second.summary << "\n";
        }
        out << "\n'" << program_ << " <command> --help' lists a command's options.\n";
    }

    void print_command_usage(const CommandSpec& command, std::ostream& out) const {
        out << "\nUsage: " << program_ << " " << command.name << " [options]\n";
        out << command.summary << "\n\nOptions:\n";
        for (const auto& option : options_for(command)) {
            std::string label = "--" + option.name;
            if (option.short_name != '\0') {
                label += std::string(", -") + option.short_name;
            }
            if (option.kind == OptionKind::Value) {
                label += " <value>";
            }
            out << "  " << label << "\n      " << option.help;
            if (option.required) out << " [required]";
            out << "\n";
        }
    }

private:
    std::vector<OptionSpec> options_for(const CommandSpec& command) const {
        std::vector<OptionSpec> all = command.options;
        all.insert(all.end(), common_.begin(), common_.end());
        return all;
    }

    std::string program_;
    std::string version_;
    std::string description_;
    std::vector<OptionSpec> common_;
    std::map<std::string, CommandSpec> commands_;
};

} // namespace wdi
