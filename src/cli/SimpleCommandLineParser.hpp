/**
 * @file SimpleCommandLineParser.hpp
 * @brief Lightweight command-line parser shared by the keyforge executables
 */

#pragma once

#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace keyforge {

/**
 * @brief Simple command-line argument parser
 *
 * Supports --long VALUE, --long=VALUE, -s VALUE and boolean flags. Help text
 * is generated from the registered options, grouped under section headings
 * in registration order.
 */
class SimpleCommandLineParser {
public:
    struct Option {
        std::string long_name;
        std::string short_name;
        std::string description;
        bool has_value = true;
        std::string default_value;
    };

    SimpleCommandLineParser(const std::string& program_name, const std::string& description)
        : program_name_(program_name), description_(description) {}

    /**
     * @brief Start a new heading in the help output
     */
    void add_section(const std::string& title) {
        help_layout_.push_back({title, ""});
    }

    void add_option(const std::string& long_name, const std::string& short_name,
                    const std::string& description, const std::string& default_value = "") {
        register_option(Option{long_name, short_name, description, true, default_value});
    }

    void add_flag(const std::string& long_name, const std::string& short_name,
                  const std::string& description) {
        register_option(Option{long_name, short_name, description, false, ""});
    }

    /**
     * @brief Parse command line arguments
     * @return false if help was requested or the arguments are invalid
     *         (check help_requested() to tell them apart)
     */
    bool parse(int argc, char* argv[]) {
        parsed_values_.clear();
        positional_args_.clear();
        help_requested_ = false;

        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) {
            args.emplace_back(argv[i]);
        }

        for (const auto& arg : args) {
            if (arg == "--help" || arg == "-h" || arg == "-?") {
                help_requested_ = true;
                show_help();
                return false;
            }
        }

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];

            std::string option_name;
            std::string value;
            bool inline_value = false;

            if (arg.starts_with("--")) {
                option_name = arg.substr(2);
                const size_t eq_pos = option_name.find('=');
                if (eq_pos != std::string::npos) {
                    value = option_name.substr(eq_pos + 1);
                    option_name = option_name.substr(0, eq_pos);
                    inline_value = true;
                }
                if (options_.find(option_name) == options_.end()) {
                    std::cerr << "Unknown option: --" << option_name << std::endl;
                    return false;
                }
            } else if (arg.starts_with("-") && arg.size() > 1) {
                auto it = short_to_long_.find(arg.substr(1));
                if (it == short_to_long_.end()) {
                    std::cerr << "Unknown option: " << arg << std::endl;
                    return false;
                }
                option_name = it->second;
            } else {
                positional_args_.push_back(arg);
                continue;
            }

            const Option& option = options_.at(option_name);
            if (!option.has_value) {
                if (inline_value) {
                    std::cerr << "Option --" << option_name << " does not take a value" << std::endl;
                    return false;
                }
                parsed_values_[option_name] = "true";
                continue;
            }

            if (!inline_value) {
                // Values may legitimately start with '-' (e.g. a negative number), so
                // only reject when the next token is a registered option.
                if (i + 1 >= args.size() || is_registered_option(args[i + 1])) {
                    std::cerr << "Option " << arg << " requires a value" << std::endl;
                    return false;
                }
                value = args[++i];
            }
            parsed_values_[option_name] = value;
        }

        for (const auto& [name, option] : options_) {
            if (parsed_values_.find(name) == parsed_values_.end() && !option.default_value.empty()) {
                parsed_values_[name] = option.default_value;
            }
        }

        return true;
    }

    bool help_requested() const { return help_requested_; }

    std::optional<std::string> get(const std::string& option_name) const {
        auto it = parsed_values_.find(option_name);
        if (it != parsed_values_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    bool has(const std::string& option_name) const {
        return parsed_values_.find(option_name) != parsed_values_.end();
    }

    bool get_flag(const std::string& option_name) const {
        auto value = get(option_name);
        return value.has_value() && value.value() == "true";
    }

    template<typename T>
    std::optional<T> get_as(const std::string& option_name) const {
        auto value = get(option_name);
        if (!value.has_value()) {
            return std::nullopt;
        }

        std::istringstream iss(value.value());
        T result;
        if (iss >> result && iss.eof()) {
            return result;
        }
        return std::nullopt;
    }

    const std::vector<std::string>& get_positional() const {
        return positional_args_;
    }

    void show_help() const {
        std::cout << description_ << "\n\n";
        std::cout << "USAGE:\n";
        std::cout << "    " << program_name_ << " [OPTIONS]\n";

        for (const auto& [section, option_name] : help_layout_) {
            if (option_name.empty()) {
                std::cout << "\n" << section << ":\n";
                continue;
            }
            print_help_line(options_.at(option_name));
        }

        std::cout << "\nHELP:\n";
        std::cout << "    -h, --help, -?           Show this help\n";
    }

private:
    void register_option(const Option& option) {
        options_[option.long_name] = option;
        if (!option.short_name.empty()) {
            short_to_long_[option.short_name] = option.long_name;
        }
        help_layout_.push_back({"", option.long_name});
    }

    bool is_registered_option(const std::string& token) const {
        if (token.starts_with("--")) {
            std::string name = token.substr(2);
            name = name.substr(0, name.find('='));
            return options_.find(name) != options_.end();
        }
        if (token.starts_with("-") && token.size() > 1) {
            return short_to_long_.find(token.substr(1)) != short_to_long_.end();
        }
        return false;
    }

    void print_help_line(const Option& option) const {
        std::string flags = "    ";
        if (!option.short_name.empty()) {
            flags += "-" + option.short_name + ", ";
        }
        flags += "--" + option.long_name;
        if (option.has_value) {
            flags += " VALUE";
        }
        if (flags.size() < 34) {
            flags.append(34 - flags.size(), ' ');
        } else {
            flags += "  ";
        }
        std::cout << flags << option.description;
        if (!option.default_value.empty()) {
            std::cout << " (default: " << option.default_value << ")";
        }
        std::cout << "\n";
    }

    std::string program_name_;
    std::string description_;
    std::map<std::string, Option> options_;
    std::map<std::string, std::string> short_to_long_;
    std::vector<std::pair<std::string, std::string>> help_layout_;  // (section, option) rows
    std::map<std::string, std::string> parsed_values_;
    std::vector<std::string> positional_args_;
    bool help_requested_ = false;
};

} // namespace keyforge
