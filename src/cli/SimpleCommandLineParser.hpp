/**
 * @file SimpleCommandLineParser.hpp
 * @brief Lightweight command-line parser
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace habitat {

/**
 * @brief Simple command-line argument parser
 *
 * Supports --long VALUE, --long=VALUE, -s VALUE and boolean flags. Options
 * are listed in help output in registration order, under the section that
 * was current when they were added.
 *
 * Defaults are documentation only: get() returns a value only for options
 * that were actually given, so callers can layer command line values over
 * configuration files.
 */
class SimpleCommandLineParser {
public:
    struct Option {
        std::string long_name;
        std::string short_name;
        std::string description;
        bool required;
        bool has_value;
        std::string default_value;
        std::string section;

        // Default constructor for std::map
        Option() : required(false), has_value(true) {}

        Option(const std::string& long_name, const std::string& short_name,
               const std::string& description, bool required, bool has_value,
               const std::string& default_value, const std::string& section)
            : long_name(long_name), short_name(short_name), description(description),
              required(required), has_value(has_value), default_value(default_value), section(section) {}
    };

    SimpleCommandLineParser(const std::string& program_name, const std::string& description)
        : program_name_(program_name), description_(description) {}

    /**
     * @brief Start a new help section for subsequently added options
     */
    void begin_section(const std::string& title) { current_section_ = title; }

    void add_option(const std::string& long_name, const std::string& short_name,
                    const std::string& description, bool required = false,
                    const std::string& default_value = "") {
        register_option(Option(long_name, short_name, description, required, true, default_value, current_section_));
    }

    void add_flag(const std::string& long_name, const std::string& short_name,
                  const std::string& description) {
        register_option(Option(long_name, short_name, description, false, false, "", current_section_));
    }

    /**
     * @brief Parse command line arguments
     * @return false on error or when help was shown
     */
    bool parse(int argc, char* argv[]) {
        args_.clear();
        parsed_values_.clear();
        positional_args_.clear();

        for (int i = 1; i < argc; ++i) {
            args_.push_back(argv[i]);
        }

        for (const auto& arg : args_) {
            if (arg == "--help" || arg == "-h") {
                show_help();
                return false;
            }
        }

        for (size_t i = 0; i < args_.size(); ++i) {
            const std::string& arg = args_[i];

            if (arg.starts_with("--")) {
                std::string option_name = arg.substr(2);

                // Handle --option=value format
                size_t eq_pos = option_name.find('=');
                std::string value;
                bool inline_value = false;
                if (eq_pos != std::string::npos) {
                    value = option_name.substr(eq_pos + 1);
                    option_name = option_name.substr(0, eq_pos);
                    inline_value = true;
                }

                auto it = options_.find(option_name);
                if (it == options_.end()) {
                    std::cerr << "Unknown option: --" << option_name << std::endl;
                    return false;
                }

                if (it->second.has_value) {
                    if (!inline_value) {
                        if (!has_value_at(i + 1)) {
                            std::cerr << "Option --" << option_name << " requires a value" << std::endl;
                            return false;
                        }
                        value = args_[++i];
                    }
                    parsed_values_[option_name] = value;
                } else {
                    parsed_values_[option_name] = "true";
                }

            } else if (arg.starts_with("-") && arg.size() > 1) {
                std::string short_name = arg.substr(1);

                auto short_it = short_to_long_.find(short_name);
                if (short_it == short_to_long_.end()) {
                    std::cerr << "Unknown option: -" << short_name << std::endl;
                    return false;
                }

                const std::string& option_name = short_it->second;
                if (options_[option_name].has_value) {
                    if (!has_value_at(i + 1)) {
                        std::cerr << "Option -" << short_name << " requires a value" << std::endl;
                        return false;
                    }
                    parsed_values_[option_name] = args_[++i];
                } else {
                    parsed_values_[option_name] = "true";
                }
            } else {
                positional_args_.push_back(arg);
            }
        }

        for (const auto& [name, option] : options_) {
            if (option.required && parsed_values_.find(name) == parsed_values_.end()) {
                std::cerr << "Required option --" << name << " not provided" << std::endl;
                return false;
            }
        }

        return true;
    }

    /**
     * @brief Value given on the command line, if any
     */
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

    /**
     * @brief Value converted with operator>>, empty if absent or not fully convertible
     */
    template<typename T>
    std::optional<T> get_as(const std::string& option_name) const {
        auto value = get(option_name);
        if (!value.has_value()) {
            return std::nullopt;
        }

        std::istringstream iss(value.value());
        T result;
        if (iss >> result && (iss >> std::ws).eof()) {
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
        std::cout << "    " << program_name_ << " [OPTIONS]\n\n";

        for (const auto& section : sections_) {
            std::cout << section << ":\n";
            for (const auto& name : order_) {
                const auto& option = options_.at(name);
                if (option.section == section) {
                    print_help_line(option);
                }
            }
            std::cout << "\n";
        }

        std::cout << "HELP:\n";
        std::cout << "    -h, --help                      Show this help\n";
    }

private:
    void register_option(Option option) {
        const std::string name = option.long_name;
        if (!option.short_name.empty()) {
            short_to_long_[option.short_name] = name;
        }
        if (options_.find(name) == options_.end()) {
            order_.push_back(name);
        }
        if (std::find(sections_.begin(), sections_.end(), option.section) == sections_.end()) {
            sections_.push_back(option.section);
        }
        options_[name] = std::move(option);
    }

    /**
     * @brief True if args_[index] can be an option value (negative numbers allowed)
     */
    bool has_value_at(size_t index) const {
        if (index >= args_.size()) {
            return false;
        }
        const std::string& candidate = args_[index];
        if (!candidate.starts_with("-") || candidate.size() == 1) {
            return true;
        }
        return std::isdigit(static_cast<unsigned char>(candidate[1])) || candidate[1] == '.';
    }

    void print_help_line(const Option& option) const {
        std::string left = "    ";
        left += option.short_name.empty() ? "    " : "-" + option.short_name + ", ";
        left += "--" + option.long_name;
        if (option.has_value) {
            left += " VALUE";
        }
        if (left.size() < 36) {
            left.append(36 - left.size(), ' ');
        } else {
            left += "  ";
        }

        std::cout << left << option.description;
        if (!option.default_value.empty()) {
            std::cout << " (default: " << option.default_value << ")";
        }
        std::cout << "\n";
    }

    std::string program_name_;
    std::string description_;
    std::string current_section_ = "OPTIONS";
    std::map<std::string, Option> options_;
    std::vector<std::string> order_;
    std::vector<std::string> sections_;
    std::map<std::string, std::string> short_to_long_;
    std::vector<std::string> args_;
    std::map<std::string, std::string> parsed_values_;
    std::vector<std::string> positional_args_;
};

} // namespace habitat
