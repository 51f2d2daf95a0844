#ifndef DDOSFLOWGEN_TOOLS_ARG_PARSER_HPP
#define DDOSFLOWGEN_TOOLS_ARG_PARSER_HPP

#include <string>
#include <vector>
#include <iostream>
#include <stdexcept>
#include <cstdint>

namespace ddosflowgen {
namespace tools {

/**
 * Simple command-line argument parser
 *
 * Supports string options, unsigned integer options and boolean flags.
 */
class ArgParser {
public:
    explicit ArgParser(const std::string& description)
        : description_(description), show_help_(false) {}

    // Add string option
    void add_option(const std::string& short_name,
                    const std::string& long_name,
                    std::string& target,
                    const std::string& description,
                    bool required = false,
                    const std::string& default_value = "") {
        Option opt;
        opt.short_name = short_name;
        opt.long_name = long_name;
        opt.description = description;
        opt.required = required;
        opt.type = OptionType::STRING;
        opt.string_target = &target;
        opt.default_string = default_value;
        options_.push_back(opt);

        if (!default_value.empty()) {
            target = default_value;
        }
    }

    // Add unsigned integer option; was_set() tells whether it was given
    void add_option(const std::string& short_name,
                    const std::string& long_name,
                    uint64_t& target,
                    const std::string& description,
                    uint64_t default_value) {
        Option opt;
        opt.short_name = short_name;
        opt.long_name = long_name;
        opt.description = description;
        opt.type = OptionType::UINT64;
        opt.uint64_target = &target;
        opt.default_uint64 = default_value;
        options_.push_back(opt);

        target = default_value;
    }

    // Add flag (boolean) option
    void add_flag(const std::string& long_name,
                  bool& target,
                  const std::string& description) {
        Option opt;
        opt.long_name = long_name;
        opt.description = description;
        opt.type = OptionType::BOOL;
        opt.bool_target = &target;
        options_.push_back(opt);

        target = false;
    }

    // Parse arguments
    bool parse(int argc, char** argv) {
        program_name_ = argc > 0 ? argv[0] : "ddosflowgen";

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                show_help_ = true;
                return false;
            }

            Option* opt = find_option(arg);
            if (!opt) {
                error_ = "Unknown option: " + arg;
                return false;
            }

            if (opt->type == OptionType::BOOL) {
                *opt->bool_target = true;
                opt->was_set = true;
                continue;
            }

            if (i + 1 >= argc) {
                error_ = "Option " + arg + " requires a value";
                return false;
            }

            std::string value = argv[++i];

            if (opt->type == OptionType::STRING) {
                *opt->string_target = value;
            } else {
                if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
                    error_ = "Invalid value '" + value + "' for option " + arg;
                    return false;
                }
                try {
                    *opt->uint64_target = std::stoull(value);
                } catch (const std::out_of_range&) {
                    error_ = "Value '" + value + "' out of range for option " + arg;
                    return false;
                }
            }
            opt->was_set = true;
        }

        // Check required options
        for (const auto& opt : options_) {
            if (opt.required && !opt.was_set) {
                error_ = "Required option --" + opt.long_name + " not provided";
                return false;
            }
        }

        return true;
    }

    bool was_set(const std::string& long_name) const {
        for (const auto& opt : options_) {
            if (opt.long_name == long_name) {
                return opt.was_set;
            }
        }
        return false;
    }

    // Print help
    void print_help(std::ostream& out = std::cout) const {
        out << description_ << "\n";
        out << "Usage: " << program_name_ << " [OPTIONS]\n\n";
        out << "Options:\n";

        for (const auto& opt : options_) {
            out << "  ";
            if (!opt.short_name.empty()) {
                out << opt.short_name << ", ";
            }
            out << "--" << opt.long_name;
            if (opt.type != OptionType::BOOL) {
                out << " <value>";
            }
            out << "\n      " << opt.description;

            if (opt.type == OptionType::STRING && !opt.required && !opt.default_string.empty()) {
                out << " (default: " << opt.default_string << ")";
            } else if (opt.type == OptionType::UINT64) {
                out << " (default: " << opt.default_uint64 << ")";
            }
            if (opt.required) {
                out << " [REQUIRED]";
            }
            out << "\n\n";
        }
    }

    std::string error() const { return error_; }

    bool should_show_help() const { return show_help_; }

private:
    enum class OptionType {
        STRING,
        UINT64,
        BOOL
    };

    struct Option {
        std::string short_name;
        std::string long_name;
        std::string description;
        bool required = false;
        bool was_set = false;
        OptionType type = OptionType::STRING;

        std::string* string_target = nullptr;
        uint64_t* uint64_target = nullptr;
        bool* bool_target = nullptr;

        std::string default_string;
        uint64_t default_uint64 = 0;
    };

    Option* find_option(const std::string& name) {
        for (auto& opt : options_) {
            if ((!opt.short_name.empty() && name == opt.short_name) ||
                name == "--" + opt.long_name) {
                return &opt;
            }
        }
        return nullptr;
    }

    std::string description_;
    std::string program_name_;
    std::string error_;
    bool show_help_;
    std::vector<Option> options_;
};

} // namespace tools
} // namespace ddosflowgen

#endif // DDOSFLOWGEN_TOOLS_ARG_PARSER_HPP
