#include "peerdrop/core/cli.hpp"
#include "peerdrop/core/utils.hpp"
#include <charconv>
#include <iomanip>
#include <iostream>
#include <limits>

namespace peerdrop::core {

namespace {

template<typename T>
std::optional<T> parse_number(const std::string& text) {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

}

CommandLineParser::CommandLineParser(const std::string& program_name)
    : program_name_(program_name) {
    add_option("h", "help", "Show this help message");
    add_option("v", "version", "Show version information");
    add_option("c", "config", "Configuration file path", true, "peerdrop.conf");
    add_option("", "verbose", "Enable verbose logging");
    add_option("p", "password", "Password protecting the transfer", true);
    add_option("", "port", "TCP port to listen on (share)", true);
    add_option("o", "output", "Directory for downloaded files (fetch)", true, ".");
}

void CommandLineParser::add_option(const std::string& short_name, const std::string& long_name,
                                   const std::string& description, bool has_value,
                                   const std::string& default_value) {
    specs_.push_back(OptionSpec{short_name, long_name, description, has_value, default_value});
}

const CommandLineParser::OptionSpec* CommandLineParser::find_long(const std::string& name) const {
    for (const auto& spec : specs_) {
        if (spec.long_name == name) return &spec;
    }
    return nullptr;
}

const CommandLineParser::OptionSpec* CommandLineParser::find_short(char name) const {
    for (const auto& spec : specs_) {
        if (spec.short_name.size() == 1 && spec.short_name[0] == name) return &spec;
    }
    return nullptr;
}

bool CommandLineParser::store(const OptionSpec& spec, const std::string& spelled,
                              std::optional<std::string> inline_value,
                              int& index, int argc, char* argv[]) {
    if (!spec.has_value) {
        values_[spec.long_name] = "true";
        return true;
    }

    if (inline_value) {
        values_[spec.long_name] = std::move(*inline_value);
    } else if (index + 1 < argc) {
        values_[spec.long_name] = argv[++index];
    } else {
        error_ = "Option " + spelled + " requires a value";
        return false;
    }
    return true;
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    values_.clear();
    positional_args_.clear();
    error_.clear();

    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (options_done || arg == "-" || !arg.starts_with("-")) {
            positional_args_.push_back(arg);
            continue;
        }
        if (arg == "--") {
            options_done = true;
            continue;
        }

        if (arg.starts_with("--")) {
            auto eq = arg.find('=');
            std::string name = arg.substr(2, eq == std::string::npos ? std::string::npos : eq - 2);
            std::optional<std::string> inline_value;
            if (eq != std::string::npos) inline_value = arg.substr(eq + 1);

            const auto* spec = find_long(name);
            if (!spec) {
                error_ = "Unknown option: --" + name;
                return false;
            }
            if (!store(*spec, "--" + name, std::move(inline_value), i, argc, argv)) {
                return false;
            }
            continue;
        }

        // Short flags may be grouped (-hv); a value-taking one ends the group.
        for (std::size_t j = 1; j < arg.size(); ++j) {
            std::string spelled = std::string("-") + arg[j];
            const auto* spec = find_short(arg[j]);
            if (!spec) {
                error_ = "Unknown option: " + spelled;
                return false;
            }

            std::optional<std::string> inline_value;
            if (spec->has_value && j + 1 < arg.size()) {
                inline_value = arg.substr(j + 1);
            }
            if (!store(*spec, spelled, std::move(inline_value), i, argc, argv)) {
                return false;
            }
            if (spec->has_value) break;
        }
    }

    return true;
}

bool CommandLineParser::has_option(const std::string& name) const {
    if (values_.count(name)) return true;
    if (name.size() == 1) {
        const auto* spec = find_short(name[0]);
        return spec && values_.count(spec->long_name);
    }
    return false;
}

std::string CommandLineParser::get_option(const std::string& name, const std::string& default_value) const {
    const OptionSpec* spec = find_long(name);
    if (!spec && name.size() == 1) spec = find_short(name[0]);

    const std::string& key = spec ? spec->long_name : name;
    if (auto it = values_.find(key); it != values_.end()) {
        return it->second;
    }
    if (spec && !spec->default_value.empty()) {
        return spec->default_value;
    }
    return default_value;
}

int CommandLineParser::get_int_option(const std::string& name, int default_value) const {
    return parse_number<int>(get_option(name)).value_or(default_value);
}

bool CommandLineParser::get_bool_option(const std::string& name, bool default_value) const {
    if (!has_option(name)) return default_value;

    auto value = utils::StringUtils::to_lower(get_option(name));
    return value.empty() || value == "true" || value == "1" || value == "yes";
}

std::optional<std::uint16_t> CommandLineParser::get_port_option(const std::string& name) const {
    auto value = parse_number<unsigned long>(get_option(name));
    if (!value || *value > std::numeric_limits<std::uint16_t>::max()) {
        return std::nullopt;
    }
    return static_cast<std::uint16_t>(*value);
}

void CommandLineParser::print_help() const {
    std::cout << "Usage: " << program_name_ << " [options] <command> [args...]\n\n"
              << "Options:\n";

    for (const auto& spec : specs_) {
        std::string flags = spec.short_name.empty() ? "    " : "-" + spec.short_name + ", ";
        flags += "--" + spec.long_name;
        if (spec.has_value) flags += " <value>";

        std::cout << "  " << std::left << std::setw(26) << flags << spec.description;
        if (!spec.default_value.empty()) {
            std::cout << " (default: " << spec.default_value << ")";
        }
        std::cout << "\n";
    }
}

void CommandLineParser::print_version() const {
    std::cout << program_name_ << " 1.0.0 (protocol v1)\n";
}

}
