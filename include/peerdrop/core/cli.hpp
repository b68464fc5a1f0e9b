#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace peerdrop::core {

class CommandLineParser {
public:
    explicit CommandLineParser(const std::string& program_name);

    // short_name may be empty; long_name is the key every getter accepts.
    void add_option(const std::string& short_name, const std::string& long_name,
                    const std::string& description, bool has_value = false,
                    const std::string& default_value = "");

    bool parse(int argc, char* argv[]);

    bool has_option(const std::string& name) const;
    std::string get_option(const std::string& name, const std::string& default_value = "") const;
    int get_int_option(const std::string& name, int default_value = 0) const;
    bool get_bool_option(const std::string& name, bool default_value = false) const;

    // Empty when the value is not a port number in 0..65535.
    std::optional<std::uint16_t> get_port_option(const std::string& name) const;

    const std::vector<std::string>& get_positional_args() const { return positional_args_; }
    const std::string& get_error() const { return error_; }

    void print_help() const;
    void print_version() const;

private:
    struct OptionSpec {
        std::string short_name;
        std::string long_name;
        std::string description;
        bool has_value = false;
        std::string default_value;
    };

    const OptionSpec* find_long(const std::string& name) const;
    const OptionSpec* find_short(char name) const;
    bool store(const OptionSpec& spec, const std::string& spelled,
               std::optional<std::string> inline_value, int& index, int argc, char* argv[]);

    std::string program_name_;
    std::vector<OptionSpec> specs_;
    std::map<std::string, std::string> values_;
    std::vector<std::string> positional_args_;
    std::string error_;
};

}
