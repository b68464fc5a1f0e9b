#include "peerdrop/core/config.hpp"
#include "peerdrop/core/logger.hpp"
#include "peerdrop/core/utils.hpp"
#include <charconv>
#include <fstream>

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

std::string section_of(const std::string& key) {
    auto dot = key.find('.');
    return dot == std::string::npos ? std::string{} : key.substr(0, dot);
}

}

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    std::string section;
    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        line = utils::StringUtils::trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line.front() == '[' && line.back() == ']') {
            section = utils::StringUtils::trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto eq_pos = line.find('=');
        std::string key = eq_pos == std::string::npos ? "" : utils::StringUtils::trim(line.substr(0, eq_pos));
        if (key.empty()) {
            LOG_WARN("{}:{}: ignoring malformed line", filename, line_number);
            continue;
        }

        if (!section.empty()) {
            key = section + "." + key;
        }
        values_[key] = utils::StringUtils::trim(line.substr(eq_pos + 1));
    }

    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << "# peerdrop configuration\n";

    // Keys are sorted, so each section's entries are contiguous.
    std::string current;
    bool first = true;
    for (const auto& [key, value] : values_) {
        auto section = section_of(key);
        if (first || section != current) {
            file << "\n";
            current = section;
            first = false;
        }
        file << key << "=" << value << "\n";
    }

    return file.good();
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    auto lower = utils::StringUtils::to_lower(*value);
    return lower == "true" || lower == "1" || lower == "yes" || lower == "on";
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get(key);
    if (!value) return default_value;
    return parse_number<int>(*value).value_or(default_value);
}

std::uint64_t Config::get_uint64(const std::string& key, std::uint64_t default_value) const {
    auto value = get(key);
    if (!value) return default_value;
    return parse_number<std::uint64_t>(*value).value_or(default_value);
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    return get(key).value_or(default_value);
}

void Config::set_defaults() {
    values_["server.port"] = "7070";
    values_["transfer.chunk_size"] = "262144";
    values_["transfer.max_in_flight_bytes"] = "4194304";
    values_["transfer.connection_timeout_ms"] = "30000";
    values_["transfer.stall_timeout_ms"] = "60000";
    values_["transfer.max_file_size"] = "2147483648";
    values_["log.level"] = "info";
    values_["log.file"] = "peerdrop.log";
}

}
