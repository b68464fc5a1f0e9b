#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <span>
#include <cstdint>

namespace peerdrop::core::utils {

class StringUtils {
public:
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static bool starts_with(const std::string& str, const std::string& prefix);
    static std::string format_bytes(std::uint64_t bytes);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static bool is_file(const std::filesystem::path& path);
    static std::optional<std::uint64_t> file_size(const std::filesystem::path& path);
    static bool create_directories(const std::filesystem::path& path);
    static bool write_binary_file(const std::filesystem::path& path, std::span<const std::uint8_t> content);
    
    // Maps the extension to a MIME type, application/octet-stream when unknown.
    static std::string guess_mime_type(const std::filesystem::path& path);
    
    // Appends " (n)" before the extension until the path is free.
    static std::filesystem::path unique_path(const std::filesystem::path& path);
};

class SystemUtils {
public:
    static std::string os_name();
};

}
