#pragma once

#include "peerdrop/network/protocol.hpp"
#include <chrono>
#include <cstdint>
#include <string>

namespace peerdrop::core {
class Config;
}

namespace peerdrop::transfer {

using FileInfo = network::FileInfo;

constexpr std::uint32_t DEFAULT_CHUNK_SIZE = 256 * 1024;
constexpr std::uint64_t DEFAULT_MAX_IN_FLIGHT_BYTES = 4 * 1024 * 1024;
constexpr std::chrono::milliseconds DEFAULT_CONNECTION_TIMEOUT{30000};
constexpr std::chrono::milliseconds DEFAULT_STALL_TIMEOUT{60000};
constexpr std::uint64_t DEFAULT_MAX_FILE_SIZE = 2ULL * 1024 * 1024 * 1024;

constexpr const char* DEFAULT_MIME_TYPE = "application/octet-stream";

enum class TransferError {
    SUCCESS = 0,
    INVALID_STATE,
    INVALID_ARGUMENT,
    NOT_CONNECTED,
    FILE_ERROR
};

struct TransferResult {
    TransferError error;
    std::string message;
    
    TransferResult(TransferError err = TransferError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}
    
    bool success() const { return error == TransferError::SUCCESS; }
    operator bool() const { return success(); }
};

struct TransferSettings {
    std::uint32_t chunk_size = DEFAULT_CHUNK_SIZE;
    std::uint64_t max_in_flight_bytes = DEFAULT_MAX_IN_FLIGHT_BYTES;
    std::chrono::milliseconds connection_timeout = DEFAULT_CONNECTION_TIMEOUT;
    std::chrono::milliseconds stall_timeout = DEFAULT_STALL_TIMEOUT;
    std::uint64_t max_file_size = DEFAULT_MAX_FILE_SIZE;
    
    // Diagnostic metadata the downloader reports in RequestInfo.
    std::string client_name = "peerdrop";
    std::string os_name;
    
    // Reads the transfer.* keys. Out-of-range values are replaced by their
    // defaults and logged.
    static TransferSettings from_config(const core::Config& config);
};

}
