#include "peerdrop/transfer/transfer_types.hpp"
#include "peerdrop/core/config.hpp"
#include "peerdrop/core/logger.hpp"
#include "peerdrop/core/utils.hpp"
#include <algorithm>

namespace peerdrop::transfer {

TransferSettings TransferSettings::from_config(const core::Config& config) {
    TransferSettings settings;
    settings.os_name = core::utils::SystemUtils::os_name();
    
    auto chunk_size = config.get_uint64("transfer.chunk_size", DEFAULT_CHUNK_SIZE);
    if (chunk_size == 0 || chunk_size > network::MAX_FRAME_PAYLOAD) {
        LOG_WARN("Invalid transfer.chunk_size {}, using {}", chunk_size, DEFAULT_CHUNK_SIZE);
        chunk_size = DEFAULT_CHUNK_SIZE;
    }
    settings.chunk_size = static_cast<std::uint32_t>(chunk_size);
    
    auto in_flight = config.get_uint64("transfer.max_in_flight_bytes", DEFAULT_MAX_IN_FLIGHT_BYTES);
    if (in_flight < settings.chunk_size) {
        LOG_WARN("transfer.max_in_flight_bytes {} is below the chunk size, using {}",
                 in_flight, DEFAULT_MAX_IN_FLIGHT_BYTES);
        in_flight = std::max<std::uint64_t>(DEFAULT_MAX_IN_FLIGHT_BYTES, settings.chunk_size);
    }
    settings.max_in_flight_bytes = in_flight;
    
    auto connection_ms = config.get_uint64("transfer.connection_timeout_ms",
                                           DEFAULT_CONNECTION_TIMEOUT.count());
    if (connection_ms == 0) {
        LOG_WARN("Invalid transfer.connection_timeout_ms 0, using {}", DEFAULT_CONNECTION_TIMEOUT.count());
        connection_ms = DEFAULT_CONNECTION_TIMEOUT.count();
    }
    settings.connection_timeout = std::chrono::milliseconds(connection_ms);
    
    auto stall_ms = config.get_uint64("transfer.stall_timeout_ms", DEFAULT_STALL_TIMEOUT.count());
    if (stall_ms == 0) {
        LOG_WARN("Invalid transfer.stall_timeout_ms 0, using {}", DEFAULT_STALL_TIMEOUT.count());
        stall_ms = DEFAULT_STALL_TIMEOUT.count();
    }
    settings.stall_timeout = std::chrono::milliseconds(stall_ms);
    
    auto max_file_size = config.get_uint64("transfer.max_file_size", DEFAULT_MAX_FILE_SIZE);
    if (max_file_size == 0) {
        LOG_WARN("Invalid transfer.max_file_size 0, using {}", DEFAULT_MAX_FILE_SIZE);
        max_file_size = DEFAULT_MAX_FILE_SIZE;
    }
    settings.max_file_size = max_file_size;
    
    return settings;
}

}
