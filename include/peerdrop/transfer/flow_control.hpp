#pragma once

#include <cstdint>

namespace peerdrop::transfer {

// Bounds how far the uploader may stream ahead of the downloader's last
// cumulative ChunkAck.
class FlowController {
public:
    explicit FlowController(std::uint64_t max_in_flight_bytes);
    
    void reset(std::uint64_t start_offset);
    
    bool can_send() const { return in_flight() < max_in_flight_bytes_; }
    std::uint64_t window_remaining() const;
    void on_bytes_sent(std::uint64_t bytes);
    
    // Returns false when the acknowledgment goes backwards or covers bytes
    // that were never sent.
    bool on_ack(std::uint64_t bytes_received);
    
    std::uint64_t in_flight() const { return bytes_sent_ - bytes_acked_; }
    std::uint64_t bytes_sent() const { return bytes_sent_; }
    std::uint64_t bytes_acked() const { return bytes_acked_; }
    std::uint64_t max_in_flight_bytes() const { return max_in_flight_bytes_; }
    
    bool is_paused() const { return paused_; }
    void set_paused(bool paused) { paused_ = paused; }

private:
    std::uint64_t max_in_flight_bytes_;
    std::uint64_t bytes_sent_;
    std::uint64_t bytes_acked_;
    bool paused_;
};

} // namespace peerdrop::transfer
