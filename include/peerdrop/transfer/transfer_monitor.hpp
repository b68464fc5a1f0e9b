#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace peerdrop::transfer {

// The two per-session timers. Callbacks run on the io_context and never fire
// after their timer was cancelled or re-armed.
class TransferMonitor {
public:
    using TimeoutCallback = std::function<void()>;
    
    TransferMonitor(boost::asio::io_context& io_context,
                    std::chrono::milliseconds connection_timeout,
                    std::chrono::milliseconds stall_timeout);
    ~TransferMonitor();
    
    TransferMonitor(const TransferMonitor&) = delete;
    TransferMonitor& operator=(const TransferMonitor&) = delete;
    
    // Connection establishment / first response.
    void arm_connection_timeout(TimeoutCallback callback);
    void cancel_connection_timeout();
    bool is_connection_timeout_active() const { return connection_active_; }
    
    // No progress while downloading or streaming.
    void arm_stall_timeout(TimeoutCallback callback);
    void reset_stall_timeout();
    void cancel_stall_timeout();
    bool is_stall_timeout_active() const { return stall_active_; }
    
    void cancel_all();
    
    std::chrono::milliseconds connection_timeout() const { return connection_timeout_; }
    std::chrono::milliseconds stall_timeout() const { return stall_timeout_; }

private:
    void start_connection_timer();
    void start_stall_timer();
    
    std::chrono::milliseconds connection_timeout_;
    std::chrono::milliseconds stall_timeout_;
    
    boost::asio::steady_timer connection_timer_;
    boost::asio::steady_timer stall_timer_;
    
    TimeoutCallback connection_callback_;
    TimeoutCallback stall_callback_;
    
    // Bumped on every arm/cancel; a completion carrying an older value is stale.
    std::uint64_t connection_generation_;
    std::uint64_t stall_generation_;
    bool connection_active_;
    bool stall_active_;
    
    std::shared_ptr<bool> alive_;
};

}
