#include "peerdrop/transfer/transfer_monitor.hpp"
#include "peerdrop/core/logger.hpp"

namespace peerdrop::transfer {

TransferMonitor::TransferMonitor(boost::asio::io_context& io_context,
                                 std::chrono::milliseconds connection_timeout,
                                 std::chrono::milliseconds stall_timeout)
    : connection_timeout_(connection_timeout)
    , stall_timeout_(stall_timeout)
    , connection_timer_(io_context)
    , stall_timer_(io_context)
    , connection_generation_(0)
    , stall_generation_(0)
    , connection_active_(false)
    , stall_active_(false)
    , alive_(std::make_shared<bool>(true)) {
}

TransferMonitor::~TransferMonitor() {
    *alive_ = false;
    connection_timer_.cancel();
    stall_timer_.cancel();
}

void TransferMonitor::arm_connection_timeout(TimeoutCallback callback) {
    connection_callback_ = std::move(callback);
    start_connection_timer();
}

void TransferMonitor::cancel_connection_timeout() {
    if (connection_active_) {
        LOG_TRACE("Connection timer cancelled");
    }
    ++connection_generation_;
    connection_active_ = false;
    connection_callback_ = nullptr;
    connection_timer_.cancel();
}

void TransferMonitor::arm_stall_timeout(TimeoutCallback callback) {
    stall_callback_ = std::move(callback);
    start_stall_timer();
}

void TransferMonitor::reset_stall_timeout() {
    if (!stall_active_) {
        return;
    }
    start_stall_timer();
}

void TransferMonitor::cancel_stall_timeout() {
    if (stall_active_) {
        LOG_TRACE("Stall timer cancelled");
    }
    ++stall_generation_;
    stall_active_ = false;
    stall_callback_ = nullptr;
    stall_timer_.cancel();
}

void TransferMonitor::cancel_all() {
    cancel_connection_timeout();
    cancel_stall_timeout();
}

void TransferMonitor::start_connection_timer() {
    auto generation = ++connection_generation_;
    connection_active_ = true;
    
    connection_timer_.expires_after(connection_timeout_);
    connection_timer_.async_wait(
        [this, generation, alive = alive_](boost::system::error_code ec) {
            if (ec || !*alive || generation != connection_generation_) {
                return;
            }
            connection_active_ = false;
            LOG_DEBUG("Connection timer expired after {} ms", connection_timeout_.count());
            
            auto callback = std::move(connection_callback_);
            connection_callback_ = nullptr;
            if (callback) {
                callback();
            }
        });
}

void TransferMonitor::start_stall_timer() {
    auto generation = ++stall_generation_;
    stall_active_ = true;
    
    stall_timer_.expires_after(stall_timeout_);
    stall_timer_.async_wait(
        [this, generation, alive = alive_](boost::system::error_code ec) {
            if (ec || !*alive || generation != stall_generation_) {
                return;
            }
            stall_active_ = false;
            LOG_DEBUG("Stall timer expired after {} ms", stall_timeout_.count());
            
            auto callback = std::move(stall_callback_);
            stall_callback_ = nullptr;
            if (callback) {
                callback();
            }
        });
}

}
