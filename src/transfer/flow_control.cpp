#include "peerdrop/transfer/flow_control.hpp"
#include <algorithm>

namespace peerdrop::transfer {

FlowController::FlowController(std::uint64_t max_in_flight_bytes)
    : max_in_flight_bytes_(std::max<std::uint64_t>(max_in_flight_bytes, 1))
    , bytes_sent_(0)
    , bytes_acked_(0)
    , paused_(false)
{
}

// Offsets are absolute file positions, so a stream resumed at `start_offset`
// counts everything before it as already delivered.
void FlowController::reset(std::uint64_t start_offset) {
    bytes_sent_ = start_offset;
    bytes_acked_ = start_offset;
    paused_ = false;
}

std::uint64_t FlowController::window_remaining() const {
    auto used = in_flight();
    return used >= max_in_flight_bytes_ ? 0 : max_in_flight_bytes_ - used;
}

void FlowController::on_bytes_sent(std::uint64_t bytes) {
    bytes_sent_ += bytes;
}

bool FlowController::on_ack(std::uint64_t bytes_received) {
    if (bytes_received < bytes_acked_ || bytes_received > bytes_sent_) {
        return false;
    }
    bytes_acked_ = bytes_received;
    return true;
}

} // namespace peerdrop::transfer
