#include "peerdrop/network/channel.hpp"

namespace peerdrop::network {

const char* to_string(ChannelState state) {
    switch (state) {
        case ChannelState::IDLE: return "idle";
        case ChannelState::OPENING: return "opening";
        case ChannelState::OPEN: return "open";
        case ChannelState::CLOSED: return "closed";
    }
    return "unknown";
}

void Channel::clear_handlers() {
    open_handler_ = nullptr;
    frame_handler_ = nullptr;
    close_handler_ = nullptr;
    error_handler_ = nullptr;
}

// Handlers are copied before the call: a handler may clear or replace the
// handlers of the channel that is invoking it.

void Channel::notify_open() {
    if (auto handler = open_handler_) {
        handler();
    }
}

void Channel::notify_frame(Frame frame) {
    if (auto handler = frame_handler_) {
        handler(std::move(frame));
    }
}

void Channel::notify_close() {
    if (auto handler = close_handler_) {
        handler();
    }
}

void Channel::notify_error(const std::string& message) {
    if (auto handler = error_handler_) {
        handler(message);
    }
}

}
