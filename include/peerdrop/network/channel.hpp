#pragma once

#include "peerdrop/network/protocol.hpp"
#include <memory>
#include <string>
#include <functional>

namespace peerdrop::network {

enum class ChannelState {
    IDLE,
    OPENING,
    OPEN,
    CLOSED
};

const char* to_string(ChannelState state);

// Reliable, ordered, message-oriented connection between two peers. Every
// event is delivered on the io_context thread that owns the channel.
class Channel : public std::enable_shared_from_this<Channel> {
public:
    using OpenHandler = std::function<void()>;
    using FrameHandler = std::function<void(Frame)>;
    using CloseHandler = std::function<void()>;
    using ErrorHandler = std::function<void(const std::string&)>;
    
    virtual ~Channel() = default;
    
    virtual void open() = 0;
    virtual void send(const Frame& frame) = 0;
    virtual void close() = 0;
    virtual std::string label() const = 0;
    
    ChannelState state() const { return state_; }
    bool is_open() const { return state_ == ChannelState::OPEN; }
    
    void set_open_handler(OpenHandler handler) { open_handler_ = std::move(handler); }
    void set_frame_handler(FrameHandler handler) { frame_handler_ = std::move(handler); }
    void set_close_handler(CloseHandler handler) { close_handler_ = std::move(handler); }
    void set_error_handler(ErrorHandler handler) { error_handler_ = std::move(handler); }
    void clear_handlers();
    
    void send_control(const ControlMessage& message) { send(Frame{message}); }
    void send_binary(std::vector<std::uint8_t> data) { send(Frame{BinaryChunk{std::move(data)}}); }

protected:
    void set_state(ChannelState state) { state_ = state; }
    
    void notify_open();
    void notify_frame(Frame frame);
    void notify_close();
    void notify_error(const std::string& message);

private:
    ChannelState state_ = ChannelState::IDLE;
    
    OpenHandler open_handler_;
    FrameHandler frame_handler_;
    CloseHandler close_handler_;
    ErrorHandler error_handler_;
};

using ChannelFactory = std::function<std::shared_ptr<Channel>()>;

}
