#include "peerdrop/network/loopback_channel.hpp"
#include "peerdrop/core/logger.hpp"
#include <boost/asio/post.hpp>

namespace peerdrop::network {

LoopbackChannel::Pair LoopbackChannel::create_pair(boost::asio::io_context& io_context) {
    auto a = std::make_shared<LoopbackChannel>(io_context, "loopback-a");
    auto b = std::make_shared<LoopbackChannel>(io_context, "loopback-b");
    a->peer_ = b;
    b->peer_ = a;
    return {a, b};
}

LoopbackChannel::LoopbackChannel(boost::asio::io_context& io_context, std::string label)
    : io_context_(io_context)
    , label_(std::move(label))
    , frames_sent_(0)
    , bytes_sent_(0) {
}

LoopbackChannel::~LoopbackChannel() {
    LOG_TRACE("Loopback channel {} destroyed", label_);
}

std::shared_ptr<LoopbackChannel> LoopbackChannel::self() {
    return std::static_pointer_cast<LoopbackChannel>(shared_from_this());
}

void LoopbackChannel::open() {
    if (state() != ChannelState::IDLE) {
        LOG_WARN("Loopback channel {} cannot be opened from state {}", label_, to_string(state()));
        return;
    }
    
    set_state(ChannelState::OPENING);
    
    auto me = self();
    boost::asio::post(io_context_, [me]() {
        if (me->state() != ChannelState::OPENING) {
            return;
        }
        me->set_state(ChannelState::OPEN);
        LOG_DEBUG("Loopback channel {} open", me->label_);
        me->notify_open();
        
        // Frames the peer sent before this end opened.
        while (!me->pending_.empty() && me->state() == ChannelState::OPEN) {
            auto data = std::move(me->pending_.front());
            me->pending_.pop_front();
            me->dispatch(data);
        }
    });
}

void LoopbackChannel::send(const Frame& frame) {
    if (state() != ChannelState::OPEN) {
        LOG_WARN("Attempted to send on inactive loopback channel {}", label_);
        return;
    }
    
    auto peer = peer_.lock();
    if (!peer) {
        LOG_WARN("Loopback channel {} has no peer", label_);
        return;
    }
    
    auto data = FrameCodec::encode(frame);
    ++frames_sent_;
    bytes_sent_ += data.size();
    
    boost::asio::post(io_context_, [peer, data = std::move(data)]() mutable {
        peer->deliver(std::move(data));
    });
}

void LoopbackChannel::deliver(std::vector<std::uint8_t> data) {
    switch (state()) {
        case ChannelState::CLOSED:
            return;
        case ChannelState::IDLE:
        case ChannelState::OPENING:
            pending_.push_back(std::move(data));
            return;
        case ChannelState::OPEN:
            dispatch(data);
            return;
    }
}

void LoopbackChannel::dispatch(const std::vector<std::uint8_t>& data) {
    Frame frame;
    try {
        frame = FrameCodec::decode(data);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to decode frame on {}: {}", label_, e.what());
        fail(e.what());
        return;
    }
    notify_frame(std::move(frame));
}

void LoopbackChannel::close() {
    if (state() == ChannelState::CLOSED) {
        return;
    }
    
    set_state(ChannelState::CLOSED);
    pending_.clear();
    LOG_DEBUG("Closing loopback channel {}", label_);
    
    auto me = self();
    boost::asio::post(io_context_, [me]() { me->notify_close(); });
    
    if (auto peer = peer_.lock()) {
        boost::asio::post(io_context_, [peer]() { peer->remote_closed(); });
    }
}

void LoopbackChannel::remote_closed() {
    if (state() == ChannelState::CLOSED) {
        return;
    }
    
    set_state(ChannelState::CLOSED);
    pending_.clear();
    LOG_DEBUG("Loopback channel {} closed by peer", label_);
    notify_close();
}

void LoopbackChannel::fail(const std::string& message) {
    if (state() == ChannelState::CLOSED) {
        return;
    }
    
    LOG_WARN("Loopback channel {} failed: {}", label_, message);
    notify_error(message);
    close();
}

}
