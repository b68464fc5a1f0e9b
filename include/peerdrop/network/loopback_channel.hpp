#pragma once

#include "peerdrop/network/channel.hpp"
#include <boost/asio/io_context.hpp>
#include <deque>
#include <utility>

namespace peerdrop::network {

// One end of an in-process channel pair. Frames go through FrameCodec and are
// posted to the peer end, so delivery order and wire validation match a real
// transport while everything runs on a single io_context.
class LoopbackChannel : public Channel {
public:
    using Pair = std::pair<std::shared_ptr<LoopbackChannel>, std::shared_ptr<LoopbackChannel>>;
    
    static Pair create_pair(boost::asio::io_context& io_context);
    
    LoopbackChannel(boost::asio::io_context& io_context, std::string label);
    ~LoopbackChannel() override;
    
    void open() override;
    void send(const Frame& frame) override;
    void close() override;
    std::string label() const override { return label_; }
    
    // Simulates a transport failure: fires error on this end, then tears
    // down both ends.
    void fail(const std::string& message);
    
    std::size_t frames_sent() const { return frames_sent_; }
    std::uint64_t bytes_sent() const { return bytes_sent_; }

private:
    void deliver(std::vector<std::uint8_t> data);
    void dispatch(const std::vector<std::uint8_t>& data);
    void remote_closed();
    std::shared_ptr<LoopbackChannel> self();
    
    boost::asio::io_context& io_context_;
    std::string label_;
    std::weak_ptr<LoopbackChannel> peer_;
    
    std::deque<std::vector<std::uint8_t>> pending_;
    std::size_t frames_sent_;
    std::uint64_t bytes_sent_;
};

}
