#pragma once

#include "peerdrop/network/channel.hpp"
#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <array>
#include <deque>

namespace peerdrop::network {

using boost::asio::ip::tcp;

// Channel over a TCP stream. Each frame travels as a FrameHeader followed by
// its payload. Client channels resolve and connect on open(); server channels
// wrap a socket handed over by an acceptor.
class TcpChannel : public Channel {
public:
    TcpChannel(boost::asio::io_context& io_context, std::string host, std::uint16_t port);
    TcpChannel(boost::asio::io_context& io_context, tcp::socket socket);
    ~TcpChannel() override;
    
    void open() override;
    void send(const Frame& frame) override;
    void close() override;
    std::string label() const override { return remote_endpoint_; }
    
    bool is_client() const { return client_; }

private:
    std::shared_ptr<TcpChannel> self();
    
    void handle_connected();
    void do_read_header();
    void do_read_payload(const FrameHeader& header);
    void do_write();
    void handle_error(const boost::system::error_code& error);
    void fail(const std::string& message);
    void shutdown_socket();
    void discard_pending_writes();
    
    boost::asio::io_context& io_context_;
    tcp::socket socket_;
    tcp::resolver resolver_;
    bool client_;
    std::string host_;
    std::uint16_t port_;
    std::string remote_endpoint_;
    
    std::array<std::uint8_t, FRAME_HEADER_SIZE> read_header_buffer_;
    std::vector<std::uint8_t> read_payload_buffer_;
    
    std::deque<std::vector<std::uint8_t>> write_queue_;
    bool write_in_progress_;
    bool close_after_write_;
};

}
