#pragma once

#include "peerdrop/network/tcp_channel.hpp"
#include <functional>
#include <memory>

namespace peerdrop::network {

// Accepts downloader connections and hands each one over as an unopened
// server-mode TcpChannel. Runs on the caller's io_context.
class TcpUploadServer {
public:
    using ChannelHandler = std::function<void(std::shared_ptr<Channel>)>;
    
    TcpUploadServer(boost::asio::io_context& io_context, std::uint16_t port);
    ~TcpUploadServer();
    
    TcpUploadServer(const TcpUploadServer&) = delete;
    TcpUploadServer& operator=(const TcpUploadServer&) = delete;
    
    bool start();
    void stop();
    
    bool is_running() const { return running_; }
    std::uint16_t port() const;
    std::size_t accepted_count() const { return accepted_count_; }
    
    void set_channel_handler(ChannelHandler handler) { channel_handler_ = std::move(handler); }

private:
    void do_accept();
    
    boost::asio::io_context& io_context_;
    std::uint16_t port_;
    tcp::acceptor acceptor_;
    boost::asio::steady_timer retry_timer_;
    bool running_;
    std::size_t accepted_count_;
    
    ChannelHandler channel_handler_;
};

}
