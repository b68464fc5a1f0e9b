#include "peerdrop/network/tcp_upload_server.hpp"
#include "peerdrop/core/logger.hpp"

namespace peerdrop::network {

TcpUploadServer::TcpUploadServer(boost::asio::io_context& io_context, std::uint16_t port)
    : io_context_(io_context)
    , port_(port)
    , acceptor_(io_context)
    , retry_timer_(io_context)
    , running_(false)
    , accepted_count_(0) {
}

TcpUploadServer::~TcpUploadServer() {
    stop();
}

bool TcpUploadServer::start() {
    if (running_) {
        LOG_WARN("Upload server already running");
        return false;
    }
    
    try {
        tcp::endpoint endpoint(tcp::v4(), port_);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
        running_ = true;
        
        LOG_INFO("Upload server listening on port {}", port());
        do_accept();
        return true;
    } catch (const boost::system::system_error& e) {
        LOG_ERROR("Failed to start upload server on port {}: {}", port_, e.what());
        boost::system::error_code ec;
        acceptor_.close(ec);
        return false;
    }
}

void TcpUploadServer::stop() {
    if (!running_) {
        return;
    }
    
    LOG_INFO("Stopping upload server on port {}", port());
    running_ = false;
    
    retry_timer_.cancel();
    boost::system::error_code ec;
    acceptor_.close(ec);
}

std::uint16_t TcpUploadServer::port() const {
    boost::system::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? port_ : endpoint.port();
}

void TcpUploadServer::do_accept() {
    if (!running_) {
        return;
    }
    
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (!running_) {
                return;
            }
            
            if (!ec) {
                auto channel = std::make_shared<TcpChannel>(io_context_, std::move(socket));
                ++accepted_count_;
                LOG_INFO("Accepted downloader connection from {}", channel->label());
                
                if (channel_handler_) {
                    channel_handler_(channel);
                } else {
                    LOG_WARN("No handler for connection from {}, closing", channel->label());
                    channel->close();
                }
                do_accept();
            } else if (ec != boost::asio::error::operation_aborted) {
                LOG_ERROR("Accept error: {}", ec.message());
                
                retry_timer_.expires_after(std::chrono::milliseconds(100));
                retry_timer_.async_wait([this](boost::system::error_code wait_ec) {
                    if (!wait_ec) {
                        do_accept();
                    }
                });
            }
        });
}

}
