#include "peerdrop/network/tcp_channel.hpp"
#include "peerdrop/core/logger.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>

namespace peerdrop::network {

TcpChannel::TcpChannel(boost::asio::io_context& io_context, std::string host, std::uint16_t port)
    : io_context_(io_context)
    , socket_(io_context)
    , resolver_(io_context)
    , client_(true)
    , host_(std::move(host))
    , port_(port)
    , remote_endpoint_(host_ + ":" + std::to_string(port))
    , write_in_progress_(false)
    , close_after_write_(false) {
}

TcpChannel::TcpChannel(boost::asio::io_context& io_context, tcp::socket socket)
    : io_context_(io_context)
    , socket_(std::move(socket))
    , resolver_(io_context)
    , client_(false)
    , port_(0)
    , write_in_progress_(false)
    , close_after_write_(false) {
    
    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if (!ec) {
        host_ = endpoint.address().to_string();
        port_ = endpoint.port();
        remote_endpoint_ = host_ + ":" + std::to_string(port_);
    } else {
        remote_endpoint_ = "unknown";
        LOG_WARN("Failed to get remote endpoint: {}", ec.message());
    }
}

TcpChannel::~TcpChannel() {
    LOG_DEBUG("TCP channel to {} destroyed", remote_endpoint_);
}

std::shared_ptr<TcpChannel> TcpChannel::self() {
    return std::static_pointer_cast<TcpChannel>(shared_from_this());
}

void TcpChannel::open() {
    if (state() != ChannelState::IDLE) {
        LOG_WARN("TCP channel to {} cannot be opened from state {}", remote_endpoint_, to_string(state()));
        return;
    }
    
    set_state(ChannelState::OPENING);
    auto me = self();
    
    if (!client_) {
        boost::asio::post(io_context_, [me]() {
            if (me->state() == ChannelState::OPENING) {
                me->handle_connected();
            }
        });
        return;
    }
    
    LOG_INFO("Connecting to {}", remote_endpoint_);
    
    resolver_.async_resolve(host_, std::to_string(port_),
        [this, me](boost::system::error_code ec, tcp::resolver::results_type endpoints) {
            if (state() != ChannelState::OPENING) {
                return;
            }
            if (ec) {
                LOG_ERROR("Failed to resolve {}: {}", remote_endpoint_, ec.message());
                fail("Failed to resolve " + remote_endpoint_ + ": " + ec.message());
                return;
            }
            
            boost::asio::async_connect(socket_, endpoints,
                [this, me](boost::system::error_code ec, const tcp::endpoint&) {
                    if (state() != ChannelState::OPENING) {
                        return;
                    }
                    if (ec) {
                        LOG_ERROR("Failed to connect to {}: {}", remote_endpoint_, ec.message());
                        fail("Failed to connect to " + remote_endpoint_ + ": " + ec.message());
                        return;
                    }
                    handle_connected();
                });
        });
}

void TcpChannel::handle_connected() {
    set_state(ChannelState::OPEN);
    
    boost::system::error_code ec;
    socket_.set_option(tcp::no_delay(true), ec);
    if (ec) {
        LOG_DEBUG("Failed to disable Nagle on {}: {}", remote_endpoint_, ec.message());
    }
    
    LOG_INFO("TCP channel to {} open", remote_endpoint_);
    do_read_header();
    notify_open();
}

void TcpChannel::send(const Frame& frame) {
    if (state() != ChannelState::OPEN) {
        LOG_WARN("Attempted to send on inactive TCP channel to {}", remote_endpoint_);
        return;
    }
    
    std::vector<std::uint8_t> data;
    try {
        data = FrameCodec::encode(frame);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to encode frame for {}: {}", remote_endpoint_, e.what());
        fail(e.what());
        return;
    }
    
    write_queue_.push_back(std::move(data));
    if (!write_in_progress_) {
        do_write();
    }
}

void TcpChannel::close() {
    if (state() == ChannelState::CLOSED) {
        return;
    }
    
    set_state(ChannelState::CLOSED);
    LOG_INFO("Closing TCP channel to {}", remote_endpoint_);
    
    resolver_.cancel();
    
    // Frames already queued (typically a final Error or Done) still go out.
    if (write_in_progress_ || !write_queue_.empty()) {
        close_after_write_ = true;
    } else {
        shutdown_socket();
    }
    
    auto me = self();
    boost::asio::post(io_context_, [me]() { me->notify_close(); });
}

void TcpChannel::shutdown_socket() {
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

// The frame at the front stays alive while async_write still references it.
void TcpChannel::discard_pending_writes() {
    if (write_in_progress_ && !write_queue_.empty()) {
        write_queue_.erase(write_queue_.begin() + 1, write_queue_.end());
    } else {
        write_queue_.clear();
    }
}

void TcpChannel::do_read_header() {
    if (state() != ChannelState::OPEN) {
        return;
    }
    
    auto me = self();
    boost::asio::async_read(socket_,
        boost::asio::buffer(read_header_buffer_),
        [this, me](boost::system::error_code ec, std::size_t) {
            if (state() != ChannelState::OPEN) {
                return;
            }
            if (ec) {
                handle_error(ec);
                return;
            }
            
            FrameHeader header;
            try {
                header = FrameHeader::deserialize(read_header_buffer_);
            } catch (const std::exception& e) {
                LOG_ERROR("Failed to parse frame header from {}: {}", remote_endpoint_, e.what());
                fail(e.what());
                return;
            }
            
            if (!header.is_valid()) {
                LOG_ERROR("Invalid frame header from {} (payload {} bytes)", remote_endpoint_, header.payload_size);
                fail("Invalid frame header");
                return;
            }
            
            do_read_payload(header);
        });
}

void TcpChannel::do_read_payload(const FrameHeader& header) {
    read_payload_buffer_.resize(header.payload_size);
    
    auto me = self();
    boost::asio::async_read(socket_,
        boost::asio::buffer(read_payload_buffer_),
        [this, me, header](boost::system::error_code ec, std::size_t) {
            if (state() != ChannelState::OPEN) {
                return;
            }
            if (ec) {
                handle_error(ec);
                return;
            }
            
            Frame frame;
            try {
                frame = FrameCodec::decode_payload(header, std::move(read_payload_buffer_));
            } catch (const std::exception& e) {
                LOG_ERROR("Failed to decode frame from {}: {}", remote_endpoint_, e.what());
                fail(e.what());
                return;
            }
            read_payload_buffer_.clear();
            
            do_read_header();
            notify_frame(std::move(frame));
        });
}

void TcpChannel::do_write() {
    if (write_queue_.empty() || write_in_progress_) {
        return;
    }
    
    write_in_progress_ = true;
    auto& message = write_queue_.front();
    
    auto me = self();
    boost::asio::async_write(socket_,
        boost::asio::buffer(message),
        [this, me](boost::system::error_code ec, std::size_t) {
            write_in_progress_ = false;
            
            if (ec) {
                if (close_after_write_) {
                    LOG_DEBUG("Dropping queued frames for {}: {}", remote_endpoint_, ec.message());
                    write_queue_.clear();
                    shutdown_socket();
                } else {
                    handle_error(ec);
                }
                return;
            }
            
            write_queue_.pop_front();
            if (!write_queue_.empty()) {
                do_write();
            } else if (close_after_write_) {
                shutdown_socket();
            }
        });
}

void TcpChannel::handle_error(const boost::system::error_code& error) {
    if (error == boost::asio::error::operation_aborted) {
        LOG_DEBUG("TCP operation aborted for {}", remote_endpoint_);
        return;
    }
    
    if (error == boost::asio::error::eof ||
        error == boost::asio::error::connection_reset ||
        error == boost::asio::error::broken_pipe) {
        LOG_INFO("TCP channel to {} closed by peer", remote_endpoint_);
        discard_pending_writes();
        close();
        return;
    }
    
    LOG_ERROR("TCP channel error with {}: {}", remote_endpoint_, error.message());
    fail(error.message());
}

void TcpChannel::fail(const std::string& message) {
    if (state() == ChannelState::CLOSED) {
        return;
    }
    
    discard_pending_writes();
    notify_error(message);
    close();
}

}
