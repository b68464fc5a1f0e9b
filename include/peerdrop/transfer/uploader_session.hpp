#pragma once

#include "peerdrop/crypto/crypto_types.hpp"
#include "peerdrop/network/channel.hpp"
#include "peerdrop/transfer/file_source.hpp"
#include "peerdrop/transfer/flow_control.hpp"
#include "peerdrop/transfer/transfer_monitor.hpp"
#include "peerdrop/transfer/transfer_types.hpp"
#include <boost/asio/io_context.hpp>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace peerdrop::transfer {

enum class UploadState {
    IDLE,
    AWAITING_AUTH,
    SERVING,
    STREAMING,
    DONE,
    ERROR
};

const char* to_string(UploadState state);

struct UploadConnectionInfo {
    std::uint64_t id = 0;
    std::string label;
    UploadState state = UploadState::IDLE;
    std::string client_name;
    std::string client_os;
    std::uint64_t bytes_sent = 0;
    std::uint64_t bytes_acknowledged = 0;
    std::string error;
};

// Sending side of one transfer over one channel. Create with std::make_shared.
class UploaderSession : public std::enable_shared_from_this<UploaderSession> {
public:
    using StateCallback = std::function<void(UploadState)>;
    using ProgressCallback = std::function<void(std::uint64_t acknowledged, std::uint64_t total)>;
    
    // An empty password disables the challenge.
    UploaderSession(boost::asio::io_context& io_context,
                    std::shared_ptr<network::Channel> channel,
                    std::shared_ptr<FileSource> file,
                    std::string_view password = {},
                    TransferSettings settings = {},
                    std::uint64_t id = 0);
    ~UploaderSession();
    
    UploaderSession(const UploaderSession&) = delete;
    UploaderSession& operator=(const UploaderSession&) = delete;
    
    TransferResult start();
    void stop();
    
    std::uint64_t id() const { return id_; }
    UploadState state() const { return state_; }
    const std::string& error() const { return error_; }
    const FileInfo& file_info() const { return file_info_; }
    bool holds_file() const { return file_ != nullptr; }
    bool is_finished() const { return state_ == UploadState::DONE || state_ == UploadState::ERROR; }
    std::uint64_t bytes_acknowledged() const { return flow_.bytes_acked(); }
    std::uint32_t failed_password_attempts() const { return failed_password_attempts_; }
    UploadConnectionInfo connection_info() const;
    
    void set_state_callback(StateCallback callback) { state_callback_ = std::move(callback); }
    void set_progress_callback(ProgressCallback callback) { progress_callback_ = std::move(callback); }

private:
    void attach_channel();
    
    void handle_frame(network::Frame frame);
    void handle_close();
    void handle_channel_error(const std::string& message);
    
    void on_request_info(const network::RequestInfoMessage& message);
    void on_use_password(const network::UsePasswordMessage& message);
    void on_start(const network::StartMessage& message);
    void on_chunk_ack(const network::ChunkAckMessage& message);
    void on_done();
    void on_remote_error(const network::ErrorMessage& message);
    
    bool issue_challenge(bool previous_rejected);
    void send_info();
    void schedule_pump();
    void pump();
    
    void finish();
    void fail(const std::string& message);
    void fail_and_notify(const std::string& message);
    void send(const network::ControlMessage& message);
    void set_state(UploadState state);
    
    boost::asio::io_context& io_context_;
    std::shared_ptr<network::Channel> channel_;
    std::shared_ptr<FileSource> file_;
    FileInfo file_info_;
    crypto::SecureBytes password_;
    TransferSettings settings_;
    std::uint64_t id_;
    
    TransferMonitor monitor_;
    FlowController flow_;
    
    UploadState state_;
    std::string error_;
    std::string challenge_;
    std::uint32_t failed_password_attempts_;
    bool info_sent_;
    bool final_sent_;
    bool pump_scheduled_;
    std::uint64_t next_offset_;
    
    std::string client_name_;
    std::string client_os_;
    
    StateCallback state_callback_;
    ProgressCallback progress_callback_;
};

}
