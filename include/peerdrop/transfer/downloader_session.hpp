#pragma once

#include "peerdrop/network/channel.hpp"
#include "peerdrop/transfer/transfer_monitor.hpp"
#include "peerdrop/transfer/transfer_types.hpp"
#include <boost/asio/io_context.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace peerdrop::transfer {

enum class DownloadState {
    CONNECTING,
    PASSWORD_REQUIRED,
    PASSWORD_ERROR,
    READY,
    DOWNLOADING,
    COMPLETE,
    ERROR
};

const char* to_string(DownloadState state);

struct DownloadedFile {
    std::string name;
    std::string mime_type;
    std::vector<std::uint8_t> data;
};

// Receiving side of one transfer. Create with std::make_shared; every
// callback runs on the io_context thread.
class DownloaderSession : public std::enable_shared_from_this<DownloaderSession> {
public:
    using StateCallback = std::function<void(DownloadState)>;
    using ProgressCallback = std::function<void(std::uint64_t received, std::uint64_t total)>;
    using CompleteCallback = std::function<void(const DownloadedFile&)>;
    
    DownloaderSession(boost::asio::io_context& io_context,
                      network::ChannelFactory channel_factory,
                      TransferSettings settings = {});
    ~DownloaderSession();
    
    DownloaderSession(const DownloaderSession&) = delete;
    DownloaderSession& operator=(const DownloaderSession&) = delete;
    
    TransferResult connect();
    TransferResult submit_password(const std::string& password);
    TransferResult start_download();
    // Drops the current channel and runs the connecting logic again.
    void reconnect();
    void cancel();
    
    DownloadState state() const { return state_; }
    const std::string& error() const { return error_; }
    const std::optional<FileInfo>& file_info() const { return file_info_; }
    std::uint64_t bytes_downloaded() const { return bytes_downloaded_; }
    double progress() const;
    bool has_pending_challenge() const { return challenge_.has_value(); }
    const std::optional<DownloadedFile>& downloaded_file() const { return downloaded_file_; }
    
    void set_state_callback(StateCallback callback) { state_callback_ = std::move(callback); }
    void set_progress_callback(ProgressCallback callback) { progress_callback_ = std::move(callback); }
    void set_complete_callback(CompleteCallback callback) { complete_callback_ = std::move(callback); }

private:
    void attach_channel();
    void detach_channel();
    void reset_transfer();
    
    void handle_open();
    void handle_frame(network::Frame frame);
    void handle_close();
    void handle_channel_error(const std::string& message);
    
    void on_password_required(const network::PasswordRequiredMessage& message);
    void on_info(const network::InfoMessage& message);
    void on_chunk(const network::ChunkMessage& message);
    void on_binary(network::BinaryChunk chunk);
    void on_remote_error(const network::ErrorMessage& message);
    
    void finalize();
    void fail(const std::string& message);
    void fail_and_notify(const std::string& message);
    void send(const network::ControlMessage& message);
    void set_state(DownloadState state);
    bool is_terminal() const;
    
    boost::asio::io_context& io_context_;
    network::ChannelFactory channel_factory_;
    TransferSettings settings_;
    TransferMonitor monitor_;
    
    std::shared_ptr<network::Channel> channel_;
    DownloadState state_;
    std::string error_;
    
    std::optional<FileInfo> file_info_;
    std::optional<std::string> challenge_;
    
    std::vector<std::vector<std::uint8_t>> chunks_;
    std::uint64_t bytes_downloaded_;
    std::uint64_t last_frame_size_;
    bool final_received_;
    std::optional<DownloadedFile> downloaded_file_;
    
    StateCallback state_callback_;
    ProgressCallback progress_callback_;
    CompleteCallback complete_callback_;
};

}
