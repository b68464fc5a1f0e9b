#pragma once

#include "peerdrop/transfer/uploader_session.hpp"
#include <vector>

namespace peerdrop::transfer {

// Serves one file to any number of downloaders. Each accepted channel gets
// its own UploaderSession; the file source and password are shared.
class UploaderHost {
public:
    using SessionCallback = std::function<void(const UploadConnectionInfo&)>;
    
    UploaderHost(boost::asio::io_context& io_context,
                 std::shared_ptr<FileSource> file,
                 std::string_view password = {},
                 TransferSettings settings = {});
    ~UploaderHost();
    
    UploaderHost(const UploaderHost&) = delete;
    UploaderHost& operator=(const UploaderHost&) = delete;
    
    std::shared_ptr<UploaderSession> accept(std::shared_ptr<network::Channel> channel);
    
    std::vector<UploadConnectionInfo> connections() const;
    std::size_t active_count() const;
    std::size_t total_downloads() const { return completed_downloads_; }
    std::size_t session_count() const { return sessions_.size(); }
    
    // Drops sessions that reached DONE or ERROR. Returns how many were removed.
    std::size_t remove_finished();
    void stop();
    
    const FileInfo& file_info() const { return file_->info(); }
    bool is_stopped() const { return stopped_; }
    
    void set_session_callback(SessionCallback callback) { session_callback_ = std::move(callback); }

private:
    void on_session_state(std::uint64_t id, UploadState state);
    
    boost::asio::io_context& io_context_;
    std::shared_ptr<FileSource> file_;
    crypto::SecureBytes password_;
    TransferSettings settings_;
    
    std::vector<std::shared_ptr<UploaderSession>> sessions_;
    std::uint64_t next_session_id_;
    std::size_t completed_downloads_;
    bool stopped_;
    
    SessionCallback session_callback_;
};

}
