#include "peerdrop/transfer/uploader_host.hpp"
#include "peerdrop/core/logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace peerdrop::transfer {

UploaderHost::UploaderHost(boost::asio::io_context& io_context,
                           std::shared_ptr<FileSource> file,
                           std::string_view password,
                           TransferSettings settings)
    : io_context_(io_context)
    , file_(std::move(file))
    , password_(password)
    , settings_(std::move(settings))
    , next_session_id_(1)
    , completed_downloads_(0)
    , stopped_(false) {
    
    if (!file_) {
        throw std::invalid_argument("UploaderHost requires a file source");
    }
}

UploaderHost::~UploaderHost() {
    stop();
}

std::shared_ptr<UploaderSession> UploaderHost::accept(std::shared_ptr<network::Channel> channel) {
    if (stopped_) {
        LOG_WARN("Host stopped, rejecting connection from {}", channel->label());
        channel->close();
        return nullptr;
    }
    
    auto id = next_session_id_++;
    auto session = std::make_shared<UploaderSession>(
        io_context_, std::move(channel), file_, password_.view(), settings_, id);
    
    session->set_state_callback([this, id](UploadState state) {
        on_session_state(id, state);
    });
    
    auto result = session->start();
    if (!result) {
        LOG_ERROR("Failed to start upload session #{}: {}", id, result.message);
        return nullptr;
    }
    
    sessions_.push_back(session);
    LOG_DEBUG("Upload session #{} accepted ({} sessions)", id, sessions_.size());
    return session;
}

std::vector<UploadConnectionInfo> UploaderHost::connections() const {
    std::vector<UploadConnectionInfo> result;
    result.reserve(sessions_.size());
    for (const auto& session : sessions_) {
        result.push_back(session->connection_info());
    }
    return result;
}

std::size_t UploaderHost::active_count() const {
    return std::count_if(sessions_.begin(), sessions_.end(), [](const auto& session) {
        return session->state() == UploadState::SERVING || session->state() == UploadState::STREAMING;
    });
}

std::size_t UploaderHost::remove_finished() {
    auto before = sessions_.size();
    sessions_.erase(
        std::remove_if(sessions_.begin(), sessions_.end(),
                       [](const auto& session) { return session->is_finished(); }),
        sessions_.end());
    return before - sessions_.size();
}

void UploaderHost::stop() {
    if (stopped_) {
        return;
    }
    stopped_ = true;
    
    LOG_INFO("Stopping host for {} ({} sessions)", file_->info().name, sessions_.size());
    for (auto& session : sessions_) {
        session->set_state_callback(nullptr);
    }
    for (auto& session : sessions_) {
        session->stop();
    }
}

void UploaderHost::on_session_state(std::uint64_t id, UploadState state) {
    if (state == UploadState::DONE) {
        ++completed_downloads_;
        LOG_INFO("Download #{} finished ({} total)", id, completed_downloads_);
    }
    
    if (!session_callback_) {
        return;
    }
    
    auto it = std::find_if(sessions_.begin(), sessions_.end(),
                           [id](const auto& session) { return session->id() == id; });
    if (it != sessions_.end()) {
        session_callback_((*it)->connection_info());
    }
}

}
