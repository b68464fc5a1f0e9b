#include "peerdrop/transfer/downloader_session.hpp"
#include "peerdrop/crypto/challenge_auth.hpp"
#include "peerdrop/core/logger.hpp"
#include "peerdrop/core/utils.hpp"
#include <type_traits>

namespace peerdrop::transfer {

using namespace peerdrop::network;

const char* to_string(DownloadState state) {
    switch (state) {
        case DownloadState::CONNECTING: return "connecting";
        case DownloadState::PASSWORD_REQUIRED: return "password-required";
        case DownloadState::PASSWORD_ERROR: return "password-error";
        case DownloadState::READY: return "ready";
        case DownloadState::DOWNLOADING: return "downloading";
        case DownloadState::COMPLETE: return "complete";
        case DownloadState::ERROR: return "error";
    }
    return "unknown";
}

DownloaderSession::DownloaderSession(boost::asio::io_context& io_context,
                                     ChannelFactory channel_factory,
                                     TransferSettings settings)
    : io_context_(io_context)
    , channel_factory_(std::move(channel_factory))
    , settings_(std::move(settings))
    , monitor_(io_context, settings_.connection_timeout, settings_.stall_timeout)
    , state_(DownloadState::CONNECTING)
    , bytes_downloaded_(0)
    , last_frame_size_(0)
    , final_received_(false) {
}

DownloaderSession::~DownloaderSession() {
    monitor_.cancel_all();
    detach_channel();
}

TransferResult DownloaderSession::connect() {
    if (channel_ && !is_terminal()) {
        return TransferResult(TransferError::INVALID_STATE, "Already connected");
    }
    if (weak_from_this().expired()) {
        return TransferResult(TransferError::INVALID_STATE, "Session must be owned by a shared_ptr");
    }
    
    detach_channel();
    monitor_.cancel_all();
    reset_transfer();
    file_info_.reset();
    challenge_.reset();
    downloaded_file_.reset();
    error_.clear();
    set_state(DownloadState::CONNECTING);
    
    channel_ = channel_factory_ ? channel_factory_() : nullptr;
    if (!channel_) {
        fail("Failed to create channel");
        return TransferResult(TransferError::NOT_CONNECTED, error_);
    }
    
    LOG_INFO("Connecting to uploader via {}", channel_->label());
    attach_channel();
    
    std::weak_ptr<DownloaderSession> weak = shared_from_this();
    monitor_.arm_connection_timeout([weak]() {
        auto self = weak.lock();
        if (self && self->state_ == DownloadState::CONNECTING) {
            LOG_WARN("Connection to uploader timed out");
            self->fail("Connection timeout");
        }
    });
    
    channel_->open();
    return TransferResult(TransferError::SUCCESS);
}

void DownloaderSession::reconnect() {
    LOG_INFO("Reconnecting to uploader");
    detach_channel();
    auto result = connect();
    if (!result) {
        LOG_ERROR("Reconnect failed: {}", result.message);
    }
}

void DownloaderSession::cancel() {
    if (is_terminal()) {
        return;
    }
    LOG_INFO("Download cancelled");
    fail("Transfer cancelled");
}

TransferResult DownloaderSession::submit_password(const std::string& password) {
    if (!challenge_) {
        return TransferResult(TransferError::INVALID_STATE, "No password challenge pending");
    }
    if (!channel_ || !channel_->is_open()) {
        return TransferResult(TransferError::NOT_CONNECTED, "Channel is not open");
    }
    
    // A challenge answers exactly one submission; the uploader issues a new
    // one with its reply.
    auto response = crypto::ChallengeAuth::compute_response(password, *challenge_);
    challenge_.reset();
    
    LOG_DEBUG("Submitting password response");
    send(UsePasswordMessage{std::move(response)});
    return TransferResult(TransferError::SUCCESS);
}

TransferResult DownloaderSession::start_download() {
    if (state_ != DownloadState::READY) {
        return TransferResult(TransferError::INVALID_STATE,
                              std::string("Cannot start download in state ") + to_string(state_));
    }
    if (!channel_ || !channel_->is_open()) {
        return TransferResult(TransferError::NOT_CONNECTED, "Channel is not open");
    }
    
    reset_transfer();
    
    std::weak_ptr<DownloaderSession> weak = shared_from_this();
    monitor_.arm_stall_timeout([weak]() {
        if (auto self = weak.lock(); self && self->state_ == DownloadState::DOWNLOADING) {
            LOG_ERROR("No data received for {} ms", self->settings_.stall_timeout.count());
            self->fail("Transfer stalled - no data received");
        }
    });
    
    set_state(DownloadState::DOWNLOADING);
    LOG_INFO("Starting download of {} ({})", file_info_->name,
             core::utils::StringUtils::format_bytes(file_info_->size));
    send(StartMessage{0});
    return TransferResult(TransferError::SUCCESS);
}

double DownloaderSession::progress() const {
    if (!file_info_) {
        return 0.0;
    }
    if (file_info_->size == 0) {
        return state_ == DownloadState::COMPLETE ? 100.0 : 0.0;
    }
    return static_cast<double>(bytes_downloaded_) * 100.0 / static_cast<double>(file_info_->size);
}

void DownloaderSession::attach_channel() {
    std::weak_ptr<DownloaderSession> weak = shared_from_this();
    
    channel_->set_open_handler([weak]() {
        if (auto self = weak.lock()) self->handle_open();
    });
    channel_->set_frame_handler([weak](Frame frame) {
        if (auto self = weak.lock()) self->handle_frame(std::move(frame));
    });
    channel_->set_close_handler([weak]() {
        if (auto self = weak.lock()) self->handle_close();
    });
    channel_->set_error_handler([weak](const std::string& message) {
        if (auto self = weak.lock()) self->handle_channel_error(message);
    });
}

void DownloaderSession::detach_channel() {
    if (!channel_) {
        return;
    }
    channel_->clear_handlers();
    channel_->close();
    channel_.reset();
}

void DownloaderSession::reset_transfer() {
    chunks_.clear();
    bytes_downloaded_ = 0;
    last_frame_size_ = 0;
    final_received_ = false;
}

void DownloaderSession::handle_open() {
    LOG_INFO("Channel {} open, requesting file info", channel_->label());
    send(RequestInfoMessage{settings_.client_name, settings_.os_name});
}

void DownloaderSession::handle_frame(Frame frame) {
    monitor_.cancel_connection_timeout();
    
    if (is_terminal()) {
        LOG_DEBUG("Ignoring frame in state {}", to_string(state_));
        return;
    }
    
    if (auto* binary = std::get_if<BinaryChunk>(&frame)) {
        on_binary(std::move(*binary));
        return;
    }
    
    auto& control = std::get<ControlMessage>(frame);
    LOG_TRACE("Received {} in state {}", network::to_string(message_type(control)), to_string(state_));
    
    std::visit([this](auto& message) {
        using T = std::decay_t<decltype(message)>;
        if constexpr (std::is_same_v<T, PasswordRequiredMessage>) {
            on_password_required(message);
        } else if constexpr (std::is_same_v<T, InfoMessage>) {
            on_info(message);
        } else if constexpr (std::is_same_v<T, ChunkMessage>) {
            on_chunk(message);
        } else if constexpr (std::is_same_v<T, ErrorMessage>) {
            on_remote_error(message);
        } else {
            LOG_WARN("Unexpected {} message from uploader", network::to_string(T::TYPE));
        }
    }, control);
}

void DownloaderSession::handle_close() {
    if (is_terminal()) {
        LOG_DEBUG("Channel closed in state {}", to_string(state_));
        return;
    }
    LOG_WARN("Channel closed by uploader in state {}", to_string(state_));
    fail("Connection closed by peer");
}

void DownloaderSession::handle_channel_error(const std::string& message) {
    if (is_terminal()) {
        LOG_DEBUG("Channel error after session ended: {}", message);
        return;
    }
    LOG_ERROR("Channel error: {}", message);
    fail(message);
}

void DownloaderSession::on_password_required(const PasswordRequiredMessage& message) {
    switch (state_) {
        case DownloadState::CONNECTING:
        case DownloadState::PASSWORD_REQUIRED:
        case DownloadState::PASSWORD_ERROR:
            break;
        default:
            LOG_WARN("Ignoring password challenge in state {}", to_string(state_));
            return;
    }
    
    challenge_ = message.challenge;
    if (message.error) {
        LOG_WARN("Password rejected by uploader");
        set_state(DownloadState::PASSWORD_ERROR);
    } else {
        LOG_INFO("Uploader requires a password");
        set_state(DownloadState::PASSWORD_REQUIRED);
    }
}

void DownloaderSession::on_info(const InfoMessage& message) {
    if (state_ == DownloadState::READY || state_ == DownloadState::DOWNLOADING) {
        LOG_DEBUG("Ignoring duplicate file info");
        return;
    }
    
    if (message.file.size > settings_.max_file_size) {
        LOG_ERROR("Offered file {} is {} bytes, limit is {}", message.file.name,
                  message.file.size, settings_.max_file_size);
        fail_and_notify("File too large");
        return;
    }
    
    challenge_.reset();
    file_info_ = message.file;
    LOG_INFO("File info: {} ({}, {})", file_info_->name,
             core::utils::StringUtils::format_bytes(file_info_->size), file_info_->mime_type);
    set_state(DownloadState::READY);
}

void DownloaderSession::on_chunk(const ChunkMessage& message) {
    if (state_ != DownloadState::DOWNLOADING) {
        LOG_WARN("Ignoring chunk marker in state {}", to_string(state_));
        return;
    }
    
    // A marker either precedes its frame or follows it directly.
    bool before_frame = message.offset == bytes_downloaded_;
    bool after_frame = last_frame_size_ <= bytes_downloaded_ &&
                       message.offset == bytes_downloaded_ - last_frame_size_;
    if (!before_frame && !after_frame) {
        LOG_ERROR("Chunk marker at offset {} does not match frame boundary ({} bytes received)",
                  message.offset, bytes_downloaded_);
        fail_and_notify("Chunk offset mismatch");
        return;
    }
    
    if (!message.final) {
        return;
    }
    
    final_received_ = true;
    LOG_DEBUG("Final chunk marker received at {}/{} bytes", bytes_downloaded_, file_info_->size);
    
    // The last binary frame may still be in flight.
    if (bytes_downloaded_ == file_info_->size) {
        finalize();
    }
}

void DownloaderSession::on_binary(BinaryChunk chunk) {
    if (state_ != DownloadState::DOWNLOADING) {
        LOG_WARN("Ignoring {} byte binary frame in state {}", chunk.data.size(), to_string(state_));
        return;
    }
    
    auto total = bytes_downloaded_ + chunk.data.size();
    if (total > file_info_->size) {
        LOG_ERROR("Received {} bytes, expected {}", total, file_info_->size);
        fail_and_notify("Received more data than expected");
        return;
    }
    
    last_frame_size_ = chunk.data.size();
    if (!chunk.data.empty()) {
        chunks_.push_back(std::move(chunk.data));
    }
    bytes_downloaded_ = total;
    monitor_.reset_stall_timeout();
    
    send(ChunkAckMessage{bytes_downloaded_});
    
    if (progress_callback_) {
        progress_callback_(bytes_downloaded_, file_info_->size);
    }
    
    if (final_received_ && bytes_downloaded_ == file_info_->size) {
        finalize();
    }
}

void DownloaderSession::on_remote_error(const ErrorMessage& message) {
    LOG_ERROR("Uploader reported error: {}", message.message);
    fail(message.message);
}

void DownloaderSession::finalize() {
    monitor_.cancel_stall_timeout();
    
    DownloadedFile file;
    file.name = file_info_->name;
    file.mime_type = file_info_->mime_type.empty() ? DEFAULT_MIME_TYPE : file_info_->mime_type;
    file.data.reserve(bytes_downloaded_);
    for (auto& chunk : chunks_) {
        file.data.insert(file.data.end(), chunk.begin(), chunk.end());
    }
    chunks_.clear();
    downloaded_file_ = std::move(file);
    
    send(DoneMessage{});
    LOG_INFO("Download of {} complete ({})", downloaded_file_->name,
             core::utils::StringUtils::format_bytes(downloaded_file_->data.size()));
    set_state(DownloadState::COMPLETE);
    
    if (complete_callback_) {
        complete_callback_(*downloaded_file_);
    }
}

void DownloaderSession::fail(const std::string& message) {
    if (is_terminal()) {
        return;
    }
    
    error_ = message;
    monitor_.cancel_all();
    challenge_.reset();
    chunks_.clear();
    
    // Closed before the callback runs, which may reconnect onto a new channel.
    if (channel_) {
        channel_->close();
    }
    set_state(DownloadState::ERROR);
}

void DownloaderSession::fail_and_notify(const std::string& message) {
    send(ErrorMessage{message});
    fail(message);
}

void DownloaderSession::send(const ControlMessage& message) {
    if (!channel_ || !channel_->is_open()) {
        LOG_WARN("Dropping {}: channel is not open", network::to_string(message_type(message)));
        return;
    }
    channel_->send_control(message);
}

void DownloaderSession::set_state(DownloadState state) {
    if (state_ == state) {
        return;
    }
    LOG_DEBUG("Download state {} -> {}", to_string(state_), to_string(state));
    state_ = state;
    if (state_callback_) {
        state_callback_(state_);
    }
}

bool DownloaderSession::is_terminal() const {
    return state_ == DownloadState::COMPLETE || state_ == DownloadState::ERROR;
}

}
