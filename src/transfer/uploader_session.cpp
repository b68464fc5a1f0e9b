#include "peerdrop/transfer/uploader_session.hpp"
#include "peerdrop/crypto/challenge_auth.hpp"
#include "peerdrop/core/logger.hpp"
#include <boost/asio/post.hpp>
#include <type_traits>

namespace peerdrop::transfer {

using namespace peerdrop::network;

const char* to_string(UploadState state) {
    switch (state) {
        case UploadState::IDLE: return "idle";
        case UploadState::AWAITING_AUTH: return "awaiting-auth";
        case UploadState::SERVING: return "serving";
        case UploadState::STREAMING: return "streaming";
        case UploadState::DONE: return "done";
        case UploadState::ERROR: return "error";
    }
    return "unknown";
}

UploaderSession::UploaderSession(boost::asio::io_context& io_context,
                                 std::shared_ptr<Channel> channel,
                                 std::shared_ptr<FileSource> file,
                                 std::string_view password,
                                 TransferSettings settings,
                                 std::uint64_t id)
    : io_context_(io_context)
    , channel_(std::move(channel))
    , file_(std::move(file))
    , password_(password)
    , settings_(std::move(settings))
    , id_(id)
    , monitor_(io_context, settings_.connection_timeout, settings_.stall_timeout)
    , flow_(settings_.max_in_flight_bytes)
    , state_(UploadState::IDLE)
    , failed_password_attempts_(0)
    , info_sent_(false)
    , final_sent_(false)
    , pump_scheduled_(false)
    , next_offset_(0) {
    
    if (file_) {
        file_info_ = file_->info();
    }
}

UploaderSession::~UploaderSession() {
    monitor_.cancel_all();
    if (channel_) {
        channel_->clear_handlers();
    }
    LOG_DEBUG("[upload #{}] session destroyed", id_);
}

TransferResult UploaderSession::start() {
    if (state_ != UploadState::IDLE || monitor_.is_connection_timeout_active()) {
        return TransferResult(TransferError::INVALID_STATE, "Session already started");
    }
    if (!channel_ || !file_) {
        return TransferResult(TransferError::INVALID_ARGUMENT, "Session needs a channel and a file");
    }
    if (weak_from_this().expired()) {
        return TransferResult(TransferError::INVALID_STATE, "Session must be owned by a shared_ptr");
    }
    
    attach_channel();
    
    std::weak_ptr<UploaderSession> weak = shared_from_this();
    monitor_.arm_connection_timeout([weak]() {
        auto self = weak.lock();
        if (self && self->state_ == UploadState::IDLE) {
            LOG_WARN("[upload #{}] no file request received", self->id_);
            self->fail("Timed out waiting for file request");
        }
    });
    
    if (channel_->state() == ChannelState::IDLE) {
        channel_->open();
    }
    
    LOG_INFO("[upload #{}] serving {} on {}{}", id_, file_info_.name, channel_->label(),
             password_.empty() ? "" : " (password protected)");
    return TransferResult(TransferError::SUCCESS);
}

void UploaderSession::stop() {
    if (is_finished()) {
        return;
    }
    LOG_INFO("[upload #{}] stopping", id_);
    fail_and_notify("Upload stopped by sender");
}

UploadConnectionInfo UploaderSession::connection_info() const {
    UploadConnectionInfo info;
    info.id = id_;
    info.label = channel_ ? channel_->label() : "";
    info.state = state_;
    info.client_name = client_name_;
    info.client_os = client_os_;
    info.bytes_sent = flow_.bytes_sent();
    info.bytes_acknowledged = flow_.bytes_acked();
    info.error = error_;
    return info;
}

void UploaderSession::attach_channel() {
    std::weak_ptr<UploaderSession> weak = shared_from_this();
    
    channel_->set_open_handler([weak]() {
        if (auto self = weak.lock()) {
            LOG_DEBUG("[upload #{}] channel open", self->id_);
        }
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

void UploaderSession::handle_frame(Frame frame) {
    monitor_.cancel_connection_timeout();
    
    if (is_finished()) {
        LOG_DEBUG("[upload #{}] ignoring frame in state {}", id_, to_string(state_));
        return;
    }
    
    if (std::holds_alternative<BinaryChunk>(frame)) {
        LOG_WARN("[upload #{}] unexpected binary frame from downloader", id_);
        fail_and_notify("Unexpected binary data");
        return;
    }
    
    std::visit([this](const auto& message) {
        using T = std::decay_t<decltype(message)>;
        if constexpr (std::is_same_v<T, RequestInfoMessage>) {
            on_request_info(message);
        } else if constexpr (std::is_same_v<T, UsePasswordMessage>) {
            on_use_password(message);
        } else if constexpr (std::is_same_v<T, StartMessage>) {
            on_start(message);
        } else if constexpr (std::is_same_v<T, ChunkAckMessage>) {
            on_chunk_ack(message);
        } else if constexpr (std::is_same_v<T, DoneMessage>) {
            on_done();
        } else if constexpr (std::is_same_v<T, ErrorMessage>) {
            on_remote_error(message);
        } else {
            LOG_WARN("[upload #{}] unexpected {} message from downloader", id_, network::to_string(T::TYPE));
        }
    }, std::get<ControlMessage>(frame));
}

void UploaderSession::handle_close() {
    if (is_finished()) {
        return;
    }
    LOG_WARN("[upload #{}] downloader disconnected in state {}", id_, to_string(state_));
    fail("Connection closed by peer");
}

void UploaderSession::handle_channel_error(const std::string& message) {
    if (is_finished()) {
        return;
    }
    LOG_ERROR("[upload #{}] channel error: {}", id_, message);
    fail(message);
}

void UploaderSession::on_request_info(const RequestInfoMessage& message) {
    if (state_ != UploadState::IDLE) {
        LOG_WARN("[upload #{}] ignoring repeated file request in state {}", id_, to_string(state_));
        return;
    }
    
    client_name_ = message.browser_name;
    client_os_ = message.os_name;
    LOG_INFO("[upload #{}] file requested by {} on {}", id_, client_name_, client_os_);
    
    if (!password_.empty()) {
        if (issue_challenge(false)) {
            set_state(UploadState::AWAITING_AUTH);
        }
    } else {
        send_info();
    }
}

void UploaderSession::on_use_password(const UsePasswordMessage& message) {
    if (state_ != UploadState::AWAITING_AUTH) {
        LOG_WARN("[upload #{}] ignoring password in state {}", id_, to_string(state_));
        return;
    }
    
    auto challenge = std::move(challenge_);
    challenge_.clear();
    
    if (!challenge.empty() &&
        crypto::ChallengeAuth::verify(password_.view(), challenge, message.response)) {
        LOG_INFO("[upload #{}] password accepted", id_);
        send_info();
        return;
    }
    
    ++failed_password_attempts_;
    LOG_WARN("[upload #{}] password rejected ({} failed attempts)", id_, failed_password_attempts_);
    if (issue_challenge(true)) {
        LOG_DEBUG("[upload #{}] new challenge issued", id_);
    }
}

void UploaderSession::on_start(const StartMessage& message) {
    if (!info_sent_) {
        LOG_WARN("[upload #{}] start requested before file info was sent", id_);
        fail_and_notify("File info has not been sent");
        return;
    }
    if (state_ != UploadState::SERVING) {
        LOG_WARN("[upload #{}] ignoring start in state {}", id_, to_string(state_));
        return;
    }
    if (message.offset > file_info_.size) {
        LOG_WARN("[upload #{}] start offset {} beyond file size {}", id_, message.offset, file_info_.size);
        fail_and_notify("Invalid start offset");
        return;
    }
    
    next_offset_ = message.offset;
    final_sent_ = false;
    flow_.reset(message.offset);
    set_state(UploadState::STREAMING);
    
    std::weak_ptr<UploaderSession> weak = shared_from_this();
    monitor_.arm_stall_timeout([weak]() {
        if (auto self = weak.lock(); self && self->state_ == UploadState::STREAMING) {
            LOG_ERROR("[upload #{}] no acknowledgment for {} ms", self->id_, self->settings_.stall_timeout.count());
            self->fail("Transfer stalled - no acknowledgment received");
        }
    });
    
    LOG_INFO("[upload #{}] streaming {} from offset {}", id_, file_info_.name, message.offset);
    
    if (next_offset_ == file_info_.size) {
        // Nothing left to send: the final marker alone ends the stream.
        send(ChunkMessage{next_offset_, true});
        final_sent_ = true;
        return;
    }
    
    schedule_pump();
}

void UploaderSession::on_chunk_ack(const ChunkAckMessage& message) {
    if (state_ != UploadState::STREAMING) {
        LOG_DEBUG("[upload #{}] ignoring acknowledgment in state {}", id_, to_string(state_));
        return;
    }
    
    if (!flow_.on_ack(message.bytes_received)) {
        LOG_WARN("[upload #{}] invalid acknowledgment {} (acked {}, sent {})", id_,
                 message.bytes_received, flow_.bytes_acked(), flow_.bytes_sent());
        fail_and_notify("Invalid chunk acknowledgment");
        return;
    }
    
    monitor_.reset_stall_timeout();
    
    if (progress_callback_) {
        progress_callback_(flow_.bytes_acked(), file_info_.size);
    }
    
    if (flow_.is_paused() && flow_.can_send()) {
        LOG_TRACE("[upload #{}] resuming at {} bytes in flight", id_, flow_.in_flight());
        flow_.set_paused(false);
        schedule_pump();
    }
}

void UploaderSession::on_done() {
    if (state_ != UploadState::STREAMING) {
        LOG_WARN("[upload #{}] ignoring done in state {}", id_, to_string(state_));
        return;
    }
    LOG_INFO("[upload #{}] downloader confirmed {}", id_, file_info_.name);
    finish();
}

void UploaderSession::on_remote_error(const ErrorMessage& message) {
    LOG_WARN("[upload #{}] downloader reported error: {}", id_, message.message);
    fail(message.message);
}

bool UploaderSession::issue_challenge(bool previous_rejected) {
    try {
        challenge_ = crypto::ChallengeAuth::issue_challenge();
    } catch (const std::exception& e) {
        LOG_ERROR("[upload #{}] cannot issue challenge: {}", id_, e.what());
        fail_and_notify("Authentication unavailable");
        return false;
    }
    send(PasswordRequiredMessage{challenge_, previous_rejected});
    return true;
}

void UploaderSession::send_info() {
    challenge_.clear();
    send(InfoMessage{file_info_});
    info_sent_ = true;
    set_state(UploadState::SERVING);
}

void UploaderSession::schedule_pump() {
    if (pump_scheduled_) {
        return;
    }
    pump_scheduled_ = true;
    
    // One chunk per turn of the event loop so acknowledgments interleave.
    std::weak_ptr<UploaderSession> weak = shared_from_this();
    boost::asio::post(io_context_, [weak]() {
        if (auto self = weak.lock()) {
            self->pump_scheduled_ = false;
            self->pump();
        }
    });
}

void UploaderSession::pump() {
    if (state_ != UploadState::STREAMING || final_sent_ || !file_) {
        return;
    }
    if (!channel_->is_open()) {
        return;
    }
    
    if (!flow_.can_send()) {
        LOG_TRACE("[upload #{}] pausing with {} bytes in flight", id_, flow_.in_flight());
        flow_.set_paused(true);
        return;
    }
    
    std::vector<std::uint8_t> data;
    auto result = file_->read(next_offset_, settings_.chunk_size, data);
    if (!result) {
        LOG_ERROR("[upload #{}] {}", id_, result.message);
        fail_and_notify("Failed to read file");
        return;
    }
    if (data.empty()) {
        LOG_ERROR("[upload #{}] file ended at {} of {} bytes", id_, next_offset_, file_info_.size);
        fail_and_notify("File is no longer available");
        return;
    }
    
    auto offset = next_offset_;
    next_offset_ += data.size();
    flow_.on_bytes_sent(data.size());
    bool final = next_offset_ >= file_info_.size;
    
    channel_->send_binary(std::move(data));
    send(ChunkMessage{offset, final});
    monitor_.reset_stall_timeout();
    
    if (final) {
        final_sent_ = true;
        LOG_DEBUG("[upload #{}] final chunk sent at offset {}", id_, offset);
        return;
    }
    
    schedule_pump();
}

void UploaderSession::finish() {
    monitor_.cancel_all();
    file_.reset();
    channel_->close();
    set_state(UploadState::DONE);
}

void UploaderSession::fail(const std::string& message) {
    if (is_finished()) {
        return;
    }
    
    error_ = message;
    monitor_.cancel_all();
    challenge_.clear();
    file_.reset();
    if (channel_) {
        channel_->close();
    }
    set_state(UploadState::ERROR);
}

void UploaderSession::fail_and_notify(const std::string& message) {
    send(ErrorMessage{message});
    fail(message);
}

void UploaderSession::send(const ControlMessage& message) {
    if (!channel_ || !channel_->is_open()) {
        LOG_DEBUG("[upload #{}] dropping {}: channel is not open", id_, network::to_string(message_type(message)));
        return;
    }
    channel_->send_control(message);
}

void UploaderSession::set_state(UploadState state) {
    if (state_ == state) {
        return;
    }
    LOG_DEBUG("[upload #{}] state {} -> {}", id_, to_string(state_), to_string(state));
    state_ = state;
    if (state_callback_) {
        state_callback_(state_);
    }
}

}
