#include <gtest/gtest.h>
#include "peerdrop/network/loopback_channel.hpp"
#include "peerdrop/transfer/downloader_session.hpp"
#include "peerdrop/transfer/uploader_host.hpp"
#include <boost/asio/post.hpp>

using namespace peerdrop::transfer;
using namespace peerdrop::network;
using namespace std::chrono_literals;

// Uploader and downloader wired together through in-process channel pairs.
class TransferFlowTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_.chunk_size = 400;
        settings_.max_in_flight_bytes = 4096;
    }
    
    std::vector<std::uint8_t> make_content(std::size_t size) {
        std::vector<std::uint8_t> content(size);
        for (std::size_t i = 0; i < size; ++i) {
            content[i] = static_cast<std::uint8_t>((i * 31 + 7) & 0xFF);
        }
        return content;
    }
    
    void share(std::vector<std::uint8_t> content, const std::string& password = "") {
        auto file = std::make_shared<MemoryFileSource>("card.png", std::move(content), "image/png");
        host_ = std::make_unique<UploaderHost>(io_, file, password, settings_);
    }
    
    // Each connect() on the returned session gets a fresh pair whose far end
    // is accepted by the host.
    std::shared_ptr<DownloaderSession> make_downloader(TransferSettings settings) {
        auto factory = [this]() -> std::shared_ptr<Channel> {
            auto [uploader_end, downloader_end] = LoopbackChannel::create_pair(io_);
            host_->accept(uploader_end);
            return downloader_end;
        };
        return std::make_shared<DownloaderSession>(io_, factory, settings);
    }
    
    std::shared_ptr<DownloaderSession> make_downloader() {
        return make_downloader(settings_);
    }
    
    // Starts the download as soon as the file info arrives.
    void auto_start(const std::shared_ptr<DownloaderSession>& session) {
        auto* raw = session.get();
        session->set_state_callback([this, raw](DownloadState state) {
            states_.push_back(state);
            if (state == DownloadState::READY) {
                boost::asio::post(io_, [raw]() { EXPECT_TRUE(raw->start_download()); });
            }
        });
    }
    
    void run() {
        io_.restart();
        io_.run_for(5s);
    }
    
    boost::asio::io_context io_;
    TransferSettings settings_;
    std::unique_ptr<UploaderHost> host_;
    std::vector<DownloadState> states_;
};

TEST_F(TransferFlowTest, TransfersFileInChunks) {
    auto content = make_content(1000);
    share(content);
    auto downloader = make_downloader();
    auto_start(downloader);
    
    std::vector<std::uint64_t> progress;
    downloader->set_progress_callback([&](std::uint64_t received, std::uint64_t total) {
        EXPECT_EQ(total, 1000u);
        progress.push_back(received);
    });
    
    ASSERT_TRUE(downloader->connect());
    run();
    
    ASSERT_EQ(downloader->state(), DownloadState::COMPLETE) << downloader->error();
    const auto& file = downloader->downloaded_file();
    ASSERT_TRUE(file.has_value());
    EXPECT_EQ(file->name, "card.png");
    EXPECT_EQ(file->mime_type, "image/png");
    EXPECT_EQ(file->data, content);
    EXPECT_EQ(progress, (std::vector<std::uint64_t>{400, 800, 1000}));
    
    std::vector<DownloadState> expected = {DownloadState::READY, DownloadState::DOWNLOADING, DownloadState::COMPLETE};
    EXPECT_EQ(states_, expected);
    
    EXPECT_EQ(host_->total_downloads(), 1u);
    auto connections = host_->connections();
    ASSERT_EQ(connections.size(), 1u);
    EXPECT_EQ(connections[0].state, UploadState::DONE);
    EXPECT_EQ(connections[0].bytes_acknowledged, 1000u);
    EXPECT_EQ(connections[0].client_name, "peerdrop");
}

TEST_F(TransferFlowTest, SmallWindowStillCompletes) {
    settings_.chunk_size = 1024;
    settings_.max_in_flight_bytes = 2048;
    auto content = make_content(256 * 1024 + 17);
    share(content);
    auto downloader = make_downloader();
    auto_start(downloader);
    
    ASSERT_TRUE(downloader->connect());
    run();
    
    ASSERT_EQ(downloader->state(), DownloadState::COMPLETE) << downloader->error();
    EXPECT_EQ(downloader->downloaded_file()->data, content);
    EXPECT_DOUBLE_EQ(downloader->progress(), 100.0);
}

TEST_F(TransferFlowTest, EmptyFile) {
    share({});
    auto downloader = make_downloader();
    auto_start(downloader);
    
    ASSERT_TRUE(downloader->connect());
    run();
    
    ASSERT_EQ(downloader->state(), DownloadState::COMPLETE) << downloader->error();
    EXPECT_TRUE(downloader->downloaded_file()->data.empty());
    EXPECT_EQ(host_->total_downloads(), 1u);
}

TEST_F(TransferFlowTest, PasswordProtectedTransfer) {
    auto content = make_content(900);
    share(content, "open sesame");
    auto downloader = make_downloader();
    auto* raw = downloader.get();
    
    int attempts = 0;
    downloader->set_state_callback([&, raw](DownloadState state) {
        states_.push_back(state);
        if (state == DownloadState::PASSWORD_REQUIRED || state == DownloadState::PASSWORD_ERROR) {
            // First guess is wrong, the second one is right.
            auto password = attempts++ == 0 ? "open barley" : "open sesame";
            boost::asio::post(io_, [raw, password]() { EXPECT_TRUE(raw->submit_password(password)); });
        } else if (state == DownloadState::READY) {
            boost::asio::post(io_, [raw]() { EXPECT_TRUE(raw->start_download()); });
        }
    });
    
    ASSERT_TRUE(downloader->connect());
    run();
    
    ASSERT_EQ(downloader->state(), DownloadState::COMPLETE) << downloader->error();
    EXPECT_EQ(downloader->downloaded_file()->data, content);
    EXPECT_EQ(attempts, 2);
    
    std::vector<DownloadState> expected = {
        DownloadState::PASSWORD_REQUIRED, DownloadState::PASSWORD_ERROR,
        DownloadState::READY, DownloadState::DOWNLOADING, DownloadState::COMPLETE};
    EXPECT_EQ(states_, expected);
}

TEST_F(TransferFlowTest, NoFileDataBeforeAuthentication) {
    share(make_content(100), "pw");
    auto downloader = make_downloader();
    downloader->set_state_callback([this](DownloadState state) { states_.push_back(state); });
    
    ASSERT_TRUE(downloader->connect());
    io_.restart();
    io_.run_for(200ms);
    
    EXPECT_EQ(downloader->state(), DownloadState::PASSWORD_REQUIRED);
    EXPECT_FALSE(downloader->file_info().has_value());
    EXPECT_EQ(host_->connections().front().state, UploadState::AWAITING_AUTH);
    
    // Starting is refused until the uploader has sent file info.
    EXPECT_EQ(downloader->start_download().error, TransferError::INVALID_STATE);
}

TEST_F(TransferFlowTest, DownloaderRejectsOversizedFile) {
    share(make_content(5000));
    auto limited = settings_;
    limited.max_file_size = 1000;
    auto downloader = make_downloader(limited);
    
    ASSERT_TRUE(downloader->connect());
    run();
    
    EXPECT_EQ(downloader->state(), DownloadState::ERROR);
    EXPECT_EQ(downloader->error(), "File too large");
    auto connections = host_->connections();
    EXPECT_EQ(connections[0].state, UploadState::ERROR);
    EXPECT_EQ(connections[0].error, "File too large");
}

TEST_F(TransferFlowTest, SenderStopReachesDownloader) {
    settings_.chunk_size = 100;
    settings_.max_in_flight_bytes = 100;
    share(make_content(10000));
    auto downloader = make_downloader();
    auto_start(downloader);
    
    bool stopped = false;
    downloader->set_progress_callback([&](std::uint64_t, std::uint64_t) {
        if (!stopped) {
            stopped = true;
            boost::asio::post(io_, [this]() { host_->stop(); });
        }
    });
    
    ASSERT_TRUE(downloader->connect());
    run();
    
    EXPECT_EQ(downloader->state(), DownloadState::ERROR);
    EXPECT_EQ(downloader->error(), "Upload stopped by sender");
    EXPECT_FALSE(downloader->downloaded_file().has_value());
}

TEST_F(TransferFlowTest, CancelClosesUploaderSession) {
    settings_.chunk_size = 100;
    settings_.max_in_flight_bytes = 100;
    share(make_content(10000));
    auto downloader = make_downloader();
    auto_start(downloader);
    auto* raw = downloader.get();
    
    downloader->set_progress_callback([&, raw](std::uint64_t received, std::uint64_t) {
        if (received == 300) {
            boost::asio::post(io_, [raw]() { raw->cancel(); });
        }
    });
    
    ASSERT_TRUE(downloader->connect());
    run();
    
    EXPECT_EQ(downloader->state(), DownloadState::ERROR);
    EXPECT_EQ(downloader->error(), "Transfer cancelled");
    auto connections = host_->connections();
    EXPECT_EQ(connections[0].state, UploadState::ERROR);
    EXPECT_EQ(connections[0].error, "Connection closed by peer");
}

TEST_F(TransferFlowTest, ReconnectAfterFailureDownloadsAgain) {
    auto content = make_content(2000);
    share(content);
    auto downloader = make_downloader();
    
    ASSERT_TRUE(downloader->connect());
    run();
    ASSERT_EQ(downloader->state(), DownloadState::READY);
    downloader->cancel();
    run();
    ASSERT_EQ(downloader->state(), DownloadState::ERROR);
    
    auto_start(downloader);
    downloader->reconnect();
    run();
    
    ASSERT_EQ(downloader->state(), DownloadState::COMPLETE) << downloader->error();
    EXPECT_EQ(downloader->downloaded_file()->data, content);
    EXPECT_EQ(host_->session_count(), 2u);
    EXPECT_EQ(host_->total_downloads(), 1u);
}

TEST_F(TransferFlowTest, ConcurrentDownloadersShareOneHost) {
    auto content = make_content(3000);
    share(content);
    
    std::vector<std::shared_ptr<DownloaderSession>> downloaders;
    for (int i = 0; i < 3; ++i) {
        auto downloader = make_downloader();
        auto* raw = downloader.get();
        downloader->set_state_callback([this, raw](DownloadState state) {
            if (state == DownloadState::READY) {
                boost::asio::post(io_, [raw]() { EXPECT_TRUE(raw->start_download()); });
            }
        });
        ASSERT_TRUE(downloader->connect());
        downloaders.push_back(downloader);
    }
    
    run();
    
    for (const auto& downloader : downloaders) {
        ASSERT_EQ(downloader->state(), DownloadState::COMPLETE) << downloader->error();
        EXPECT_EQ(downloader->downloaded_file()->data, content);
    }
    EXPECT_EQ(host_->total_downloads(), 3u);
    EXPECT_EQ(host_->remove_finished(), 3u);
}

TEST_F(TransferFlowTest, SilentUploaderStallsDownload) {
    settings_.stall_timeout = 50ms;
    
    // A hand-driven uploader end that answers RequestInfo and then goes quiet.
    std::shared_ptr<LoopbackChannel> uploader_end;
    bool uploader_closed = false;
    auto factory = [&]() -> std::shared_ptr<Channel> {
        auto [ours, theirs] = LoopbackChannel::create_pair(io_);
        uploader_end = ours;
        uploader_end->set_frame_handler([&](Frame frame) {
            auto* control = std::get_if<ControlMessage>(&frame);
            if (control && std::holds_alternative<RequestInfoMessage>(*control)) {
                uploader_end->send_control(InfoMessage{FileInfo{"slow.bin", 1000, "application/octet-stream"}});
            }
        });
        uploader_end->set_close_handler([&]() { uploader_closed = true; });
        uploader_end->open();
        return theirs;
    };
    auto downloader = std::make_shared<DownloaderSession>(io_, factory, settings_);
    auto_start(downloader);
    
    ASSERT_TRUE(downloader->connect());
    run();
    
    EXPECT_EQ(downloader->state(), DownloadState::ERROR);
    EXPECT_EQ(downloader->error(), "Transfer stalled - no data received");
    EXPECT_TRUE(uploader_closed);
}

TEST_F(TransferFlowTest, UnansweredConnectTimesOut) {
    settings_.connection_timeout = 50ms;
    
    std::shared_ptr<LoopbackChannel> silent_end;
    auto factory = [&]() -> std::shared_ptr<Channel> {
        auto [ours, theirs] = LoopbackChannel::create_pair(io_);
        silent_end = ours;
        return theirs;
    };
    auto downloader = std::make_shared<DownloaderSession>(io_, factory, settings_);
    
    ASSERT_TRUE(downloader->connect());
    run();
    
    EXPECT_EQ(downloader->state(), DownloadState::ERROR);
    EXPECT_EQ(downloader->error(), "Connection timeout");
}
