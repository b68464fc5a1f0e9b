#include "peerdrop/core/command_handler.hpp"
#include "peerdrop/core/config.hpp"
#include "peerdrop/core/logger.hpp"
#include "peerdrop/core/utils.hpp"
#include "peerdrop/crypto/hash.hpp"
#include "peerdrop/network/tcp_channel.hpp"
#include "peerdrop/network/tcp_upload_server.hpp"
#include "peerdrop/transfer/downloader_session.hpp"
#include "peerdrop/transfer/file_source.hpp"
#include "peerdrop/transfer/uploader_host.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <charconv>
#include <csignal>
#include <filesystem>
#include <iostream>

namespace peerdrop::core {

namespace {
    bool parse_endpoint(const std::string& target, std::string& host, std::uint16_t& port) {
        auto colon = target.rfind(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 == target.size()) {
            return false;
        }
        
        host = target.substr(0, colon);
        if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
            host = host.substr(1, host.size() - 2);
        }
        
        unsigned int value = 0;
        auto begin = target.data() + colon + 1;
        auto end = target.data() + target.size();
        auto [ptr, ec] = std::from_chars(begin, end, value);
        if (ec != std::errc() || ptr != end || value == 0 || value > 65535) {
            return false;
        }
        port = static_cast<std::uint16_t>(value);
        return true;
    }
}

// ShareCommandHandler Implementation
CommandResult ShareCommandHandler::execute(const std::vector<std::string>& args, const CommandLineParser& options) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    std::filesystem::path file_path = args[1];
    auto& config = Config::instance();
    int port = config.get_int("server.port", 7070);
    if (options.has_option("port")) {
        auto requested = options.get_port_option("port");
        if (!requested) {
            return CommandResult::error("Invalid port: " + options.get_option("port"));
        }
        port = *requested;
    }
    if (port < 0 || port > 65535) {
        return CommandResult::error("Invalid port: " + std::to_string(port));
    }
    
    auto source = std::make_shared<transfer::DiskFileSource>(file_path);
    auto open_result = source->open();
    if (!open_result) {
        return CommandResult::error(open_result.message);
    }
    
    auto settings = transfer::TransferSettings::from_config(config);
    std::string password = options.get_option("password");
    
    boost::asio::io_context io_context;
    transfer::UploaderHost host(io_context, source, password, settings);
    network::TcpUploadServer server(io_context, static_cast<std::uint16_t>(port));
    
    host.set_session_callback([&host, &io_context](const transfer::UploadConnectionInfo& info) {
        std::cout << "  #" << info.id << " " << info.label << ": " << transfer::to_string(info.state);
        if (!info.error.empty()) {
            std::cout << " (" << info.error << ")";
        }
        std::cout << "  [active " << host.active_count()
                  << ", completed " << host.total_downloads() << "]\n";
        boost::asio::post(io_context, [&host]() { host.remove_finished(); });
    });
    
    server.set_channel_handler([&host](std::shared_ptr<network::Channel> channel) {
        host.accept(std::move(channel));
    });
    
    if (!server.start()) {
        return CommandResult::error("Failed to listen on port " + std::to_string(port));
    }
    
    boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
        if (ec) {
            return;
        }
        LOG_INFO("Received signal {}, shutting down", signal_number);
        server.stop();
        host.stop();
    });
    
    const auto& info = host.file_info();
    std::cout << "Sharing " << info.name << " (" << utils::StringUtils::format_bytes(info.size)
              << ", " << info.mime_type << ")\n";
    std::cout << "Listening on port " << server.port();
    if (!password.empty()) {
        std::cout << " (password protected)";
    }
    std::cout << "\nPress Ctrl+C to stop\n";
    
    io_context.run();
    
    std::cout << "Stopped sharing. Completed downloads: " << host.total_downloads() << "\n";
    return CommandResult::ok();
}

// FetchCommandHandler Implementation
CommandResult FetchCommandHandler::execute(const std::vector<std::string>& args, const CommandLineParser& options) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    std::string host;
    std::uint16_t port = 0;
    if (!parse_endpoint(args[1], host, port)) {
        return CommandResult::error("Invalid address (expected host:port): " + args[1]);
    }
    
    std::filesystem::path output_dir = options.get_option("output", ".");
    if (!utils::FileUtils::create_directories(output_dir)) {
        return CommandResult::error("Cannot create output directory: " + output_dir.string());
    }
    
    auto settings = transfer::TransferSettings::from_config(Config::instance());
    bool has_password = options.has_option("password");
    std::string password = options.get_option("password");
    
    boost::asio::io_context io_context;
    auto session = std::make_shared<transfer::DownloaderSession>(
        io_context,
        [&io_context, host, port]() -> std::shared_ptr<network::Channel> {
            return std::make_shared<network::TcpChannel>(io_context, host, port);
        },
        settings);
    
    std::string failure;
    std::filesystem::path saved_path;
    bool password_used = false;
    int last_percent = -1;
    
    session->set_state_callback([&](transfer::DownloadState state) {
        switch (state) {
            case transfer::DownloadState::PASSWORD_ERROR:
                if (has_password) {
                    failure = "Password rejected";
                    session->cancel();
                    return;
                }
                std::cout << "Wrong password.\n";
                [[fallthrough]];
            case transfer::DownloadState::PASSWORD_REQUIRED: {
                if (has_password && !password_used) {
                    password_used = true;
                } else if (!has_password) {
                    std::cout << "Password: " << std::flush;
                    if (!std::getline(std::cin, password)) {
                        failure = "No password provided";
                        session->cancel();
                        return;
                    }
                }
                boost::asio::post(io_context, [&]() {
                    auto result = session->submit_password(password);
                    if (!result) {
                        LOG_ERROR("Failed to submit password: {}", result.message);
                    }
                });
                break;
            }
            case transfer::DownloadState::READY: {
                const auto& info = *session->file_info();
                std::cout << "Receiving " << info.name << " ("
                          << utils::StringUtils::format_bytes(info.size) << ")\n";
                boost::asio::post(io_context, [&]() {
                    auto result = session->start_download();
                    if (!result) {
                        failure = result.message;
                        session->cancel();
                    }
                });
                break;
            }
            case transfer::DownloadState::COMPLETE:
            case transfer::DownloadState::ERROR:
                io_context.stop();
                break;
            default:
                break;
        }
    });
    
    session->set_progress_callback([&](std::uint64_t received, std::uint64_t total) {
        int percent = total == 0 ? 100 : static_cast<int>(received * 100 / total);
        if (percent != last_percent) {
            last_percent = percent;
            std::cout << "\r  " << percent << "% (" << utils::StringUtils::format_bytes(received)
                      << " / " << utils::StringUtils::format_bytes(total) << ")" << std::flush;
        }
    });
    
    auto connect_result = session->connect();
    if (!connect_result) {
        return CommandResult::error("Failed to connect: " + connect_result.message);
    }
    
    io_context.run();
    if (last_percent >= 0) {
        std::cout << "\n";
    }
    
    if (session->state() != transfer::DownloadState::COMPLETE) {
        return CommandResult::error(failure.empty() ? session->error() : failure);
    }
    
    const auto& file = *session->downloaded_file();
    auto file_name = std::filesystem::path(file.name).filename();
    if (file_name.empty() || file_name == "." || file_name == "..") {
        file_name = "download";
    }
    saved_path = utils::FileUtils::unique_path(output_dir / file_name);
    if (!utils::FileUtils::write_binary_file(saved_path, file.data)) {
        return CommandResult::error("Failed to write " + saved_path.string());
    }
    
    auto digest = crypto::Sha256Hasher::hash(file.data);
    std::cout << "Saved " << saved_path.string() << " (" << utils::StringUtils::format_bytes(file.data.size())
              << ", " << file.mime_type << ")\n";
    std::cout << "SHA-256: " << crypto::hash_utils::hash_to_hex(digest) << "\n";
    
    return CommandResult::ok("Download complete");
}

}
