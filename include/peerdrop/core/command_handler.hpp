#pragma once

#include "peerdrop/core/cli.hpp"
#include <string>
#include <vector>

namespace peerdrop::core {

struct CommandResult {
    bool success;
    std::string message;
    int exit_code;
    
    static CommandResult ok(const std::string& msg = "") {
        return CommandResult{true, msg, 0};
    }
    
    static CommandResult error(const std::string& msg, int code = 1) {
        return CommandResult{false, msg, code};
    }
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;
    
    // args[0] is the command name itself.
    virtual CommandResult execute(const std::vector<std::string>& args, const CommandLineParser& options) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

// Serves one file over TCP until interrupted.
class ShareCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args, const CommandLineParser& options) override;
    std::string get_description() const override { return "Share a file with downloaders"; }
    std::string get_usage() const override { return "peerdrop share <file> [--password <pw>] [--port <n>]"; }
};

// Downloads the file offered at host:port.
class FetchCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args, const CommandLineParser& options) override;
    std::string get_description() const override { return "Download a shared file"; }
    std::string get_usage() const override { return "peerdrop fetch <host:port> [--password <pw>] [--output <dir>]"; }
};

}
