#include <iostream>
#include <string>
#include <vector>
#include "peerdrop/core/logger.hpp"
#include "peerdrop/core/config.hpp"
#include "peerdrop/core/cli.hpp"
#include "peerdrop/core/utils.hpp"
#include "peerdrop/core/command_registry.hpp"
#include "peerdrop/crypto/challenge_auth.hpp"

int main(int argc, char* argv[]) {
    peerdrop::core::CommandLineParser parser("peerdrop");
    peerdrop::core::CommandRegistry command_registry;
    
    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }
    
    if (parser.has_option("help")) {
        parser.print_help();
        command_registry.print_help();
        return 0;
    }
    
    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }
    
    auto& config = peerdrop::core::Config::instance();
    config.set_defaults();
    
    std::string config_file = parser.get_option("config", "peerdrop.conf");
    if (peerdrop::core::utils::FileUtils::exists(config_file)) {
        if (!config.load_from_file(config_file)) {
            std::cerr << "Error: failed to read configuration from " << config_file << "\n";
            return 1;
        }
    }
    
    auto log_level = parser.has_option("verbose")
        ? peerdrop::core::LogLevel::Debug
        : peerdrop::core::Logger::parse_level(config.get_string("log.level", "info"));
    peerdrop::core::Logger::initialize(config.get_string("log.file", "peerdrop.log"), log_level);
    
    if (!peerdrop::crypto::ChallengeAuth::initialize()) {
        LOG_CRITICAL("Failed to initialize libsodium");
        std::cerr << "Error: failed to initialize crypto library\n";
        return 1;
    }
    
    LOG_INFO("peerdrop starting up");
    
    auto& args = parser.get_positional_args();
    if (args.empty()) {
        parser.print_help();
        command_registry.print_help();
        return 0;
    }
    
    std::string command = args[0];
    auto result = command_registry.execute_command(command, args, parser);
    
    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!command_registry.has_command(command)) {
            command_registry.print_help();
        }
    } else if (!result.message.empty()) {
        LOG_INFO("{}", result.message);
    }
    
    peerdrop::core::Logger::shutdown();
    return result.exit_code;
}
