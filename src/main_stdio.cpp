#include "config/HostConfig.hpp"
#include "mcp/MCPServer.hpp"
#include "mcp/MessageFramer.hpp"
#include "tools/ToolRegistry.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <vector>

namespace {
    quirk_mcp::MCPServer* global_server = nullptr;

    void signal_handler(int /*signal*/) {
        if (global_server) {
            global_server->stop();
        }
    }

    void setup_signal_handlers() {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
    }

    bool parse_log_level(const std::string& name, spdlog::level::level_enum& level) {
        if (name == "trace") {
            level = spdlog::level::trace;
        } else if (name == "debug") {
            level = spdlog::level::debug;
        } else if (name == "info") {
            level = spdlog::level::info;
        } else if (name == "warn") {
            level = spdlog::level::warn;
        } else if (name == "error") {
            level = spdlog::level::err;
        } else if (name == "critical") {
            level = spdlog::level::critical;
        } else if (name == "off") {
            level = spdlog::level::off;
        } else {
            return false;
        }
        return true;
    }

    // stdout carries protocol frames, so logs go to stderr (and optionally a file)
    void configure_logging(spdlog::level::level_enum level, const std::string& log_file) {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (!log_file.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file));
        }

        auto logger = std::make_shared<spdlog::logger>("quirk-mcp", sinks.begin(), sinks.end());
        logger->set_level(level);
        logger->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(logger);
    }

    std::string executable_path(const char* argv0) {
        std::error_code ec;
        auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
        if (!ec) {
            return self.string();
        }
        return std::filesystem::absolute(argv0, ec).string();
    }
}

int main(int argc, char** argv) {
    // Parse command-line arguments
    CLI::App app{"quirk-mcp - Model Context Protocol server over stdio"};

    quirk_mcp::ServerConfig config;

    std::string log_level = "info";
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error, critical, off)")
        ->default_val("info");

    std::string log_file;
    app.add_option("--log-file", log_file, "Also write logs to this file");

    app.add_option("--name", config.name, "Server name reported to the host")
        ->default_val(config.name);
    app.add_option("--server-version", config.version, "Server version reported to the host")
        ->default_val(config.version);
    app.add_flag("--strict-handshake", config.strict_handshake,
                 "Reject tool methods until the host has sent initialize");
    app.add_option("--max-frame-bytes", config.max_content_length, "Largest accepted frame body")
        ->default_val(config.max_content_length)
        ->check(CLI::PositiveNumber);

    bool no_tools = false;
    app.add_flag("--no-tools", no_tools, "Run without a tool registry (no tools capability)");

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    // Host (Claude Desktop) configuration management
    auto* config_cmd = app.add_subcommand("config", "Manage the host application's MCP server entry");
    config_cmd->require_subcommand(1);
    std::string config_path = quirk_mcp::HostConfig::default_config_path().string();
    config_cmd->add_option("--path", config_path, "Host config file")
        ->default_val(config_path);

    auto* print_cmd = config_cmd->add_subcommand("print", "Print the mcpServers entry for this server");
    auto* install_cmd = config_cmd->add_subcommand("install", "Add this server to the host config");
    bool overwrite = false;
    install_cmd->add_flag("--overwrite", overwrite, "Replace the whole file instead of merging");
    auto* uninstall_cmd = config_cmd->add_subcommand("uninstall", "Remove this server from the host config");
    auto* check_cmd = config_cmd->add_subcommand("check", "Report whether the host config launches this server");

    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << config.name << " version " << config.version << std::endl;
        return 0;
    }

    spdlog::level::level_enum level = spdlog::level::info;
    if (!parse_log_level(log_level, level)) {
        std::cerr << "Invalid log level: " << log_level << std::endl;
        return 1;
    }
    configure_logging(level, log_file);

    try {
        if (config_cmd->parsed()) {
            const std::string command = executable_path(argv[0]);
            if (print_cmd->parsed()) {
                std::cout << quirk_mcp::HostConfig::generate_config(config.name, command).dump(2) << std::endl;
            } else if (install_cmd->parsed()) {
                quirk_mcp::HostConfig::install(config_path, config.name, command, {}, !overwrite);
                std::cout << "Config installed to: " << config_path << std::endl;
            } else if (uninstall_cmd->parsed()) {
                bool removed = quirk_mcp::HostConfig::uninstall(config_path, config.name);
                std::cout << (removed ? "Removed " : "Not found: ") << config.name << std::endl;
            } else if (check_cmd->parsed()) {
                auto status = quirk_mcp::HostConfig::check(config_path, config.name);
                std::cout << status.to_json().dump(2) << std::endl;
                return status.installed ? 0 : 1;
            }
            return 0;
        }

        spdlog::info("Starting MCP stdio server {} v{}", config.name, config.version);
        spdlog::info("Log level: {}", log_level);

        // Setup signal handlers for graceful shutdown
        setup_signal_handlers();

        std::shared_ptr<quirk_mcp::ToolRegistry> tools;
        if (!no_tools) {
            tools = std::make_shared<quirk_mcp::ToolRegistry>();
        }

        auto transport = std::make_unique<quirk_mcp::MessageFramer>(
            std::cin, std::cout, config.max_content_length);
        quirk_mcp::MCPServer server(std::move(transport), config, tools);

        // Store global reference for signal handler
        global_server = &server;

        // Run server (blocks until stopped)
        bool clean = server.run();

        global_server = nullptr;
        spdlog::info("Server stopped {}", clean ? "cleanly" : "after transport failure");
        return clean ? 0 : 1;

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
