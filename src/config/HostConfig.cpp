#include "HostConfig.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace quirk_mcp {

namespace fs = std::filesystem;

namespace {

constexpr const char* kServersKey = "mcpServers";
constexpr const char* kConfigFileName = "claude_desktop_config.json";

fs::path home_directory() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
#else
    const char* home = std::getenv("HOME");
#endif
    if (home == nullptr || *home == '\0') {
        return fs::current_path();
    }
    return fs::path(home);
}

} // namespace

json InstallationStatus::to_json() const {
    return {
        {"installed", installed},
        {"config_path", config_path},
        {"command", command},
        {"errors", errors}
    };
}

fs::path HostConfig::default_config_path() {
#if defined(__APPLE__)
    return home_directory() / "Library" / "Application Support" / "Claude" / kConfigFileName;
#elif defined(_WIN32)
    const char* appdata = std::getenv("APPDATA");
    fs::path base = appdata ? fs::path(appdata) : home_directory() / "AppData" / "Roaming";
    return base / "Claude" / kConfigFileName;
#else
    return home_directory() / ".config" / "Claude" / kConfigFileName;
#endif
}

json HostConfig::generate_config(const std::string& server_name,
                                 const std::string& command,
                                 const std::vector<std::string>& args) {
    return {
        {kServersKey, {
            {server_name, {
                {"command", command},
                {"args", args},
                {"env", json::object()}
            }}
        }}
    };
}

json HostConfig::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return json::object();
    }

    std::ifstream file(path);
    if (!file) {
        spdlog::warn("Cannot open host config {}", path.string());
        return json::object();
    }

    json config = json::parse(file, nullptr, false);
    if (config.is_discarded() || !config.is_object()) {
        spdlog::warn("Host config {} is not a JSON object, treating as empty", path.string());
        return json::object();
    }
    return config;
}

void HostConfig::write(const fs::path& path, const json& config) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        throw std::runtime_error("Cannot write host config: " + path.string());
    }
    file << config.dump(2) << '\n';
    if (!file) {
        throw std::runtime_error("Failed writing host config: " + path.string());
    }
}

void HostConfig::install(const fs::path& path,
                         const std::string& server_name,
                         const std::string& command,
                         const std::vector<std::string>& args,
                         bool merge) {
    json generated = generate_config(server_name, command, args);
    json config = generated;

    if (merge) {
        config = load(path);
        if (!config.contains(kServersKey) || !config[kServersKey].is_object()) {
            config[kServersKey] = json::object();
        }
        config[kServersKey][server_name] = generated[kServersKey][server_name];
    }

    write(path, config);
    spdlog::info("Installed {} into {}", server_name, path.string());
}

bool HostConfig::uninstall(const fs::path& path, const std::string& server_name) {
    if (!fs::exists(path)) {
        return false;
    }

    json config = load(path);
    auto servers = config.find(kServersKey);
    if (servers == config.end() || !servers->is_object() || !servers->contains(server_name)) {
        return false;
    }

    servers->erase(server_name);
    write(path, config);
    spdlog::info("Removed {} from {}", server_name, path.string());
    return true;
}

InstallationStatus HostConfig::check(const fs::path& path, const std::string& server_name) {
    InstallationStatus status;
    status.config_path = path.string();

    if (!fs::exists(path)) {
        status.errors.push_back("Host config file not found");
        return status;
    }

    json config = load(path);
    auto servers = config.find(kServersKey);
    if (servers == config.end() || !servers->is_object()) {
        status.errors.push_back("No MCP servers configured");
        return status;
    }

    auto entry = servers->find(server_name);
    if (entry == servers->end() || !entry->is_object()) {
        status.errors.push_back(server_name + " not configured as MCP server");
        return status;
    }

    status.command = entry->value("command", "");
    fs::path command_path(status.command);
    // Bare names are resolved through PATH by the host
    if (status.command.empty() ||
        (command_path.has_parent_path() && !fs::exists(command_path))) {
        status.errors.push_back("Server command not found: " + status.command);
        return status;
    }

    status.installed = true;
    return status;
}

} // namespace quirk_mcp
