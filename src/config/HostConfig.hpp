#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace quirk_mcp {

using json = nlohmann::ordered_json;

/**
 * @brief Result of checking whether the server is registered with the host
 */
struct InstallationStatus {
    bool installed = false;
    std::string config_path;
    std::string command;
    std::vector<std::string> errors;

    json to_json() const;
};

/**
 * @brief Reads and writes the host application's MCP server table
 *
 * The host (Claude Desktop) keeps launched servers under "mcpServers" in
 * claude_desktop_config.json:
 *
 *     {"mcpServers": {"<name>": {"command": "...", "args": [...], "env": {}}}}
 *
 * Entries for other servers are always preserved when merging.
 */
class HostConfig {
public:
    /**
     * @brief Per-platform location of claude_desktop_config.json
     *
     * macOS: ~/Library/Application Support/Claude/
     * Windows: %APPDATA%/Claude/
     * Others: ~/.config/Claude/
     */
    static std::filesystem::path default_config_path();

    /**
     * @brief Build the mcpServers block for this server
     */
    static json generate_config(const std::string& server_name,
                                const std::string& command,
                                const std::vector<std::string>& args = {});

    /**
     * @brief Load existing host config
     * @return Parsed object, or {} if the file is missing, unreadable or not an object
     */
    static json load(const std::filesystem::path& path);

    /**
     * @brief Write this server's entry into the host config
     * @param merge Keep other entries when true, replace the whole file when false
     * @throws std::runtime_error if the file cannot be written
     */
    static void install(const std::filesystem::path& path,
                        const std::string& server_name,
                        const std::string& command,
                        const std::vector<std::string>& args = {},
                        bool merge = true);

    /**
     * @brief Remove this server's entry
     * @return true if an entry was removed
     * @throws std::runtime_error if the file cannot be rewritten
     */
    static bool uninstall(const std::filesystem::path& path, const std::string& server_name);

    static InstallationStatus check(const std::filesystem::path& path, const std::string& server_name);

private:
    static void write(const std::filesystem::path& path, const json& config);
};

} // namespace quirk_mcp
