#pragma once

#include <cstddef>
#include <string>

namespace quirk_mcp {

/**
 * @brief Static server settings, filled from the command line in main
 */
struct ServerConfig {
    std::string name = "quirkllm";
    std::string version = "0.1.0";

    /// Refuse non-lifecycle methods until initialize has been received
    bool strict_handshake = false;

    std::size_t max_content_length = 16 * 1024 * 1024;
};

} // namespace quirk_mcp
