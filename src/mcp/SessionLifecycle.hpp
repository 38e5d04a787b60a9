#pragma once

#include <string>

namespace quirk_mcp {

enum class SessionState {
    Uninitialized,
    Initializing,
    Ready,
    ShuttingDown,
    Stopped
};

const char* to_string(SessionState state);

/// Lifecycle method names
namespace methods {
constexpr const char* kInitialize = "initialize";
constexpr const char* kInitialized = "notifications/initialized";
constexpr const char* kShutdown = "shutdown";
constexpr const char* kPing = "ping";
constexpr const char* kCancelled = "notifications/cancelled";
constexpr const char* kToolsList = "tools/list";
constexpr const char* kToolsCall = "tools/call";
} // namespace methods

/**
 * @brief Session state machine around the initialize handshake
 *
 *     Uninitialized --initialize--> Initializing --notifications/initialized--> Ready
 *     Ready --shutdown--> ShuttingDown
 *     any --end of stream--> Stopped
 *
 * In tolerant mode (default) the handshake is advisory: every method is
 * permitted while the session is open. In strict mode, methods other than the
 * lifecycle ones are refused until initialize has been received.
 * ping is permitted in every state.
 */
class SessionLifecycle {
public:
    explicit SessionLifecycle(bool strict_handshake = false);

    SessionState state() const { return state_; }
    bool strict_handshake() const { return strict_handshake_; }

    /**
     * @brief Check whether method may be dispatched in the current state
     */
    bool permits(const std::string& method) const;

    void on_initialize();
    void on_initialized();
    void on_shutdown();
    void on_end_of_stream();

private:
    void transition(SessionState next);

    SessionState state_ = SessionState::Uninitialized;
    bool strict_handshake_;
};

} // namespace quirk_mcp
