#include "SessionLifecycle.hpp"
#include <spdlog/spdlog.h>

namespace quirk_mcp {

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Uninitialized: return "uninitialized";
        case SessionState::Initializing:  return "initializing";
        case SessionState::Ready:         return "ready";
        case SessionState::ShuttingDown:  return "shutting_down";
        case SessionState::Stopped:       return "stopped";
    }
    return "unknown";
}

SessionLifecycle::SessionLifecycle(bool strict_handshake)
    : strict_handshake_(strict_handshake) {}

bool SessionLifecycle::permits(const std::string& method) const {
    if (method == methods::kPing) {
        return true;
    }

    switch (state_) {
        case SessionState::ShuttingDown:
        case SessionState::Stopped:
            return false;
        case SessionState::Uninitialized:
            if (strict_handshake_) {
                return method == methods::kInitialize ||
                       method == methods::kInitialized ||
                       method == methods::kShutdown;
            }
            return true;
        case SessionState::Initializing:
        case SessionState::Ready:
            return true;
    }
    return false;
}

void SessionLifecycle::on_initialize() {
    if (state_ != SessionState::Uninitialized) {
        spdlog::warn("initialize received again in state {}, ignoring", to_string(state_));
        return;
    }
    transition(SessionState::Initializing);
}

void SessionLifecycle::on_initialized() {
    if (state_ != SessionState::Initializing) {
        spdlog::warn("notifications/initialized received in state {}", to_string(state_));
        return;
    }
    transition(SessionState::Ready);
}

void SessionLifecycle::on_shutdown() {
    if (state_ == SessionState::ShuttingDown || state_ == SessionState::Stopped) {
        return;
    }
    transition(SessionState::ShuttingDown);
}

void SessionLifecycle::on_end_of_stream() {
    transition(SessionState::Stopped);
}

void SessionLifecycle::transition(SessionState next) {
    if (next == state_) {
        return;
    }
    spdlog::debug("Session state: {} -> {}", to_string(state_), to_string(next));
    state_ = next;
}

} // namespace quirk_mcp
