#pragma once

/**
 * @file module_session.hpp
 * @brief Per-driver session state shared by the foreground and the TX worker.
 */

#include <atomic>
#include <cstdint>

/// @brief lastSendUs value meaning "nothing sent yet in this session".
static constexpr int64_t SESSION_NEVER_SENT = -1;

/**
 * @brief Join flag and duty-cycle anchor of one module session.
 *
 * @c joined only ever goes false → true.  @c lastSendUs (esp_timer µs) is
 * written by the TX worker after every attempt sequence and may be read
 * from any task.
 */
struct ModuleSession {
    std::atomic<bool>    joined{false};
    std::atomic<int64_t> lastSendUs{SESSION_NEVER_SENT};

    void markJoined() { joined.store(true); }
    bool isJoined() const { return joined.load(); }

    /// Start a fresh session (after stop(), before the next init()).
    void reset()
    {
        joined.store(false);
        lastSendUs.store(SESSION_NEVER_SENT);
    }
};
