#pragma once

/**
 * @file at_channel.hpp
 * @brief Request/response framing over the module's AT serial link.
 *
 * @details
 * One exchange = one command line out, one parsed reply in.  Replies are
 * correlated to requests purely by temporal order, so the channel is a single
 * mutually-exclusive resource: every exchange holds an internal FreeRTOS
 * mutex from the input flush until the reply has been consumed.
 *
 * @verbatim
 *   take mutex → flush stale RX → write "<cmd>\r\n" → settle delay
 *     → poll RX every 50 ms until "\r\n" seen or timeout → parse
 *     → [optional hold after OK] → give mutex
 * @endverbatim
 */

#include <cstdint>
#include <string>

#include "esp_err.h"
#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"
#include "serial_port.hpp"

// ============================================================================
// Framing constants
// ============================================================================

/// @brief Line delimiter appended to every command and expected after a reply.
static constexpr const char* AT_LINE_DELIMITER = "\r\n";

/// @brief Sentinel for AtCommand timing fields: use the channel default.
static constexpr uint32_t AT_CHANNEL_DEFAULT = UINT32_MAX;

// ============================================================================
// Command / response value types
// ============================================================================

/// @brief Whether a failed exchange should abort the enclosing sequence.
enum class AtCriticality : uint8_t {
    ADVISORY,   ///< failure is logged and ignored
    CRITICAL,   ///< failure aborts the sequence
};

/// @brief One AT command, immutable per call.
struct AtCommand {
    std::string   text;                               ///< without line delimiter
    uint32_t      timeoutMs     = AT_CHANNEL_DEFAULT; ///< reply deadline after the settle delay
    uint32_t      settleMs      = AT_CHANNEL_DEFAULT; ///< pause between write and first read
    uint32_t      holdAfterOkMs = 0;                  ///< keep the channel reserved after an OK reply
    AtCriticality criticality   = AtCriticality::ADVISORY;
};

/// @brief Parsed module reply.
struct AtResponse {
    bool        ok       = false;
    bool        hasValue = false;
    std::string value;               ///< text after the first '=' (trimmed), when hasValue
    esp_err_t   status   = ESP_FAIL; ///< ESP_OK, ESP_FAIL (I/O), ESP_ERR_TIMEOUT, ESP_ERR_INVALID_RESPONSE
};

/**
 * @brief Decode raw reply bytes as UTF-8, dropping malformed sequences.
 *
 * Well-formed multi-byte sequences and NUL bytes are kept.  A byte that
 * cannot start a sequence is dropped on its own; a truncated or malformed
 * sequence is dropped up to the first byte that breaks it.
 */
std::string decodeAtReply(const std::string& raw);

/**
 * @brief Parse a decoded reply.
 *
 * After trimming surrounding whitespace:
 *  1. @c "OK"                → ok, no value
 *  2. contains @c "=OK"      → ok, no value
 *  3. contains @c '='        → ok, value = trimmed text after the first '='
 *  4. anything else          → not ok
 *
 * @c status is ESP_OK for cases 1-3 and ESP_ERR_INVALID_RESPONSE otherwise.
 */
AtResponse parseAtResponse(const std::string& raw);

// ============================================================================
// AtChannel
// ============================================================================

/// @brief Channel-wide timing defaults.
struct AtChannelConfig {
    uint32_t defaultTimeoutMs = 3000;
    uint32_t settleMs         = 800;
    uint32_t pollIntervalMs   = 50;
    bool     trace            = false;  ///< log every TX line and RX text at debug level
};

/**
 * @brief Serialised command/response exchange over an ISerialPort.
 *
 * The port is not owned.  exchange() is safe to call from any task; concurrent
 * callers queue up on the internal mutex.
 */
class AtChannel {
public:
    explicit AtChannel(const AtChannelConfig& cfg = AtChannelConfig{});
    ~AtChannel();

    AtChannel(const AtChannel&) = delete;
    AtChannel& operator=(const AtChannel&) = delete;

    /// Bind the port and create the channel mutex.
    /// @return ESP_OK | ESP_ERR_INVALID_ARG (null port) | ESP_ERR_NO_MEM
    esp_err_t init(ISerialPort* port);

    /// Drop the port binding and free the mutex.  Callers must have stopped
    /// using the channel.
    void deinit();

    /// Issue one command and wait for its reply.  Never fails fatally: I/O
    /// errors are reported as @c {ok=false, status=ESP_FAIL} and the next call
    /// starts afresh.
    AtResponse exchange(const AtCommand& cmd);

    /// Convenience overload for a plain command with default timing.
    AtResponse exchange(const char* text, uint32_t timeoutMs = AT_CHANNEL_DEFAULT);

    void setTrace(bool enabled) { _cfg.trace = enabled; }

    const AtChannelConfig& config() const { return _cfg; }

private:
    AtResponse exchangeLocked(const AtCommand& cmd);

    AtChannelConfig   _cfg;
    ISerialPort*      _port  = nullptr;
    SemaphoreHandle_t _mutex = nullptr;
};
