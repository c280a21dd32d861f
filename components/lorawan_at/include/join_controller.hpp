#pragma once

/**
 * @file join_controller.hpp
 * @brief LoRaWAN OTAA join sequence over the AT command channel.
 *
 * @details
 * @verbatim
 *  UNCONFIGURED → CONFIGURING → REQUESTING → POLLING → JOINED
 *                      │             │           │
 *                      └─────────────┴───────────┴──→ FAILED
 * @endverbatim
 *
 * CONFIGURING sends the fixed configuration sequence; only the JoinEUI and
 * AppKey commands are critical.  REQUESTING issues AT+JOIN=1.  POLLING asks
 * AT+JOIN? on a fixed interval until the module reports 1 or the deadline
 * passes.  JOINED and FAILED are terminal: one controller, one attempt.
 */

#include <cstdint>
#include <string>

#include "esp_err.h"
#include "at_channel.hpp"
#include "module_session.hpp"

/// @brief Highest data rate index accepted by AT+DATARATE.
static constexpr uint8_t LORAWAN_MAX_DATA_RATE = 5;

/// @brief LoRaWAN frequency plans supported by the module.
enum class LoraRegion : uint8_t {
    EU868,
    US915,
    CN470,
};

/// @brief Region token as used in AT+REGION=.
const char* loraRegionName(LoraRegion region);

/// @brief Everything one join attempt needs.
struct JoinParams {
    const char* joinEui    = nullptr;   ///< 16 hex chars, any case
    const char* appKey     = nullptr;   ///< 32 hex chars, any case
    uint32_t    timeoutMs  = 60000;     ///< accept deadline, counted from AT+JOIN=1
    uint8_t     dataRate   = 3;         ///< 0-5, lower = longer range (3 = SF9 in EU868)
    int8_t      txPowerDbm = 14;        ///< AT+EIRP
    LoraRegion  region     = LoraRegion::EU868;
};

/// @brief Timing knobs of the join sequence.
struct JoinTiming {
    uint32_t joinRequestTimeoutMs = 5000;   ///< reply deadline for AT+JOIN=1
    uint32_t pollIntervalMs       = 5000;   ///< pause between AT+JOIN? polls
};

/**
 * @brief Runs one OTAA join attempt.
 *
 * Not thread-safe by itself; the channel it drives is.
 */
class JoinController {
public:
    /// Join state machine states.
    enum class State : uint8_t {
        UNCONFIGURED,
        CONFIGURING,
        REQUESTING,
        POLLING,
        JOINED,
        FAILED,
    };

    JoinController(AtChannel&        channel,
                   ModuleSession&    session,
                   const JoinTiming& timing = JoinTiming{});

    /// Configure the module, request the join and wait for the accept.
    /// @return ESP_OK                        joined (session marked joined)
    ///         ESP_ERR_INVALID_ARG           missing credentials / bad data rate
    ///         ESP_ERR_INVALID_STATE         this controller already finished
    ///         ESP_ERR_LORAWAN_CONFIG        a critical command failed, see failedCommand()
    ///         ESP_ERR_LORAWAN_JOIN_REJECTED AT+JOIN=1 refused
    ///         ESP_ERR_TIMEOUT               no accept before params.timeoutMs
    esp_err_t join(const JoinParams& params);

    State getState() const { return _state; }

    /// Command text that aborted the configuration phase (empty otherwise).
    const std::string& failedCommand() const { return _failedCommand; }

    /// Number of AT+JOIN? polls issued by the last join().
    uint32_t pollCount() const { return _pollCount; }

private:
    esp_err_t configure(const JoinParams& params);
    esp_err_t fail(esp_err_t err);

    AtChannel&     _channel;
    ModuleSession& _session;
    JoinTiming     _timing;

    State       _state     = State::UNCONFIGURED;
    std::string _failedCommand;
    uint32_t    _pollCount = 0;
};
