#pragma once

/**
 * @file lorawan_client.hpp
 * @brief LoRaWAN AT-modem driver component public API for ESP-IDF.
 *
 * @details
 * Drives a LoRaWAN module that speaks a line-oriented AT protocol over a UART:
 *  - Module bring-up: reboot + liveness probe (LorawanClient::init())
 *  - OTAA join with configurable region, data rate and TX power
 *  - Non-blocking uplink queue (LorawanClient::send())
 *  - Background transmit task with duty-cycle spacing and bounded retries
 *  - Status queries (DevEUI, RSSI, SNR) that share the serial link safely
 *
 * Architecture overview:
 * @verbatim
 *  ┌───────────────────────────────────────────────────────────────┐
 *  │                    Caller (application)                      │
 *  │  send() / getRssi() / getDevEui()          join() / begin()   │
 *  └───────┬────────────────────┬──────────────────────┬──────────┘
 *          │ enqueue (no wait)  │ status query         │ once, before start()
 *  ┌───────▼────────┐  ┌────────┴─────────┐  ┌─────────▼──────────┐
 *  │  MessageQueue  │  │                  │  │  JoinController    │
 *  └───────┬────────┘  │                  │  └─────────┬──────────┘
 *          │           │    AtChannel     │◄───────────┘
 *  ┌───────▼────────┐  │  (mutex-guarded) │
 *  │  TxWorker task ├─►│                  │
 *  └────────────────┘  └────────┬─────────┘
 *                               │ ISerialPort (UartSerialPort / mock)
 *                               ▼
 *                          LoRaWAN module
 * @endverbatim
 *
 * Radio-layer encryption and MAC framing happen inside the module firmware.
 * The driver only issues AT commands and interprets their textual replies.
 */

#include <atomic>
#include <cstdint>
#include <cstddef>
#include <string>

#include "esp_err.h"
#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"
#include "at_channel.hpp"
#include "join_controller.hpp"
#include "lorawan_at_err.hpp"
#include "message_queue.hpp"
#include "module_session.hpp"
#include "payload_encoder.hpp"
#include "serial_port.hpp"
#include "tx_worker.hpp"
#include "uart_serial_port.hpp"

/// @brief getRssi() / getSnr() result when the module gave no usable value.
static constexpr int LORAWAN_SIGNAL_UNAVAILABLE = -999;

// ============================================================================
// Configuration struct
// ============================================================================

/**
 * @brief Runtime configuration for LorawanClient.
 *
 * Every member has a default, so @c LorawanClientConfig{} is a valid
 * configuration for a module on UART1 in EU868.  Tests shrink the timings.
 */
struct LorawanClientConfig {
    // Serial endpoint (used by init(); ignored by initWithPort())
    UartSerialPortConfig uart;
    // Network parameters
    LoraRegion region     = LoraRegion::EU868;
    uint8_t    dataRate   = 3;
    int8_t     txPowerDbm = 14;
    // Sub-component knobs
    AtChannelConfig channel;
    JoinTiming      join;
    TxWorkerConfig  worker;
    // Module bring-up
    uint32_t bootDelayMs      = 500;    ///< after opening the port
    uint32_t rebootTimeoutMs  = 2000;   ///< AT+REBOOT reply deadline (reply ignored)
    uint32_t postRebootMs     = 1000;
    uint32_t probeAttempts    = 3;      ///< AT liveness probes
    uint32_t probeIntervalMs  = 500;
    // Raise component log tags to DEBUG and trace every AT line
    bool     debugLogging     = false;
};

// ============================================================================
// LorawanClient class
// ============================================================================

/**
 * @brief LoRaWAN AT-modem driver.
 *
 * One instance drives one module.  Lifecycle:
 * init()/initWithPort() → join() → start() → send()... → stop().
 * begin() runs the first three in one call.  The destructor calls stop().
 *
 * Lifecycle calls belong to one owner task.  send() and the status queries
 * may be called from any task, also while the owner runs stop(): they hold
 * an internal gate for as long as they touch the queue or the channel, and
 * stop() releases those only once it owns the gate.  A query in progress
 * therefore delays stop() by at most its own command timeout.
 */
class LorawanClient {
public:
    explicit LorawanClient(const LorawanClientConfig& cfg = LorawanClientConfig{});

    /// RAII destructor, calls stop() and waits for the worker if needed.
    ~LorawanClient();

    LorawanClient(const LorawanClient&) = delete;
    LorawanClient& operator=(const LorawanClient&) = delete;

    // -----------------------------------------------------------------------
    // Lifecycle
    // -----------------------------------------------------------------------

    /// Open the configured UART, reboot the module and probe it.
    /// @return ESP_OK | ESP_ERR_LORAWAN_NO_MODULE | UART driver error |
    ///         ESP_ERR_NO_MEM | ESP_ERR_INVALID_STATE (already initialised)
    esp_err_t init();

    /// Same as init() over a caller-owned port, which must outlive stop().
    esp_err_t initWithPort(ISerialPort* port);

    /// OTAA join with the configured region, data rate and TX power.
    /// @param joinEui   16 hex chars (JoinEUI / AppEUI)
    /// @param appKey    32 hex chars
    /// @param timeoutMs accept deadline, counted from the join request
    /// @return see JoinController::join(); ESP_ERR_INVALID_STATE before init()
    esp_err_t join(const char* joinEui, const char* appKey, uint32_t timeoutMs = 60000);

    /// Start the background transmit task.
    /// @return ESP_OK | ESP_ERR_LORAWAN_NOT_JOINED | ESP_ERR_INVALID_STATE | ESP_ERR_NO_MEM
    esp_err_t start();

    /// init() + join() + start().  On any failure everything acquired so far
    /// is released again and the first error is returned.
    esp_err_t begin(const char* joinEui, const char* appKey, uint32_t joinTimeoutMs = 60000);

    /// begin() over a caller-owned port.
    esp_err_t beginWithPort(ISerialPort* port,
                            const char*  joinEui,
                            const char*  appKey,
                            uint32_t     joinTimeoutMs = 60000);

    /// Stop the worker, discard pending messages, release the port.
    /// Idempotent.  Bounded by TxWorkerConfig::stopGraceMs.
    /// @return ESP_OK | ESP_ERR_TIMEOUT (worker still finishing an exchange;
    ///         release is deferred to the next stop() or the destructor)
    esp_err_t stop();

    // -----------------------------------------------------------------------
    // Transmit API  (thread-safe, never blocks)
    // -----------------------------------------------------------------------

    /// Queue a binary payload (1..LORAWAN_MAX_PAYLOAD bytes).
    /// @return false (logged) when not joined, empty, too large or queue full.
    bool send(const uint8_t* data, size_t len);

    /// Queue the bytes of a text message.
    bool send(const std::string& text);
    bool send(const char* text) { return send(std::string(text ? text : "")); }

    /// Encode and queue a sensor record (see payload_encoder.hpp).
    bool send(const SensorRecord& record);

    /// @brief Register a sink for delivery outcomes (called from the worker task).
    void setTxCallback(TxCallback cb) { _worker.setCallback(cb); }

    // -----------------------------------------------------------------------
    // Status
    // -----------------------------------------------------------------------

    bool   isJoined() const { return _session.isJoined(); }
    size_t queueDepth() const;

    /// State the last join() left its controller in.
    JoinController::State getJoinState() const { return _joinState; }

    /// Read the module's DevEUI (needed for network-server registration).
    /// @return ESP_OK | ESP_ERR_INVALID_RESPONSE | ESP_ERR_INVALID_STATE
    esp_err_t getDevEui(std::string& out);

    /// Last received signal strength in dBm, or LORAWAN_SIGNAL_UNAVAILABLE.
    int getRssi();

    /// Last signal-to-noise ratio in dB, or LORAWAN_SIGNAL_UNAVAILABLE.
    int getSnr();

private:
    esp_err_t _initCommon();
    esp_err_t bringUpModule();
    esp_err_t finishBegin(esp_err_t initErr, const char* joinEui,
                          const char* appKey, uint32_t joinTimeoutMs);
    bool      enqueue(const uint8_t* data, size_t len);
    int       querySignal(const char* cmd);
    void      releaseResources();

    LorawanClientConfig _cfg;

    // Serial endpoint (injected or created in init())
    ISerialPort* _port     = nullptr;
    bool         _ownsPort = false;   ///< true → release deletes _port

    // Declaration order matters: the worker references the three members
    // above it and is destroyed first.
    AtChannel     _channel;
    ModuleSession _session;
    MessageQueue  _queue;
    TxWorker      _worker;

    JoinController::State _joinState   = JoinController::State::UNCONFIGURED;
    std::atomic<bool>     _initialized{false};

    // Held by send()/status queries while they use _queue or _channel, and
    // by releaseResources() while it tears them down.
    StaticSemaphore_t _gateBuf;
    SemaphoreHandle_t _gate = nullptr;
};
