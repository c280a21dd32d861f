#pragma once

/**
 * @file tx_worker.hpp
 * @brief Background task that drains the MessageQueue onto the AT channel.
 *
 * @details
 * One FreeRTOS task per driver, created only once the session is joined:
 * @verbatim
 *   dequeue (≤ queuePollMs) → duty-cycle wait → AT+SEND=<HEX> × ≤ maxRetries
 *        ↑                                                 │
 *        └──────────── lastSendUs = now, report ◄──────────┘
 * @endverbatim
 * Every wait inside the loop is either a queue receive bounded by
 * queuePollMs or a task-notification wait that NOTIFY_STOP ends early, so a
 * stop request is observed within one poll period.  An in-flight exchange is
 * never interrupted.
 */

#include <atomic>
#include <cstdint>

#include "esp_err.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "freertos/semphr.h"

#include "at_channel.hpp"
#include "message_queue.hpp"
#include "module_session.hpp"

/// @brief How an attempt sequence ended.
enum class TxOutcome : uint8_t {
    DELIVERED,  ///< module acknowledged AT+SEND
    DROPPED,    ///< every attempt failed; message discarded
    ABORTED,    ///< stop requested before the sequence finished
};

const char* txOutcomeName(TxOutcome outcome);

/// @brief Observability sink, invoked from the worker task after every
/// attempt sequence.  Must not block for long or call back into the driver.
using TxCallback = void (*)(TxOutcome outcome, const QueuedMessage& msg);

/// @brief Worker timing and task knobs.  Defaults are the production values.
struct TxWorkerConfig {
    uint32_t sendIntervalMs = 30000;  ///< minimum gap between attempt sequences (duty cycle)
    uint32_t maxRetries     = 3;      ///< attempts per message
    uint32_t retryDelayMs   = 2000;   ///< pause between failed attempts
    uint32_t sendTimeoutMs  = 10000;  ///< reply deadline for AT+SEND
    uint32_t rxWindowMs     = 3000;   ///< channel hold after an acknowledged send
    uint32_t queuePollMs    = 1000;   ///< dequeue timeout / stop-check granularity
    uint32_t stopGraceMs    = 10000;  ///< how long stop() waits for the task to exit
    uint32_t taskStackSize  = 4096;
    uint32_t taskPriority   = 5;
};

class TxWorker {
public:
    TxWorker(MessageQueue&         queue,
             AtChannel&            channel,
             ModuleSession&        session,
             const TxWorkerConfig& cfg = TxWorkerConfig{});

    /// Stops the task.  If it overran the grace period, blocks until it has
    /// really exited so nothing it touches is freed underneath it.
    ~TxWorker();

    TxWorker(const TxWorker&) = delete;
    TxWorker& operator=(const TxWorker&) = delete;

    /// Create the worker task.
    /// @return ESP_OK (also when already running) | ESP_ERR_LORAWAN_NOT_JOINED |
    ///         ESP_ERR_NO_MEM
    esp_err_t start();

    /// Request the task to exit and wait up to stopGraceMs for it.
    /// Idempotent.
    /// @return ESP_OK | ESP_ERR_TIMEOUT (task still finishing an exchange)
    esp_err_t stop();

    /// Block until a task that overran stop()'s grace period has exited,
    /// then release it.  No-op when no task exists.
    void waitForExit();

    bool isRunning() const { return _taskHandle != nullptr; }

    /// Register the outcome sink.  Pass nullptr to disable.
    void setCallback(TxCallback cb) { _cb.store(cb); }

    const TxWorkerConfig& config() const { return _cfg; }

private:
    static constexpr uint32_t NOTIFY_STOP = (1u << 0);

    static void taskEntryStatic(void* arg);
    void taskLoop();

    /// Sleep up to @p ms; returns true as soon as a stop is requested.
    bool waitForStop(uint32_t ms);

    void      waitForDutyCycle();
    TxOutcome deliver(QueuedMessage& msg);
    bool      attemptSend(const QueuedMessage& msg);
    void      report(TxOutcome outcome, const QueuedMessage& msg);
    void      releaseTask();

    MessageQueue&  _queue;
    AtChannel&     _channel;
    ModuleSession& _session;
    TxWorkerConfig _cfg;

    TaskHandle_t      _taskHandle = nullptr;
    SemaphoreHandle_t _exitSem    = nullptr;   ///< given by the task right before it parks
    std::atomic<bool> _stopRequested{false};
    std::atomic<TxCallback> _cb{nullptr};
};
