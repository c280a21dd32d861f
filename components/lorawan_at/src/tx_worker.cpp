/**
 * @file tx_worker.cpp
 * @brief Duty-cycle limited, retrying uplink task.
 *
 * @details
 * Implementation notes:
 *  - The task never deletes itself.  On exit it gives @c _exitSem and parks
 *    in vTaskSuspend(); the owner deletes it after taking the semaphore.  The
 *    task handle therefore stays valid for every xTaskNotify() issued by
 *    stop(), however the exit races with it.
 *  - lastSendUs is written after every attempt sequence, whatever the
 *    outcome, so the duty-cycle clock always advances.
 *  - The duty-cycle wait re-reads esp_timer after every chunk; tick rounding
 *    can only make it longer, never shorter.
 */

#include "tx_worker.hpp"
#include "lorawan_at_err.hpp"

#include "esp_log.h"
#include "esp_timer.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "freertos/semphr.h"

#include <algorithm>
#include <string>

static const char* TAG = "TxWorker";

const char* txOutcomeName(TxOutcome outcome)
{
    switch (outcome) {
        case TxOutcome::DELIVERED: return "DELIVERED";
        case TxOutcome::DROPPED:   return "DROPPED";
        case TxOutcome::ABORTED:   return "ABORTED";
    }
    return "?";
}

static void appendHexUpper(std::string& out, const uint8_t* data, size_t len)
{
    static const char digits[] = "0123456789ABCDEF";
    out.reserve(out.size() + len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
}

// ===========================================================================
// Constructor / Destructor
// ===========================================================================

TxWorker::TxWorker(MessageQueue&         queue,
                   AtChannel&            channel,
                   ModuleSession&        session,
                   const TxWorkerConfig& cfg)
    : _queue(queue),
      _channel(channel),
      _session(session),
      _cfg(cfg)
{}

TxWorker::~TxWorker()
{
    if (stop() == ESP_ERR_TIMEOUT) {
        waitForExit();
    }
}

// ===========================================================================
// Lifecycle
// ===========================================================================

esp_err_t TxWorker::start()
{
    if (_taskHandle) {
        ESP_LOGW(TAG, "start() called twice, ignoring");
        return ESP_OK;
    }
    if (!_session.isJoined()) {
        ESP_LOGE(TAG, "Cannot start worker: not joined");
        return ESP_ERR_LORAWAN_NOT_JOINED;
    }

    _exitSem = xSemaphoreCreateBinary();
    if (!_exitSem) {
        ESP_LOGE(TAG, "xSemaphoreCreateBinary failed");
        return ESP_ERR_NO_MEM;
    }

    _stopRequested.store(false);

    BaseType_t created = xTaskCreate(taskEntryStatic,
                                     "lorawan_tx",
                                     _cfg.taskStackSize,
                                     this,
                                     _cfg.taskPriority,
                                     &_taskHandle);
    if (created != pdPASS) {
        ESP_LOGE(TAG, "xTaskCreate failed");
        vSemaphoreDelete(_exitSem);
        _exitSem    = nullptr;
        _taskHandle = nullptr;
        return ESP_ERR_NO_MEM;
    }

    ESP_LOGD(TAG, "Background worker started (interval %lu ms, %lu retries)",
             (unsigned long)_cfg.sendIntervalMs, (unsigned long)_cfg.maxRetries);
    return ESP_OK;
}

esp_err_t TxWorker::stop()
{
    if (!_taskHandle) return ESP_OK;

    _stopRequested.store(true);
    xTaskNotify(_taskHandle, NOTIFY_STOP, eSetBits);

    if (xSemaphoreTake(_exitSem, pdMS_TO_TICKS(_cfg.stopGraceMs)) != pdTRUE) {
        ESP_LOGW(TAG, "Worker did not stop cleanly within %lu ms",
                 (unsigned long)_cfg.stopGraceMs);
        return ESP_ERR_TIMEOUT;
    }

    releaseTask();
    return ESP_OK;
}

void TxWorker::waitForExit()
{
    if (!_taskHandle) return;

    ESP_LOGW(TAG, "Waiting for worker to finish its current exchange");
    _stopRequested.store(true);
    xSemaphoreTake(_exitSem, portMAX_DELAY);
    releaseTask();
}

void TxWorker::releaseTask()
{
    if (_taskHandle) {
        vTaskDelete(_taskHandle);
        _taskHandle = nullptr;
    }
    if (_exitSem) {
        vSemaphoreDelete(_exitSem);
        _exitSem = nullptr;
    }
}

// ===========================================================================
// Task
// ===========================================================================

void TxWorker::taskEntryStatic(void* arg)
{
    TxWorker* self = static_cast<TxWorker*>(arg);
    self->taskLoop();
    xSemaphoreGive(self->_exitSem);
    vTaskSuspend(nullptr);
}

void TxWorker::taskLoop()
{
    while (!_stopRequested.load()) {
        QueuedMessage msg;
        if (!_queue.dequeue(msg, _cfg.queuePollMs)) {
            continue;
        }
        if (_stopRequested.load()) {
            break;
        }

        waitForDutyCycle();
        if (_stopRequested.load()) {
            break;
        }

        TxOutcome outcome = deliver(msg);
        _session.lastSendUs.store(esp_timer_get_time());
        report(outcome, msg);
    }
    ESP_LOGD(TAG, "Worker exiting");
}

bool TxWorker::waitForStop(uint32_t ms)
{
    const int64_t deadline = esp_timer_get_time() + static_cast<int64_t>(ms) * 1000;

    while (!_stopRequested.load()) {
        int64_t remainingUs = deadline - esp_timer_get_time();
        if (remainingUs <= 0) {
            return false;
        }

        uint32_t chunkMs = static_cast<uint32_t>(
            std::min<int64_t>(remainingUs / 1000 + 1, _cfg.queuePollMs));
        TickType_t ticks = pdMS_TO_TICKS(chunkMs);
        if (ticks == 0) ticks = 1;

        uint32_t bits = 0;
        xTaskNotifyWait(0, NOTIFY_STOP, &bits, ticks);
    }
    return true;
}

void TxWorker::waitForDutyCycle()
{
    const int64_t last = _session.lastSendUs.load();
    if (last == SESSION_NEVER_SENT) return;

    const int64_t intervalUs = static_cast<int64_t>(_cfg.sendIntervalMs) * 1000;
    const int64_t elapsedUs  = esp_timer_get_time() - last;
    if (elapsedUs >= intervalUs) return;

    // Round up so the wait never ends before the interval has fully passed.
    const uint32_t waitMs = static_cast<uint32_t>((intervalUs - elapsedUs + 999) / 1000);
    ESP_LOGD(TAG, "Rate limit: waiting %lu ms", (unsigned long)waitMs);
    waitForStop(waitMs);
}

TxOutcome TxWorker::deliver(QueuedMessage& msg)
{
    for (uint32_t attempt = 0; attempt < _cfg.maxRetries; ++attempt) {
        if (_stopRequested.load()) {
            return TxOutcome::ABORTED;
        }

        ++msg.attempts;
        if (attemptSend(msg)) {
            return TxOutcome::DELIVERED;
        }

        if (attempt + 1 < _cfg.maxRetries) {
            ESP_LOGW(TAG, "Send failed, retry %lu/%lu",
                     (unsigned long)(attempt + 1), (unsigned long)_cfg.maxRetries);
            if (waitForStop(_cfg.retryDelayMs)) {
                return TxOutcome::ABORTED;
            }
        }
    }
    return TxOutcome::DROPPED;
}

bool TxWorker::attemptSend(const QueuedMessage& msg)
{
    if (!_session.isJoined()) {
        ESP_LOGW(TAG, "Cannot send: not joined");
        return false;
    }

    AtCommand cmd;
    cmd.text = "AT+SEND=";
    appendHexUpper(cmd.text, msg.payload, msg.len);
    cmd.timeoutMs     = _cfg.sendTimeoutMs;
    cmd.holdAfterOkMs = _cfg.rxWindowMs;

    AtResponse resp = _channel.exchange(cmd);
    if (!resp.ok) {
        ESP_LOGW(TAG, "Send error: %s", esp_err_to_name(resp.status));
    }
    return resp.ok;
}

void TxWorker::report(TxOutcome outcome, const QueuedMessage& msg)
{
    switch (outcome) {
        case TxOutcome::DELIVERED:
            ESP_LOGI(TAG, "Sent %u bytes (queue: %u)",
                     msg.len, (unsigned)_queue.size());
            break;
        case TxOutcome::DROPPED:
            ESP_LOGE(TAG, "Send failed after %u attempts, dropping message",
                     msg.attempts);
            break;
        case TxOutcome::ABORTED:
            ESP_LOGI(TAG, "Send of %u bytes abandoned on stop", msg.len);
            break;
    }

    TxCallback cb = _cb.load();
    if (cb) {
        cb(outcome, msg);
    }
}
