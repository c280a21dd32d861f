/**
 * @file lorawan_client.cpp
 * @brief LorawanClient lifecycle, transmit API and status queries.
 *
 * @details
 * The UART-owning entry points (init() and begin()) live in
 * lorawan_client_uart.cpp so that this file builds without the UART driver.
 *
 * Cleanup rules:
 *  - Every failed lifecycle step leaves the object as if stop() had run.
 *  - If the worker overruns its stop grace period, the channel, queue and
 *    port stay alive until it exits (next stop() or the destructor).
 *  - Callers on other tasks only reach the queue and the channel while
 *    holding _gate and after seeing _initialized; teardown clears
 *    _initialized and the joined flag under the same gate first.
 */

#include "lorawan_client.hpp"

#include "esp_log.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

#include <cerrno>
#include <climits>
#include <cstdlib>

static const char* TAG = "LorawanClient";

static const char* const COMPONENT_TAGS[] = {
    "LorawanClient", "AtChannel", "JoinController", "TxWorker",
    "MessageQueue", "PayloadEncoder", "UartSerialPort",
};

// ===========================================================================
// Constructor / Destructor
// ===========================================================================

LorawanClient::LorawanClient(const LorawanClientConfig& cfg)
    : _cfg(cfg),
      _channel(cfg.channel),
      _worker(_queue, _channel, _session, cfg.worker)
{
    _gate = xSemaphoreCreateMutexStatic(&_gateBuf);
}

LorawanClient::~LorawanClient()
{
    if (stop() == ESP_ERR_TIMEOUT) {
        _worker.waitForExit();
        releaseResources();
    }
    vSemaphoreDelete(_gate);
}

// RAII hold of the client gate.
namespace {
class GateLock {
public:
    explicit GateLock(SemaphoreHandle_t gate) : _gate(gate) { xSemaphoreTake(_gate, portMAX_DELAY); }
    ~GateLock() { xSemaphoreGive(_gate); }

    GateLock(const GateLock&) = delete;
    GateLock& operator=(const GateLock&) = delete;

private:
    SemaphoreHandle_t _gate;
};
} // namespace

// ===========================================================================
// Lifecycle
// ===========================================================================

esp_err_t LorawanClient::initWithPort(ISerialPort* port)
{
    if (!port) {
        return ESP_ERR_INVALID_ARG;
    }
    if (_initialized || _port) {
        ESP_LOGW(TAG, "Already initialised, call stop() first");
        return ESP_ERR_INVALID_STATE;
    }

    _port     = port;
    _ownsPort = false;

    esp_err_t err = _initCommon();
    if (err != ESP_OK) {
        stop();
    }
    return err;
}

esp_err_t LorawanClient::_initCommon()
{
    if (_cfg.debugLogging) {
        for (const char* tag : COMPONENT_TAGS) {
            esp_log_level_set(tag, ESP_LOG_DEBUG);
        }
        _channel.setTrace(true);
    }

    _session.reset();

    esp_err_t err = _queue.init();
    if (err != ESP_OK) return err;

    err = _channel.init(_port);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Channel init failed: %s", esp_err_to_name(err));
        return err;
    }

    {
        GateLock lock(_gate);
        _initialized = true;
    }

    err = bringUpModule();
    if (err != ESP_OK) return err;

    ESP_LOGI(TAG, "Connected to LoRaWAN module");
    return ESP_OK;
}

esp_err_t LorawanClient::bringUpModule()
{
    vTaskDelay(pdMS_TO_TICKS(_cfg.bootDelayMs));

    // Reboot into a clean state.  The module usually resets before it can
    // answer, so the reply is not checked.
    AtResponse resp = _channel.exchange("AT+REBOOT", _cfg.rebootTimeoutMs);
    ESP_LOGD(TAG, "AT+REBOOT -> %s", esp_err_to_name(resp.status));
    vTaskDelay(pdMS_TO_TICKS(_cfg.postRebootMs));

    for (uint32_t attempt = 0; attempt < _cfg.probeAttempts; ++attempt) {
        if (_channel.exchange("AT").ok) {
            return ESP_OK;
        }
        vTaskDelay(pdMS_TO_TICKS(_cfg.probeIntervalMs));
    }

    ESP_LOGE(TAG, "Module not responding after %lu probe(s)",
             (unsigned long)_cfg.probeAttempts);
    return ESP_ERR_LORAWAN_NO_MODULE;
}

esp_err_t LorawanClient::join(const char* joinEui, const char* appKey, uint32_t timeoutMs)
{
    if (!_initialized) {
        ESP_LOGE(TAG, "join() before init()");
        return ESP_ERR_INVALID_STATE;
    }
    if (_session.isJoined()) {
        ESP_LOGW(TAG, "Already joined");
        return ESP_OK;
    }

    JoinParams params;
    params.joinEui    = joinEui;
    params.appKey     = appKey;
    params.timeoutMs  = timeoutMs;
    params.dataRate   = _cfg.dataRate;
    params.txPowerDbm = _cfg.txPowerDbm;
    params.region     = _cfg.region;

    JoinController controller(_channel, _session, _cfg.join);
    esp_err_t err = controller.join(params);
    _joinState = controller.getState();

    if (err == ESP_OK) {
        ESP_LOGI(TAG, "Joined network");
    } else if (err == ESP_ERR_LORAWAN_CONFIG) {
        ESP_LOGE(TAG, "Join aborted, module refused '%s'",
                 controller.failedCommand().c_str());
    } else {
        ESP_LOGE(TAG, "Join failed: %s", lorawanErrToName(err));
    }
    return err;
}

esp_err_t LorawanClient::start()
{
    if (!_initialized) {
        return ESP_ERR_INVALID_STATE;
    }
    return _worker.start();
}

esp_err_t LorawanClient::beginWithPort(ISerialPort* port,
                                       const char*  joinEui,
                                       const char*  appKey,
                                       uint32_t     joinTimeoutMs)
{
    return finishBegin(initWithPort(port), joinEui, appKey, joinTimeoutMs);
}

esp_err_t LorawanClient::finishBegin(esp_err_t   initErr,
                                     const char* joinEui,
                                     const char* appKey,
                                     uint32_t    joinTimeoutMs)
{
    esp_err_t err = initErr;
    if (err == ESP_OK) {
        err = join(joinEui, appKey, joinTimeoutMs);
    }
    if (err == ESP_OK) {
        err = start();
    }
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Initialization failed: %s", lorawanErrToName(err));
        stop();
    }
    return err;
}

esp_err_t LorawanClient::stop()
{
    esp_err_t err = _worker.stop();

    size_t discarded = _queue.size();
    _queue.clear();
    if (discarded > 0) {
        ESP_LOGI(TAG, "Discarded %u queued message(s)", (unsigned)discarded);
    }

    if (err == ESP_ERR_TIMEOUT) {
        return err;
    }

    releaseResources();
    return ESP_OK;
}

void LorawanClient::releaseResources()
{
    GateLock lock(_gate);

    const bool wasActive = _initialized.exchange(false);
    _session.reset();

    _channel.deinit();
    _queue.deinit();

    if (_ownsPort && _port) {
        delete _port;
    }
    _port      = nullptr;
    _ownsPort  = false;
    _joinState = JoinController::State::UNCONFIGURED;

    if (wasActive) {
        ESP_LOGI(TAG, "Stopped");
    }
}

// ===========================================================================
// Transmit API
// ===========================================================================

bool LorawanClient::enqueue(const uint8_t* data, size_t len)
{
    GateLock lock(_gate);

    if (!_initialized || !_session.isJoined()) {
        ESP_LOGW(TAG, "Not joined to network, message not queued");
        return false;
    }
    if (!data || len == 0) {
        ESP_LOGW(TAG, "Empty payload, message not queued");
        return false;
    }
    if (len > LORAWAN_MAX_PAYLOAD) {
        ESP_LOGW(TAG, "Payload too large (%u bytes), max %u",
                 (unsigned)len, (unsigned)LORAWAN_MAX_PAYLOAD);
        return false;
    }
    if (!_queue.enqueue(data, len)) {
        ESP_LOGW(TAG, "Queue full, message dropped");
        return false;
    }

    ESP_LOGD(TAG, "Queued %u bytes (%u/%u)", (unsigned)len,
             (unsigned)_queue.size(), (unsigned)_queue.capacity());
    return true;
}

bool LorawanClient::send(const uint8_t* data, size_t len)
{
    return enqueue(data, len);
}

bool LorawanClient::send(const std::string& text)
{
    std::vector<uint8_t> payload = textPayload(text);
    return enqueue(payload.data(), payload.size());
}

bool LorawanClient::send(const SensorRecord& record)
{
    std::vector<uint8_t> payload = encodeSensorRecord(record);
    return enqueue(payload.data(), payload.size());
}

// ===========================================================================
// Status
// ===========================================================================

size_t LorawanClient::queueDepth() const
{
    GateLock lock(_gate);
    return _initialized ? _queue.size() : 0;
}

esp_err_t LorawanClient::getDevEui(std::string& out)
{
    GateLock lock(_gate);
    if (!_initialized) {
        return ESP_ERR_INVALID_STATE;
    }

    AtResponse resp = _channel.exchange("AT+DEVEUI?");
    if (!resp.ok || !resp.hasValue || resp.value.empty()) {
        ESP_LOGE(TAG, "Failed to get DevEUI (%s)", esp_err_to_name(resp.status));
        return ESP_ERR_INVALID_RESPONSE;
    }

    out = resp.value;
    return ESP_OK;
}

int LorawanClient::getRssi()
{
    return querySignal("AT+RSSI?");
}

int LorawanClient::getSnr()
{
    return querySignal("AT+SNR?");
}

int LorawanClient::querySignal(const char* cmd)
{
    GateLock lock(_gate);
    if (!_initialized) {
        return LORAWAN_SIGNAL_UNAVAILABLE;
    }

    AtResponse resp = _channel.exchange(cmd);
    if (!resp.ok || !resp.hasValue || resp.value.empty()) {
        return LORAWAN_SIGNAL_UNAVAILABLE;
    }

    // Whole value must be a decimal integer ("-87"); "-8.5" or "n/a" is not.
    const char* text = resp.value.c_str();
    char*       end  = nullptr;
    errno = 0;
    long value = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || errno == ERANGE ||
        value < INT_MIN || value > INT_MAX) {
        ESP_LOGD(TAG, "%s: unusable value '%s'", cmd, text);
        return LORAWAN_SIGNAL_UNAVAILABLE;
    }
    return static_cast<int>(value);
}
