/**
 * @file at_channel.cpp
 * @brief AT command/response exchange and reply parsing.
 *
 * @details
 * Implementation notes:
 *  - The mutex is taken for the whole exchange, including the optional hold
 *    after an OK reply, so a send's receive windows cannot be interleaved
 *    with a status query.
 *  - Reply bytes are accumulated raw and decoded once as UTF-8; malformed
 *    sequences are dropped, everything else is kept until parsing trims it.
 *  - An I/O error ends the current exchange only.  The port is not closed
 *    and no state survives into the next exchange except the mutex.
 */

#include "at_channel.hpp"

#include "esp_log.h"
#include "esp_timer.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "freertos/semphr.h"

#include <algorithm>
#include <cctype>

static const char* TAG = "AtChannel";

// ===========================================================================
// Reply parsing
// ===========================================================================

static std::string trimmed(const std::string& s)
{
    size_t first = 0;
    size_t last  = s.size();
    while (first < last && std::isspace(static_cast<unsigned char>(s[first]))) ++first;
    while (last > first && std::isspace(static_cast<unsigned char>(s[last - 1]))) --last;
    return s.substr(first, last - first);
}

// Length of the well-formed UTF-8 prefix starting at raw[i] (1..4), or the
// number of bytes to discard (as a negative value) when it is malformed.
static int utf8SequenceAt(const std::string& raw, size_t i)
{
    const uint8_t lead = static_cast<uint8_t>(raw[i]);
    if (lead < 0x80) return 1;

    int     need;
    uint8_t lo = 0x80;
    uint8_t hi = 0xBF;
    if      (lead >= 0xC2 && lead <= 0xDF) { need = 1; }
    else if (lead == 0xE0)                 { need = 2; lo = 0xA0; }
    else if (lead == 0xED)                 { need = 2; hi = 0x9F; }
    else if (lead >= 0xE1 && lead <= 0xEF) { need = 2; }
    else if (lead == 0xF0)                 { need = 3; lo = 0x90; }
    else if (lead >= 0xF1 && lead <= 0xF3) { need = 3; }
    else if (lead == 0xF4)                 { need = 3; hi = 0x8F; }
    else return -1;

    for (int k = 1; k <= need; ++k) {
        if (i + k >= raw.size()) return -k;
        const uint8_t b = static_cast<uint8_t>(raw[i + k]);
        if (b < lo || b > hi) return -k;
        lo = 0x80;
        hi = 0xBF;
    }
    return need + 1;
}

std::string decodeAtReply(const std::string& raw)
{
    std::string out;
    out.reserve(raw.size());

    size_t i = 0;
    while (i < raw.size()) {
        int n = utf8SequenceAt(raw, i);
        if (n > 0) {
            out.append(raw, i, n);
            i += n;
        } else {
            i += static_cast<size_t>(-n);
        }
    }
    return out;
}

AtResponse parseAtResponse(const std::string& raw)
{
    AtResponse resp;
    resp.status = ESP_ERR_INVALID_RESPONSE;

    const std::string text = trimmed(raw);

    if (text == "OK" || text.find("=OK") != std::string::npos) {
        resp.ok     = true;
        resp.status = ESP_OK;
        return resp;
    }

    const size_t eq = text.find('=');
    if (eq != std::string::npos) {
        resp.ok       = true;
        resp.hasValue = true;
        resp.value    = trimmed(text.substr(eq + 1));
        resp.status   = ESP_OK;
    }
    return resp;
}

// ===========================================================================
// Constructor / Destructor
// ===========================================================================

AtChannel::AtChannel(const AtChannelConfig& cfg)
    : _cfg(cfg)
{}

AtChannel::~AtChannel()
{
    deinit();
}

// ===========================================================================
// Lifecycle
// ===========================================================================

esp_err_t AtChannel::init(ISerialPort* port)
{
    if (!port) {
        return ESP_ERR_INVALID_ARG;
    }
    if (!_mutex) {
        _mutex = xSemaphoreCreateMutex();
        if (!_mutex) {
            ESP_LOGE(TAG, "xSemaphoreCreateMutex failed");
            return ESP_ERR_NO_MEM;
        }
    }
    _port = port;
    return ESP_OK;
}

void AtChannel::deinit()
{
    _port = nullptr;
    if (_mutex) {
        vSemaphoreDelete(_mutex);
        _mutex = nullptr;
    }
}

// ===========================================================================
// Exchange
// ===========================================================================

AtResponse AtChannel::exchange(const char* text, uint32_t timeoutMs)
{
    AtCommand cmd;
    cmd.text      = text ? text : "";
    cmd.timeoutMs = timeoutMs;
    return exchange(cmd);
}

AtResponse AtChannel::exchange(const AtCommand& cmd)
{
    if (!_port || !_mutex || !_port->isOpen()) {
        AtResponse resp;
        resp.status = ESP_ERR_INVALID_STATE;
        return resp;
    }

    xSemaphoreTake(_mutex, portMAX_DELAY);

    AtResponse resp = exchangeLocked(cmd);
    if (resp.ok && cmd.holdAfterOkMs > 0) {
        vTaskDelay(pdMS_TO_TICKS(cmd.holdAfterOkMs));
    }

    xSemaphoreGive(_mutex);
    return resp;
}

AtResponse AtChannel::exchangeLocked(const AtCommand& cmd)
{
    const uint32_t timeoutMs = (cmd.timeoutMs == AT_CHANNEL_DEFAULT)
                               ? _cfg.defaultTimeoutMs : cmd.timeoutMs;
    const uint32_t settleMs  = (cmd.settleMs == AT_CHANNEL_DEFAULT)
                               ? _cfg.settleMs : cmd.settleMs;

    AtResponse failed;   // ok=false, status=ESP_FAIL

    // ------------------------------------------------------------------
    // 1. Drop whatever is left over from an earlier, abandoned reply.
    // ------------------------------------------------------------------
    esp_err_t err = _port->flushInput();
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Serial error: input flush before '%s' failed (%s)",
                 cmd.text.c_str(), esp_err_to_name(err));
        return failed;
    }

    // ------------------------------------------------------------------
    // 2. Write the command line and let it drain.
    // ------------------------------------------------------------------
    if (_cfg.trace) {
        ESP_LOGD(TAG, "TX: %s", cmd.text.c_str());
    }

    const std::string line = cmd.text + AT_LINE_DELIMITER;
    int written = _port->write(reinterpret_cast<const uint8_t*>(line.data()), line.size());
    if (written != static_cast<int>(line.size())) {
        ESP_LOGE(TAG, "Serial error: wrote %d of %u bytes of '%s'",
                 written, (unsigned)line.size(), cmd.text.c_str());
        return failed;
    }

    err = _port->waitTxDone(timeoutMs);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Serial error: TX of '%s' did not drain (%s)",
                 cmd.text.c_str(), esp_err_to_name(err));
        return failed;
    }

    vTaskDelay(pdMS_TO_TICKS(settleMs));

    // ------------------------------------------------------------------
    // 3. Accumulate reply bytes until a full line or the deadline.
    // ------------------------------------------------------------------
    std::string rx;
    bool        delimited  = false;
    uint8_t     chunk[64];
    const int64_t deadline = esp_timer_get_time() + static_cast<int64_t>(timeoutMs) * 1000;

    while (esp_timer_get_time() < deadline) {
        int pending = _port->available();
        if (pending < 0) {
            ESP_LOGE(TAG, "Serial error: RX unavailable while waiting for '%s'",
                     cmd.text.c_str());
            return failed;
        }

        while (pending > 0) {
            size_t want = std::min(static_cast<size_t>(pending), sizeof(chunk));
            int got = _port->read(chunk, want, 0);
            if (got < 0) {
                ESP_LOGE(TAG, "Serial error: read failed while waiting for '%s'",
                         cmd.text.c_str());
                return failed;
            }
            if (got == 0) break;

            rx.append(reinterpret_cast<const char*>(chunk), got);
            pending -= got;
        }

        if (rx.find(AT_LINE_DELIMITER) != std::string::npos) {
            delimited = true;
            break;
        }
        vTaskDelay(pdMS_TO_TICKS(_cfg.pollIntervalMs));
    }

    // ------------------------------------------------------------------
    // 4. Parse.
    // ------------------------------------------------------------------
    const std::string text = decodeAtReply(rx);
    AtResponse resp = parseAtResponse(text);

    if (_cfg.trace) {
        ESP_LOGD(TAG, "RX: %s", trimmed(text).c_str());
    }

    if (!resp.ok) {
        resp.status = delimited ? ESP_ERR_INVALID_RESPONSE : ESP_ERR_TIMEOUT;
        if (!delimited) {
            ESP_LOGD(TAG, "'%s': no reply line within %lu ms",
                     cmd.text.c_str(), (unsigned long)timeoutMs);
        }
    }
    return resp;
}
