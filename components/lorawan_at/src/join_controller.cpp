// ---------------------------------------------------------------------------
// join_controller.cpp: OTAA configuration, join request and accept polling
// ---------------------------------------------------------------------------

#include "join_controller.hpp"
#include "lorawan_at_err.hpp"

#include "esp_log.h"
#include "esp_timer.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

#include <cctype>
#include <cstdio>

static const char* TAG = "JoinController";

const char* loraRegionName(LoraRegion region)
{
    switch (region) {
        case LoraRegion::EU868: return "EU868";
        case LoraRegion::US915: return "US915";
        case LoraRegion::CN470: return "CN470";
    }
    return "EU868";
}

static std::string upperCased(const char* s)
{
    std::string out(s);
    for (char& c : out) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return out;
}

static AtCommand makeCommand(const std::string& text, AtCriticality criticality)
{
    AtCommand cmd;
    cmd.text        = text;
    cmd.criticality = criticality;
    return cmd;
}

// ===========================================================================
// Constructor
// ===========================================================================

JoinController::JoinController(AtChannel&        channel,
                               ModuleSession&    session,
                               const JoinTiming& timing)
    : _channel(channel),
      _session(session),
      _timing(timing)
{}

// ===========================================================================
// join
// ===========================================================================

esp_err_t JoinController::join(const JoinParams& params)
{
    if (_state != State::UNCONFIGURED) {
        ESP_LOGW(TAG, "join() on a finished controller, ignoring");
        return ESP_ERR_INVALID_STATE;
    }
    if (!params.joinEui || !params.joinEui[0] || !params.appKey || !params.appKey[0]) {
        ESP_LOGE(TAG, "JoinEUI and AppKey are required");
        return ESP_ERR_INVALID_ARG;
    }
    if (params.dataRate > LORAWAN_MAX_DATA_RATE) {
        ESP_LOGE(TAG, "data rate %u out of range 0-%u",
                 params.dataRate, LORAWAN_MAX_DATA_RATE);
        return ESP_ERR_INVALID_ARG;
    }

    ESP_LOGI(TAG, "Joining (region %s, DR%u, %d dBm)...",
             loraRegionName(params.region), params.dataRate, params.txPowerDbm);

    // ------------------------------------------------------------------
    // CONFIGURING
    // ------------------------------------------------------------------
    _state = State::CONFIGURING;
    esp_err_t err = configure(params);
    if (err != ESP_OK) {
        return fail(err);
    }

    // ------------------------------------------------------------------
    // REQUESTING
    // ------------------------------------------------------------------
    _state = State::REQUESTING;
    AtResponse resp = _channel.exchange("AT+JOIN=1", _timing.joinRequestTimeoutMs);
    if (!resp.ok) {
        ESP_LOGE(TAG, "Join request rejected by module");
        return fail(ESP_ERR_LORAWAN_JOIN_REJECTED);
    }
    ESP_LOGI(TAG, "Join request sent, waiting for network accept...");

    // ------------------------------------------------------------------
    // POLLING
    // ------------------------------------------------------------------
    _state     = State::POLLING;
    _pollCount = 0;

    const int64_t startUs   = esp_timer_get_time();
    const int64_t timeoutUs = static_cast<int64_t>(params.timeoutMs) * 1000;

    while (esp_timer_get_time() - startUs < timeoutUs) {
        resp = _channel.exchange("AT+JOIN?");
        ++_pollCount;

        if (resp.ok && resp.hasValue && resp.value == "1") {
            _session.markJoined();
            _state = State::JOINED;
            ESP_LOGI(TAG, "Joined after %lu poll(s)", (unsigned long)_pollCount);
            return ESP_OK;
        }
        vTaskDelay(pdMS_TO_TICKS(_timing.pollIntervalMs));
    }

    ESP_LOGE(TAG, "Join timeout after %lu ms - check gateway coverage and credentials",
             (unsigned long)params.timeoutMs);
    return fail(ESP_ERR_TIMEOUT);
}

// ===========================================================================
// Helpers
// ===========================================================================

esp_err_t JoinController::configure(const JoinParams& params)
{
    char buf[32];

    snprintf(buf, sizeof(buf), "AT+REGION=%s", loraRegionName(params.region));
    const std::string region = buf;
    snprintf(buf, sizeof(buf), "AT+DATARATE=%u", params.dataRate);
    const std::string dataRate = buf;
    snprintf(buf, sizeof(buf), "AT+EIRP=%d", params.txPowerDbm);
    const std::string eirp = buf;

    const AtCommand sequence[] = {
        makeCommand("AT+LORAMODE=LORAWAN",                     AtCriticality::ADVISORY),
        makeCommand("AT+JOINTYPE=OTAA",                        AtCriticality::ADVISORY),
        makeCommand(region,                                    AtCriticality::ADVISORY),
        makeCommand("AT+CLASS=CLASS_A",                        AtCriticality::ADVISORY),
        makeCommand(dataRate,                                  AtCriticality::ADVISORY),
        makeCommand(eirp,                                      AtCriticality::ADVISORY),
        makeCommand("AT+ADR=0",                                AtCriticality::ADVISORY),
        makeCommand("AT+UPLINKTYPE=UNCONFIRMED",               AtCriticality::ADVISORY),
        makeCommand("AT+JOINEUI=" + upperCased(params.joinEui), AtCriticality::CRITICAL),
        makeCommand("AT+APPKEY=" + upperCased(params.appKey),   AtCriticality::CRITICAL),
    };

    for (const AtCommand& cmd : sequence) {
        AtResponse resp = _channel.exchange(cmd);
        if (resp.ok) continue;

        if (cmd.criticality == AtCriticality::CRITICAL) {
            _failedCommand = cmd.text;
            ESP_LOGE(TAG, "Failed to execute: %s", cmd.text.c_str());
            return ESP_ERR_LORAWAN_CONFIG;
        }
        ESP_LOGW(TAG, "'%s' not acknowledged (%s), continuing",
                 cmd.text.c_str(), esp_err_to_name(resp.status));
    }
    return ESP_OK;
}

esp_err_t JoinController::fail(esp_err_t err)
{
    _state = State::FAILED;
    return err;
}
