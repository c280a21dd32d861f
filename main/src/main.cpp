// ---------------------------------------------------------------------------
// main.cpp: Application entry point
// ---------------------------------------------------------------------------
// Connects to the LoRaWAN module on UART1, joins the network over OTAA and
// queues two demo uplinks.  Replace the credentials with the ones from the
// network server console before flashing.
// ---------------------------------------------------------------------------

#include <string>

#include "lorawan_client.hpp"
#include "esp_log.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

static const char* TAG = "app_main";

static const char* JOIN_EUI = "2309199300000000";
static const char* APP_KEY  = "0102030405060708090A0B0C0D0E0F10";

static constexpr uint32_t STATUS_INTERVAL_MS = 10000;

static LorawanClientConfig makeConfig()
{
    LorawanClientConfig cfg;
    cfg.region       = LoraRegion::EU868;
    cfg.debugLogging = true;
    return cfg;
}

static LorawanClient lorawan(makeConfig());

static void onTxOutcome(TxOutcome outcome, const QueuedMessage& msg)
{
    ESP_LOGI(TAG, "Uplink of %u bytes: %s after %u attempt(s)",
             msg.len, txOutcomeName(outcome), msg.attempts);
}

extern "C" void app_main(void)
{
    ESP_LOGI(TAG, "Connecting to LoRaWAN module...");

    lorawan.setTxCallback(onTxOutcome);

    esp_err_t err = lorawan.begin(JOIN_EUI, APP_KEY);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "lorawan.begin() failed: %s", lorawanErrToName(err));
        return;
    }

    std::string devEui;
    if (lorawan.getDevEui(devEui) == ESP_OK) {
        ESP_LOGI(TAG, "DevEUI: %s", devEui.c_str());
    }
    ESP_LOGI(TAG, "Joined: %s", lorawan.isJoined() ? "yes" : "no");

    // Sent in the background, 30 s apart
    lorawan.send("Hello World!");
    lorawan.send(SensorRecord{
        {"temp",     SensorValue::ofFloat(23.5)},
        {"humidity", SensorValue::ofInt(65)},
        {"battery",  SensorValue::ofInt(95)},
    });

    ESP_LOGI(TAG, "Queue size: %u", (unsigned)lorawan.queueDepth());

    while (true) {
        vTaskDelay(pdMS_TO_TICKS(STATUS_INTERVAL_MS));
        ESP_LOGI(TAG, "Queue: %u | RSSI: %d dBm | SNR: %d dB",
                 (unsigned)lorawan.queueDepth(), lorawan.getRssi(), lorawan.getSnr());
    }
}
