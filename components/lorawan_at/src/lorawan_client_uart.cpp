// ---------------------------------------------------------------------------
// lorawan_client_uart.cpp: LorawanClient entry points that own a UART
// ---------------------------------------------------------------------------

#include "lorawan_client.hpp"
#include "uart_serial_port.hpp"

#include "esp_log.h"

#include <new>

static const char* TAG = "LorawanClient";

esp_err_t LorawanClient::init()
{
    if (_initialized || _port) {
        ESP_LOGW(TAG, "Already initialised, call stop() first");
        return ESP_ERR_INVALID_STATE;
    }

    UartSerialPort* uart = new (std::nothrow) UartSerialPort(_cfg.uart);
    if (!uart) {
        return ESP_ERR_NO_MEM;
    }

    esp_err_t err = uart->init();
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Failed to open UART %d: %s", _cfg.uart.port, esp_err_to_name(err));
        delete uart;
        return err;
    }

    _port     = uart;
    _ownsPort = true;

    err = _initCommon();
    if (err != ESP_OK) {
        stop();
    }
    return err;
}

esp_err_t LorawanClient::begin(const char* joinEui, const char* appKey, uint32_t joinTimeoutMs)
{
    return finishBegin(init(), joinEui, appKey, joinTimeoutMs);
}
