// ---------------------------------------------------------------------------
// uart_serial_port.cpp: ISerialPort over the ESP-IDF UART driver
// ---------------------------------------------------------------------------

#include "uart_serial_port.hpp"

#include "driver/uart.h"
#include "esp_log.h"
#include "freertos/FreeRTOS.h"

static const char* TAG = "UartSerialPort";

static inline uart_port_t toUartPort(int port)
{
    return static_cast<uart_port_t>(port);
}

// ===========================================================================
// Lifecycle
// ===========================================================================

esp_err_t UartSerialPort::init()
{
    if (_installed) {
        ESP_LOGW(TAG, "init() called twice, ignoring");
        return ESP_OK;
    }

    uart_config_t cfg = {};
    cfg.baud_rate  = static_cast<int>(_cfg.baudRate);
    cfg.data_bits  = UART_DATA_8_BITS;
    cfg.parity     = UART_PARITY_DISABLE;
    cfg.stop_bits  = UART_STOP_BITS_1;
    cfg.flow_ctrl  = UART_HW_FLOWCTRL_DISABLE;
    cfg.source_clk = UART_SCLK_DEFAULT;

    esp_err_t err = uart_driver_install(toUartPort(_cfg.port), _cfg.rxBufferLen, 0, 0, nullptr, 0);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "uart_driver_install(port %d) failed: %s",
                 _cfg.port, esp_err_to_name(err));
        return err;
    }

    err = uart_param_config(toUartPort(_cfg.port), &cfg);
    if (err == ESP_OK) {
        err = uart_set_pin(toUartPort(_cfg.port), _cfg.pinTx, _cfg.pinRx,
                           UART_PIN_NO_CHANGE, UART_PIN_NO_CHANGE);
    }
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "UART %d configuration failed: %s",
                 _cfg.port, esp_err_to_name(err));
        uart_driver_delete(toUartPort(_cfg.port));
        return err;
    }

    _installed = true;
    ESP_LOGI(TAG, "UART %d open: %lu baud 8N1, TX=%d RX=%d",
             _cfg.port, (unsigned long)_cfg.baudRate, _cfg.pinTx, _cfg.pinRx);
    return ESP_OK;
}

void UartSerialPort::term()
{
    if (!_installed) return;

    uart_driver_delete(toUartPort(_cfg.port));
    _installed = false;
    ESP_LOGD(TAG, "UART %d closed", _cfg.port);
}

// ===========================================================================
// ISerialPort
// ===========================================================================

esp_err_t UartSerialPort::flushInput()
{
    if (!_installed) return ESP_ERR_INVALID_STATE;
    return uart_flush_input(toUartPort(_cfg.port));
}

int UartSerialPort::write(const uint8_t* data, size_t len)
{
    if (!_installed) return -1;
    return uart_write_bytes(toUartPort(_cfg.port), data, len);
}

esp_err_t UartSerialPort::waitTxDone(uint32_t timeoutMs)
{
    if (!_installed) return ESP_ERR_INVALID_STATE;
    return uart_wait_tx_done(toUartPort(_cfg.port), pdMS_TO_TICKS(timeoutMs));
}

int UartSerialPort::available()
{
    if (!_installed) return -1;

    size_t buffered = 0;
    esp_err_t err = uart_get_buffered_data_len(toUartPort(_cfg.port), &buffered);
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "uart_get_buffered_data_len failed: %s", esp_err_to_name(err));
        return -1;
    }
    return static_cast<int>(buffered);
}

int UartSerialPort::read(uint8_t* buf, size_t len, uint32_t timeoutMs)
{
    if (!_installed) return -1;
    return uart_read_bytes(toUartPort(_cfg.port), buf, static_cast<uint32_t>(len),
                           pdMS_TO_TICKS(timeoutMs));
}
