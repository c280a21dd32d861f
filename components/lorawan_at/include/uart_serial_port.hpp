#pragma once

/**
 * @file uart_serial_port.hpp
 * @brief ISerialPort implementation over the ESP-IDF UART driver.
 *
 * @details
 * Owns one UART port for the lifetime of the object: init() installs the
 * driver and applies the 9600 8N1 framing the module expects, term() (or the
 * destructor) deletes it again.  Every ISerialPort call maps onto a single
 * @c driver/uart.h function; the driver header stays out of this one.
 */

#include "serial_port.hpp"

/**
 * @brief Pin and buffer assignment for the module UART.
 *
 * Defaults match a UART1 wiring on GPIO17 (TX) / GPIO18 (RX); override for
 * the board at hand.
 */
struct UartSerialPortConfig {
    int      port        = 1;       ///< uart_port_t number
    int      pinTx       = 17;
    int      pinRx       = 18;
    uint32_t baudRate    = SERIAL_AT_BAUD_RATE;
    int      rxBufferLen = 1024;    ///< driver ring buffer (must exceed the HW FIFO)
};

/**
 * @brief UART-backed serial duplex.
 */
class UartSerialPort final : public ISerialPort {
public:
    explicit UartSerialPort(const UartSerialPortConfig& cfg = UartSerialPortConfig{})
        : _cfg(cfg)
    {}

    /// @brief RAII destructor, deletes the UART driver if it was installed.
    ~UartSerialPort() override { term(); }

    UartSerialPort(const UartSerialPort&) = delete;
    UartSerialPort& operator=(const UartSerialPort&) = delete;

    /// @brief Install the UART driver, configure 8N1 framing and route pins.
    /// @return ESP_OK, or the first driver error (the port is left closed).
    esp_err_t init();

    /// @brief Delete the UART driver.  Safe to call multiple times.
    void term();

    // ------------------------------------------------------------------
    // ISerialPort implementation
    // ------------------------------------------------------------------

    bool      isOpen() const override { return _installed; }
    esp_err_t flushInput() override;
    int       write(const uint8_t* data, size_t len) override;
    esp_err_t waitTxDone(uint32_t timeoutMs) override;
    int       available() override;
    int       read(uint8_t* buf, size_t len, uint32_t timeoutMs) override;

private:
    UartSerialPortConfig _cfg;
    bool                 _installed = false;
};
