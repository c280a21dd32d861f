#pragma once

/**
 * @file serial_port.hpp
 * @brief Abstract byte-stream duplex used by the AT command channel.
 *
 * @details
 * Decouples AtChannel from the concrete ESP-IDF UART driver.  The production
 * path uses UartSerialPort; the test path injects MockSerialPort (defined in
 * the test component) without touching any real hardware.
 *
 * Method semantics mirror the ESP-IDF @c driver/uart.h calls they wrap, so
 * return values follow the same conventions (byte counts, -1 on error).
 */

#include <cstdint>
#include <cstddef>

#include "esp_err.h"

// ---------------------------------------------------------------------------
// Serial framing of the module link
// ---------------------------------------------------------------------------

/// @brief Baud rate of the AT link (8 data bits, no parity, 1 stop bit).
static constexpr uint32_t SERIAL_AT_BAUD_RATE = 9600;

// ---------------------------------------------------------------------------
// ISerialPort: pure-virtual serial duplex interface
// ---------------------------------------------------------------------------

/**
 * @brief Pure-virtual interface over an open serial duplex.
 *
 * @details
 * Opening and configuring the endpoint is the implementation's business
 * (see UartSerialPort::init()).  AtChannel only needs to discard stale input,
 * write a line, and pick up whatever the module answered.
 */
class ISerialPort {
public:
    virtual ~ISerialPort() = default;

    /// @brief True once the endpoint is open and usable.
    virtual bool isOpen() const = 0;

    /// @brief Discard every byte received but not yet read.
    /// Equivalent to uart_flush_input().
    /// @return ESP_OK, or an error if the endpoint is gone.
    virtual esp_err_t flushInput() = 0;

    /// @brief Queue bytes for transmission.
    /// Equivalent to uart_write_bytes().
    /// @return Number of bytes accepted, or -1 on error.
    virtual int write(const uint8_t* data, size_t len) = 0;

    /// @brief Block until every queued byte has left the transmitter.
    /// Equivalent to uart_wait_tx_done().
    /// @param timeoutMs  Upper bound on the wait.
    virtual esp_err_t waitTxDone(uint32_t timeoutMs) = 0;

    /// @brief Number of received bytes ready to be read without blocking.
    /// Equivalent to uart_get_buffered_data_len().
    /// @return Byte count, or -1 on error (e.g. device disconnected).
    virtual int available() = 0;

    /// @brief Read up to @p len bytes, waiting at most @p timeoutMs.
    /// Equivalent to uart_read_bytes().
    /// @return Number of bytes read (0 on timeout), or -1 on error.
    virtual int read(uint8_t* buf, size_t len, uint32_t timeoutMs) = 0;
};
