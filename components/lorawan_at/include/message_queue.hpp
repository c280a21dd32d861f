#pragma once

/**
 * @file message_queue.hpp
 * @brief Bounded FIFO of pending uplink payloads.
 *
 * @details
 * Thin wrapper over a FreeRTOS queue of fixed-size QueuedMessage items.
 * Admission never blocks: a full queue or an out-of-range payload is simply
 * refused and the caller gets @c false.
 */

#include <cstdint>
#include <cstddef>

#include "esp_err.h"
#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"

/// @brief LoRaWAN application payload ceiling, in bytes.
static constexpr size_t LORAWAN_MAX_PAYLOAD = 242;

/// @brief Number of messages the queue can hold.
static constexpr size_t LORAWAN_QUEUE_CAPACITY = 20;

/// @brief One pending uplink.
struct QueuedMessage {
    uint8_t payload[LORAWAN_MAX_PAYLOAD];
    uint8_t len;        ///< 1..LORAWAN_MAX_PAYLOAD
    uint8_t attempts;   ///< send attempts made so far (worker-owned)
};

class MessageQueue {
public:
    MessageQueue() = default;
    ~MessageQueue();

    MessageQueue(const MessageQueue&) = delete;
    MessageQueue& operator=(const MessageQueue&) = delete;

    /// Create the underlying FreeRTOS queue.
    /// @return ESP_OK | ESP_ERR_NO_MEM
    esp_err_t init();

    /// Delete the underlying queue.  No task may be blocked on it.
    void deinit();

    /// Copy a payload in at the tail.
    /// @return false if @p len is 0 or above LORAWAN_MAX_PAYLOAD, or the
    ///         queue is full (the message is dropped, nothing is overwritten).
    bool enqueue(const uint8_t* data, size_t len);

    /// Pop the head, waiting up to @p timeoutMs for one to arrive.
    /// @return true and fills @p out, or false on timeout.
    bool dequeue(QueuedMessage& out, uint32_t timeoutMs);

    /// Discard every pending message.
    void clear();

    size_t size() const;
    size_t capacity() const { return LORAWAN_QUEUE_CAPACITY; }

private:
    QueueHandle_t _queue = nullptr;
};
