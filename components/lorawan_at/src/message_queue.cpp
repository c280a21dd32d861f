// ---------------------------------------------------------------------------
// message_queue.cpp: FreeRTOS-backed uplink FIFO
// ---------------------------------------------------------------------------

#include "message_queue.hpp"

#include "esp_err.h"
#include "esp_log.h"

#include <cstring>

static const char* TAG = "MessageQueue";

MessageQueue::~MessageQueue()
{
    deinit();
}

esp_err_t MessageQueue::init()
{
    if (_queue) return ESP_OK;

    _queue = xQueueCreate(LORAWAN_QUEUE_CAPACITY, sizeof(QueuedMessage));
    if (!_queue) {
        ESP_LOGE(TAG, "xQueueCreate failed");
        return ESP_ERR_NO_MEM;
    }
    return ESP_OK;
}

void MessageQueue::deinit()
{
    if (_queue) {
        vQueueDelete(_queue);
        _queue = nullptr;
    }
}

bool MessageQueue::enqueue(const uint8_t* data, size_t len)
{
    if (!_queue || !data || len == 0 || len > LORAWAN_MAX_PAYLOAD) {
        return false;
    }

    QueuedMessage msg{};
    std::memcpy(msg.payload, data, len);
    msg.len      = static_cast<uint8_t>(len);
    msg.attempts = 0;

    return xQueueSend(_queue, &msg, 0) == pdTRUE;
}

bool MessageQueue::dequeue(QueuedMessage& out, uint32_t timeoutMs)
{
    if (!_queue) return false;
    return xQueueReceive(_queue, &out, pdMS_TO_TICKS(timeoutMs)) == pdTRUE;
}

void MessageQueue::clear()
{
    if (_queue) {
        xQueueReset(_queue);
    }
}

size_t MessageQueue::size() const
{
    if (!_queue) return 0;
    return static_cast<size_t>(uxQueueMessagesWaiting(_queue));
}
