#pragma once

/**
 * @file lorawan_at_err.hpp
 * @brief Component-specific esp_err_t codes for the LoRaWAN AT driver.
 *
 * @details
 * Generic conditions reuse the stock ESP-IDF codes:
 *  - ESP_ERR_TIMEOUT          join accept not seen before the deadline
 *  - ESP_ERR_INVALID_ARG      bad join parameters
 *  - ESP_ERR_INVALID_STATE    operation issued in the wrong lifecycle phase
 *  - ESP_ERR_INVALID_RESPONSE status query answered with nothing usable
 */

#include "esp_err.h"

/// @brief First code of the range reserved for this component.
static constexpr esp_err_t ESP_ERR_LORAWAN_BASE          = 0x1A000;

/// @brief Module did not answer the @c AT liveness probe.
static constexpr esp_err_t ESP_ERR_LORAWAN_NO_MODULE     = ESP_ERR_LORAWAN_BASE + 1;

/// @brief A critical join configuration command (JoinEUI / AppKey) failed.
static constexpr esp_err_t ESP_ERR_LORAWAN_CONFIG        = ESP_ERR_LORAWAN_BASE + 2;

/// @brief Module refused @c AT+JOIN=1.
static constexpr esp_err_t ESP_ERR_LORAWAN_JOIN_REJECTED = ESP_ERR_LORAWAN_BASE + 3;

/// @brief Operation requires a joined session.
static constexpr esp_err_t ESP_ERR_LORAWAN_NOT_JOINED    = ESP_ERR_LORAWAN_BASE + 4;

/// @brief Like esp_err_to_name(), but also knows the component codes above.
const char* lorawanErrToName(esp_err_t err);
