#include "lorawan_at_err.hpp"

const char* lorawanErrToName(esp_err_t err)
{
    switch (err) {
        case ESP_ERR_LORAWAN_NO_MODULE:     return "ESP_ERR_LORAWAN_NO_MODULE";
        case ESP_ERR_LORAWAN_CONFIG:        return "ESP_ERR_LORAWAN_CONFIG";
        case ESP_ERR_LORAWAN_JOIN_REJECTED: return "ESP_ERR_LORAWAN_JOIN_REJECTED";
        case ESP_ERR_LORAWAN_NOT_JOINED:    return "ESP_ERR_LORAWAN_NOT_JOINED";
        default:                            return esp_err_to_name(err);
    }
}
