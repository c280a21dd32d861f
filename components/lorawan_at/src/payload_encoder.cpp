// ---------------------------------------------------------------------------
// payload_encoder.cpp: sensor record to uplink bytes
// ---------------------------------------------------------------------------

#include "payload_encoder.hpp"

#include "esp_log.h"

#include <cmath>
#include <limits>

static const char* TAG = "PayloadEncoder";

SensorValue SensorValue::ofInt(int64_t v)
{
    SensorValue out;
    out.kind = Kind::INT;
    out.i    = v;
    return out;
}

SensorValue SensorValue::ofFloat(double v)
{
    SensorValue out;
    out.kind = Kind::FLOAT;
    out.f    = v;
    return out;
}

SensorValue SensorValue::ofString(const std::string& v)
{
    SensorValue out;
    out.kind = Kind::STRING;
    out.s    = v;
    return out;
}

// ===========================================================================
// Helpers
// ===========================================================================

/// int(v * factor), truncated toward zero.  False when the value is not
/// numeric, not finite, or does not fit an int64.
static bool scaledInt(const SensorValue& v, int64_t factor, int64_t& out)
{
    if (v.kind == SensorValue::Kind::INT) {
        const int64_t limit = std::numeric_limits<int64_t>::max() / factor;
        if (v.i > limit || v.i < -limit) return false;
        out = v.i * factor;
        return true;
    }
    if (v.kind == SensorValue::Kind::FLOAT) {
        const double scaled = std::trunc(v.f * static_cast<double>(factor));
        if (!std::isfinite(scaled)) return false;
        // 2^63 is exactly representable; anything at or beyond it overflows.
        if (scaled >= 9223372036854775808.0 || scaled < -9223372036854775808.0) return false;
        out = static_cast<int64_t>(scaled);
        return true;
    }
    return false;
}

static void appendBigEndian16(std::vector<uint8_t>& out, uint16_t v)
{
    out.push_back(static_cast<uint8_t>(v >> 8));
    out.push_back(static_cast<uint8_t>(v & 0xFF));
}

static uint8_t clampByte(int64_t v)
{
    if (v < 0)   return 0;
    if (v > 255) return 255;
    return static_cast<uint8_t>(v);
}

static void skipField(const SensorField& field, const char* why)
{
    ESP_LOGW(TAG, "Failed to encode '%s': %s", field.key.c_str(), why);
}

// ===========================================================================
// Encoders
// ===========================================================================

std::vector<uint8_t> encodeSensorRecord(const SensorRecord& record)
{
    std::vector<uint8_t> out;
    out.reserve(record.size() * 2);

    for (const SensorField& field : record) {
        const std::string& key = field.key;
        const SensorValue& v   = field.value;
        int64_t            n   = 0;

        if (key == "temp" || key == "temperature") {
            if (!scaledInt(v, 10, n)) { skipField(field, "not a number"); continue; }
            if (n < INT16_MIN || n > INT16_MAX) { skipField(field, "out of int16 range"); continue; }
            appendBigEndian16(out, static_cast<uint16_t>(static_cast<int16_t>(n)));

        } else if (key == "humidity") {
            if (!scaledInt(v, 2, n)) { skipField(field, "not a number"); continue; }
            out.push_back(clampByte(n));

        } else if (key == "pressure") {
            if (!scaledInt(v, 10, n)) { skipField(field, "not a number"); continue; }
            if (n < 0 || n > UINT16_MAX) { skipField(field, "out of uint16 range"); continue; }
            appendBigEndian16(out, static_cast<uint16_t>(n));

        } else if (key == "battery") {
            if (!scaledInt(v, 1, n)) { skipField(field, "not a number"); continue; }
            out.push_back(clampByte(n));

        } else {
            switch (v.kind) {
                case SensorValue::Kind::STRING:
                    out.insert(out.end(), v.s.begin(), v.s.end());
                    break;
                case SensorValue::Kind::INT:
                    out.push_back(static_cast<uint8_t>(v.i & 0xFF));
                    break;
                case SensorValue::Kind::FLOAT:
                    if (!scaledInt(v, 100, n)) { skipField(field, "not finite"); break; }
                    if (n < INT16_MIN || n > INT16_MAX) { skipField(field, "out of int16 range"); break; }
                    appendBigEndian16(out, static_cast<uint16_t>(static_cast<int16_t>(n)));
                    break;
                case SensorValue::Kind::NONE:
                    skipField(field, "no value");
                    break;
            }
        }
    }

    ESP_LOGD(TAG, "Encoded %u field(s) into %u bytes",
             (unsigned)record.size(), (unsigned)out.size());
    return out;
}

std::vector<uint8_t> textPayload(const std::string& text)
{
    return std::vector<uint8_t>(text.begin(), text.end());
}
