#pragma once

/**
 * @file payload_encoder.hpp
 * @brief Compact binary encoding of sensor readings for uplink payloads.
 *
 * @details
 * Fields are encoded in insertion order.  Well-known keys get a fixed layout:
 *
 * | key                   | bytes | encoding                                  |
 * |-----------------------|-------|-------------------------------------------|
 * | temp / temperature    | 2     | int(v*10), signed big-endian (0.1 °C)     |
 * | humidity              | 1     | clamp(int(v*2), 0, 255) (0.5 %)           |
 * | pressure              | 2     | int(v*10), unsigned big-endian (0.1 hPa)  |
 * | battery               | 1     | clamp(int(v), 0, 255) (%)                 |
 *
 * Any other key is encoded by the kind of its value: STRING as raw bytes,
 * INT as its low byte, FLOAT as int(v*100) signed big-endian.
 *
 * int() truncates toward zero.  A value that does not fit its field, a
 * non-numeric value under a numeric key, and a NONE value are skipped with a
 * warning; encoding itself never fails.
 */

#include <cstdint>
#include <string>
#include <vector>

/// @brief One sensor reading, tagged with the kind of value it carries.
struct SensorValue {
    enum class Kind : uint8_t {
        NONE,
        INT,
        FLOAT,
        STRING,
    };

    Kind        kind = Kind::NONE;
    int64_t     i    = 0;
    double      f    = 0.0;
    std::string s;

    static SensorValue ofInt(int64_t v);
    static SensorValue ofFloat(double v);
    static SensorValue ofString(const std::string& v);
    static SensorValue none() { return SensorValue{}; }

    bool isNumeric() const { return kind == Kind::INT || kind == Kind::FLOAT; }
};

struct SensorField {
    std::string key;
    SensorValue value;
};

/// @brief Ordered set of readings; encoded front to back.
using SensorRecord = std::vector<SensorField>;

/// Encode @p record into an uplink payload.  May return an empty vector when
/// every field was skipped.
std::vector<uint8_t> encodeSensorRecord(const SensorRecord& record);

/// Raw bytes of a text payload (no terminator).
std::vector<uint8_t> textPayload(const std::string& text);
