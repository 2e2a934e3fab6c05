#pragma once

#include "FrameCodec.hpp"
#include <cstdint>
#include <string>

enum class OperatingMode : uint8_t {
    Manual,
    Auto,
    Night
};

enum class FlowDirection : uint8_t {
    Balanced,      // supply and exhaust fans both running
    SupplyOnly,
    ExhaustOnly,
    Off
};

/**
 * ConnectionHealth - Link bookkeeping reported alongside device state
 */
struct ConnectionHealth {
    bool connected = false;
    uint8_t consecutiveFailures = 0;
    PranaError lastError = PranaError::None;
};

/**
 * DeviceInfo - What discovery learned about a device
 */
struct DeviceInfo {
    std::string address;
    std::string advertisedName;
    std::string name;     // advertised name without the vendor prefix
    int rssi = 0;
};

/**
 * DeviceState - Decoded snapshot of a recuperator
 *
 * Always handed out by value; the live copy belongs to its DeviceSession.
 */
struct DeviceState {
    // Speed levels run 0..MAX_SPEED
    static constexpr uint8_t MAX_SPEED = 10;

    // Absolute frame offsets of the state payload
    static constexpr size_t OFFSET_POWER = 10;
    static constexpr size_t OFFSET_HEATING = 14;
    static constexpr size_t OFFSET_NIGHT_MODE = 16;
    static constexpr size_t OFFSET_AUTO_MODE = 20;
    static constexpr size_t OFFSET_FLOWS_LOCKED = 22;
    static constexpr size_t OFFSET_SPEED = 26;
    static constexpr size_t OFFSET_INPUT_FAN = 28;
    static constexpr size_t OFFSET_SPEED_IN = 30;
    static constexpr size_t OFFSET_OUTPUT_FAN = 32;
    static constexpr size_t OFFSET_SPEED_OUT = 34;
    static constexpr size_t OFFSET_WINTER_MODE = 42;
    static constexpr size_t OFFSET_INDOOR_TEMP = 48;    // int16 BE, tenths of a degree
    static constexpr size_t OFFSET_OUTDOOR_TEMP = 50;   // int16 BE, tenths of a degree
    static constexpr size_t OFFSET_HUMIDITY = 52;

    static constexpr size_t MIN_STATE_FRAME_SIZE = OFFSET_WINTER_MODE + 2;
    static constexpr size_t MIN_SENSOR_FRAME_SIZE = OFFSET_HUMIDITY + 2;

    bool valid = false;   // false until the first state frame was decoded

    bool powerOn = false;
    uint8_t speed = 0;
    uint8_t speedIn = 0;
    uint8_t speedOut = 0;
    OperatingMode mode = OperatingMode::Manual;
    FlowDirection flowDirection = FlowDirection::Off;
    bool flowsLocked = false;
    bool heatingOn = false;
    bool winterMode = false;
    bool inputFanOn = false;
    bool outputFanOn = false;

    bool hasSensors = false;
    float indoorTempC = 0.0f;
    float outdoorTempC = 0.0f;
    uint8_t humidityPercent = 0;

    uint64_t lastUpdatedMs = 0;
    ConnectionHealth health;

    /**
     * Decode the state carried by a response frame
     * @param frame Decoded frame (raw bytes are read at absolute offsets)
     * @param out Output: decoded state; timestamp and health are left untouched
     * @return true if the frame is long enough to carry state
     */
    static bool fromFrame(const Frame& frame, DeviceState& out);
};

const char* operatingModeToString(OperatingMode mode);
const char* flowDirectionToString(FlowDirection direction);
