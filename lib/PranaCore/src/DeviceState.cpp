#include "DeviceState.hpp"

constexpr uint8_t DeviceState::MAX_SPEED;
constexpr size_t DeviceState::OFFSET_POWER;
constexpr size_t DeviceState::OFFSET_HEATING;
constexpr size_t DeviceState::OFFSET_NIGHT_MODE;
constexpr size_t DeviceState::OFFSET_AUTO_MODE;
constexpr size_t DeviceState::OFFSET_FLOWS_LOCKED;
constexpr size_t DeviceState::OFFSET_SPEED;
constexpr size_t DeviceState::OFFSET_INPUT_FAN;
constexpr size_t DeviceState::OFFSET_SPEED_IN;
constexpr size_t DeviceState::OFFSET_OUTPUT_FAN;
constexpr size_t DeviceState::OFFSET_SPEED_OUT;
constexpr size_t DeviceState::OFFSET_WINTER_MODE;
constexpr size_t DeviceState::OFFSET_INDOOR_TEMP;
constexpr size_t DeviceState::OFFSET_OUTDOOR_TEMP;
constexpr size_t DeviceState::OFFSET_HUMIDITY;
constexpr size_t DeviceState::MIN_STATE_FRAME_SIZE;
constexpr size_t DeviceState::MIN_SENSOR_FRAME_SIZE;

namespace {

float readTenths(const std::vector<uint8_t>& raw, size_t offset) {
    int16_t value = static_cast<int16_t>((raw[offset] << 8) | raw[offset + 1]);
    return static_cast<float>(value) / 10.0f;
}

}  // namespace

bool DeviceState::fromFrame(const Frame& frame, DeviceState& out) {
    const std::vector<uint8_t>& raw = frame.raw;
    if (raw.size() < MIN_STATE_FRAME_SIZE) {
        return false;
    }

    out.valid = true;
    out.powerOn = raw[OFFSET_POWER] != 0;
    out.heatingOn = raw[OFFSET_HEATING] != 0;
    out.flowsLocked = raw[OFFSET_FLOWS_LOCKED] != 0;
    out.winterMode = raw[OFFSET_WINTER_MODE] != 0;

    // Speeds are reported multiplied by ten
    out.speed = raw[OFFSET_SPEED] / 10;
    out.speedIn = raw[OFFSET_SPEED_IN] / 10;
    out.speedOut = raw[OFFSET_SPEED_OUT] / 10;

    if (raw[OFFSET_NIGHT_MODE] != 0) {
        out.mode = OperatingMode::Night;
    } else if (raw[OFFSET_AUTO_MODE] != 0) {
        out.mode = OperatingMode::Auto;
    } else {
        out.mode = OperatingMode::Manual;
    }

    out.inputFanOn = raw[OFFSET_INPUT_FAN] != 0;
    out.outputFanOn = raw[OFFSET_OUTPUT_FAN] != 0;
    if (out.inputFanOn && out.outputFanOn) {
        out.flowDirection = FlowDirection::Balanced;
    } else if (out.inputFanOn) {
        out.flowDirection = FlowDirection::SupplyOnly;
    } else if (out.outputFanOn) {
        out.flowDirection = FlowDirection::ExhaustOnly;
    } else {
        out.flowDirection = FlowDirection::Off;
    }

    out.hasSensors = raw.size() >= MIN_SENSOR_FRAME_SIZE;
    if (out.hasSensors) {
        out.indoorTempC = readTenths(raw, OFFSET_INDOOR_TEMP);
        out.outdoorTempC = readTenths(raw, OFFSET_OUTDOOR_TEMP);
        out.humidityPercent = raw[OFFSET_HUMIDITY];
    } else {
        out.indoorTempC = 0.0f;
        out.outdoorTempC = 0.0f;
        out.humidityPercent = 0;
    }
    return true;
}

const char* operatingModeToString(OperatingMode mode) {
    switch (mode) {
        case OperatingMode::Manual: return "manual";
        case OperatingMode::Auto: return "auto";
        case OperatingMode::Night: return "night";
        default: return "unknown";
    }
}

const char* flowDirectionToString(FlowDirection direction) {
    switch (direction) {
        case FlowDirection::Balanced: return "balanced";
        case FlowDirection::SupplyOnly: return "supply";
        case FlowDirection::ExhaustOnly: return "exhaust";
        case FlowDirection::Off: return "off";
        default: return "unknown";
    }
}
