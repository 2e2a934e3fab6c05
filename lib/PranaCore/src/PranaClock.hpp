#pragma once

#include <cstdint>
#include <functional>

// Time sources are injectable so that staleness and idle policies can be
// driven by a fake clock in tests. Firmware wires in esp_timer/delay().
using MillisFn = std::function<uint64_t()>;
using DelayFn = std::function<void(uint32_t ms)>;

/**
 * Monotonic milliseconds since an unspecified epoch (steady clock)
 */
uint64_t steadyMillis();

/**
 * Block the calling thread for the given number of milliseconds
 */
void steadyDelay(uint32_t ms);
