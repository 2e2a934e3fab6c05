#pragma once

/**
 * PranaCore - Device session and protocol bridge for Prana recuperators
 *
 * Architecture:
 *
 *   [HTTP layer / maintenance task]
 *           |
 *   [SessionRegistry] <--- [DiscoveryScanner]
 *           |
 *   [DeviceSession]  - connection state machine, single flight, retries, cache
 *           |
 *   [FrameCodec]     - frame building and validation, DeviceState decoding
 *           |
 *   [Transport : IBleTransport] - BLE radio access
 *
 * Transport options:
 *   - BLECentralTransport: arduino-esp32 Bluedroid central (firmware builds)
 *   - Any IBleTransport implementation (host tests use a scripted fake)
 *
 * Usage:
 *   1. Create the transport and initialize the radio
 *   2. Create one SessionRegistry with the transport
 *   3. Create a DiscoveryScanner feeding that registry
 *   4. Hand the registry to the HTTP layer; run evictIdle() and
 *      DiscoveryScanner::maintain() periodically
 */

#include "PranaError.hpp"
#include "IBleTransport.hpp"
#include "FrameCodec.hpp"
#include "DeviceState.hpp"
#include "DeviceSession.hpp"
#include "SessionRegistry.hpp"
#include "DiscoveryScanner.hpp"

#ifdef ARDUINO
#include "BLECentralTransport.hpp"
#endif
