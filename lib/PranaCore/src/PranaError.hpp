#pragma once

#include <cstdint>

/**
 * PranaError - Result codes shared by every layer of the gateway
 *
 * Transport-level kinds (ConnectionError, TransportTimeout, TransportError)
 * are retried inside DeviceSession. Decode kinds (MalformedFrame,
 * UnexpectedCommand) come from FrameCodec and get a single retry.
 * The remaining kinds are what callers of the session and registry see.
 */
enum class PranaError : uint8_t {
    None = 0,
    ConnectionError,     // could not establish or restore the BLE link
    TransportTimeout,    // write or notification did not complete in time
    TransportError,      // write rejected by the peer or the stack
    MalformedFrame,      // wrong prefix, length or checksum
    UnexpectedCommand,   // echoed command does not match the request
    DeviceUnreachable,   // transport retry budget exhausted
    ProtocolError,       // decode failure persisted after a retry
    Timeout,             // caller-side wait exceeded
    DiscoveryError,      // scan failed
    SessionClosed,       // session was evicted or removed
    InvalidArgument
};

/**
 * Get a stable name for an error code (used in logs and JSON)
 * @param error Error code
 * @return Error name string
 */
const char* errorToString(PranaError error);

/**
 * Check whether an error is a transport-level failure that warrants
 * dropping the link and retrying the exchange
 */
bool isTransportFailure(PranaError error);

/**
 * Check whether an error came from frame decoding
 */
bool isDecodeFailure(PranaError error);
