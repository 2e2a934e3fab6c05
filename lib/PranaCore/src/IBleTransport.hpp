#pragma once

#include "PranaError.hpp"
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

// Opaque per-connection handle issued by the transport. 0 is never issued.
using ConnectionHandle = uint16_t;
static constexpr ConnectionHandle INVALID_CONNECTION = 0;

/**
 * AdvertisementRecord - One device seen during a scan
 */
struct AdvertisementRecord {
    std::string address;                    // "AA:BB:CC:DD:EE:FF"
    std::string name;                       // advertised local name, may be empty
    int rssi = 0;
    std::vector<std::string> serviceUuids;  // lower-case 128-bit UUID strings
};

/**
 * IBleTransport - Interface for the BLE radio capability used by the core
 *
 * This interface abstracts the underlying radio stack and provides a small
 * connection-oriented API: scan, connect, write a frame, wait for the reply
 * notification, disconnect.
 *
 * Implementations must support independent connections to distinct devices
 * from different threads. Exclusive access to a single device is enforced by
 * DeviceSession, not assumed of the transport.
 */
class IBleTransport {
public:
    virtual ~IBleTransport() = default;

    /**
     * Connect to a device and prepare its control characteristic
     * @param address Device MAC address
     * @param timeoutMs Upper bound for link establishment
     * @param outHandle Output: handle for the new connection
     * @return None, or ConnectionError
     */
    virtual PranaError connect(const std::string& address, uint32_t timeoutMs,
                               ConnectionHandle& outHandle) = 0;

    /**
     * Release a connection. Unknown or already released handles are ignored.
     * @param handle Connection handle
     */
    virtual void disconnect(ConnectionHandle handle) = 0;

    /**
     * Write raw bytes to the control characteristic
     * @return None, TransportError, or ConnectionError if the link is gone
     *
     * Backends whose stack does not report the GATT write status (Bluedroid
     * in arduino-esp32 2.x) can only return TransportError for a write they
     * refuse locally. A write the peer rejects then shows up as TransportTimeout
     * from awaitNotification(), which the session retries the same way.
     */
    virtual PranaError write(ConnectionHandle handle, const uint8_t* data, size_t len) = 0;

    /**
     * Wait for the next inbound frame on a connection
     * @param handle Connection handle
     * @param timeoutMs Maximum time to wait
     * @param out Output: received bytes
     * @return None, TransportTimeout, or ConnectionError if the link dropped
     */
    virtual PranaError awaitNotification(ConnectionHandle handle, uint32_t timeoutMs,
                                         std::vector<uint8_t>& out) = 0;

    /**
     * Listen to advertisements
     * @param durationSec Scan duration in seconds
     * @param out Output: every advertisement seen
     * @return None, or DiscoveryError
     */
    virtual PranaError scan(uint32_t durationSec, std::vector<AdvertisementRecord>& out) = 0;
};

/**
 * ScopedConnection - Exclusive owner of one transport connection
 *
 * Disconnects on destruction and on release(), so every exit from the
 * connected state gives the handle back to the transport.
 */
class ScopedConnection {
public:
    ScopedConnection() = default;

    ScopedConnection(IBleTransport& transport, ConnectionHandle handle)
        : m_transport(&transport)
        , m_handle(handle)
    {
    }

    ~ScopedConnection() { release(); }

    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    ScopedConnection(ScopedConnection&& other) noexcept
        : m_transport(other.m_transport)
        , m_handle(other.m_handle)
    {
        other.m_transport = nullptr;
        other.m_handle = INVALID_CONNECTION;
    }

    ScopedConnection& operator=(ScopedConnection&& other) noexcept {
        if (this != &other) {
            release();
            m_transport = other.m_transport;
            m_handle = other.m_handle;
            other.m_transport = nullptr;
            other.m_handle = INVALID_CONNECTION;
        }
        return *this;
    }

    void release() {
        if (m_transport != nullptr && m_handle != INVALID_CONNECTION) {
            m_transport->disconnect(m_handle);
        }
        m_transport = nullptr;
        m_handle = INVALID_CONNECTION;
    }

    bool valid() const { return m_handle != INVALID_CONNECTION; }
    ConnectionHandle handle() const { return m_handle; }

private:
    IBleTransport* m_transport = nullptr;
    ConnectionHandle m_handle = INVALID_CONNECTION;
};
