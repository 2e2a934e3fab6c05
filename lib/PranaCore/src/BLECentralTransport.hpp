#pragma once

#include "IBleTransport.hpp"
#include <BLEDevice.h>
#include <BLEClient.h>
#include <BLEUtils.h>
#include <Arduino.h>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>

/**
 * BLECentralTransport - arduino-esp32 (Bluedroid) implementation of IBleTransport
 *
 * This class handles:
 * - BLE stack initialization
 * - Active scanning, reporting name, RSSI and advertised services
 * - Up to Config::maxConnections simultaneous client links, one per device
 * - Locating the control characteristic and subscribing to its notifications
 * - Request/response: a write with response, then the next notification, or a
 *   read of the characteristic once the settle delay passed
 *
 * Connection setup and scanning share the radio and are serialized; traffic
 * on established links is not.
 */
class BLECentralTransport : public IBleTransport {
public:
    static constexpr const char* CONTROL_SERVICE_UUID = "0000baba-0000-1000-8000-00805f9b34fb";
    static constexpr const char* CONTROL_CHAR_UUID = "0000cccc-0000-1000-8000-00805f9b34fb";

    // Bluedroid allows at most 4 concurrent client links by default
    static constexpr uint8_t MAX_SLOTS = 4;

    struct Config {
        const char* deviceName = "Prana-Bridge";
        uint8_t maxConnections = MAX_SLOTS;
        uint16_t preferredMtu = 185;
        uint32_t settleDelayMs = 600;        // device needs time to apply a command
        int serviceDiscoveryRetries = 3;
        int serviceDiscoveryRetryDelayMs = 500;
        int clientCleanupDelayMs = 100;
    };

    explicit BLECentralTransport(const Config& config);
    ~BLECentralTransport() override;

    /**
     * Initialize BLE stack
     * @return true if initialization succeeded
     */
    bool init();

    /**
     * Drop every link and deinitialize the BLE stack
     */
    void deinit();

    bool isInitialized() const { return m_bleInitialized; }

    /**
     * Number of links currently held
     */
    size_t getConnectionCount() const;

    // IBleTransport interface
    PranaError connect(const std::string& address, uint32_t timeoutMs,
                       ConnectionHandle& outHandle) override;
    void disconnect(ConnectionHandle handle) override;
    PranaError write(ConnectionHandle handle, const uint8_t* data, size_t len) override;
    PranaError awaitNotification(ConnectionHandle handle, uint32_t timeoutMs,
                                 std::vector<uint8_t>& out) override;
    PranaError scan(uint32_t durationSec, std::vector<AdvertisementRecord>& out) override;

private:
    class ClientCallbacks;

    struct Slot {
        ConnectionHandle handle = INVALID_CONNECTION;
        std::string address;
        BLEClient* client = nullptr;
        BLERemoteCharacteristic* control = nullptr;
        bool connected = false;
        std::deque<std::vector<uint8_t>> inbox;
    };

    // Static notification callback for BLE; routes to the owning slot
    static void notifyCallback(BLERemoteCharacteristic* pCharacteristic,
                               uint8_t* pData, size_t length, bool isNotify);

    // BLE library callbacks are plain functions, so one instance is active at a time
    static BLECentralTransport* s_instance;

    Slot* findSlotLocked(ConnectionHandle handle);
    Slot* findSlotByCharacteristicLocked(BLERemoteCharacteristic* characteristic);
    Slot* findSlotByClientLocked(BLEClient* client);
    ConnectionHandle nextHandleLocked();
    BLERemoteCharacteristic* discoverControl(BLEClient* client);
    void destroyClient(BLEClient* client);

    static std::string normalize(const std::string& address);

    Config m_config;
    bool m_bleInitialized = false;

    std::mutex m_radioMutex;                 // connect and scan
    mutable std::mutex m_mutex;              // guards the slot table
    std::condition_variable m_cv;
    Slot m_slots[MAX_SLOTS];
    ConnectionHandle m_lastHandle = INVALID_CONNECTION;

    // Address type seen in the last advertisement, needed for random addresses
    std::map<std::string, esp_ble_addr_type_t> m_addressTypes;

    ClientCallbacks* m_clientCallbacks = nullptr;
};
