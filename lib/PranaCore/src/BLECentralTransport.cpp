#include "BLECentralTransport.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>

// Define static constexpr members for pre-C++17 ODR compliance
constexpr const char* BLECentralTransport::CONTROL_SERVICE_UUID;
constexpr const char* BLECentralTransport::CONTROL_CHAR_UUID;
constexpr uint8_t BLECentralTransport::MAX_SLOTS;

// Static instance pointer for callbacks
BLECentralTransport* BLECentralTransport::s_instance = nullptr;

// Client callbacks class for BLE connection events
class BLECentralTransport::ClientCallbacks : public BLEClientCallbacks {
public:
    explicit ClientCallbacks(BLECentralTransport* transport) : m_transport(transport) {}

    void onConnect(BLEClient* client) override {
        Serial.printf("BLE ClientCallbacks: onConnect %s\n",
                      client->getPeerAddress().toString().c_str());
    }

    void onDisconnect(BLEClient* client) override {
        Serial.printf("BLE ClientCallbacks: onDisconnect %s\n",
                      client->getPeerAddress().toString().c_str());
        {
            std::lock_guard<std::mutex> guard(m_transport->m_mutex);
            Slot* slot = m_transport->findSlotByClientLocked(client);
            if (slot != nullptr) {
                slot->connected = false;
            }
        }
        // Wake anyone waiting for a reply on this link
        m_transport->m_cv.notify_all();
    }

private:
    BLECentralTransport* m_transport;
};

BLECentralTransport::BLECentralTransport(const Config& config)
    : m_config(config)
{
    if (m_config.maxConnections == 0 || m_config.maxConnections > MAX_SLOTS) {
        m_config.maxConnections = MAX_SLOTS;
    }
    s_instance = this;
    m_clientCallbacks = new ClientCallbacks(this);
}

BLECentralTransport::~BLECentralTransport() {
    deinit();
    delete m_clientCallbacks;
    if (s_instance == this) {
        s_instance = nullptr;
    }
}

std::string BLECentralTransport::normalize(const std::string& address) {
    std::string normalized = address;
    for (char& c : normalized) {
        c = static_cast<char>(toupper(static_cast<unsigned char>(c)));
    }
    return normalized;
}

bool BLECentralTransport::init() {
    Serial.println("BLECentralTransport: Initializing BLE...");
    Serial.printf("Free heap before BLE init: %d bytes\n", ESP.getFreeHeap());

    BLEDevice::init(m_config.deviceName);

    if (!BLEDevice::getInitialized()) {
        Serial.println("ERROR: BLE initialization failed - check if Bluetooth is enabled in sdkconfig");
        return false;
    }

    m_bleInitialized = true;
    Serial.printf("BLE initialized successfully as '%s' (max %d links)\n", m_config.deviceName,
                  m_config.maxConnections);
    Serial.printf("Free heap after BLE init: %d bytes\n", ESP.getFreeHeap());
    return true;
}

void BLECentralTransport::deinit() {
    std::vector<BLEClient*> clients;
    {
        std::lock_guard<std::mutex> guard(m_mutex);
        for (Slot& slot : m_slots) {
            if (slot.client != nullptr) {
                clients.push_back(slot.client);
            }
            slot = Slot();
        }
    }
    m_cv.notify_all();

    for (BLEClient* client : clients) {
        destroyClient(client);
    }

    if (m_bleInitialized) {
        BLEDevice::deinit();
        m_bleInitialized = false;
        Serial.println("BLE deinitialized");
    }
}

size_t BLECentralTransport::getConnectionCount() const {
    std::lock_guard<std::mutex> guard(m_mutex);
    size_t count = 0;
    for (const Slot& slot : m_slots) {
        if (slot.handle != INVALID_CONNECTION) {
            count++;
        }
    }
    return count;
}

BLECentralTransport::Slot* BLECentralTransport::findSlotLocked(ConnectionHandle handle) {
    if (handle == INVALID_CONNECTION) {
        return nullptr;
    }
    for (Slot& slot : m_slots) {
        if (slot.handle == handle) {
            return &slot;
        }
    }
    return nullptr;
}

BLECentralTransport::Slot* BLECentralTransport::findSlotByCharacteristicLocked(
    BLERemoteCharacteristic* characteristic) {
    for (Slot& slot : m_slots) {
        if (slot.handle != INVALID_CONNECTION && slot.control == characteristic) {
            return &slot;
        }
    }
    return nullptr;
}

BLECentralTransport::Slot* BLECentralTransport::findSlotByClientLocked(BLEClient* client) {
    for (Slot& slot : m_slots) {
        if (slot.handle != INVALID_CONNECTION && slot.client == client) {
            return &slot;
        }
    }
    return nullptr;
}

ConnectionHandle BLECentralTransport::nextHandleLocked() {
    do {
        m_lastHandle++;
    } while (m_lastHandle == INVALID_CONNECTION || findSlotLocked(m_lastHandle) != nullptr);
    return m_lastHandle;
}

void BLECentralTransport::notifyCallback(BLERemoteCharacteristic* pCharacteristic,
                                          uint8_t* pData, size_t length, bool isNotify) {
    if (s_instance == nullptr || length == 0) {
        return;
    }
    {
        std::lock_guard<std::mutex> guard(s_instance->m_mutex);
        Slot* slot = s_instance->findSlotByCharacteristicLocked(pCharacteristic);
        if (slot == nullptr) {
            return;
        }
        slot->inbox.push_back(std::vector<uint8_t>(pData, pData + length));
    }
    s_instance->m_cv.notify_all();
}

void BLECentralTransport::destroyClient(BLEClient* client) {
    if (client == nullptr) {
        return;
    }
    if (client->isConnected()) {
        client->disconnect();
    }
    delay(m_config.clientCleanupDelayMs);
    delete client;
}

BLERemoteCharacteristic* BLECentralTransport::discoverControl(BLEClient* client) {
    BLERemoteService* service = nullptr;
    for (int retry = 0; retry < m_config.serviceDiscoveryRetries; retry++) {
        service = client->getService(CONTROL_SERVICE_UUID);
        if (service != nullptr) {
            break;
        }
        Serial.printf("BLECentralTransport: control service not found (attempt %d)\n", retry + 1);
        if (retry < m_config.serviceDiscoveryRetries - 1) {
            delay(m_config.serviceDiscoveryRetryDelayMs);
        }
    }
    if (service == nullptr) {
        return nullptr;
    }

    BLERemoteCharacteristic* control = service->getCharacteristic(CONTROL_CHAR_UUID);
    if (control == nullptr || !control->canWrite()) {
        Serial.println("BLECentralTransport: control characteristic missing or not writable");
        return nullptr;
    }

    if (control->canNotify()) {
        control->registerForNotify(notifyCallback, true, true);
    }
    return control;
}

PranaError BLECentralTransport::connect(const std::string& address, uint32_t timeoutMs,
                                        ConnectionHandle& outHandle) {
    outHandle = INVALID_CONNECTION;
    std::lock_guard<std::mutex> radioGuard(m_radioMutex);

    if (!m_bleInitialized && !init()) {
        return PranaError::ConnectionError;
    }

    const std::string key = normalize(address);
    esp_ble_addr_type_t addrType = BLE_ADDR_TYPE_PUBLIC;
    {
        std::lock_guard<std::mutex> guard(m_mutex);
        size_t inUse = 0;
        for (const Slot& slot : m_slots) {
            if (slot.handle != INVALID_CONNECTION) {
                inUse++;
            }
        }
        if (inUse >= m_config.maxConnections) {
            Serial.printf("BLECentralTransport: no free link for %s (%u in use)\n", key.c_str(),
                          (unsigned int)inUse);
            return PranaError::ConnectionError;
        }
        auto it = m_addressTypes.find(key);
        if (it != m_addressTypes.end()) {
            addrType = it->second;
        }
    }

    Serial.printf("BLECentralTransport: connecting to %s...\n", key.c_str());

    BLEClient* client = BLEDevice::createClient();
    client->setClientCallbacks(m_clientCallbacks);

    if (!client->connect(BLEAddress(key), addrType, timeoutMs)) {
        Serial.printf("BLECentralTransport: connection to %s failed\n", key.c_str());
        destroyClient(client);
        return PranaError::ConnectionError;
    }

    if (!client->setMTU(m_config.preferredMtu)) {
        Serial.println("BLECentralTransport: MTU negotiation failed, using default MTU");
    }

    BLERemoteCharacteristic* control = discoverControl(client);
    if (control == nullptr) {
        destroyClient(client);
        return PranaError::ConnectionError;
    }

    bool stored = false;
    {
        std::lock_guard<std::mutex> guard(m_mutex);
        for (Slot& slot : m_slots) {
            if (slot.handle == INVALID_CONNECTION) {
                slot.handle = nextHandleLocked();
                slot.address = key;
                slot.client = client;
                slot.control = control;
                slot.connected = client->isConnected();
                slot.inbox.clear();
                outHandle = slot.handle;
                stored = true;
                break;
            }
        }
    }
    if (!stored) {
        destroyClient(client);
        return PranaError::ConnectionError;
    }

    Serial.printf("BLECentralTransport: %s connected (handle %u, MTU %d)\n", key.c_str(),
                  (unsigned int)outHandle, client->getMTU());
    return PranaError::None;
}

void BLECentralTransport::disconnect(ConnectionHandle handle) {
    BLEClient* client = nullptr;
    {
        std::lock_guard<std::mutex> guard(m_mutex);
        Slot* slot = findSlotLocked(handle);
        if (slot == nullptr) {
            return;
        }
        Serial.printf("BLECentralTransport: releasing %s (handle %u)\n", slot->address.c_str(),
                      (unsigned int)handle);
        client = slot->client;
        *slot = Slot();
    }
    m_cv.notify_all();
    destroyClient(client);
}

PranaError BLECentralTransport::write(ConnectionHandle handle, const uint8_t* data, size_t len) {
    if (data == nullptr || len == 0) {
        return PranaError::TransportError;
    }

    BLERemoteCharacteristic* control = nullptr;
    BLEClient* client = nullptr;
    {
        std::lock_guard<std::mutex> guard(m_mutex);
        Slot* slot = findSlotLocked(handle);
        if (slot == nullptr || !slot->connected || slot->control == nullptr) {
            return PranaError::ConnectionError;
        }
        // Anything queued before this request cannot be its reply
        slot->inbox.clear();
        control = slot->control;
        client = slot->client;
    }

    // A frame longer than the negotiated MTU payload would be split or refused by the stack
    if (len > static_cast<size_t>(client->getMTU()) - 3) {
        Serial.printf("BLECentralTransport: %u byte frame exceeds MTU %d (handle %u)\n",
                      (unsigned int)len, client->getMTU(), (unsigned int)handle);
        return PranaError::TransportError;
    }

    // writeValue() reports no GATT status; a rejected write surfaces as a missing reply
    std::vector<uint8_t> buffer(data, data + len);
    control->writeValue(buffer.data(), buffer.size(), true);

    if (!client->isConnected()) {
        Serial.printf("BLECentralTransport: link lost during write (handle %u)\n",
                      (unsigned int)handle);
        return PranaError::ConnectionError;
    }
    return PranaError::None;
}

PranaError BLECentralTransport::awaitNotification(ConnectionHandle handle, uint32_t timeoutMs,
                                                  std::vector<uint8_t>& out) {
    const unsigned long start = millis();
    BLERemoteCharacteristic* control = nullptr;

    std::unique_lock<std::mutex> lock(m_mutex);
    auto ready = [this, handle]() {
        Slot* slot = findSlotLocked(handle);
        return slot == nullptr || !slot->connected || !slot->inbox.empty();
    };

    // Give the device its settle time; a notification ends the wait early
    uint32_t settleMs = std::min(m_config.settleDelayMs, timeoutMs);
    m_cv.wait_for(lock, std::chrono::milliseconds(settleMs), ready);

    Slot* slot = findSlotLocked(handle);
    if (slot == nullptr || !slot->connected) {
        return PranaError::ConnectionError;
    }
    if (!slot->inbox.empty()) {
        out = slot->inbox.front();
        slot->inbox.pop_front();
        return PranaError::None;
    }
    control = slot->control;
    lock.unlock();

    // No notification: the device answers reads with its current frame
    if (control != nullptr && control->canRead()) {
        std::string value = control->readValue();
        if (!value.empty()) {
            out.assign(value.begin(), value.end());
            return PranaError::None;
        }
    }

    uint32_t elapsed = millis() - start;
    if (elapsed >= timeoutMs) {
        return PranaError::TransportTimeout;
    }

    lock.lock();
    m_cv.wait_for(lock, std::chrono::milliseconds(timeoutMs - elapsed), ready);
    slot = findSlotLocked(handle);
    if (slot == nullptr || !slot->connected) {
        return PranaError::ConnectionError;
    }
    if (slot->inbox.empty()) {
        return PranaError::TransportTimeout;
    }
    out = slot->inbox.front();
    slot->inbox.pop_front();
    return PranaError::None;
}

PranaError BLECentralTransport::scan(uint32_t durationSec, std::vector<AdvertisementRecord>& out) {
    std::lock_guard<std::mutex> radioGuard(m_radioMutex);
    out.clear();

    if (!m_bleInitialized && !init()) {
        return PranaError::DiscoveryError;
    }

    BLEScan* scan = BLEDevice::getScan();
    scan->setActiveScan(true);
    scan->setInterval(100);
    scan->setWindow(99);

    Serial.printf("BLECentralTransport: scanning for %u seconds...\n", (unsigned int)durationSec);
    BLEScanResults results = scan->start(durationSec, false);
    int deviceCount = results.getCount();

    if (deviceCount < 0) {
        Serial.println("BLE scan failed");
        scan->clearResults();
        return PranaError::DiscoveryError;
    }

    std::map<std::string, esp_ble_addr_type_t> addressTypes;
    for (int i = 0; i < deviceCount; i++) {
        BLEAdvertisedDevice device = results.getDevice(i);

        AdvertisementRecord record;
        record.address = normalize(device.getAddress().toString());
        record.name = device.haveName() ? device.getName() : std::string();
        record.rssi = device.haveRSSI() ? device.getRSSI() : 0;
        for (int u = 0; u < device.getServiceUUIDCount(); u++) {
            std::string uuid = device.getServiceUUID(u).toString();
            std::transform(uuid.begin(), uuid.end(), uuid.begin(), [](char c) {
                return static_cast<char>(tolower(static_cast<unsigned char>(c)));
            });
            record.serviceUuids.push_back(uuid);
        }

        addressTypes[record.address] = device.getAddressType();
        out.push_back(record);
    }

    scan->clearResults();

    {
        std::lock_guard<std::mutex> guard(m_mutex);
        for (const auto& entry : addressTypes) {
            m_addressTypes[entry.first] = entry.second;
        }
    }

    Serial.printf("BLE Scan Complete: %d device(s) found\n", deviceCount);
    return PranaError::None;
}
