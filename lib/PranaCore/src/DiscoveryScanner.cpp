#include "DiscoveryScanner.hpp"
#include "PranaLog.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>

// Define static constexpr members for pre-C++17 ODR compliance
constexpr const char* DiscoveryScanner::NAME_PREFIX;
constexpr const char* DiscoveryScanner::CONTROL_SERVICE_UUID;

namespace {

std::string trim(const std::string& value) {
    size_t first = 0;
    while (first < value.size() && isspace(static_cast<unsigned char>(value[first]))) {
        first++;
    }
    size_t last = value.size();
    while (last > first && isspace(static_cast<unsigned char>(value[last - 1]))) {
        last--;
    }
    return value.substr(first, last - first);
}

bool equalsIgnoreCase(const std::string& a, const char* b) {
    size_t len = strlen(b);
    if (a.size() != len) {
        return false;
    }
    for (size_t i = 0; i < len; i++) {
        if (tolower(static_cast<unsigned char>(a[i])) != tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

}  // namespace

DiscoveryScanner::DiscoveryScanner(IBleTransport& transport, SessionRegistry& registry, const Config& config)
    : m_transport(transport)
    , m_registry(registry)
    , m_config(config)
{
    if (!m_config.millis) {
        m_config.millis = steadyMillis;
    }
}

bool DiscoveryScanner::isPranaDevice(const AdvertisementRecord& record) {
    if (record.name.compare(0, strlen(NAME_PREFIX), NAME_PREFIX) == 0) {
        return true;
    }
    for (const std::string& uuid : record.serviceUuids) {
        if (equalsIgnoreCase(uuid, CONTROL_SERVICE_UUID)) {
            return true;
        }
    }
    return false;
}

std::string DiscoveryScanner::displayName(const std::string& advertisedName) {
    std::string name = advertisedName;
    size_t prefixPos = name.find(NAME_PREFIX);
    if (prefixPos != std::string::npos) {
        name.erase(prefixPos, strlen(NAME_PREFIX));
    }
    return trim(name);
}

PranaError DiscoveryScanner::scan(uint32_t durationSec, std::vector<DeviceInfo>& out) {
    std::lock_guard<std::mutex> scanGuard(m_scanMutex);

    uint32_t seconds = durationSec != 0 ? durationSec : m_config.scanSeconds;
    pranaLog("DiscoveryScanner: scanning for %u seconds...\n", (unsigned int)seconds);

    std::vector<AdvertisementRecord> records;
    PranaError err = m_transport.scan(seconds, records);
    if (err != PranaError::None) {
        pranaLog("DiscoveryScanner: scan failed (%s)\n", errorToString(err));
        std::lock_guard<std::mutex> guard(m_mutex);
        m_lastError = PranaError::DiscoveryError;
        m_lastScanMs = m_config.millis();
        m_hasScanned = true;
        return PranaError::DiscoveryError;
    }

    out.clear();
    for (const AdvertisementRecord& record : records) {
        if (!isPranaDevice(record) || !SessionRegistry::isValidAddress(record.address)) {
            continue;
        }

        const std::string address = SessionRegistry::normalizeAddress(record.address);
        auto existing = std::find_if(out.begin(), out.end(), [&address](const DeviceInfo& info) {
            return info.address == address;
        });
        if (existing != out.end()) {
            // Same device advertised twice; keep the strongest reading
            if (record.rssi > existing->rssi) {
                existing->rssi = record.rssi;
            }
            continue;
        }

        DeviceInfo info;
        info.address = address;
        info.advertisedName = trim(record.name);
        info.name = displayName(record.name);
        info.rssi = record.rssi;
        out.push_back(info);
    }

    for (const DeviceInfo& info : out) {
        pranaLog("DiscoveryScanner: found '%s' at %s (RSSI %d)\n", info.name.c_str(),
                 info.address.c_str(), info.rssi);
        if (!m_registry.registerDiscovered(info)) {
            pranaLog("DiscoveryScanner: could not register %s\n", info.address.c_str());
        }
    }

    pranaLog("DiscoveryScanner: %u of %u advertisements matched\n", (unsigned int)out.size(),
             (unsigned int)records.size());

    std::lock_guard<std::mutex> guard(m_mutex);
    m_lastResults = out;
    m_lastScanMs = m_config.millis();
    m_hasScanned = true;
    m_lastError = PranaError::None;
    return PranaError::None;
}

bool DiscoveryScanner::maintain() {
    {
        std::lock_guard<std::mutex> guard(m_mutex);
        uint64_t now = m_config.millis();
        if (m_hasScanned && now - m_lastScanMs < m_config.intervalMs) {
            return false;
        }
    }

    std::vector<DeviceInfo> found;
    PranaError err = scan(0, found);
    if (err != PranaError::None) {
        pranaLog("DiscoveryScanner: background scan failed, existing sessions kept\n");
    }
    return true;
}

std::vector<DeviceInfo> DiscoveryScanner::getLastResults() const {
    std::lock_guard<std::mutex> guard(m_mutex);
    return m_lastResults;
}

uint64_t DiscoveryScanner::getLastScanMs() const {
    std::lock_guard<std::mutex> guard(m_mutex);
    return m_lastScanMs;
}

PranaError DiscoveryScanner::getLastError() const {
    std::lock_guard<std::mutex> guard(m_mutex);
    return m_lastError;
}
