#pragma once

#include "DeviceState.hpp"
#include "IBleTransport.hpp"
#include "PranaClock.hpp"
#include "SessionRegistry.hpp"
#include <mutex>
#include <string>
#include <vector>

/**
 * DiscoveryScanner - Finds recuperators by their advertisements
 *
 * A device matches when its advertised name carries the vendor prefix or it
 * advertises the control service. Matches are registered with the
 * SessionRegistry; no connection is made.
 */
class DiscoveryScanner {
public:
    static constexpr const char* NAME_PREFIX = "PRNAQaq";
    static constexpr const char* CONTROL_SERVICE_UUID = "0000baba-0000-1000-8000-00805f9b34fb";

    struct Config {
        uint32_t scanSeconds = 5;
        uint32_t intervalMs = 300000;   // background rescan period
        MillisFn millis;                // defaults to steadyMillis
    };

    DiscoveryScanner(IBleTransport& transport, SessionRegistry& registry, const Config& config);

    /**
     * Scan and register every matching device
     * @param durationSec Scan duration in seconds (0 = Config::scanSeconds)
     * @param out Output: matching devices, one entry per address
     * @return None, or DiscoveryError
     */
    PranaError scan(uint32_t durationSec, std::vector<DeviceInfo>& out);

    /**
     * Background pass: scans when the interval elapsed since the last scan
     * @return true if a scan ran
     */
    bool maintain();

    std::vector<DeviceInfo> getLastResults() const;
    uint64_t getLastScanMs() const;
    PranaError getLastError() const;

    static bool isPranaDevice(const AdvertisementRecord& record);

    /**
     * Friendly name: advertised name without the vendor prefix, trimmed
     */
    static std::string displayName(const std::string& advertisedName);

private:
    IBleTransport& m_transport;
    SessionRegistry& m_registry;
    Config m_config;

    std::mutex m_scanMutex;          // one scan at a time
    mutable std::mutex m_mutex;      // guards the fields below
    std::vector<DeviceInfo> m_lastResults;
    uint64_t m_lastScanMs = 0;
    bool m_hasScanned = false;
    PranaError m_lastError = PranaError::None;
};
