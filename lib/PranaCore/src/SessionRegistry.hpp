#pragma once

#include "DeviceSession.hpp"
#include "IBleTransport.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * DeviceSummary - One row of the device listing
 */
struct DeviceSummary {
    DeviceInfo info;
    DeviceState state;
    DeviceSession::State sessionState = DeviceSession::State::Disconnected;
};

/**
 * SessionRegistry - Owner of every DeviceSession, keyed by MAC address
 *
 * Sessions are created lazily on first reference and never connect on
 * creation. The registry lock covers only lookup, insert and the idle
 * check; closing a connection happens outside it.
 *
 * One instance is created at startup and passed to the HTTP layer and the
 * discovery scanner.
 */
class SessionRegistry {
public:
    struct Config {
        DeviceSession::Config session;
        uint32_t idleTimeoutMs = 120000;
        uint8_t maxConsecutiveFailures = 5;   // 0 disables failure eviction
    };

    SessionRegistry(IBleTransport& transport, const Config& config);
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    /**
     * Get the session for an address, creating it if needed
     * @param address Device MAC address (any case)
     * @return Session, or nullptr if the address is malformed
     */
    std::shared_ptr<DeviceSession> get(const std::string& address);

    /**
     * Look up a session without creating one
     */
    std::shared_ptr<DeviceSession> find(const std::string& address) const;

    /**
     * Make sure a discovered device has a session and record its advertisement
     * @return false if the address is malformed
     */
    bool registerDiscovered(const DeviceInfo& info);

    /**
     * Close and drop sessions idle for longer than thresholdMs, and sessions
     * that reached the consecutive failure limit. Busy sessions are skipped.
     * @return Number of sessions evicted
     */
    size_t evictIdle(uint32_t thresholdMs);

    /**
     * Close and drop one session
     * @return true if a session existed
     */
    bool remove(const std::string& address);

    /**
     * Snapshot of every known device
     */
    std::vector<DeviceSummary> list() const;

    /**
     * Close every session (shutdown)
     */
    void closeAll();

    size_t size() const;

    const Config& getConfig() const { return m_config; }

    static bool isValidAddress(const std::string& address);
    static std::string normalizeAddress(const std::string& address);

private:
    IBleTransport& m_transport;
    Config m_config;

    mutable std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<DeviceSession>> m_sessions;
};
