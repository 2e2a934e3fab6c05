#include "SessionRegistry.hpp"
#include "PranaLog.hpp"
#include <cctype>

SessionRegistry::SessionRegistry(IBleTransport& transport, const Config& config)
    : m_transport(transport)
    , m_config(config)
{
    if (!m_config.session.millis) {
        m_config.session.millis = steadyMillis;
    }
    if (!m_config.session.delay) {
        m_config.session.delay = steadyDelay;
    }
}

SessionRegistry::~SessionRegistry() {
    closeAll();
}

bool SessionRegistry::isValidAddress(const std::string& address) {
    // XX:XX:XX:XX:XX:XX
    if (address.size() != 17) {
        return false;
    }
    for (size_t i = 0; i < address.size(); i++) {
        char c = address[i];
        if (i % 3 == 2) {
            if (c != ':') {
                return false;
            }
        } else if (!isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::string SessionRegistry::normalizeAddress(const std::string& address) {
    std::string normalized = address;
    for (char& c : normalized) {
        c = static_cast<char>(toupper(static_cast<unsigned char>(c)));
    }
    return normalized;
}

std::shared_ptr<DeviceSession> SessionRegistry::get(const std::string& address) {
    if (!isValidAddress(address)) {
        return nullptr;
    }
    const std::string key = normalizeAddress(address);

    std::lock_guard<std::mutex> guard(m_mutex);
    auto it = m_sessions.find(key);
    if (it != m_sessions.end()) {
        return it->second;
    }

    std::shared_ptr<DeviceSession> session(new DeviceSession(key, m_transport, m_config.session));
    m_sessions[key] = session;
    pranaLog("SessionRegistry: created session for %s (%u total)\n", key.c_str(),
             (unsigned int)m_sessions.size());
    return session;
}

std::shared_ptr<DeviceSession> SessionRegistry::find(const std::string& address) const {
    if (!isValidAddress(address)) {
        return nullptr;
    }
    std::lock_guard<std::mutex> guard(m_mutex);
    auto it = m_sessions.find(normalizeAddress(address));
    return it != m_sessions.end() ? it->second : nullptr;
}

bool SessionRegistry::registerDiscovered(const DeviceInfo& info) {
    std::shared_ptr<DeviceSession> session = get(info.address);
    if (!session) {
        return false;
    }
    session->setInfo(info);
    return true;
}

size_t SessionRegistry::evictIdle(uint32_t thresholdMs) {
    std::vector<std::shared_ptr<DeviceSession>> retired;
    const uint64_t now = m_config.session.millis();

    {
        std::lock_guard<std::mutex> guard(m_mutex);
        for (auto it = m_sessions.begin(); it != m_sessions.end();) {
            if (it->second->retireIfIdle(now, thresholdMs, m_config.maxConsecutiveFailures)) {
                retired.push_back(it->second);
                it = m_sessions.erase(it);
            } else {
                ++it;
            }
        }
    }

    // Release links outside the registry lock
    for (const std::shared_ptr<DeviceSession>& session : retired) {
        pranaLog("SessionRegistry: evicting %s\n", session->getAddress().c_str());
        session->close();
    }
    return retired.size();
}

bool SessionRegistry::remove(const std::string& address) {
    if (!isValidAddress(address)) {
        return false;
    }

    std::shared_ptr<DeviceSession> session;
    {
        std::lock_guard<std::mutex> guard(m_mutex);
        auto it = m_sessions.find(normalizeAddress(address));
        if (it == m_sessions.end()) {
            return false;
        }
        session = it->second;
        m_sessions.erase(it);
    }

    session->retire();
    session->close();
    return true;
}

std::vector<DeviceSummary> SessionRegistry::list() const {
    std::vector<std::shared_ptr<DeviceSession>> sessions;
    {
        std::lock_guard<std::mutex> guard(m_mutex);
        sessions.reserve(m_sessions.size());
        for (const auto& entry : m_sessions) {
            sessions.push_back(entry.second);
        }
    }

    std::vector<DeviceSummary> summaries;
    summaries.reserve(sessions.size());
    for (const std::shared_ptr<DeviceSession>& session : sessions) {
        DeviceSummary summary;
        summary.info = session->getInfo();
        summary.state = session->snapshot();
        summary.sessionState = session->getSessionState();
        summaries.push_back(summary);
    }
    return summaries;
}

void SessionRegistry::closeAll() {
    std::map<std::string, std::shared_ptr<DeviceSession>> sessions;
    {
        std::lock_guard<std::mutex> guard(m_mutex);
        sessions.swap(m_sessions);
    }

    for (auto& entry : sessions) {
        entry.second->retire();
        entry.second->close();
    }
    if (!sessions.empty()) {
        pranaLog("SessionRegistry: closed %u sessions\n", (unsigned int)sessions.size());
    }
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> guard(m_mutex);
    return m_sessions.size();
}
