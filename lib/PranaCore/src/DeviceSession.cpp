#include "DeviceSession.hpp"
#include "PranaLog.hpp"

#ifdef ARDUINO
#include <esp_pthread.h>
#endif

// Define static constexpr members for pre-C++17 ODR compliance
constexpr size_t DeviceSession::WORKER_STACK_SIZE;

DeviceSession::DeviceSession(const std::string& address, IBleTransport& transport, const Config& config)
    : m_address(address)
    , m_transport(transport)
    , m_config(config)
{
    if (!m_config.millis) {
        m_config.millis = steadyMillis;
    }
    if (!m_config.delay) {
        m_config.delay = steadyDelay;
    }
    if (m_config.connectAttempts == 0) {
        m_config.connectAttempts = 1;
    }
    m_info.address = address;
    m_lastActivityMs = m_config.millis();
}

DeviceSession::~DeviceSession() {
    {
        std::lock_guard<std::mutex> guard(m_mutex);
        m_stopWorker = true;
        m_stateCallback = nullptr;
    }
    m_cv.notify_all();

    // The worker finishes a pending operation before it exits
    if (m_worker.joinable()) {
        m_worker.join();
    }
    // ScopedConnection releases the link if one is still held
}

const char* DeviceSession::stateToString(State state) {
    switch (state) {
        case State::Disconnected: return "Disconnected";
        case State::Connecting: return "Connecting";
        case State::Ready: return "Ready";
        case State::Busy: return "Busy";
        default: return "Unknown";
    }
}

const char* DeviceSession::getStateString() const {
    return stateToString(getSessionState());
}

DeviceSession::State DeviceSession::getSessionState() const {
    std::lock_guard<std::mutex> guard(m_mutex);
    return m_state;
}

void DeviceSession::setStateLocked(State newState) {
    if (m_state != newState) {
        pranaLog("DeviceSession[%s]: state %s -> %s\n", m_address.c_str(),
                 stateToString(m_state), stateToString(newState));
        m_state = newState;
        if (m_stateCallback) {
            m_stateCallback(m_state);
        }
    }
}

void DeviceSession::setState(State newState) {
    std::lock_guard<std::mutex> guard(m_mutex);
    setStateLocked(newState);
}

void DeviceSession::setStateCallback(StateCallback callback) {
    std::lock_guard<std::mutex> guard(m_mutex);
    m_stateCallback = std::move(callback);
}

DeviceState DeviceSession::snapshot() const {
    std::lock_guard<std::mutex> guard(m_mutex);
    return snapshotLocked();
}

bool DeviceSession::peekState(DeviceState& out) const {
    std::lock_guard<std::mutex> guard(m_mutex);
    out = snapshotLocked();
    return isCacheFreshLocked();
}

DeviceState DeviceSession::snapshotLocked() const {
    DeviceState copy = m_deviceState;
    copy.health.connected = (m_state == State::Ready || m_state == State::Busy);
    copy.health.consecutiveFailures = m_consecutiveFailures;
    copy.health.lastError = m_lastError;
    return copy;
}

DeviceState DeviceSession::currentState() const {
    std::lock_guard<std::mutex> guard(m_mutex);
    return m_deviceState;
}

DeviceInfo DeviceSession::getInfo() const {
    std::lock_guard<std::mutex> guard(m_mutex);
    return m_info;
}

void DeviceSession::setInfo(const DeviceInfo& info) {
    std::lock_guard<std::mutex> guard(m_mutex);
    m_info = info;
    m_info.address = m_address;
}

uint64_t DeviceSession::getLastActivityMs() const {
    std::lock_guard<std::mutex> guard(m_mutex);
    return m_lastActivityMs;
}

uint8_t DeviceSession::getConsecutiveFailures() const {
    std::lock_guard<std::mutex> guard(m_mutex);
    return m_consecutiveFailures;
}

PranaError DeviceSession::getLastError() const {
    std::lock_guard<std::mutex> guard(m_mutex);
    return m_lastError;
}

bool DeviceSession::isRetired() const {
    std::lock_guard<std::mutex> guard(m_mutex);
    return m_retired;
}

void DeviceSession::touchLocked() {
    uint64_t now = m_config.millis();
    if (now > m_lastActivityMs) {
        m_lastActivityMs = now;
    }
}

bool DeviceSession::isCacheFreshLocked() const {
    if (!m_deviceState.valid) {
        return false;
    }
    uint64_t now = m_config.millis();
    uint64_t age = now >= m_deviceState.lastUpdatedMs ? now - m_deviceState.lastUpdatedMs : 0;
    return age < m_config.stalenessMs;
}

DeviceSession::Clock::time_point DeviceSession::deadlineFor(uint32_t timeoutMs) const {
    uint32_t effective = timeoutMs != 0 ? timeoutMs : m_config.waitTimeoutMs;
    return Clock::now() + std::chrono::milliseconds(effective);
}

uint32_t DeviceSession::backoffDelayMs(unsigned int attempt) const {
    uint32_t delayMs = m_config.backoffBaseMs;
    for (unsigned int i = 1; i < attempt && delayMs < m_config.backoffMaxMs; i++) {
        delayMs *= 2;
    }
    return delayMs < m_config.backoffMaxMs ? delayMs : m_config.backoffMaxMs;
}

void DeviceSession::recordFailure(PranaError error) {
    std::lock_guard<std::mutex> guard(m_mutex);
    if (m_consecutiveFailures < UINT8_MAX) {
        m_consecutiveFailures++;
    }
    m_lastError = error;
}

void DeviceSession::noteError(PranaError error) {
    std::lock_guard<std::mutex> guard(m_mutex);
    m_lastError = error;
}

PranaError DeviceSession::waitForSlotLocked(std::unique_lock<std::mutex>& lock, Clock::time_point deadline) {
    bool acquired = m_cv.wait_until(lock, deadline, [this]() { return !m_busy || m_retired; });
    if (m_retired) {
        return PranaError::SessionClosed;
    }
    if (!acquired) {
        pranaLog("DeviceSession[%s]: timed out waiting for execution slot\n", m_address.c_str());
        return PranaError::Timeout;
    }
    return PranaError::None;
}

void DeviceSession::startWorkerLocked() {
#ifdef ARDUINO
    esp_pthread_cfg_t cfg = esp_pthread_get_default_config();
    cfg.stack_size = WORKER_STACK_SIZE;
    cfg.thread_name = "prana-session";
    esp_pthread_set_cfg(&cfg);
#endif
    m_worker = std::thread(&DeviceSession::workerLoop, this);
}

void DeviceSession::workerLoop() {
    std::unique_lock<std::mutex> lock(m_mutex);
    while (true) {
        m_cv.wait(lock, [this]() { return m_pendingJob || m_stopWorker; });
        if (!m_pendingJob) {
            return;
        }
        std::shared_ptr<Job> job = m_pendingJob;
        m_pendingJob.reset();
        lock.unlock();

        PranaError result = job->body();
        finishSlot(*job, result);

        lock.lock();
    }
}

PranaError DeviceSession::runOnWorker(std::unique_lock<std::mutex>& lock,
                                      const std::function<PranaError()>& body, bool isRead,
                                      Clock::time_point deadline, DeviceState& out) {
    std::shared_ptr<Job> job = std::make_shared<Job>();
    job->body = body;
    job->isRead = isRead;

    m_busy = true;
    m_inflightRead = isRead;
    m_pendingJob = job;
    if (!m_worker.joinable()) {
        startWorkerLocked();
    }
    m_cv.notify_all();

    if (!m_cv.wait_until(lock, deadline, [&job]() { return job->done; })) {
        // The worker keeps the slot and still updates the cache
        pranaLog("DeviceSession[%s]: caller deadline passed, operation continues\n", m_address.c_str());
        return PranaError::Timeout;
    }
    out = job->state;
    return job->result;
}

void DeviceSession::finishSlot(Job& job, PranaError result) {
    bool closeNow;
    {
        std::lock_guard<std::mutex> guard(m_mutex);
        closeNow = m_closeRequested || m_retired;
    }

    if (closeNow) {
        m_connection.release();
    }

    {
        std::lock_guard<std::mutex> guard(m_mutex);
        if (closeNow) {
            m_closeRequested = false;
        }
        if (job.isRead) {
            m_lastReadError = result;
            m_readGeneration++;
        }
        m_busy = false;
        m_inflightRead = false;
        touchLocked();
        setStateLocked(m_connection.valid() ? State::Ready : State::Disconnected);
        job.result = result;
        job.state = snapshotLocked();
        job.done = true;
    }
    m_cv.notify_all();
}

PranaError DeviceSession::runExclusive(const std::function<PranaError()>& body, DeviceState& out) {
    const Clock::time_point deadline = deadlineFor(0);

    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_retired) {
        return PranaError::SessionClosed;
    }
    touchLocked();

    PranaError err = waitForSlotLocked(lock, deadline);
    if (err != PranaError::None) {
        return err;
    }
    return runOnWorker(lock, body, false, deadline, out);
}

PranaError DeviceSession::ensureConnected() {
    {
        std::lock_guard<std::mutex> guard(m_mutex);
        if (m_retired) {
            return PranaError::SessionClosed;
        }
        if (m_state == State::Ready || m_state == State::Busy) {
            return PranaError::None;
        }
    }

    DeviceState ignored;
    return runExclusive([this]() -> PranaError { return connectAsOwner(); }, ignored);
}

PranaError DeviceSession::execute(PranaCommand command, const std::vector<uint8_t>& params,
                                  const ExecuteOptions& options, DeviceState& out) {
    const bool isRead = (command == PranaCommand::ReadState);
    const Clock::time_point deadline = deadlineFor(options.timeoutMs);

    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_retired) {
        return PranaError::SessionClosed;
    }
    touchLocked();

    if (isRead && !options.forceFresh && isCacheFreshLocked()) {
        out = snapshotLocked();
        return PranaError::None;
    }

    // A read already in flight answers this one too
    if (isRead && m_busy && m_inflightRead) {
        const uint32_t generation = m_readGeneration;
        bool done = m_cv.wait_until(lock, deadline, [this, generation]() {
            return m_readGeneration != generation;
        });
        if (!done) {
            return PranaError::Timeout;
        }
        out = snapshotLocked();
        return m_lastReadError;
    }

    PranaError err = waitForSlotLocked(lock, deadline);
    if (err != PranaError::None) {
        return err;
    }

    // The previous slot owner may have refreshed the cache while we waited
    if (isRead && !options.forceFresh && isCacheFreshLocked()) {
        out = snapshotLocked();
        return PranaError::None;
    }

    return runOnWorker(lock, [this, command, params]() -> PranaError {
        return exchange(command, params);
    }, isRead, deadline, out);
}

PranaError DeviceSession::getState(bool forceFresh, DeviceState& out) {
    ExecuteOptions options;
    options.forceFresh = forceFresh;
    return execute(PranaCommand::ReadState, std::vector<uint8_t>(), options, out);
}

void DeviceSession::close() {
    std::unique_lock<std::mutex> lock(m_mutex);
    bool acquired = m_cv.wait_until(lock, deadlineFor(0), [this]() { return !m_busy; });
    if (!acquired) {
        // The slot owner releases the link when it finishes
        m_closeRequested = true;
        pranaLog("DeviceSession[%s]: close deferred until current command completes\n",
                 m_address.c_str());
        return;
    }
    m_busy = true;
    m_inflightRead = false;
    lock.unlock();

    m_connection.release();

    lock.lock();
    m_closeRequested = false;
    m_busy = false;
    setStateLocked(State::Disconnected);
    lock.unlock();
    m_cv.notify_all();
}

bool DeviceSession::retireIfIdle(uint64_t nowMs, uint32_t idleThresholdMs, uint8_t maxFailures) {
    std::lock_guard<std::mutex> guard(m_mutex);
    if (m_busy || m_retired) {
        return false;
    }

    bool idle = nowMs >= m_lastActivityMs && (nowMs - m_lastActivityMs) >= idleThresholdMs;
    bool failed = maxFailures > 0 && m_consecutiveFailures >= maxFailures;
    if (!idle && !failed) {
        return false;
    }

    pranaLog("DeviceSession[%s]: retiring (%s)\n", m_address.c_str(), idle ? "idle" : "failing");
    m_retired = true;
    m_cv.notify_all();
    return true;
}

void DeviceSession::retire() {
    {
        std::lock_guard<std::mutex> guard(m_mutex);
        m_retired = true;
    }
    m_cv.notify_all();
}

PranaError DeviceSession::connectAsOwner() {
    if (m_connection.valid()) {
        return PranaError::None;
    }

    setState(State::Connecting);

    PranaError err = PranaError::ConnectionError;
    for (unsigned int attempt = 1; attempt <= m_config.connectAttempts; attempt++) {
        ConnectionHandle handle = INVALID_CONNECTION;
        err = m_transport.connect(m_address, m_config.connectTimeoutMs, handle);
        if (err == PranaError::None && handle != INVALID_CONNECTION) {
            m_connection = ScopedConnection(m_transport, handle);
            pranaLog("DeviceSession[%s]: connected on attempt %u\n", m_address.c_str(), attempt);
            setState(State::Ready);
            return PranaError::None;
        }

        pranaLog("DeviceSession[%s]: connect attempt %u/%u failed (%s)\n", m_address.c_str(),
                 attempt, (unsigned int)m_config.connectAttempts, errorToString(err));
        if (attempt < m_config.connectAttempts) {
            m_config.delay(backoffDelayMs(attempt));
        }
    }

    recordFailure(PranaError::ConnectionError);
    setState(State::Disconnected);
    return PranaError::ConnectionError;
}

void DeviceSession::dropConnection() {
    m_connection.release();
    setState(State::Disconnected);
}

PranaError DeviceSession::roundTrip(PranaCommand command, const std::vector<uint8_t>& request,
                                    Frame& response) {
    setState(State::Busy);

    PranaError err = m_transport.write(m_connection.handle(), request.data(), request.size());
    if (err != PranaError::None) {
        return err;
    }

    std::vector<uint8_t> reply;
    err = m_transport.awaitNotification(m_connection.handle(), m_config.responseTimeoutMs, reply);
    if (err != PranaError::None) {
        return err;
    }

    err = FrameCodec::decode(reply.data(), reply.size(), response);
    if (err != PranaError::None) {
        pranaLog("DeviceSession[%s]: bad frame for %s (%s, %u bytes)\n", m_address.c_str(),
                 FrameCodec::commandName(command), errorToString(err), (unsigned int)reply.size());
        return err;
    }

    if (!FrameCodec::matches(command, response)) {
        pranaLog("DeviceSession[%s]: expected echo of %s, got %02X/%02X\n", m_address.c_str(),
                 FrameCodec::commandName(command), response.kind, response.code);
        return PranaError::UnexpectedCommand;
    }
    return PranaError::None;
}

void DeviceSession::applyResponse(const Frame& response) {
    std::lock_guard<std::mutex> guard(m_mutex);
    m_consecutiveFailures = 0;
    m_lastError = PranaError::None;

    DeviceState decoded = m_deviceState;
    if (DeviceState::fromFrame(response, decoded)) {
        uint64_t now = m_config.millis();
        if (now > decoded.lastUpdatedMs) {
            decoded.lastUpdatedMs = now;
        }
        m_deviceState = decoded;
    }
}

PranaError DeviceSession::exchange(PranaCommand command, const std::vector<uint8_t>& params) {
    // Queries carry zero padding on the wire
    std::vector<uint8_t> wireParams = params;
    if (wireParams.empty() && FrameCodec::isQuery(command)) {
        wireParams.assign(FrameCodec::QUERY_PARAM_SIZE, 0x00);
    }

    std::vector<uint8_t> request;
    PranaError err = FrameCodec::encode(command, wireParams, request);
    if (err != PranaError::None) {
        return err;
    }

    uint8_t transportRetries = 0;
    uint8_t decodeRetries = 0;
    while (true) {
        // connectAsOwner already spent its own retry budget
        if (connectAsOwner() != PranaError::None) {
            return PranaError::DeviceUnreachable;
        }

        Frame response;
        err = roundTrip(command, request, response);
        if (err == PranaError::None) {
            applyResponse(response);
            return PranaError::None;
        }

        if (isTransportFailure(err)) {
            recordFailure(err);
            dropConnection();
            if (transportRetries >= m_config.commandRetries) {
                pranaLog("DeviceSession[%s]: %s failed after %d retries\n", m_address.c_str(),
                         FrameCodec::commandName(command), transportRetries);
                return PranaError::DeviceUnreachable;
            }
            transportRetries++;
            m_config.delay(backoffDelayMs(transportRetries));
            continue;
        }

        if (isDecodeFailure(err)) {
            noteError(err);
            if (decodeRetries >= 1) {
                return PranaError::ProtocolError;
            }
            decodeRetries++;
            continue;
        }

        noteError(err);
        return err;
    }
}

PranaError DeviceSession::setFlag(PranaCommand toggle, bool DeviceState::*field, bool desired,
                                  DeviceState& out) {
    return runExclusive([this, toggle, field, desired]() -> PranaError {
        PranaError err = exchange(PranaCommand::ReadState, std::vector<uint8_t>());
        if (err != PranaError::None) {
            return err;
        }
        if (currentState().*field == desired) {
            return PranaError::None;
        }

        err = exchange(toggle, std::vector<uint8_t>());
        if (err != PranaError::None) {
            return err;
        }
        if (currentState().*field != desired) {
            pranaLog("DeviceSession[%s]: %s did not take effect\n", m_address.c_str(),
                     FrameCodec::commandName(toggle));
            return PranaError::ProtocolError;
        }
        return PranaError::None;
    }, out);
}

PranaError DeviceSession::setPower(bool on, DeviceState& out) {
    return setFlag(PranaCommand::Power, &DeviceState::powerOn, on, out);
}

PranaError DeviceSession::setHeating(bool on, DeviceState& out) {
    return setFlag(PranaCommand::Heating, &DeviceState::heatingOn, on, out);
}

PranaError DeviceSession::setWinterMode(bool on, DeviceState& out) {
    return setFlag(PranaCommand::WinterMode, &DeviceState::winterMode, on, out);
}

PranaError DeviceSession::setFlowsLocked(bool locked, DeviceState& out) {
    return setFlag(PranaCommand::FlowLock, &DeviceState::flowsLocked, locked, out);
}

PranaError DeviceSession::setSpeed(uint8_t level, DeviceState& out) {
    if (level > DeviceState::MAX_SPEED) {
        return PranaError::InvalidArgument;
    }

    return runExclusive([this, level]() -> PranaError {
        PranaError err = exchange(PranaCommand::ReadState, std::vector<uint8_t>());
        if (err != PranaError::None) {
            return err;
        }

        // Each step moves one level; twice the range covers any overshoot
        uint8_t current = currentState().speed;
        for (int steps = 0; current != level; steps++) {
            if (steps >= 2 * DeviceState::MAX_SPEED) {
                return PranaError::ProtocolError;
            }
            PranaCommand step = current < level ? PranaCommand::SpeedUp : PranaCommand::SpeedDown;
            err = exchange(step, std::vector<uint8_t>());
            if (err != PranaError::None) {
                return err;
            }

            uint8_t reported = currentState().speed;
            if (reported == current) {
                pranaLog("DeviceSession[%s]: speed stuck at %d (target %d)\n", m_address.c_str(),
                         current, level);
                return PranaError::ProtocolError;
            }
            current = reported;
        }
        return PranaError::None;
    }, out);
}

PranaError DeviceSession::setNightMode(bool on, DeviceState& out) {
    return runExclusive([this, on]() -> PranaError {
        PranaError err = exchange(PranaCommand::ReadState, std::vector<uint8_t>());
        if (err != PranaError::None) {
            return err;
        }
        if ((currentState().mode == OperatingMode::Night) == on) {
            return PranaError::None;
        }

        err = exchange(PranaCommand::NightMode, std::vector<uint8_t>());
        if (err != PranaError::None) {
            return err;
        }
        if ((currentState().mode == OperatingMode::Night) != on) {
            pranaLog("DeviceSession[%s]: night mode did not take effect\n", m_address.c_str());
            return PranaError::ProtocolError;
        }
        return PranaError::None;
    }, out);
}

PranaError DeviceSession::setHighSpeed(DeviceState& out) {
    return runExclusive([this]() -> PranaError {
        return exchange(PranaCommand::HighSpeed, std::vector<uint8_t>());
    }, out);
}
