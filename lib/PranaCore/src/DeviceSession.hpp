#pragma once

#include "DeviceState.hpp"
#include "FrameCodec.hpp"
#include "IBleTransport.hpp"
#include "PranaClock.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * DeviceSession - Managed connection to one recuperator
 *
 * This class implements:
 * - Connection lifecycle with bounded, exponentially backed-off connects
 * - Single-flight execution: one frame in flight per device, callers queue
 * - Retry policy: transport failures reconnect and resend, decode failures
 *   get one retry
 * - A cached DeviceState served without a device round trip while fresh
 *
 * State machine: Disconnected -> Connecting -> Ready <-> Busy, and any state
 * -> Disconnected on failure or close().
 *
 * Device I/O runs on the session's worker thread, which holds the execution
 * slot for the whole operation and never does I/O under m_mutex. Callers wait
 * for the slot and for their result only until their own deadline; a caller
 * that gives up gets Timeout while the worker finishes the operation and
 * updates the cache.
 */
class DeviceSession {
public:
    // Stack for the worker thread on the ESP32 (BLE client calls are stack hungry)
    static constexpr size_t WORKER_STACK_SIZE = 8192;

    enum class State {
        Disconnected,
        Connecting,
        Ready,
        Busy
    };

    // Retry, timeout and freshness policy
    struct Config {
        uint8_t connectAttempts = 3;
        uint32_t backoffBaseMs = 250;
        uint32_t backoffMaxMs = 2000;
        uint8_t commandRetries = 2;        // resends after a transport failure
        uint32_t connectTimeoutMs = 5000;
        uint32_t responseTimeoutMs = 2000;
        uint32_t waitTimeoutMs = 10000;    // default caller deadline
        uint32_t stalenessMs = 5000;
        MillisFn millis;                   // defaults to steadyMillis
        DelayFn delay;                     // defaults to steadyDelay
    };

    struct ExecuteOptions {
        uint32_t timeoutMs = 0;    // caller deadline, 0 = Config::waitTimeoutMs
        bool forceFresh = true;    // ReadState only: false allows a fresh cache hit
    };

    // Invoked with m_mutex held; must not call back into the session
    using StateCallback = std::function<void(State newState)>;

    DeviceSession(const std::string& address, IBleTransport& transport, const Config& config);
    ~DeviceSession();

    DeviceSession(const DeviceSession&) = delete;
    DeviceSession& operator=(const DeviceSession&) = delete;

    /**
     * Connect if not connected
     * @return None, ConnectionError, Timeout or SessionClosed
     */
    PranaError ensureConnected();

    /**
     * Run one command against the device
     * @param command Command to send
     * @param params Parameter bytes
     * @param options Caller deadline and freshness demand
     * @param out Output: device state after the command (cached copy)
     * @return None, Timeout, DeviceUnreachable, ProtocolError,
     *         SessionClosed or InvalidArgument
     */
    PranaError execute(PranaCommand command, const std::vector<uint8_t>& params,
                       const ExecuteOptions& options, DeviceState& out);

    /**
     * Get device state, from cache when fresh enough
     * @param forceFresh Always read from the device
     * @param out Output: device state
     */
    PranaError getState(bool forceFresh, DeviceState& out);

    /**
     * Release the connection. Safe from any state; idempotent.
     */
    void close();

    // Read-modify-write helpers; each holds the slot for the whole sequence
    PranaError setPower(bool on, DeviceState& out);
    PranaError setHeating(bool on, DeviceState& out);
    PranaError setWinterMode(bool on, DeviceState& out);
    PranaError setFlowsLocked(bool locked, DeviceState& out);
    PranaError setSpeed(uint8_t level, DeviceState& out);
    PranaError setNightMode(bool on, DeviceState& out);

    /**
     * Send the one-shot boost command
     */
    PranaError setHighSpeed(DeviceState& out);

    const std::string& getAddress() const { return m_address; }
    State getSessionState() const;
    const char* getStateString() const;
    static const char* stateToString(State state);

    /**
     * Get the cached state with connection health filled in
     */
    DeviceState snapshot() const;

    /**
     * Copy the cached state without touching the device or the slot
     * @return true if the cache is within the staleness window
     */
    bool peekState(DeviceState& out) const;

    DeviceInfo getInfo() const;
    void setInfo(const DeviceInfo& info);

    uint64_t getLastActivityMs() const;
    uint8_t getConsecutiveFailures() const;
    PranaError getLastError() const;
    bool isRetired() const;

    void setStateCallback(StateCallback callback);

    /**
     * Retire the session if it is not executing and is either idle for
     * idleThresholdMs or has failed maxFailures times in a row
     * (maxFailures 0 disables the failure check). Retired sessions refuse
     * new work with SessionClosed; the caller is expected to close() them.
     * @return true if the session was retired by this call
     */
    bool retireIfIdle(uint64_t nowMs, uint32_t idleThresholdMs, uint8_t maxFailures);

    /**
     * Retire unconditionally (explicit removal)
     */
    void retire();

private:
    using Clock = std::chrono::steady_clock;

    // One operation handed to the worker; fields other than body are guarded by m_mutex
    struct Job {
        std::function<PranaError()> body;
        bool isRead = false;
        bool done = false;
        PranaError result = PranaError::None;
        DeviceState state;
    };

    Clock::time_point deadlineFor(uint32_t timeoutMs) const;
    PranaError waitForSlotLocked(std::unique_lock<std::mutex>& lock, Clock::time_point deadline);
    PranaError runOnWorker(std::unique_lock<std::mutex>& lock, const std::function<PranaError()>& body,
                           bool isRead, Clock::time_point deadline, DeviceState& out);
    void startWorkerLocked();
    void workerLoop();
    void finishSlot(Job& job, PranaError result);
    PranaError runExclusive(const std::function<PranaError()>& body, DeviceState& out);

    // Worker thread only
    PranaError connectAsOwner();
    PranaError exchange(PranaCommand command, const std::vector<uint8_t>& params);
    PranaError roundTrip(PranaCommand command, const std::vector<uint8_t>& request, Frame& response);
    void applyResponse(const Frame& response);
    void dropConnection();
    PranaError setFlag(PranaCommand toggle, bool DeviceState::*field, bool desired, DeviceState& out);

    void recordFailure(PranaError error);
    void noteError(PranaError error);
    DeviceState currentState() const;
    uint32_t backoffDelayMs(unsigned int attempt) const;

    // m_mutex held
    void setStateLocked(State newState);
    void setState(State newState);
    void touchLocked();
    bool isCacheFreshLocked() const;
    DeviceState snapshotLocked() const;

    const std::string m_address;
    IBleTransport& m_transport;
    Config m_config;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;

    State m_state = State::Disconnected;
    StateCallback m_stateCallback;

    // Execution slot
    bool m_busy = false;
    bool m_inflightRead = false;
    uint32_t m_readGeneration = 0;
    PranaError m_lastReadError = PranaError::None;
    bool m_closeRequested = false;
    bool m_retired = false;

    // Worker thread, started on first use
    std::thread m_worker;
    std::shared_ptr<Job> m_pendingJob;
    bool m_stopWorker = false;

    // Touched only by the worker (or close() while it holds the slot)
    ScopedConnection m_connection;

    DeviceState m_deviceState;
    DeviceInfo m_info;
    uint64_t m_lastActivityMs = 0;
    uint8_t m_consecutiveFailures = 0;
    PranaError m_lastError = PranaError::None;
};
