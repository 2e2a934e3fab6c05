#include <unity.h>

#include "DeviceSession.hpp"
#include "FakeBleTransport.hpp"

#include <chrono>
#include <memory>
#include <thread>
#include <vector>

extern "C" void setUp(void) {}
extern "C" void tearDown(void) {}

namespace {

const char* ADDRESS = "AA:BB:CC:DD:EE:01";

struct Fixture {
    FakeBleTransport transport;
    FakeClock clock;
    std::vector<uint32_t> backoffs;
    DeviceSession::Config config;

    Fixture() {
        config.millis = clock.fn();
        config.delay = [this](uint32_t ms) { backoffs.push_back(ms); };
    }

    std::unique_ptr<DeviceSession> makeSession() {
        return std::unique_ptr<DeviceSession>(new DeviceSession(ADDRESS, transport, config));
    }
};

PranaError run(DeviceSession& session, PranaCommand command, DeviceState& out, uint32_t timeoutMs = 0) {
    DeviceSession::ExecuteOptions options;
    options.timeoutMs = timeoutMs;
    return session.execute(command, std::vector<uint8_t>(), options, out);
}

void pause(uint32_t ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

}  // namespace

static void test_execute_connects_and_caches_state() {
    Fixture fx;
    std::unique_ptr<DeviceSession> session = fx.makeSession();
    TEST_ASSERT_TRUE(session->getSessionState() == DeviceSession::State::Disconnected);
    TEST_ASSERT_EQUAL_INT(0, fx.transport.connectCount());

    DeviceState state;
    assertError(PranaError::None, run(*session, PranaCommand::SpeedUp, state));
    TEST_ASSERT_EQUAL_UINT8(4, state.speed);
    TEST_ASSERT_TRUE(state.valid);
    TEST_ASSERT_TRUE(state.health.connected);
    TEST_ASSERT_EQUAL_INT(1, fx.transport.connectCount());
    TEST_ASSERT_TRUE(session->getSessionState() == DeviceSession::State::Ready);
    TEST_ASSERT_EQUAL_UINT8(4, session->snapshot().speed);
}

static void test_ensure_connected_is_idempotent() {
    Fixture fx;
    std::unique_ptr<DeviceSession> session = fx.makeSession();

    assertError(PranaError::None, session->ensureConnected());
    assertError(PranaError::None, session->ensureConnected());
    TEST_ASSERT_EQUAL_INT(1, fx.transport.connectCount());
    TEST_ASSERT_EQUAL_INT(0, fx.transport.writeCount());
}

static void test_cached_state_served_within_staleness() {
    Fixture fx;
    fx.config.stalenessMs = 5000;
    std::unique_ptr<DeviceSession> session = fx.makeSession();

    DeviceState state;
    assertError(PranaError::None, session->getState(false, state));
    TEST_ASSERT_EQUAL_INT(1, fx.transport.writeCount());

    assertError(PranaError::None, session->getState(false, state));
    fx.clock.advance(4999);
    assertError(PranaError::None, session->getState(false, state));
    TEST_ASSERT_EQUAL_INT(1, fx.transport.writeCount());

    fx.clock.advance(1);
    assertError(PranaError::None, session->getState(false, state));
    TEST_ASSERT_EQUAL_INT(2, fx.transport.writeCount());

    // forceFresh always goes to the device
    assertError(PranaError::None, session->getState(true, state));
    TEST_ASSERT_EQUAL_INT(3, fx.transport.writeCount());
}

static void test_concurrent_reads_share_one_round_trip() {
    Fixture fx;
    fx.transport.setExchangeDelayMs(300);
    std::unique_ptr<DeviceSession> session = fx.makeSession();

    DeviceState first;
    DeviceState second;
    PranaError firstErr = PranaError::Timeout;
    PranaError secondErr = PranaError::Timeout;

    std::thread a([&]() { firstErr = session->getState(true, first); });
    pause(80);
    std::thread b([&]() { secondErr = session->getState(true, second); });
    a.join();
    b.join();

    assertError(PranaError::None, firstErr);
    assertError(PranaError::None, secondErr);
    TEST_ASSERT_EQUAL_INT(1, fx.transport.writeCount(PranaCommand::ReadState));
    TEST_ASSERT_EQUAL_UINT8(first.speed, second.speed);
    TEST_ASSERT_EQUAL_UINT64(first.lastUpdatedMs, second.lastUpdatedMs);
}

static void test_single_flight_under_contention() {
    Fixture fx;
    fx.transport.setExchangeDelayMs(5);
    std::unique_ptr<DeviceSession> session = fx.makeSession();

    const int threadCount = 4;
    const int perThread = 5;
    std::vector<int> failures(threadCount, 0);
    std::vector<std::thread> threads;
    for (int t = 0; t < threadCount; t++) {
        threads.push_back(std::thread([&, t]() {
            for (int i = 0; i < perThread; i++) {
                DeviceState state;
                PranaCommand command = (i % 2 == 0) ? PranaCommand::SpeedUp : PranaCommand::SpeedDown;
                if (run(*session, command, state) != PranaError::None) {
                    failures[t]++;
                }
            }
        }));
    }
    for (std::thread& thread : threads) {
        thread.join();
    }

    for (int t = 0; t < threadCount; t++) {
        TEST_ASSERT_EQUAL_INT(0, failures[t]);
    }
    TEST_ASSERT_FALSE(fx.transport.overlapDetected());
    TEST_ASSERT_EQUAL_INT(1, fx.transport.maxParallelExchanges());
    TEST_ASSERT_EQUAL_INT(threadCount * perThread, fx.transport.writeCount());
    TEST_ASSERT_EQUAL_INT(1, fx.transport.connectCount());
}

static void test_connect_budget_exhausted_is_unreachable() {
    Fixture fx;
    fx.transport.failConnects(-1);
    std::unique_ptr<DeviceSession> session = fx.makeSession();

    std::vector<DeviceSession::State> seen;
    session->setStateCallback([&seen](DeviceSession::State state) { seen.push_back(state); });

    DeviceState state;
    assertError(PranaError::DeviceUnreachable, run(*session, PranaCommand::ReadState, state));
    TEST_ASSERT_EQUAL_INT(3, fx.transport.connectCount());
    TEST_ASSERT_EQUAL_INT(0, fx.transport.writeCount());

    // exponential backoff between the three attempts
    TEST_ASSERT_EQUAL_UINT32(2, fx.backoffs.size());
    TEST_ASSERT_EQUAL_UINT32(250, fx.backoffs[0]);
    TEST_ASSERT_EQUAL_UINT32(500, fx.backoffs[1]);

    for (DeviceSession::State s : seen) {
        TEST_ASSERT_TRUE(s != DeviceSession::State::Ready);
    }
    TEST_ASSERT_TRUE(session->getSessionState() == DeviceSession::State::Disconnected);
    TEST_ASSERT_EQUAL_UINT8(1, session->getConsecutiveFailures());
    TEST_ASSERT_FALSE(state.health.connected);
}

static void test_ensure_connected_reports_connection_error() {
    Fixture fx;
    fx.transport.failConnects(-1);
    std::unique_ptr<DeviceSession> session = fx.makeSession();

    assertError(PranaError::ConnectionError, session->ensureConnected());
    TEST_ASSERT_EQUAL_INT(3, fx.transport.connectCount());
}

static void test_connect_recovers_within_budget() {
    Fixture fx;
    fx.transport.failConnects(2);
    std::unique_ptr<DeviceSession> session = fx.makeSession();

    DeviceState state;
    assertError(PranaError::None, run(*session, PranaCommand::ReadState, state));
    TEST_ASSERT_EQUAL_INT(3, fx.transport.connectCount());
    TEST_ASSERT_EQUAL_UINT8(0, session->getConsecutiveFailures());
}

static void test_largest_connect_budget_terminates() {
    Fixture fx;
    fx.config.connectAttempts = 255;
    fx.transport.failConnects(-1);
    std::unique_ptr<DeviceSession> session = fx.makeSession();

    assertError(PranaError::ConnectionError, session->ensureConnected());
    TEST_ASSERT_EQUAL_INT(255, fx.transport.connectCount());
    TEST_ASSERT_EQUAL_UINT32(254, fx.backoffs.size());
    TEST_ASSERT_EQUAL_UINT32(2000, fx.backoffs.back());
}

static void test_transport_timeout_reconnects_and_resends() {
    Fixture fx;
    fx.transport.timeoutReplies(1);
    std::unique_ptr<DeviceSession> session = fx.makeSession();

    DeviceState state;
    assertError(PranaError::None, run(*session, PranaCommand::ReadState, state));
    TEST_ASSERT_EQUAL_INT(2, fx.transport.writeCount());
    TEST_ASSERT_EQUAL_INT(2, fx.transport.connectCount());
    TEST_ASSERT_EQUAL_INT(1, fx.transport.disconnectCount());
    TEST_ASSERT_EQUAL_UINT32(1, fx.backoffs.size());
    TEST_ASSERT_EQUAL_UINT8(0, session->getConsecutiveFailures());
    assertError(PranaError::None, session->getLastError());
}

static void test_refused_write_reconnects_and_resends() {
    Fixture fx;
    fx.transport.failWrites(1);
    std::unique_ptr<DeviceSession> session = fx.makeSession();

    DeviceState state;
    assertError(PranaError::None, run(*session, PranaCommand::SpeedUp, state));
    TEST_ASSERT_EQUAL_INT(2, fx.transport.writeCount());
    TEST_ASSERT_EQUAL_INT(1, fx.transport.writeCount(PranaCommand::SpeedUp));
    TEST_ASSERT_EQUAL_INT(2, fx.transport.connectCount());
    TEST_ASSERT_EQUAL_INT(1, fx.transport.disconnectCount());
    TEST_ASSERT_EQUAL_UINT8(0, session->getConsecutiveFailures());
}

static void test_persistent_timeouts_surface_unreachable() {
    Fixture fx;
    fx.config.commandRetries = 2;
    fx.transport.timeoutReplies(100);
    std::unique_ptr<DeviceSession> session = fx.makeSession();

    DeviceState state;
    assertError(PranaError::DeviceUnreachable, run(*session, PranaCommand::ReadState, state));
    TEST_ASSERT_EQUAL_INT(3, fx.transport.writeCount());
    TEST_ASSERT_EQUAL_UINT8(3, session->getConsecutiveFailures());
    TEST_ASSERT_TRUE(session->getSessionState() == DeviceSession::State::Disconnected);
    TEST_ASSERT_EQUAL_INT(0, fx.transport.openLinks());
}

static void test_corrupt_reply_retried_once() {
    Fixture fx;
    fx.transport.corruptReplies(1);
    std::unique_ptr<DeviceSession> session = fx.makeSession();

    DeviceState state;
    assertError(PranaError::None, run(*session, PranaCommand::ReadState, state));
    TEST_ASSERT_EQUAL_INT(2, fx.transport.writeCount());
    TEST_ASSERT_EQUAL_INT(1, fx.transport.connectCount());
    TEST_ASSERT_TRUE(state.valid);
}

static void test_repeated_corruption_is_protocol_error() {
    Fixture fx;
    fx.transport.corruptReplies(2);
    std::unique_ptr<DeviceSession> session = fx.makeSession();

    DeviceState state;
    assertError(PranaError::ProtocolError, run(*session, PranaCommand::ReadState, state));
    TEST_ASSERT_EQUAL_INT(2, fx.transport.writeCount());
    // the link itself is fine
    TEST_ASSERT_TRUE(session->getSessionState() == DeviceSession::State::Ready);
}

static void test_mismatched_echo_is_protocol_error() {
    Fixture fx;
    fx.transport.mismatchReplies(2);
    std::unique_ptr<DeviceSession> session = fx.makeSession();

    DeviceState state;
    assertError(PranaError::ProtocolError, run(*session, PranaCommand::ReadState, state));
    TEST_ASSERT_FALSE(session->snapshot().valid);
}

static void test_slot_wait_times_out() {
    Fixture fx;
    fx.transport.setExchangeDelayMs(500);
    std::unique_ptr<DeviceSession> session = fx.makeSession();

    PranaError slowErr = PranaError::Timeout;
    std::thread slow([&]() {
        DeviceState state;
        slowErr = run(*session, PranaCommand::SpeedUp, state, 5000);
    });
    pause(100);

    DeviceState state;
    assertError(PranaError::Timeout, run(*session, PranaCommand::ReadState, state, 100));
    slow.join();

    assertError(PranaError::None, slowErr);
    TEST_ASSERT_EQUAL_INT(1, fx.transport.writeCount());
}

static void test_caller_deadline_bounds_the_wait() {
    Fixture fx;
    fx.transport.setExchangeDelayMs(2000);
    std::unique_ptr<DeviceSession> session = fx.makeSession();

    std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
    DeviceState state;
    assertError(PranaError::Timeout, run(*session, PranaCommand::SpeedUp, state, 100));
    long long waitedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    TEST_ASSERT_TRUE(waitedMs < 1000);
    // the command is still in flight and keeps the slot
    TEST_ASSERT_TRUE(session->getSessionState() == DeviceSession::State::Busy);
    TEST_ASSERT_FALSE(session->retireIfIdle(fx.clock.now() + 1000000, 1000, 0));
}

static void test_late_result_still_updates_cache() {
    Fixture fx;
    fx.transport.setExchangeDelayMs(300);
    std::unique_ptr<DeviceSession> session = fx.makeSession();

    DeviceState state;
    assertError(PranaError::Timeout, run(*session, PranaCommand::SpeedUp, state, 100));
    TEST_ASSERT_FALSE(session->snapshot().valid);

    pause(500);
    DeviceState cached = session->snapshot();
    TEST_ASSERT_TRUE(cached.valid);
    TEST_ASSERT_EQUAL_UINT8(4, cached.speed);
    TEST_ASSERT_TRUE(session->getSessionState() == DeviceSession::State::Ready);

    // the next caller is served normally
    assertError(PranaError::None, run(*session, PranaCommand::SpeedUp, state, 1000));
    TEST_ASSERT_EQUAL_UINT8(5, state.speed);
    TEST_ASSERT_FALSE(fx.transport.overlapDetected());
}

static void test_queries_carry_zero_padding() {
    Fixture fx;
    std::unique_ptr<DeviceSession> session = fx.makeSession();

    DeviceState state;
    assertError(PranaError::None, session->getState(true, state));
    std::vector<uint8_t> sent = fx.transport.lastPayload(PranaCommand::ReadState);
    TEST_ASSERT_EQUAL_UINT32(FrameCodec::QUERY_PARAM_SIZE, sent.size());
    TEST_ASSERT_TRUE(sent == std::vector<uint8_t>(FrameCodec::QUERY_PARAM_SIZE, 0x00));

    // control commands go out bare
    assertError(PranaError::None, run(*session, PranaCommand::Power, state));
    TEST_ASSERT_EQUAL_UINT32(0, fx.transport.lastPayload(PranaCommand::Power).size());
}

static void test_peek_state_never_touches_device() {
    Fixture fx;
    std::unique_ptr<DeviceSession> session = fx.makeSession();

    DeviceState state;
    TEST_ASSERT_FALSE(session->peekState(state));
    TEST_ASSERT_FALSE(state.valid);

    assertError(PranaError::None, session->getState(true, state));
    TEST_ASSERT_TRUE(session->peekState(state));
    TEST_ASSERT_TRUE(state.valid);

    fx.clock.advance(fx.config.stalenessMs);
    TEST_ASSERT_FALSE(session->peekState(state));
    TEST_ASSERT_TRUE(state.valid);
    TEST_ASSERT_EQUAL_INT(1, fx.transport.writeCount());
}

static void test_last_updated_never_goes_backwards() {
    Fixture fx;
    fx.clock.set(5000);
    std::unique_ptr<DeviceSession> session = fx.makeSession();

    DeviceState state;
    assertError(PranaError::None, session->getState(true, state));
    TEST_ASSERT_EQUAL_UINT64(5000, state.lastUpdatedMs);

    fx.clock.set(4000);
    assertError(PranaError::None, session->getState(true, state));
    TEST_ASSERT_EQUAL_UINT64(5000, state.lastUpdatedMs);

    fx.clock.set(7000);
    assertError(PranaError::None, session->getState(true, state));
    TEST_ASSERT_EQUAL_UINT64(7000, state.lastUpdatedMs);
}

static void test_setters_skip_redundant_toggles() {
    Fixture fx;
    SimDevice dev;
    dev.powerOn = true;
    dev.heatingOn = false;
    fx.transport.setDevice(dev);
    std::unique_ptr<DeviceSession> session = fx.makeSession();

    DeviceState state;
    assertError(PranaError::None, session->setPower(true, state));
    TEST_ASSERT_EQUAL_INT(0, fx.transport.writeCount(PranaCommand::Power));
    TEST_ASSERT_EQUAL_INT(1, fx.transport.writeCount(PranaCommand::ReadState));

    assertError(PranaError::None, session->setPower(false, state));
    TEST_ASSERT_EQUAL_INT(1, fx.transport.writeCount(PranaCommand::Power));
    TEST_ASSERT_FALSE(state.powerOn);
    TEST_ASSERT_FALSE(fx.transport.getDevice().powerOn);

    assertError(PranaError::None, session->setHeating(true, state));
    assertError(PranaError::None, session->setWinterMode(true, state));
    assertError(PranaError::None, session->setFlowsLocked(false, state));
    TEST_ASSERT_TRUE(state.heatingOn);
    TEST_ASSERT_TRUE(state.winterMode);
    TEST_ASSERT_FALSE(state.flowsLocked);

    assertError(PranaError::None, session->setNightMode(true, state));
    TEST_ASSERT_TRUE(state.mode == OperatingMode::Night);
    assertError(PranaError::None, session->setNightMode(true, state));
    TEST_ASSERT_EQUAL_INT(1, fx.transport.writeCount(PranaCommand::NightMode));
}

static void test_set_speed_steps_to_target() {
    Fixture fx;
    std::unique_ptr<DeviceSession> session = fx.makeSession();

    DeviceState state;
    assertError(PranaError::None, session->setSpeed(6, state));
    TEST_ASSERT_EQUAL_UINT8(6, state.speed);
    TEST_ASSERT_EQUAL_INT(3, fx.transport.writeCount(PranaCommand::SpeedUp));

    assertError(PranaError::None, session->setSpeed(2, state));
    TEST_ASSERT_EQUAL_UINT8(2, state.speed);
    TEST_ASSERT_EQUAL_INT(4, fx.transport.writeCount(PranaCommand::SpeedDown));

    int writes = fx.transport.writeCount();
    assertError(PranaError::InvalidArgument, session->setSpeed(DeviceState::MAX_SPEED + 1, state));
    TEST_ASSERT_EQUAL_INT(writes, fx.transport.writeCount());

    assertError(PranaError::None, session->setHighSpeed(state));
    TEST_ASSERT_EQUAL_UINT8(10, state.speed);
}

static void test_set_speed_gives_up_on_stuck_device() {
    Fixture fx;
    SimDevice dev;
    dev.speedStuck = true;
    fx.transport.setDevice(dev);
    std::unique_ptr<DeviceSession> session = fx.makeSession();

    DeviceState state;
    assertError(PranaError::ProtocolError, session->setSpeed(5, state));
    TEST_ASSERT_EQUAL_INT(1, fx.transport.writeCount(PranaCommand::SpeedUp));
}

static void test_close_is_idempotent() {
    Fixture fx;
    std::unique_ptr<DeviceSession> session = fx.makeSession();

    session->close();
    TEST_ASSERT_EQUAL_INT(0, fx.transport.disconnectCount());

    DeviceState state;
    assertError(PranaError::None, run(*session, PranaCommand::ReadState, state));
    session->close();
    session->close();
    TEST_ASSERT_EQUAL_INT(1, fx.transport.disconnectCount());
    TEST_ASSERT_TRUE(session->getSessionState() == DeviceSession::State::Disconnected);

    // the cache survives and the next command reconnects
    TEST_ASSERT_TRUE(session->snapshot().valid);
    assertError(PranaError::None, run(*session, PranaCommand::ReadState, state));
    TEST_ASSERT_EQUAL_INT(2, fx.transport.connectCount());
}

static void test_close_waits_for_command_in_flight() {
    Fixture fx;
    fx.transport.setExchangeDelayMs(300);
    std::unique_ptr<DeviceSession> session = fx.makeSession();

    PranaError err = PranaError::Timeout;
    std::thread worker([&]() {
        DeviceState state;
        err = run(*session, PranaCommand::SpeedUp, state);
    });
    pause(100);
    session->close();
    worker.join();

    assertError(PranaError::None, err);
    TEST_ASSERT_FALSE(fx.transport.overlapDetected());
    TEST_ASSERT_EQUAL_INT(0, fx.transport.openLinks());
    TEST_ASSERT_TRUE(session->getSessionState() == DeviceSession::State::Disconnected);
}

static void test_retired_session_refuses_work() {
    Fixture fx;
    std::unique_ptr<DeviceSession> session = fx.makeSession();
    session->retire();

    DeviceState state;
    assertError(PranaError::SessionClosed, run(*session, PranaCommand::ReadState, state));
    assertError(PranaError::SessionClosed, session->ensureConnected());
    assertError(PranaError::SessionClosed, session->setPower(true, state));
    TEST_ASSERT_EQUAL_INT(0, fx.transport.connectCount());
}

static void test_retire_if_idle() {
    Fixture fx;
    std::unique_ptr<DeviceSession> session = fx.makeSession();

    TEST_ASSERT_FALSE(session->retireIfIdle(fx.clock.now() + 999, 1000, 0));
    TEST_ASSERT_TRUE(session->retireIfIdle(fx.clock.now() + 1000, 1000, 0));
    TEST_ASSERT_TRUE(session->isRetired());
    // already retired
    TEST_ASSERT_FALSE(session->retireIfIdle(fx.clock.now() + 5000, 1000, 0));
}

int main() {
    UNITY_BEGIN();
    RUN_TEST(test_execute_connects_and_caches_state);
    RUN_TEST(test_ensure_connected_is_idempotent);
    RUN_TEST(test_cached_state_served_within_staleness);
    RUN_TEST(test_concurrent_reads_share_one_round_trip);
    RUN_TEST(test_single_flight_under_contention);
    RUN_TEST(test_connect_budget_exhausted_is_unreachable);
    RUN_TEST(test_ensure_connected_reports_connection_error);
    RUN_TEST(test_connect_recovers_within_budget);
    RUN_TEST(test_largest_connect_budget_terminates);
    RUN_TEST(test_transport_timeout_reconnects_and_resends);
    RUN_TEST(test_refused_write_reconnects_and_resends);
    RUN_TEST(test_persistent_timeouts_surface_unreachable);
    RUN_TEST(test_corrupt_reply_retried_once);
    RUN_TEST(test_repeated_corruption_is_protocol_error);
    RUN_TEST(test_mismatched_echo_is_protocol_error);
    RUN_TEST(test_slot_wait_times_out);
    RUN_TEST(test_caller_deadline_bounds_the_wait);
    RUN_TEST(test_late_result_still_updates_cache);
    RUN_TEST(test_queries_carry_zero_padding);
    RUN_TEST(test_peek_state_never_touches_device);
    RUN_TEST(test_last_updated_never_goes_backwards);
    RUN_TEST(test_setters_skip_redundant_toggles);
    RUN_TEST(test_set_speed_steps_to_target);
    RUN_TEST(test_set_speed_gives_up_on_stuck_device);
    RUN_TEST(test_close_is_idempotent);
    RUN_TEST(test_close_waits_for_command_in_flight);
    RUN_TEST(test_retired_session_refuses_work);
    RUN_TEST(test_retire_if_idle);
    return UNITY_END();
}
