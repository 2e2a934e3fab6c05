#include <unity.h>

#include "FakeBleTransport.hpp"
#include "SessionRegistry.hpp"

#include <memory>
#include <thread>
#include <vector>

extern "C" void setUp(void) {}
extern "C" void tearDown(void) {}

namespace {

const char* ADDRESS = "AA:BB:CC:DD:EE:01";
const char* OTHER_ADDRESS = "AA:BB:CC:DD:EE:02";

struct Fixture {
    FakeBleTransport transport;
    FakeClock clock;
    SessionRegistry::Config config;

    Fixture() {
        config.session.millis = clock.fn();
        config.session.delay = [](uint32_t) {};
        config.idleTimeoutMs = 120000;
        config.maxConsecutiveFailures = 5;
    }
};

PranaError readState(DeviceSession& session, DeviceState& out) {
    DeviceSession::ExecuteOptions options;
    return session.execute(PranaCommand::ReadState, std::vector<uint8_t>(), options, out);
}

}  // namespace

static void test_get_creates_each_session_once() {
    Fixture fx;
    SessionRegistry registry(fx.transport, fx.config);

    const int threadCount = 8;
    std::vector<std::shared_ptr<DeviceSession>> sessions(threadCount);
    std::vector<std::thread> threads;
    for (int t = 0; t < threadCount; t++) {
        threads.push_back(std::thread([&, t]() {
            // mixed case must land on the same session
            sessions[t] = registry.get(t % 2 == 0 ? "aa:bb:cc:dd:ee:01" : ADDRESS);
        }));
    }
    for (std::thread& thread : threads) {
        thread.join();
    }

    TEST_ASSERT_EQUAL_UINT32(1, registry.size());
    for (int t = 0; t < threadCount; t++) {
        TEST_ASSERT_NOT_NULL(sessions[t].get());
        TEST_ASSERT_EQUAL_PTR(sessions[0].get(), sessions[t].get());
    }
    TEST_ASSERT_EQUAL_STRING(ADDRESS, sessions[0]->getAddress().c_str());
    // creation never connects
    TEST_ASSERT_EQUAL_INT(0, fx.transport.connectCount());
}

static void test_malformed_address_rejected() {
    Fixture fx;
    SessionRegistry registry(fx.transport, fx.config);

    TEST_ASSERT_NULL(registry.get("not-an-address").get());
    TEST_ASSERT_NULL(registry.get("AA:BB:CC:DD:EE").get());
    TEST_ASSERT_NULL(registry.get("AA-BB-CC-DD-EE-01").get());
    TEST_ASSERT_NULL(registry.get("GG:BB:CC:DD:EE:01").get());
    TEST_ASSERT_EQUAL_UINT32(0, registry.size());

    TEST_ASSERT_TRUE(SessionRegistry::isValidAddress("aa:bb:cc:dd:ee:0f"));
    TEST_ASSERT_EQUAL_STRING("AA:BB:CC:DD:EE:0F", SessionRegistry::normalizeAddress("aa:bb:cc:dd:ee:0f").c_str());
}

static void test_find_does_not_create() {
    Fixture fx;
    SessionRegistry registry(fx.transport, fx.config);

    TEST_ASSERT_NULL(registry.find(ADDRESS).get());
    std::shared_ptr<DeviceSession> created = registry.get(ADDRESS);
    TEST_ASSERT_EQUAL_PTR(created.get(), registry.find("aa:bb:cc:dd:ee:01").get());
    TEST_ASSERT_EQUAL_UINT32(1, registry.size());
}

static void test_idle_session_evicted_and_recreated() {
    Fixture fx;
    SessionRegistry registry(fx.transport, fx.config);

    std::shared_ptr<DeviceSession> first = registry.get(ADDRESS);
    DeviceState state;
    assertError(PranaError::None, readState(*first, state));
    TEST_ASSERT_EQUAL_INT(1, fx.transport.connectCount());

    fx.clock.advance(119999);
    TEST_ASSERT_EQUAL_UINT32(0, registry.evictIdle(120000));

    fx.clock.advance(1);
    TEST_ASSERT_EQUAL_UINT32(1, registry.evictIdle(120000));
    TEST_ASSERT_EQUAL_UINT32(0, registry.size());
    TEST_ASSERT_TRUE(first->isRetired());
    TEST_ASSERT_EQUAL_INT(1, fx.transport.disconnectCount());
    TEST_ASSERT_EQUAL_INT(0, fx.transport.openLinks());

    // an old holder is refused, a fresh lookup gets a new session
    assertError(PranaError::SessionClosed, readState(*first, state));

    std::shared_ptr<DeviceSession> second = registry.get(ADDRESS);
    TEST_ASSERT_TRUE(second.get() != first.get());
    assertError(PranaError::None, readState(*second, state));
    TEST_ASSERT_EQUAL_INT(2, fx.transport.connectCount());
}

static void test_busy_session_never_evicted() {
    Fixture fx;
    fx.transport.setExchangeDelayMs(300);
    SessionRegistry registry(fx.transport, fx.config);
    std::shared_ptr<DeviceSession> session = registry.get(ADDRESS);

    PranaError err = PranaError::Timeout;
    std::thread worker([&]() {
        DeviceState state;
        err = readState(*session, state);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    fx.clock.advance(200000);
    size_t evictedWhileBusy = registry.evictIdle(120000);
    worker.join();

    TEST_ASSERT_EQUAL_UINT32(0, evictedWhileBusy);
    assertError(PranaError::None, err);
    TEST_ASSERT_FALSE(session->isRetired());

    // finishing the command counts as activity
    TEST_ASSERT_EQUAL_UINT32(0, registry.evictIdle(120000));
    fx.clock.advance(120000);
    TEST_ASSERT_EQUAL_UINT32(1, registry.evictIdle(120000));
}

static void test_failing_session_evicted() {
    Fixture fx;
    fx.config.maxConsecutiveFailures = 2;
    fx.transport.failConnects(-1);
    SessionRegistry registry(fx.transport, fx.config);
    std::shared_ptr<DeviceSession> session = registry.get(ADDRESS);

    DeviceState state;
    assertError(PranaError::DeviceUnreachable, readState(*session, state));
    TEST_ASSERT_EQUAL_UINT32(0, registry.evictIdle(fx.config.idleTimeoutMs));

    assertError(PranaError::DeviceUnreachable, readState(*session, state));
    TEST_ASSERT_EQUAL_UINT8(2, session->getConsecutiveFailures());
    TEST_ASSERT_EQUAL_UINT32(1, registry.evictIdle(fx.config.idleTimeoutMs));
    TEST_ASSERT_EQUAL_UINT32(0, registry.size());
}

static void test_distinct_devices_run_in_parallel() {
    Fixture fx;
    fx.transport.setExchangeDelayMs(200);
    SessionRegistry registry(fx.transport, fx.config);
    std::shared_ptr<DeviceSession> a = registry.get(ADDRESS);
    std::shared_ptr<DeviceSession> b = registry.get(OTHER_ADDRESS);

    PranaError errA = PranaError::Timeout;
    PranaError errB = PranaError::Timeout;
    std::thread ta([&]() { DeviceState s; errA = readState(*a, s); });
    std::thread tb([&]() { DeviceState s; errB = readState(*b, s); });
    ta.join();
    tb.join();

    assertError(PranaError::None, errA);
    assertError(PranaError::None, errB);
    TEST_ASSERT_EQUAL_INT(2, fx.transport.maxParallelExchanges());
    TEST_ASSERT_FALSE(fx.transport.overlapDetected());
}

static void test_list_reports_known_devices() {
    Fixture fx;
    SessionRegistry registry(fx.transport, fx.config);

    DeviceInfo info;
    info.address = "aa:bb:cc:dd:ee:02";
    info.advertisedName = "PRNAQaq Bedroom";
    info.name = "Bedroom";
    info.rssi = -61;
    TEST_ASSERT_TRUE(registry.registerDiscovered(info));

    std::shared_ptr<DeviceSession> session = registry.get(ADDRESS);
    DeviceState state;
    assertError(PranaError::None, readState(*session, state));

    std::vector<DeviceSummary> summaries = registry.list();
    TEST_ASSERT_EQUAL_UINT32(2, summaries.size());

    // ordered by address
    TEST_ASSERT_EQUAL_STRING(ADDRESS, summaries[0].info.address.c_str());
    TEST_ASSERT_TRUE(summaries[0].state.valid);
    TEST_ASSERT_TRUE(summaries[0].sessionState == DeviceSession::State::Ready);

    TEST_ASSERT_EQUAL_STRING(OTHER_ADDRESS, summaries[1].info.address.c_str());
    TEST_ASSERT_EQUAL_STRING("Bedroom", summaries[1].info.name.c_str());
    TEST_ASSERT_EQUAL_INT(-61, summaries[1].info.rssi);
    TEST_ASSERT_FALSE(summaries[1].state.valid);
    TEST_ASSERT_TRUE(summaries[1].sessionState == DeviceSession::State::Disconnected);
}

static void test_remove_closes_session() {
    Fixture fx;
    SessionRegistry registry(fx.transport, fx.config);
    std::shared_ptr<DeviceSession> session = registry.get(ADDRESS);
    DeviceState state;
    assertError(PranaError::None, readState(*session, state));

    TEST_ASSERT_TRUE(registry.remove("aa:bb:cc:dd:ee:01"));
    TEST_ASSERT_FALSE(registry.remove(ADDRESS));
    TEST_ASSERT_EQUAL_UINT32(0, registry.size());
    TEST_ASSERT_EQUAL_INT(0, fx.transport.openLinks());
    assertError(PranaError::SessionClosed, readState(*session, state));
}

static void test_close_all_releases_every_link() {
    Fixture fx;
    std::shared_ptr<DeviceSession> survivor;
    {
        SessionRegistry registry(fx.transport, fx.config);
        DeviceState state;
        assertError(PranaError::None, readState(*registry.get(ADDRESS), state));
        survivor = registry.get(OTHER_ADDRESS);
        assertError(PranaError::None, readState(*survivor, state));
        TEST_ASSERT_EQUAL_INT(2, fx.transport.openLinks());

        registry.closeAll();
        TEST_ASSERT_EQUAL_UINT32(0, registry.size());
        TEST_ASSERT_EQUAL_INT(0, fx.transport.openLinks());
    }
    TEST_ASSERT_TRUE(survivor->isRetired());
}

int main() {
    UNITY_BEGIN();
    RUN_TEST(test_get_creates_each_session_once);
    RUN_TEST(test_malformed_address_rejected);
    RUN_TEST(test_find_does_not_create);
    RUN_TEST(test_idle_session_evicted_and_recreated);
    RUN_TEST(test_busy_session_never_evicted);
    RUN_TEST(test_failing_session_evicted);
    RUN_TEST(test_distinct_devices_run_in_parallel);
    RUN_TEST(test_list_reports_known_devices);
    RUN_TEST(test_remove_closes_session);
    RUN_TEST(test_close_all_releases_every_link);
    return UNITY_END();
}
