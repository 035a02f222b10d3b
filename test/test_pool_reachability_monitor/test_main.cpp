#include <unity.h>
#include <time.h>

#include "Modules/PoolControllerModule/PoolReachabilityMonitor.h"
#include "../support/FakePoolBus.h"
#include "../support/RtosTestMain.h"

void setUp() {}
void tearDown() {}

static const uint16_t POOL_ON = (uint16_t)(1u << (uint8_t)PoolBusCircuit::Pool);

static PoolBusMessage heat()
{
    return makeHeatStatus(82, 100, PoolBusHeatSource::Heater, PoolBusHeatSource::Solar);
}

static uint32_t drain(PoolStatusSubscription& sub, PoolStatus* last)
{
    uint32_t n = 0;
    PoolStatus st{};
    while (sub.receive(st, 0)) {
        if (last) *last = st;
        ++n;
    }
    return n;
}

void test_attach_and_detach_feed()
{
    FakePoolBus bus;
    PoolStatusPublisher pub;
    PoolReachabilityMonitor mon(pub);

    TEST_ASSERT_FALSE(mon.attach(nullptr));
    TEST_ASSERT_FALSE(mon.step());

    TEST_ASSERT_TRUE(mon.attach(bus.service()));
    TEST_ASSERT_TRUE(mon.isAttached());
    TEST_ASSERT_TRUE(bus.hasFeed());
    TEST_ASSERT_TRUE(mon.attach(bus.service()));

    mon.detach();
    TEST_ASSERT_FALSE(mon.isAttached());
    TEST_ASSERT_FALSE(bus.hasFeed());
    TEST_ASSERT_EQUAL_UINT32(1, bus.unsubscribeCount());
}

void test_timeout_setting()
{
    PoolStatusPublisher pub;
    PoolReachabilityMonitor mon(pub);
    TEST_ASSERT_EQUAL_UINT32((uint32_t)PoolCtlDefaults::ReachabilityTimeoutMs, mon.timeoutMs());
    mon.setTimeoutMs(0);
    TEST_ASSERT_EQUAL_UINT32((uint32_t)PoolCtlDefaults::ReachabilityTimeoutMs, mon.timeoutMs());
    mon.setTimeoutMs(2500);
    TEST_ASSERT_EQUAL_UINT32(2500, mon.timeoutMs());
}

void test_silence_before_contact_is_unreachable_without_time()
{
    FakePoolBus bus;
    PoolStatusPublisher pub;
    PoolReachabilityMonitor mon(pub);
    TEST_ASSERT_TRUE(mon.attach(bus.service()));

    mon.handleTimeout();
    PoolStatus st{};
    TEST_ASSERT_TRUE(pub.latest(st, 0));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)PoolStatusKind::Unreachable, (uint8_t)st.kind);
    TEST_ASSERT_FALSE(st.hasLastContact);
    TEST_ASSERT_FALSE(mon.everContacted());
}

void test_no_two_consecutive_unreachable()
{
    FakePoolBus bus;
    PoolStatusPublisher pub;
    PoolReachabilityMonitor mon(pub);
    TEST_ASSERT_TRUE(mon.attach(bus.service()));
    PoolStatusSubscription sub = pub.subscribe();

    mon.handleTimeout();
    mon.handleTimeout();
    mon.handleTimeout();
    TEST_ASSERT_EQUAL_UINT32(1, drain(sub, nullptr));

    // Traffic that does not produce a status keeps the last event Unreachable.
    mon.handleMessage(makePumpStatus(1000, 200));
    mon.handleTimeout();
    TEST_ASSERT_EQUAL_UINT32(0, drain(sub, nullptr));
}

void test_silence_after_contact_carries_last_contact()
{
    FakePoolBus bus;
    PoolStatusPublisher pub;
    PoolReachabilityMonitor mon(pub);
    TEST_ASSERT_TRUE(mon.attach(bus.service()));
    mon.setTimeoutMs(10000);
    PoolStatusSubscription sub = pub.subscribe();

    mon.handleMessage(makeSystemStatus(8, 0, 70, 75, 0));
    mon.handleMessage(heat());
    TEST_ASSERT_TRUE(mon.everContacted());

    const time_t before = time(nullptr);
    mon.handleTimeout();
    const time_t after = time(nullptr);

    PoolStatus last{};
    TEST_ASSERT_EQUAL_UINT32(2, drain(sub, &last));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)PoolStatusKind::Unreachable, (uint8_t)last.kind);
    TEST_ASSERT_TRUE(last.hasLastContact);
    TEST_ASSERT_TRUE(last.lastContact >= before - 10);
    TEST_ASSERT_TRUE(last.lastContact <= after - 10);
}

void test_no_status_before_system_and_heat()
{
    FakePoolBus bus;
    PoolStatusPublisher pub;
    PoolReachabilityMonitor mon(pub);
    TEST_ASSERT_TRUE(mon.attach(bus.service()));
    PoolStatusSubscription sub = pub.subscribe();

    mon.handleMessage(makeSystemStatus(8, 0, 70, 75, POOL_ON));
    mon.handleMessage(makePumpStatus(2000, 600));
    TEST_ASSERT_EQUAL_UINT32(0, drain(sub, nullptr));

    mon.handleMessage(heat());
    PoolStatus last{};
    TEST_ASSERT_EQUAL_UINT32(1, drain(sub, &last));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)PoolStatusKind::Active, (uint8_t)last.kind);
    TEST_ASSERT_EQUAL_UINT16(2000, last.pumpSpeedRpm);
}

void test_insignificant_updates_publish_nothing()
{
    FakePoolBus bus;
    PoolStatusPublisher pub;
    PoolReachabilityMonitor mon(pub);
    TEST_ASSERT_TRUE(mon.attach(bus.service()));
    PoolStatusSubscription sub = pub.subscribe();

    mon.handleMessage(makeSystemStatus(8, 0, 70, 75, 0));
    mon.handleMessage(heat());
    TEST_ASSERT_EQUAL_UINT32(1, drain(sub, nullptr));

    mon.handleMessage(heat());
    mon.handleMessage(makeSystemStatus(8, 1, 70, 79, 0));
    mon.handleMessage(makeMessage(PoolBusMessageKind::Other));
    TEST_ASSERT_EQUAL_UINT32(0, drain(sub, nullptr));

    mon.handleMessage(makeSystemStatus(8, 2, 71, 79, 0));
    TEST_ASSERT_EQUAL_UINT32(1, drain(sub, nullptr));
}

void test_polls_are_daisy_chained()
{
    FakePoolBus bus;
    PoolStatusPublisher pub;
    PoolReachabilityMonitor mon(pub);
    TEST_ASSERT_TRUE(mon.attach(bus.service()));

    mon.handleMessage(makeSystemStatus(8, 0, 70, 75, 0));
    mon.handleMessage(heat());
    mon.handleMessage(makePumpStatus(2000, 600));
    mon.handleMessage(makeMessage(PoolBusMessageKind::StateChangeResponse));

    const std::vector<PoolBusMessage> sent = bus.sent();
    TEST_ASSERT_EQUAL_UINT32(2, (uint32_t)sent.size());
    TEST_ASSERT_EQUAL_UINT8((uint8_t)PoolBusMessageKind::HeatStatusQuery, (uint8_t)sent[0].kind);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)PoolBusMessageKind::PumpStatusRequest, (uint8_t)sent[1].kind);
    TEST_ASSERT_EQUAL_UINT32(0, bus.beginCount());
}

void test_poll_failures_are_ignored()
{
    FakePoolBus bus;
    PoolStatusPublisher pub;
    PoolReachabilityMonitor mon(pub);
    TEST_ASSERT_TRUE(mon.attach(bus.service()));
    bus.failSends(true);

    mon.handleMessage(makeSystemStatus(8, 0, 70, 75, 0));
    mon.handleMessage(heat());

    PoolStatus st{};
    TEST_ASSERT_TRUE(pub.latest(st, 0));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)PoolStatusKind::Inactive, (uint8_t)st.kind);
    TEST_ASSERT_EQUAL_UINT32(0, (uint32_t)bus.sentCount());
}

void test_step_drains_feed_then_detects_silence()
{
    FakePoolBus bus;
    PoolStatusPublisher pub;
    PoolReachabilityMonitor mon(pub);
    mon.setTimeoutMs(30);
    TEST_ASSERT_TRUE(mon.attach(bus.service()));
    PoolStatusSubscription sub = pub.subscribe();

    TEST_ASSERT_TRUE(bus.inject(makeSystemStatus(8, 0, 70, 75, POOL_ON)));
    TEST_ASSERT_TRUE(bus.inject(heat()));
    TEST_ASSERT_TRUE(mon.step());
    TEST_ASSERT_TRUE(mon.step());

    PoolStatus st{};
    TEST_ASSERT_TRUE(sub.receive(st, 0));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)PoolStatusKind::Active, (uint8_t)st.kind);

    const TickType_t start = xTaskGetTickCount();
    TEST_ASSERT_TRUE(mon.step());
    TEST_ASSERT_TRUE((xTaskGetTickCount() - start) >= pdMS_TO_TICKS(25));
    TEST_ASSERT_TRUE(sub.receive(st, 0));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)PoolStatusKind::Unreachable, (uint8_t)st.kind);
    TEST_ASSERT_TRUE(st.hasLastContact);

    // Contact again: real statuses resume.
    TEST_ASSERT_TRUE(bus.inject(makeSystemStatus(8, 5, 70, 75, 0)));
    TEST_ASSERT_TRUE(mon.step());
    TEST_ASSERT_TRUE(sub.receive(st, 0));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)PoolStatusKind::Inactive, (uint8_t)st.kind);

    mon.detach();
}

void test_observed_circuits_track_every_system_status()
{
    PoolStatusPublisher pub;
    PoolReachabilityMonitor mon(pub);
    PoolStatusSubscription sub = pub.subscribe();
    TEST_ASSERT_FALSE(mon.observed().load().known);

    mon.handleMessage(makeSystemStatus(10, 0, 70, 75, POOL_ON));
    PoolObservedCircuits c = mon.observed().load();
    TEST_ASSERT_TRUE(c.known);
    TEST_ASSERT_TRUE(c.bodyActive);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)PoolBody::Pool, (uint8_t)c.body);
    TEST_ASSERT_EQUAL_UINT32(0, drain(sub, nullptr));

    mon.handleMessage(heat());
    TEST_ASSERT_EQUAL_UINT32(1, drain(sub, nullptr));

    const uint16_t jets = circuitBit(PoolBusCircuit::Aux3);
    mon.handleMessage(makeSystemStatus(10, 1, 70, 75, 0));
    mon.handleMessage(makeSystemStatus(10, 2, 70, 75, jets));
    PoolStatus last{};
    TEST_ASSERT_EQUAL_UINT32(1, drain(sub, &last));
    TEST_ASSERT_FALSE(last.hasFeature(PoolFeature::Jets));

    c = mon.observed().load();
    TEST_ASSERT_FALSE(c.bodyActive);
    TEST_ASSERT_TRUE(c.hasFeature(PoolFeature::Jets));

    mon.handleTimeout();
    TEST_ASSERT_FALSE(mon.observed().load().known);
}

static int runTests()
{
    UNITY_BEGIN();
    RUN_TEST(test_attach_and_detach_feed);
    RUN_TEST(test_timeout_setting);
    RUN_TEST(test_silence_before_contact_is_unreachable_without_time);
    RUN_TEST(test_no_two_consecutive_unreachable);
    RUN_TEST(test_silence_after_contact_carries_last_contact);
    RUN_TEST(test_no_status_before_system_and_heat);
    RUN_TEST(test_insignificant_updates_publish_nothing);
    RUN_TEST(test_polls_are_daisy_chained);
    RUN_TEST(test_poll_failures_are_ignored);
    RUN_TEST(test_step_drains_feed_then_detects_silence);
    RUN_TEST(test_observed_circuits_track_every_system_status);
    return UNITY_END();
}

int main()
{
    return runUnderScheduler(runTests);
}
