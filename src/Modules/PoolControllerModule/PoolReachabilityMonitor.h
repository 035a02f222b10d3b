#pragma once
/**
 * @file PoolReachabilityMonitor.h
 * @brief Drains the bus feed, keeps the live snapshot and detects silence.
 */
#include "Core/Services/IPoolBus.h"
#include "Domain/PoolControllerDefaults.h"
#include "Modules/PoolControllerModule/PoolObservedState.h"
#include "Modules/PoolControllerModule/PoolStateAggregator.h"
#include "Modules/PoolControllerModule/PoolStatusPublisher.h"
#include <FreeRTOS.h>
#include <queue.h>

/**
 * @brief Single consumer of the bus feed and sole owner of the live snapshot.
 *
 * `step()` is called repeatedly from one task (the controller module task).
 * Every other task sees the snapshot through published statuses, plus the
 * circuit cell returned by `observed()`.
 */
class PoolReachabilityMonitor {
public:
    explicit PoolReachabilityMonitor(PoolStatusPublisher& publisher) : publisher_(publisher) {}

    /** @brief Take one feed from the bus. Fails when the bus has no feed to give. */
    bool attach(const PoolBusService* bus);
    /** @brief Give the feed back to the bus. */
    void detach();
    bool isAttached() const { return feed_ != nullptr; }

    /** @brief Silence longer than this publishes Unreachable. Values of 0 are ignored. */
    void setTimeoutMs(uint32_t ms);
    uint32_t timeoutMs() const { return timeoutMs_; }

    /**
     * @brief One monitor iteration: wait for the next message (bounded by the
     *        timeout), then process it or handle the silence.
     * @return false when not attached.
     */
    bool step();

    /** @brief Process one inbound message (aggregate, chain the next poll, publish). */
    void handleMessage(const PoolBusMessage& msg);
    /** @brief Handle a feed wait that timed out. */
    void handleTimeout();

    bool everContacted() const { return everContacted_; }

    /** @brief Circuits of the last system status, published or not. */
    const PoolObservedState& observed() const { return observed_; }

private:
    PoolStatusPublisher& publisher_;
    const PoolBusService* bus_ = nullptr;
    QueueHandle_t feed_ = nullptr;
    PoolStateAggregator aggregator_;
    PoolObservedState observed_;

    volatile uint32_t timeoutMs_ = (uint32_t)PoolCtlDefaults::ReachabilityTimeoutMs;
    bool everContacted_ = false;
    bool hasPublished_ = false;
    PoolStatusKind lastPublishedKind_ = PoolStatusKind::Unreachable;

    void sendPoll_(const PoolBusMessage& msg);
    void publish_(const PoolStatus& st);
};
