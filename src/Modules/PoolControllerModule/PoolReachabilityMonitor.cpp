/**
 * @file PoolReachabilityMonitor.cpp
 * @brief Implementation file.
 */
#include "PoolReachabilityMonitor.h"
#include "Core/SystemLimits.h"
#define LOG_TAG "PoolMoni"
#include "Core/ModuleLog.h"
#include <time.h>

bool PoolReachabilityMonitor::attach(const PoolBusService* bus)
{
    if (feed_) return true;
    if (!bus || !bus->subscribe) return false;

    QueueHandle_t feed = bus->subscribe(bus->ctx, Limits::PoolCtl::FeedQueueLen);
    if (!feed) {
        LOGE("bus feed subscribe failed");
        return false;
    }

    bus_ = bus;
    feed_ = feed;
    aggregator_.reset();
    observed_.clear();
    everContacted_ = false;
    hasPublished_ = false;
    LOGI("attached to bus feed (timeout=%lu ms)", (unsigned long)timeoutMs_);
    return true;
}

void PoolReachabilityMonitor::detach()
{
    if (!feed_) return;
    if (bus_ && bus_->unsubscribe) bus_->unsubscribe(bus_->ctx, feed_);
    feed_ = nullptr;
    LOGI("bus feed released");
}

void PoolReachabilityMonitor::setTimeoutMs(uint32_t ms)
{
    if (ms == 0) return;
    timeoutMs_ = ms;
}

bool PoolReachabilityMonitor::step()
{
    if (!feed_) return false;

    PoolBusMessage msg{};
    if (xQueueReceive(feed_, &msg, pdMS_TO_TICKS(timeoutMs_)) == pdTRUE) {
        handleMessage(msg);
    } else {
        handleTimeout();
    }
    return true;
}

void PoolReachabilityMonitor::handleMessage(const PoolBusMessage& msg)
{
    everContacted_ = true;

    const bool significant = aggregator_.apply(msg);

    // Daisy-chain polls so our requests follow the controller's own traffic.
    if (msg.kind == PoolBusMessageKind::SystemStatus) {
        PoolObservedCircuits circuits{};
        circuits.known = true;
        circuits.bodyActive = aggregator_.hasActiveBody();
        circuits.body = aggregator_.activeBody();
        circuits.features = aggregator_.features();
        observed_.store(circuits);
        sendPoll_(poolBusHeatStatusQuery());
    } else if (msg.kind == PoolBusMessageKind::HeatStatus) {
        sendPoll_(poolBusPumpStatusRequest());
    }

    if (!significant || !aggregator_.canSynthesize()) return;

    PoolStatus st{};
    if (aggregator_.synthesize(st)) publish_(st);
}

void PoolReachabilityMonitor::handleTimeout()
{
    if (hasPublished_ && lastPublishedKind_ == PoolStatusKind::Unreachable) return;

    observed_.clear();
    if (!everContacted_) {
        LOGW("no traffic from pool controller");
        publish_(makeUnreachableStatus(false, 0));
        return;
    }

    const time_t lastContact = time(nullptr) - (time_t)(timeoutMs_ / 1000U);
    LOGW("pool controller silent for %lu ms", (unsigned long)timeoutMs_);
    publish_(makeUnreachableStatus(true, lastContact));
}

void PoolReachabilityMonitor::sendPoll_(const PoolBusMessage& msg)
{
    if (!bus_ || !bus_->send) return;
    const PoolBusResult res = bus_->send(bus_->ctx, msg);
    if (res != POOLBUS_OK) {
        LOGW("poll %s not sent (err=%u)", poolBusMessageKindStr(msg.kind), (unsigned)res);
    }
}

void PoolReachabilityMonitor::publish_(const PoolStatus& st)
{
    hasPublished_ = true;
    lastPublishedKind_ = st.kind;

    char line[Limits::PoolCtl::StatusTextBuf];
    if (formatPoolStatus(st, line, sizeof(line))) {
        LOGI("%s", line);
    }
    publisher_.publish(st);
}
