#pragma once
/**
 * @file PoolCommandFacade.h
 * @brief Synchronous pool commands over the bus request/response primitive.
 */
#include "Core/Services/IPoolBus.h"
#include "Core/Services/IPoolController.h"
#include "Modules/PoolControllerModule/PoolObservedState.h"
#include <time.h>

/**
 * @brief Stateless command layer. Runs on the caller's task.
 *
 * Active body and JETS state come from the monitor's observed circuit cell,
 * which tracks every system status even while nothing is published.
 */
class PoolCommandFacade {
public:
    explicit PoolCommandFacade(const PoolObservedState& observed) : observed_(observed) {}

    void setBus(const PoolBusService* bus) { bus_ = bus; }
    bool hasBus() const { return bus_ && bus_->send && bus_->receive; }

    /** @brief HEATER is rejected. JETS ON without an active body is a no-op. */
    PoolCtlStatus setFeaturePower(PoolFeature feature, PoolPowerState state);
    /** @brief OFF turns JETS off first when on. POOL ON also turns SPA off. */
    PoolCtlStatus setBodyPower(PoolBody body, PoolPowerState state);
    /** @brief Read-modify-write of the heat configuration (seek temp of one body). */
    PoolCtlStatus setSeekTemperature(PoolBody body, int16_t temp);
    /** @brief Read-modify-write of the heat configuration (heat source of one body). */
    PoolCtlStatus setHeatSource(PoolBody body, PoolHeatSource source);
    /** @brief One clock-set exchange with the given local time. */
    PoolCtlStatus setClock(const struct tm& localTime);

    /**
     * @brief Send `request`, read the next message, repeat until it has `expected` kind.
     *
     * Mismatches are logged and retried without bound or backoff. Transport
     * errors end the exchange with POOLCTL_ERR_IO.
     */
    PoolCtlStatus exchange(const PoolBusMessage& request, PoolBusMessageKind expected,
                           PoolBusMessage& response);

    /** @brief Make every later call (and a looping exchange) return POOLCTL_ERR_STOPPED. */
    void stop() { stopped_ = true; }

private:
    const PoolObservedState& observed_;
    const PoolBusService* bus_ = nullptr;
    volatile bool stopped_ = false;

    PoolCtlStatus ready_() const;
    PoolCtlStatus setCircuit_(PoolBusCircuit circuit, PoolBusCircuitPower power);
    PoolCtlStatus fetchHeatStatus_(PoolBusHeatStatus& out);
    PoolCtlStatus setHeatConfiguration_(const PoolBusHeatStatus& cfg);
    void pollBestEffort_(const PoolBusMessage& msg);
    bool observedActiveBody_() const;
    bool observedFeature_(PoolFeature f) const;
};
