#pragma once
/**
 * @file PoolStateAggregator.h
 * @brief Live snapshot of the pool built from inbound bus messages.
 */
#include "Core/PoolStatus.h"
#include "Core/Services/IPoolBus.h"

/**
 * @brief Folds observation messages into the live snapshot and reports significance.
 *
 * Not thread-safe: owned by the reachability monitor, which is its only caller.
 */
class PoolStateAggregator {
public:
    /**
     * @brief Dispatch an inbound message by kind.
     * @return true when the message changed a significant attribute.
     */
    bool apply(const PoolBusMessage& msg);

    bool applySystemStatus(const PoolBusSystemStatus& sys);
    bool applyHeatStatus(const PoolBusHeatStatus& heat);
    bool applyPumpStatus(const PoolBusPumpStatus& pump);

    /** @brief Both a system status and a heat status were seen at least once. */
    bool canSynthesize() const { return systemSeen_ && heatSeen_; }

    /** @brief Build the Active or Inactive status from the snapshot. */
    bool synthesize(PoolStatus& out) const;

    /** @brief Forget everything (snapshot back to fully unknown). */
    void reset();

    bool systemSeen() const { return systemSeen_; }
    bool hasActiveBody() const { return hasActiveBody_; }
    PoolBody activeBody() const { return activeBody_; }
    PoolFeatureMask features() const { return features_; }

private:
    bool systemSeen_ = false;
    bool heatSeen_ = false;
    bool pumpSeen_ = false;

    uint8_t hour_ = 0;
    uint8_t minute_ = 0;
    int16_t airTemp_ = 0;
    int16_t waterTemp_ = 0;
    bool hasActiveBody_ = false;
    PoolBody activeBody_ = PoolBody::Pool;
    PoolFeatureMask features_ = 0;

    int16_t poolSeekTemp_ = 0;
    int16_t spaSeekTemp_ = 0;
    PoolHeatSource poolHeatSource_ = PoolHeatSource::Unheated;
    PoolHeatSource spaHeatSource_ = PoolHeatSource::Unheated;

    uint16_t pumpSpeedRpm_ = 0;
    uint16_t pumpPowerWatts_ = 0;
};
