/**
 * @file PoolStateAggregator.cpp
 * @brief Implementation file.
 */
#include "PoolStateAggregator.h"
#include "PoolHardwareMap.h"

bool PoolStateAggregator::apply(const PoolBusMessage& msg)
{
    switch (msg.kind) {
    case PoolBusMessageKind::SystemStatus: return applySystemStatus(msg.system);
    case PoolBusMessageKind::HeatStatus:   return applyHeatStatus(msg.heat);
    case PoolBusMessageKind::PumpStatus:   return applyPumpStatus(msg.pump);
    default:                               return false;
    }
}

bool PoolStateAggregator::applySystemStatus(const PoolBusSystemStatus& sys)
{
    const bool first = !systemSeen_;
    const int16_t oldAirTemp = airTemp_;
    const int16_t oldWaterTemp = waterTemp_;
    const bool oldHasBody = hasActiveBody_;
    const PoolBody oldBody = activeBody_;
    const PoolFeatureMask oldFeatures = features_;

    hour_ = sys.hour;
    minute_ = sys.minute;
    airTemp_ = sys.airTemp;
    waterTemp_ = sys.waterTemp;
    hasActiveBody_ = poolActiveBodyFromSystemStatus(sys, &activeBody_);
    if (!hasActiveBody_) activeBody_ = PoolBody::Pool;
    features_ = poolFeaturesFromSystemStatus(sys);
    systemSeen_ = true;

    if (first) return true;

    const bool bodyChanged = (hasActiveBody_ != oldHasBody) ||
                             (hasActiveBody_ && activeBody_ != oldBody);
    if (airTemp_ != oldAirTemp || bodyChanged) return true;

    // Inactive statuses carry no water temperature.
    if (hasActiveBody_ && waterTemp_ != oldWaterTemp) return true;

    // Pump off: only the light is worth reporting. Pump on: any feature change.
    if (!hasActiveBody_) {
        const PoolFeatureMask light = poolFeatureBit(PoolFeature::Light);
        return (features_ & light) != (oldFeatures & light);
    }
    return features_ != oldFeatures;
}

bool PoolStateAggregator::applyHeatStatus(const PoolBusHeatStatus& heat)
{
    const bool first = !heatSeen_;
    const PoolHeatSource poolSrc = poolHeatSourceFromBus(heat.poolHeatSource);
    const PoolHeatSource spaSrc = poolHeatSourceFromBus(heat.spaHeatSource);

    const bool changed = first ||
                         heat.poolSeekTemp != poolSeekTemp_ ||
                         heat.spaSeekTemp != spaSeekTemp_ ||
                         poolSrc != poolHeatSource_ ||
                         spaSrc != spaHeatSource_;

    poolSeekTemp_ = heat.poolSeekTemp;
    spaSeekTemp_ = heat.spaSeekTemp;
    poolHeatSource_ = poolSrc;
    spaHeatSource_ = spaSrc;
    heatSeen_ = true;
    return changed;
}

bool PoolStateAggregator::applyPumpStatus(const PoolBusPumpStatus& pump)
{
    const bool changed = !pumpSeen_ ||
                         pump.speedRpm != pumpSpeedRpm_ ||
                         pump.powerWatts != pumpPowerWatts_;

    pumpSpeedRpm_ = pump.speedRpm;
    pumpPowerWatts_ = pump.powerWatts;
    pumpSeen_ = true;
    return changed;
}

bool PoolStateAggregator::synthesize(PoolStatus& out) const
{
    if (!canSynthesize()) return false;

    PoolStatus st{};
    st.kind = hasActiveBody_ ? PoolStatusKind::Active : PoolStatusKind::Inactive;
    st.hour = hour_;
    st.minute = minute_;
    st.airTemp = airTemp_;
    st.features = features_;
    st.poolSeekTemp = poolSeekTemp_;
    st.spaSeekTemp = spaSeekTemp_;
    st.poolHeatSource = poolHeatSource_;
    st.spaHeatSource = spaHeatSource_;

    if (hasActiveBody_) {
        st.activeBody = activeBody_;
        st.waterTemp = waterTemp_;
        st.pumpSpeedRpm = pumpSpeedRpm_;
        st.pumpPowerWatts = pumpPowerWatts_;
    }

    out = st;
    return true;
}

void PoolStateAggregator::reset()
{
    *this = PoolStateAggregator{};
}
