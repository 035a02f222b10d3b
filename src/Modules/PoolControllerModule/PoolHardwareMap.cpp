/**
 * @file PoolHardwareMap.cpp
 * @brief Implementation file.
 */
#include "PoolHardwareMap.h"

namespace {

struct FeatureCircuit {
    bool switchable;
    PoolBusCircuit circuit;
};

// Indexed by PoolFeature.
const FeatureCircuit kFeatureCircuits[] = {
    {true,  PoolBusCircuit::Aux1},       // LIGHT
    {true,  PoolBusCircuit::Aux3},       // JETS
    {false, PoolBusCircuit::Count},      // HEATER
    {true,  PoolBusCircuit::HeatBoost},  // HEAT_BOOST
};

// Indexed by PoolBody.
const PoolBusCircuit kBodyCircuits[] = {
    PoolBusCircuit::Pool,
    PoolBusCircuit::Spa,
};

// Indexed by PoolHeatSource; same ordering on the bus.
const PoolBusHeatSource kHeatSources[] = {
    PoolBusHeatSource::Unheated,
    PoolBusHeatSource::Heater,
    PoolBusHeatSource::SolarPref,
    PoolBusHeatSource::Solar,
};

}  // namespace

bool poolFeatureCircuit(PoolFeature feature, PoolBusCircuit* out)
{
    const uint8_t i = (uint8_t)feature;
    if (i >= (uint8_t)PoolFeature::Count || !kFeatureCircuits[i].switchable) return false;
    if (out) *out = kFeatureCircuits[i].circuit;
    return true;
}

PoolBusCircuit poolBodyCircuit(PoolBody body)
{
    return kBodyCircuits[(uint8_t)body & 1u];
}

PoolBusCircuitPower poolPowerToBus(PoolPowerState state)
{
    return (state == PoolPowerState::On) ? PoolBusCircuitPower::On : PoolBusCircuitPower::Off;
}

PoolPowerState poolPowerFromBus(PoolBusCircuitPower power)
{
    return (power == PoolBusCircuitPower::On) ? PoolPowerState::On : PoolPowerState::Off;
}

PoolBusHeatSource poolHeatSourceToBus(PoolHeatSource source)
{
    const uint8_t i = (uint8_t)source;
    return (i < 4) ? kHeatSources[i] : PoolBusHeatSource::Unheated;
}

PoolHeatSource poolHeatSourceFromBus(PoolBusHeatSource source)
{
    for (uint8_t i = 0; i < 4; ++i) {
        if (kHeatSources[i] == source) return (PoolHeatSource)i;
    }
    return PoolHeatSource::Unheated;
}

PoolFeatureMask poolFeaturesFromSystemStatus(const PoolBusSystemStatus& sys)
{
    PoolFeatureMask mask = 0;
    for (uint8_t i = 0; i < (uint8_t)PoolFeature::Count; ++i) {
        if (!kFeatureCircuits[i].switchable) continue;
        if (poolBusCircuitOn(sys, kFeatureCircuits[i].circuit)) mask |= poolFeatureBit((PoolFeature)i);
    }
    if (sys.heaterOn) mask |= poolFeatureBit(PoolFeature::Heater);
    return mask;
}

bool poolActiveBodyFromSystemStatus(const PoolBusSystemStatus& sys, PoolBody* out)
{
    if (poolBusCircuitOn(sys, PoolBusCircuit::Spa)) {
        if (out) *out = PoolBody::Spa;
        return true;
    }
    if (poolBusCircuitOn(sys, PoolBusCircuit::Pool)) {
        if (out) *out = PoolBody::Pool;
        return true;
    }
    return false;
}
