#pragma once
/**
 * @file PoolHardwareMap.h
 * @brief Lookup tables between domain enums and bus identifiers.
 */
#include "Core/PoolStatus.h"
#include "Core/Services/IPoolBus.h"

/** @brief Circuit driving a feature. Returns false for HEATER (relay observed, not switched). */
bool poolFeatureCircuit(PoolFeature feature, PoolBusCircuit* out);
/** @brief Circuit circulating a body. */
PoolBusCircuit poolBodyCircuit(PoolBody body);

PoolBusCircuitPower poolPowerToBus(PoolPowerState state);
PoolPowerState poolPowerFromBus(PoolBusCircuitPower power);

PoolBusHeatSource poolHeatSourceToBus(PoolHeatSource source);
PoolHeatSource poolHeatSourceFromBus(PoolBusHeatSource source);

/** @brief Active features from energized circuits plus the heater relay flag. */
PoolFeatureMask poolFeaturesFromSystemStatus(const PoolBusSystemStatus& sys);
/** @brief Body with water circulating. SPA wins when both circuits are on. */
bool poolActiveBodyFromSystemStatus(const PoolBusSystemStatus& sys, PoolBody* out);
