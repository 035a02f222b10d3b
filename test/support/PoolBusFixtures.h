#pragma once
/**
 * @file PoolBusFixtures.h
 * @brief Builders for decoded bus messages used across tests.
 */
#include "Core/Services/IPoolBus.h"

PoolBusMessage makeSystemStatus(uint8_t hour, uint8_t minute, int16_t air, int16_t water,
                                uint16_t circuitsOn, bool heaterOn = false);
PoolBusMessage makeHeatStatus(int16_t poolSeek, int16_t spaSeek,
                              PoolBusHeatSource poolSrc, PoolBusHeatSource spaSrc);
PoolBusMessage makePumpStatus(uint16_t rpm, uint16_t watts);
PoolBusMessage makeMessage(PoolBusMessageKind kind);
uint16_t circuitBit(PoolBusCircuit c);
