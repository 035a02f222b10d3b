#pragma once

#include <stdint.h>

namespace PoolCtlDefaults {

/** @brief Silence on the bus longer than this marks the controller unreachable. */
constexpr int32_t ReachabilityTimeoutMs = 10000;
/** @brief Period of the recurring clock synchronization. */
constexpr int32_t ClockSyncPeriodMs = 3600000;
constexpr bool ClockSyncOnStart = false;

/** @brief Seek temperature range accepted by `poolctl.seek` (controller units, Fahrenheit). */
constexpr int16_t MinSeekTemp = 40;
constexpr int16_t MaxSeekTemp = 104;

}  // namespace PoolCtlDefaults
