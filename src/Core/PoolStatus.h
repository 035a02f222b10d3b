#pragma once
/**
 * @file PoolStatus.h
 * @brief Pool status value type and domain enumerations.
 */
#include <stddef.h>
#include <stdint.h>
#include <time.h>

/** @brief Water circuit that can be circulated independently. SPA has hardware priority. */
enum class PoolBody : uint8_t { Pool = 0, Spa = 1 };

/** @brief Controllable pool attribute. HEATER is observed only. */
enum class PoolFeature : uint8_t { Light = 0, Jets, Heater, HeatBoost, Count };

/** @brief Per-body heat source. */
enum class PoolHeatSource : uint8_t { Unheated = 0, Heater, SolarPref, Solar };

enum class PoolPowerState : uint8_t { Off = 0, On = 1 };

/** @brief Variant tag of a `PoolStatus`. */
enum class PoolStatusKind : uint8_t { Unreachable = 0, Inactive, Active };

/** @brief Set of active features, one bit per `PoolFeature`. */
using PoolFeatureMask = uint8_t;

static inline PoolFeatureMask poolFeatureBit(PoolFeature f)
{
    return (PoolFeatureMask)(1u << (uint8_t)f);
}

/**
 * @brief Externally visible pool status.
 *
 * Exactly one variant is meaningful, selected by `kind`:
 * - Unreachable: `hasLastContact`, `lastContact`.
 * - Inactive: time of day, air temp, features, seek temps, heat sources.
 * - Active: Inactive fields plus active body, water temp, pump speed/power.
 * Fields outside the current variant are zero.
 */
struct PoolStatus {
    PoolStatusKind kind = PoolStatusKind::Unreachable;

    bool hasLastContact = false;
    time_t lastContact = 0;

    uint8_t hour = 0;
    uint8_t minute = 0;
    int16_t airTemp = 0;
    PoolFeatureMask features = 0;
    int16_t poolSeekTemp = 0;
    int16_t spaSeekTemp = 0;
    PoolHeatSource poolHeatSource = PoolHeatSource::Unheated;
    PoolHeatSource spaHeatSource = PoolHeatSource::Unheated;

    PoolBody activeBody = PoolBody::Pool;
    int16_t waterTemp = 0;
    uint16_t pumpSpeedRpm = 0;
    uint16_t pumpPowerWatts = 0;

    bool isReachable() const { return kind != PoolStatusKind::Unreachable; }
    bool hasFeature(PoolFeature f) const { return (features & poolFeatureBit(f)) != 0; }
    int16_t seekTemp(PoolBody b) const { return (b == PoolBody::Spa) ? spaSeekTemp : poolSeekTemp; }
    PoolHeatSource heatSource(PoolBody b) const { return (b == PoolBody::Spa) ? spaHeatSource : poolHeatSource; }
};

/** @brief Unreachable status, with the time of last contact when one is known. */
PoolStatus makeUnreachableStatus(bool hasLastContact, time_t lastContact);

const char* poolBodyStr(PoolBody b);
const char* poolFeatureStr(PoolFeature f);
const char* poolHeatSourceStr(PoolHeatSource s);
const char* poolPowerStateStr(PoolPowerState p);
const char* poolStatusKindStr(PoolStatusKind k);

/** @brief Parse lowercase names ("pool", "jets", "solar_pref", "on"...). Return false when unknown. */
bool poolBodyFromStr(const char* s, PoolBody* out);
bool poolFeatureFromStr(const char* s, PoolFeature* out);
bool poolHeatSourceFromStr(const char* s, PoolHeatSource* out);
bool poolPowerStateFromStr(const char* s, PoolPowerState* out);

/** @brief Human-readable one-line rendering used in logs. */
bool formatPoolStatus(const PoolStatus& st, char* out, size_t outLen);

/** @brief JSON object rendering used by `poolctl.status`. */
bool writePoolStatusJson(const PoolStatus& st, char* out, size_t outLen);
