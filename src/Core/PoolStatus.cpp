/**
 * @file PoolStatus.cpp
 * @brief Implementation file.
 */
#include "Core/PoolStatus.h"
#include <stdio.h>
#include <string.h>

namespace {

struct NameEntry {
    const char* name;   ///< lowercase (JSON, commands)
    const char* label;  ///< uppercase (status line)
};

const NameEntry kBodyNames[] = {
    {"pool", "POOL"},
    {"spa", "SPA"},
};

const NameEntry kFeatureNames[] = {
    {"light", "LIGHT"},
    {"jets", "JETS"},
    {"heater", "HEATER"},
    {"heat_boost", "HEAT_BOOST"},
};

const NameEntry kHeatSourceNames[] = {
    {"unheated", "UNHEATED"},
    {"heater", "HEATER"},
    {"solar_pref", "SOLAR_PREF"},
    {"solar", "SOLAR"},
};

const char* kStatusKindNames[] = {"unreachable", "inactive", "active"};

template <size_t N>
bool lookup_(const NameEntry (&table)[N], const char* s, uint8_t* out)
{
    if (!s || !out) return false;
    for (size_t i = 0; i < N; ++i) {
        if (strcmp(table[i].name, s) == 0) {
            *out = (uint8_t)i;
            return true;
        }
    }
    return false;
}

bool append_(char* out, size_t outLen, size_t& pos, int wrote)
{
    if (wrote < 0 || (size_t)wrote >= outLen - pos) {
        pos = outLen - 1;
        return false;
    }
    pos += (size_t)wrote;
    return true;
}

void formatTimeOfDay_(const PoolStatus& st, char* out, size_t outLen)
{
    unsigned h12 = st.hour % 12;
    if (h12 == 0) h12 = 12;
    snprintf(out, outLen, "%02u:%02u %s", h12, (unsigned)st.minute, (st.hour < 12) ? "AM" : "PM");
}

}  // namespace

PoolStatus makeUnreachableStatus(bool hasLastContact, time_t lastContact)
{
    PoolStatus st{};
    st.kind = PoolStatusKind::Unreachable;
    st.hasLastContact = hasLastContact;
    st.lastContact = hasLastContact ? lastContact : 0;
    return st;
}

const char* poolBodyStr(PoolBody b)
{
    const uint8_t i = (uint8_t)b;
    return (i < 2) ? kBodyNames[i].name : "?";
}

const char* poolFeatureStr(PoolFeature f)
{
    const uint8_t i = (uint8_t)f;
    return (i < (uint8_t)PoolFeature::Count) ? kFeatureNames[i].name : "?";
}

const char* poolHeatSourceStr(PoolHeatSource s)
{
    const uint8_t i = (uint8_t)s;
    return (i < 4) ? kHeatSourceNames[i].name : "?";
}

const char* poolPowerStateStr(PoolPowerState p)
{
    return (p == PoolPowerState::On) ? "on" : "off";
}

const char* poolStatusKindStr(PoolStatusKind k)
{
    const uint8_t i = (uint8_t)k;
    return (i < 3) ? kStatusKindNames[i] : "?";
}

bool poolBodyFromStr(const char* s, PoolBody* out)
{
    uint8_t i = 0;
    if (!out || !lookup_(kBodyNames, s, &i)) return false;
    *out = (PoolBody)i;
    return true;
}

bool poolFeatureFromStr(const char* s, PoolFeature* out)
{
    uint8_t i = 0;
    if (!out || !lookup_(kFeatureNames, s, &i)) return false;
    *out = (PoolFeature)i;
    return true;
}

bool poolHeatSourceFromStr(const char* s, PoolHeatSource* out)
{
    uint8_t i = 0;
    if (!out || !lookup_(kHeatSourceNames, s, &i)) return false;
    *out = (PoolHeatSource)i;
    return true;
}

bool poolPowerStateFromStr(const char* s, PoolPowerState* out)
{
    if (!s || !out) return false;
    if (strcmp(s, "on") == 0) { *out = PoolPowerState::On; return true; }
    if (strcmp(s, "off") == 0) { *out = PoolPowerState::Off; return true; }
    return false;
}

bool formatPoolStatus(const PoolStatus& st, char* out, size_t outLen)
{
    if (!out || outLen == 0) return false;
    out[0] = '\0';
    size_t pos = 0;

    if (st.kind == PoolStatusKind::Unreachable) {
        if (!append_(out, outLen, pos, snprintf(out, outLen, "Unable to contact pool controller"))) return false;
        if (!st.hasLastContact) return true;

        struct tm t;
        localtime_r(&st.lastContact, &t);
        return append_(out, outLen, pos,
                       snprintf(out + pos, outLen - pos, " since %04d-%02d-%02d %02d:%02d:%02d",
                                t.tm_year + 1900, t.tm_mon + 1, t.tm_mday,
                                t.tm_hour, t.tm_min, t.tm_sec));
    }

    char tod[12];
    formatTimeOfDay_(st, tod, sizeof(tod));

    if (st.kind == PoolStatusKind::Inactive) {
        if (!append_(out, outLen, pos,
                     snprintf(out, outLen, "%s: Pump off. Air: %d°,%s", tod, (int)st.airTemp,
                              st.hasFeature(PoolFeature::Light) ? " Light on," : ""))) {
            return false;
        }
    } else {
        if (!append_(out, outLen, pos,
                     snprintf(out, outLen, "%s: %s on. Air: %d°, Water: %d°, Pump: %u RPM, %u watts, ",
                              tod, kBodyNames[(uint8_t)st.activeBody].label, (int)st.airTemp,
                              (int)st.waterTemp, (unsigned)st.pumpSpeedRpm, (unsigned)st.pumpPowerWatts))) {
            return false;
        }
        if (st.features != 0) {
            bool first = true;
            if (!append_(out, outLen, pos, snprintf(out + pos, outLen - pos, "["))) return false;
            for (uint8_t i = 0; i < (uint8_t)PoolFeature::Count; ++i) {
                if (!st.hasFeature((PoolFeature)i)) continue;
                if (!append_(out, outLen, pos,
                             snprintf(out + pos, outLen - pos, "%s%s", first ? "" : ", ",
                                      kFeatureNames[i].label))) {
                    return false;
                }
                first = false;
            }
            if (!append_(out, outLen, pos, snprintf(out + pos, outLen - pos, "], "))) return false;
        }
        // Trailing separator already emitted; the seek fragment is shared below.
        if (pos > 0 && out[pos - 1] == ' ') --pos;
    }

    return append_(out, outLen, pos,
                   snprintf(out + pos, outLen - pos,
                            " Pool seek: %d°, Spa seek: %d°, Pool heat src: %s, Spa heat src: %s",
                            (int)st.poolSeekTemp, (int)st.spaSeekTemp,
                            kHeatSourceNames[(uint8_t)st.poolHeatSource].label,
                            kHeatSourceNames[(uint8_t)st.spaHeatSource].label));
}

bool writePoolStatusJson(const PoolStatus& st, char* out, size_t outLen)
{
    if (!out || outLen == 0) return false;
    out[0] = '\0';
    size_t pos = 0;

    if (st.kind == PoolStatusKind::Unreachable) {
        if (st.hasLastContact) {
            return append_(out, outLen, pos,
                           snprintf(out, outLen, "{\"kind\":\"unreachable\",\"last_contact\":%lld}",
                                    (long long)st.lastContact));
        }
        return append_(out, outLen, pos,
                       snprintf(out, outLen, "{\"kind\":\"unreachable\",\"last_contact\":null}"));
    }

    if (!append_(out, outLen, pos,
                 snprintf(out, outLen,
                          "{\"kind\":\"%s\",\"time\":\"%02u:%02u\",\"air_temp\":%d,\"features\":[",
                          poolStatusKindStr(st.kind), (unsigned)st.hour, (unsigned)st.minute,
                          (int)st.airTemp))) {
        return false;
    }

    bool first = true;
    for (uint8_t i = 0; i < (uint8_t)PoolFeature::Count; ++i) {
        if (!st.hasFeature((PoolFeature)i)) continue;
        if (!append_(out, outLen, pos,
                     snprintf(out + pos, outLen - pos, "%s\"%s\"", first ? "" : ",", kFeatureNames[i].name))) {
            return false;
        }
        first = false;
    }

    if (!append_(out, outLen, pos,
                 snprintf(out + pos, outLen - pos,
                          "],\"pool_seek\":%d,\"spa_seek\":%d,\"pool_heat_src\":\"%s\",\"spa_heat_src\":\"%s\"",
                          (int)st.poolSeekTemp, (int)st.spaSeekTemp,
                          poolHeatSourceStr(st.poolHeatSource), poolHeatSourceStr(st.spaHeatSource)))) {
        return false;
    }

    if (st.kind == PoolStatusKind::Active) {
        if (!append_(out, outLen, pos,
                     snprintf(out + pos, outLen - pos,
                              ",\"active_body\":\"%s\",\"water_temp\":%d,\"pump_rpm\":%u,\"pump_watts\":%u",
                              poolBodyStr(st.activeBody), (int)st.waterTemp,
                              (unsigned)st.pumpSpeedRpm, (unsigned)st.pumpPowerWatts))) {
            return false;
        }
    }

    return append_(out, outLen, pos, snprintf(out + pos, outLen - pos, "}"));
}
