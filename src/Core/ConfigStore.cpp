/**
 * @file ConfigStore.cpp
 * @brief Implementation file.
 */
#include "Core/ConfigStore.h"
#include "Core/Log.h"
#include <ArduinoJson.h>
#include <stdio.h>

#define LOG_TAG_CORE "CfgStore"

static bool strEquals(const char* a, const char* b) {
    if (!a || !b) return false;
    return strcmp(a, b) == 0;
}

ConfigStore::ConfigStore()
{
    _applyMutex = xSemaphoreCreateMutex();
}

ConfigStore::~ConfigStore()
{
    if (_applyMutex) vSemaphoreDelete(_applyMutex);
}

const ConfigMeta* ConfigStore::find(const char* module, const char* jsonName) const
{
    if (!module || !jsonName) return nullptr;
    for (uint16_t i = 0; i < _metaCount; ++i) {
        if (strEquals(_meta[i].module, module) && strEquals(_meta[i].name, jsonName)) return &_meta[i];
    }
    return nullptr;
}

int ConfigStore::writeValue_(const ConfigMeta& m, char* out, size_t outLen) const
{
    switch (m.type) {
        case ConfigType::Int32:
            return snprintf(out, outLen, "%ld", (long)*(int32_t*)m.valuePtr);
        case ConfigType::UInt8:
            return snprintf(out, outLen, "%u", (unsigned)*(uint8_t*)m.valuePtr);
        case ConfigType::Bool:
            return snprintf(out, outLen, "%s", (*(bool*)m.valuePtr) ? "true" : "false");
        default:
            return snprintf(out, outLen, "null");
    }
}

bool ConfigStore::toJson(char* out, size_t outLen) const
{
    if (!out || outLen < 3) return false;

    const char* modules[MAX_CONFIG_VARS];
    const uint8_t moduleCount = listModules(modules, (uint8_t)(MAX_CONFIG_VARS > 255 ? 255 : MAX_CONFIG_VARS));

    size_t pos = 0;
    out[pos++] = '{';
    bool truncated = false;

    for (uint8_t i = 0; i < moduleCount; ++i) {
        int n = snprintf(out + pos, outLen - pos, "%s\"%s\":", (i > 0) ? "," : "", modules[i]);
        if (n <= 0 || (size_t)n >= outLen - pos) { truncated = true; break; }
        pos += (size_t)n;

        bool modTruncated = false;
        toJsonModule(modules[i], out + pos, outLen - pos, &modTruncated);
        if (modTruncated) { truncated = true; break; }
        pos += strlen(out + pos);
    }

    if (!truncated && pos + 2 <= outLen) {
        out[pos++] = '}';
        out[pos] = '\0';
        return true;
    }
    out[outLen - 1] = '\0';
    Log::warn(LOG_TAG_CORE, "toJson: truncated (len=%u)", (unsigned)outLen);
    return false;
}

bool ConfigStore::toJsonModule(const char* module, char* out, size_t outLen, bool* truncated) const
{
    if (!out || outLen == 0) return false;
    if (!module || module[0] == '\0') {
        out[0] = '\0';
        return false;
    }

    size_t pos = 0;
    out[pos++] = '{';

    bool any = false;
    bool truncatedLocal = false;
    for (uint16_t i = 0; i < _metaCount; ++i) {
        const ConfigMeta& m = _meta[i];
        if (!m.module || strcmp(m.module, module) != 0) continue;

        if (any) {
            if (pos + 1 >= outLen) { truncatedLocal = true; break; }
            out[pos++] = ',';
        }

        int n = snprintf(out + pos, outLen - pos, "\"%s\":", m.name ? m.name : "");
        if (n <= 0) break;
        pos += (size_t)n;
        if (pos >= outLen) { truncatedLocal = true; break; }

        n = writeValue_(m, out + pos, outLen - pos);
        if (n <= 0) break;
        pos += (size_t)n;
        if (pos >= outLen) { truncatedLocal = true; break; }

        any = true;
    }

    if (!truncatedLocal && pos + 2 <= outLen) {
        out[pos++] = '}';
        out[pos] = '\0';
    } else {
        truncatedLocal = true;
        out[outLen - 1] = '\0';
    }

    if (truncated) *truncated = truncatedLocal;
    return any;
}

uint8_t ConfigStore::listModules(const char** out, uint8_t max) const
{
    if (!out || max == 0) return 0;
    uint8_t count = 0;

    for (uint16_t i = 0; i < _metaCount; ++i) {
        const ConfigMeta& m = _meta[i];
        if (!m.module || m.module[0] == '\0') continue;

        bool exists = false;
        for (uint8_t j = 0; j < count; ++j) {
            if (strcmp(out[j], m.module) == 0) { exists = true; break; }
        }
        if (exists) continue;

        if (count < max) {
            out[count++] = m.module;
        } else {
            break;
        }
    }

    return count;
}

bool ConfigStore::applyJson(const char* json)
{
    if (!json || json[0] == '\0') return false;
    if (!_applyMutex) return false;

    // Shared by all callers, guarded by _applyMutex.
    static StaticJsonDocument<Limits::JsonConfigApplyBuf> doc;

    xSemaphoreTake(_applyMutex, portMAX_DELAY);
    doc.clear();
    const DeserializationError err = deserializeJson(doc, json);
    if (err || !doc.is<JsonObjectConst>()) {
        Log::warn(LOG_TAG_CORE, "applyJson: bad json (%s)", err.c_str());
        xSemaphoreGive(_applyMutex);
        return false;
    }
    JsonObjectConst root = doc.as<JsonObjectConst>();

    Log::debug(LOG_TAG_CORE, "applyJson: start");
    bool allOk = true;
    for (uint16_t i = 0; i < _metaCount; ++i) {
        ConfigMeta& m = _meta[i];
        if (!m.module || !m.name) continue;

        JsonVariantConst modVar = root[m.module];
        if (!modVar.is<JsonObjectConst>()) continue;
        JsonVariantConst v = modVar[m.name];
        if (v.isNull()) continue;

        bool changed = false;
        bool typeOk = true;

        switch (m.type) {
        case ConfigType::Int32: {
            if (!v.is<int32_t>()) { typeOk = false; break; }
            const int32_t nv = v.as<int32_t>();
            if (*(int32_t*)m.valuePtr != nv) { *(int32_t*)m.valuePtr = nv; changed = true; }
            break;
        }
        case ConfigType::UInt8: {
            if (!v.is<uint8_t>()) { typeOk = false; break; }
            const uint8_t nv = v.as<uint8_t>();
            if (*(uint8_t*)m.valuePtr != nv) { *(uint8_t*)m.valuePtr = nv; changed = true; }
            break;
        }
        case ConfigType::Bool: {
            if (!v.is<bool>()) { typeOk = false; break; }
            const bool nv = v.as<bool>();
            if (*(bool*)m.valuePtr != nv) { *(bool*)m.valuePtr = nv; changed = true; }
            break;
        }
        }

        if (!typeOk) {
            Log::warn(LOG_TAG_CORE, "applyJson: type mismatch for %s.%s", m.module, m.name);
            allOk = false;
            continue;
        }

        if (changed) {
            Log::debug(LOG_TAG_CORE, "applyJson: changed %s.%s", m.module, m.name);
            if (m.notify && m.var) m.notify(m.var);
        }
    }
    Log::debug(LOG_TAG_CORE, "applyJson: done");
    xSemaphoreGive(_applyMutex);
    return allOk;
}
