#pragma once
/**
 * @file ConfigStore.h
 * @brief Runtime configuration store with JSON import/export.
 */

// ConfigStore = runtime configuration store.
//
// - Modules register ConfigVariable descriptors pointing at their own storage.
// - set() and applyJson() fire the variable's change handlers when the value
//   actually changed.
// - applyJson() is serialized; it may be called from any task.
// - No persistence: the host firmware applies its config as JSON at boot.

#include <FreeRTOS.h>
#include <semphr.h>
#include <cstdint>
#include <cstring>

#include "ConfigTypes.h"
#include "Core/Log.h"

#ifndef LOG_TAG_CORE
#define LOG_TAG_CORE "CfgStore"
#define LOG_TAG_CORE_LOCAL_DEFINED
#endif

/**
 * @brief Holds config variables and JSON import/export.
 */
class ConfigStore {
public:
    static constexpr size_t MAX_CONFIG_VARS = Limits::MaxConfigVars;

    ConfigStore();
    ~ConfigStore();

    ConfigStore(const ConfigStore&) = delete;
    ConfigStore& operator=(const ConfigStore&) = delete;

    /** @brief Register a config variable definition. */
    template<typename T, size_t H>
    bool registerVar(ConfigVariable<T, H>& var);

    /** @brief Set a typed config value and notify handlers on change. */
    template<typename T, size_t H>
    bool set(ConfigVariable<T, H>& var, const T& value);

    /** @brief Serialize all registered config to JSON (`{"module":{"name":value}}`). */
    bool toJson(char* out, size_t outLen) const;
    /** @brief Serialize a single module's config (flat object). */
    bool toJsonModule(const char* module, char* out, size_t outLen, bool* truncated = nullptr) const;
    /** @brief List unique module names present in config metadata. */
    uint8_t listModules(const char** out, uint8_t max) const;
    /** @brief Apply JSON patch to registered config variables. */
    bool applyJson(const char* json);

    /** @brief Number of registered variables. */
    uint16_t count() const { return _metaCount; }

private:
    ConfigMeta _meta[MAX_CONFIG_VARS];
    uint16_t _metaCount = 0;
    SemaphoreHandle_t _applyMutex = nullptr;

    const ConfigMeta* find(const char* module, const char* jsonName) const;
    int writeValue_(const ConfigMeta& m, char* out, size_t outLen) const;
};

// -------------------------
// Template implementation
// -------------------------
template<typename T, size_t H>
bool ConfigStore::registerVar(ConfigVariable<T, H>& var)
{
    if (_metaCount >= MAX_CONFIG_VARS) {
        Log::warn(LOG_TAG_CORE, "config table full, dropping %s.%s",
                  var.moduleName ? var.moduleName : "-", var.jsonName ? var.jsonName : "-");
        return false;
    }
    if (find(var.moduleName, var.jsonName)) {
        Log::warn(LOG_TAG_CORE, "duplicate config key %s.%s", var.moduleName, var.jsonName);
        return false;
    }

    ConfigMeta& m = _meta[_metaCount++];

    m.module   = var.moduleName;
    m.name     = var.jsonName;
    m.type     = var.type;
    m.valuePtr = (void*)var.value;
    m.var      = &var;
    m.notify   = [](void* v) { static_cast<ConfigVariable<T, H>*>(v)->notify(); };
    return true;
}

template<typename T, size_t H>
bool ConfigStore::set(ConfigVariable<T, H>& var, const T& value)
{
    if (!var.value) return false;
    if (*(var.value) == value) return true;

    *(var.value) = value;
    var.notify();
    return true;
}

#ifdef LOG_TAG_CORE_LOCAL_DEFINED
#undef LOG_TAG_CORE
#undef LOG_TAG_CORE_LOCAL_DEFINED
#endif
