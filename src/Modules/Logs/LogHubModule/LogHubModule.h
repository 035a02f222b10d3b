#pragma once
/**
 * @file LogHubModule.h
 * @brief Module that hosts the LogHub and sink registry.
 */
#include "Core/ModulePassive.h"
#include "Core/ConfigTypes.h"
#include "Core/ServiceRegistry.h"
#include "Core/LogHub.h"
#include "Core/LogSinkRegistry.h"
#include "Core/Services/ILogger.h"

/**
 * @brief Passive module wiring log hub and sink registry services.
 *
 * Installs its hub as the global `Log` target on init and removes it again
 * on destruction. Config: `{"log":{"min_level":0..3}}` (Debug..Error).
 */
class LogHubModule : public ModulePassive {
public:
    ~LogHubModule() override;

    /** @brief Module id. */
    const char* moduleId() const override { return "loghub"; }

    /** @brief Initialize log hub and register services. */
    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;

    LogHub& hub() { return hub_; }

private:
    LogHub hub_;
    LogHubService hubSvc_{};

    LogSinkRegistry sinks_;
    LogSinkRegistryService sinksSvc_{};

    uint8_t minLevel_ = (uint8_t)LogLevel::Debug;
    ConfigVariable<uint8_t,1> minLevelVar_{"min_level", "log", ConfigType::UInt8, &minLevel_};

    static void onMinLevelChanged_(void* ctx, const uint8_t& value);
    void applyMinLevel_(uint8_t value);
};
