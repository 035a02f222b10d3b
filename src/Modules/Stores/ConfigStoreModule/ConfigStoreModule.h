#pragma once
/**
 * @file ConfigStoreModule.h
 * @brief Module that exposes ConfigStore service and config commands.
 */
#include "Core/ModulePassive.h"
#include "Core/Services/Services.h"

struct CommandRequest;

/**
 * @brief Passive module wiring ConfigStore JSON services.
 *
 * Commands (registered when a "cmd" service exists):
 * - `config.get` `{"module":"poolctl"}` (module optional) -> `{"ok":true,"config":{...}}`
 * - `config.apply` `{"poolctl":{"reachability_timeout_ms":5000}}` -> `{"ok":true}`
 */
class ConfigStoreModule : public ModulePassive {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "config"; }

    /** @brief Config module depends on log hub. */
    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override { return (i == 0) ? "loghub" : nullptr; }

    /** @brief Register config services. */
    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief Register config commands. */
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;

private:
    ConfigStore* registry = nullptr;
    const LogHubService* logHub = nullptr;
    const CommandService* cmdSvc_ = nullptr;
    ConfigStoreService svc_{ svcApplyJson, svcToJson, svcToJsonModule, svcListModules, nullptr };

    static bool svcApplyJson(void* ctx, const char* json);
    static bool svcToJson(void* ctx, char* out, size_t outLen);
    static bool svcToJsonModule(void* ctx, const char* module, char* out, size_t outLen, bool* truncated);
    static uint8_t svcListModules(void* ctx, const char** out, uint8_t max);

    static bool cmdGet_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdApply_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    bool handleGet_(const CommandRequest& req, char* reply, size_t replyLen);
    bool handleApply_(const CommandRequest& req, char* reply, size_t replyLen);
};
