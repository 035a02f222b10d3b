/**
 * @file ConfigStoreModule.cpp
 * @brief Implementation file.
 */
#include "ConfigStoreModule.h"
#include "Core/CommandRegistry.h"
#include "Core/ErrorCodes.h"
#include "Core/SystemLimits.h"
#define LOG_TAG "CfgModul"
#include "Core/ModuleLog.h"
#include <ArduinoJson.h>

static void writeCmdError_(char* reply, size_t replyLen, const char* where, ErrorCode code)
{
    if (!writeErrorJson(reply, replyLen, code, where)) {
        snprintf(reply, replyLen, "{\"ok\":false}");
    }
}

bool ConfigStoreModule::svcApplyJson(void* ctx, const char* json) {
    return ((ConfigStore*)ctx)->applyJson(json);
}

bool ConfigStoreModule::svcToJson(void* ctx, char* out, size_t outLen) {
    return ((ConfigStore*)ctx)->toJson(out, outLen);
}

bool ConfigStoreModule::svcToJsonModule(void* ctx, const char* module, char* out, size_t outLen, bool* truncated) {
    return ((ConfigStore*)ctx)->toJsonModule(module, out, outLen, truncated);
}

uint8_t ConfigStoreModule::svcListModules(void* ctx, const char** out, uint8_t max) {
    return ((ConfigStore*)ctx)->listModules(out, max);
}

void ConfigStoreModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    registry = &cfg;

    logHub = services.get<LogHubService>("loghub");

    svc_.ctx = registry;
    if (!services.add("config", &svc_)) {
        LOGE("service registration failed: config");
        return;
    }
    LOGI("ConfigStoreService registered");
}

void ConfigStoreModule::onConfigLoaded(ConfigStore&, ServiceRegistry& services) {
    cmdSvc_ = services.get<CommandService>("cmd");
    if (!cmdSvc_ || !cmdSvc_->registerHandler) return;
    cmdSvc_->registerHandler(cmdSvc_->ctx, "config.get", cmdGet_, this);
    cmdSvc_->registerHandler(cmdSvc_->ctx, "config.apply", cmdApply_, this);
}

bool ConfigStoreModule::cmdGet_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen) {
    ConfigStoreModule* self = static_cast<ConfigStoreModule*>(userCtx);
    if (!self) return false;
    return self->handleGet_(req, reply, replyLen);
}

bool ConfigStoreModule::cmdApply_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen) {
    ConfigStoreModule* self = static_cast<ConfigStoreModule*>(userCtx);
    if (!self) return false;
    return self->handleApply_(req, reply, replyLen);
}

bool ConfigStoreModule::handleGet_(const CommandRequest& req, char* reply, size_t replyLen) {
    if (!registry) {
        writeCmdError_(reply, replyLen, "config.get", ErrorCode::CfgServiceUnavailable);
        return false;
    }

    const char* module = nullptr;
    StaticJsonDocument<128> doc;
    const char* json = req.args ? req.args : req.json;
    if (json && json[0] != '\0') {
        const DeserializationError err = deserializeJson(doc, json);
        if (err || !doc.is<JsonObject>()) {
            writeCmdError_(reply, replyLen, "config.get", ErrorCode::BadCfgJson);
            return false;
        }
        if (doc["module"].is<const char*>()) module = doc["module"].as<const char*>();
    }

    char cfgJson[Limits::ConfigJsonBuf];
    bool ok = false;
    if (module) {
        bool truncated = false;
        ok = registry->toJsonModule(module, cfgJson, sizeof(cfgJson), &truncated) && !truncated;
    } else {
        ok = registry->toJson(cfgJson, sizeof(cfgJson));
    }
    if (!ok) {
        writeCmdError_(reply, replyLen, "config.get", ErrorCode::Failed);
        return false;
    }

    const int wrote = snprintf(reply, replyLen, "{\"ok\":true,\"config\":%s}", cfgJson);
    if (wrote < 0 || (size_t)wrote >= replyLen) {
        writeCmdError_(reply, replyLen, "config.get", ErrorCode::Failed);
        return false;
    }
    return true;
}

bool ConfigStoreModule::handleApply_(const CommandRequest& req, char* reply, size_t replyLen) {
    if (!registry) {
        writeCmdError_(reply, replyLen, "config.apply", ErrorCode::CfgServiceUnavailable);
        return false;
    }

    const char* json = req.args ? req.args : req.json;
    if (!json || json[0] == '\0') {
        writeCmdError_(reply, replyLen, "config.apply", ErrorCode::MissingArgs);
        return false;
    }
    if (!registry->applyJson(json)) {
        LOGW("config.apply rejected");
        writeCmdError_(reply, replyLen, "config.apply", ErrorCode::CfgApplyFailed);
        return false;
    }

    snprintf(reply, replyLen, "{\"ok\":true}");
    return true;
}
