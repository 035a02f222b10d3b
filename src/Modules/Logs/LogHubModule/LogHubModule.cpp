/**
 * @file LogHubModule.cpp
 * @brief Implementation file.
 */
#include "LogHubModule.h"
#include "Core/Log.h"
#include "Core/SystemLimits.h"

LogHubModule::~LogHubModule() {
    if (Log::hub() == &hubSvc_) Log::setHub(nullptr);
}

void LogHubModule::applyMinLevel_(uint8_t value) {
    if (value > (uint8_t)LogLevel::Error) value = (uint8_t)LogLevel::Error;
    hub_.setMinLevel((LogLevel)value);
}

void LogHubModule::onMinLevelChanged_(void* ctx, const uint8_t& value) {
    LogHubModule* self = static_cast<LogHubModule*>(ctx);
    if (!self) return;
    self->applyMinLevel_(value);
}

void LogHubModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    hub_.init(Limits::LogQueueLen);

    minLevelVar_.addHandler(onMinLevelChanged_, this);
    cfg.registerVar(minLevelVar_);

    /// expose loghub service
    hubSvc_.enqueue = [](void* ctx, const LogEntry& e) -> bool {
        return static_cast<LogHub*>(ctx)->enqueue(e);
    };
    hubSvc_.minLevel = [](void* ctx) -> LogLevel {
        return static_cast<LogHub*>(ctx)->minLevel();
    };
    hubSvc_.ctx = &hub_;

    /// expose sink registry service
    sinksSvc_.add = [](void* ctx, LogSinkService sink) -> bool {
        return static_cast<LogSinkRegistry*>(ctx)->add(sink);
    };
    sinksSvc_.count = [](void* ctx) -> int {
        return static_cast<LogSinkRegistry*>(ctx)->count();
    };
    sinksSvc_.get = [](void* ctx, int idx) -> LogSinkService {
        return static_cast<LogSinkRegistry*>(ctx)->get(idx);
    };
    sinksSvc_.ctx = &sinks_;

    services.add("loghub", &hubSvc_);
    services.add("logsinks", &sinksSvc_);

    Log::setHub(&hubSvc_);
}

void LogHubModule::onConfigLoaded(ConfigStore&, ServiceRegistry&) {
    applyMinLevel_(minLevel_);
}
