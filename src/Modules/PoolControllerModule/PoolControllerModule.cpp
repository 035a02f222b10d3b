/**
 * @file PoolControllerModule.cpp
 * @brief Implementation file.
 */

#include "PoolControllerModule.h"
#include "PoolHardwareMap.h"
#include "Core/CommandRegistry.h"
#include "Core/ErrorCodes.h"
#include "Core/SnprintfCheck.h"
#include "Core/SystemLimits.h"
#define LOG_TAG "PoolCtrl"
#include "Core/ModuleLog.h"
#include <ArduinoJson.h>
#include <string.h>

static bool parseCmdArgsObject_(const CommandRequest& req, JsonDocument& doc, JsonObjectConst& outObj)
{
    doc.clear();
    const char* json = req.args ? req.args : req.json;
    if (!json || json[0] == '\0') return false;

    const DeserializationError err = deserializeJson(doc, json);
    if (!err && doc.is<JsonObject>()) {
        outObj = doc.as<JsonObjectConst>();
        return true;
    }

    if (req.json && req.json[0] != '\0' && req.args != req.json) {
        doc.clear();
        const DeserializationError rootErr = deserializeJson(doc, req.json);
        if (rootErr || !doc.is<JsonObjectConst>()) return false;
        JsonVariantConst argsVar = doc["args"];
        if (argsVar.is<JsonObjectConst>()) {
            outObj = argsVar.as<JsonObjectConst>();
            return true;
        }
    }

    return false;
}

static void writeCmdError_(char* reply, size_t replyLen, const char* where, ErrorCode code)
{
    if (!writeErrorJson(reply, replyLen, code, where)) {
        snprintf(reply, replyLen, "{\"ok\":false}");
    }
}

static ErrorCode errorFromStatus_(PoolCtlStatus st)
{
    switch (st) {
    case POOLCTL_ERR_IO: return ErrorCode::IoError;
    case POOLCTL_ERR_NOT_READY: return ErrorCode::NotReady;
    case POOLCTL_ERR_STOPPED: return ErrorCode::Stopped;
    default: return ErrorCode::Failed;
    }
}

static bool parseBody_(JsonObjectConst args, PoolBody* out)
{
    if (!args["body"].is<const char*>()) return false;
    return poolBodyFromStr(args["body"].as<const char*>(), out);
}

static bool parsePowerState_(JsonVariantConst value, PoolPowerState* out)
{
    if (value.is<bool>()) {
        *out = value.as<bool>() ? PoolPowerState::On : PoolPowerState::Off;
        return true;
    }
    if (value.is<const char*>()) {
        return poolPowerStateFromStr(value.as<const char*>(), out);
    }
    return false;
}

uint32_t PoolControllerModule::effectiveMs_(int32_t value, int32_t fallback)
{
    return (uint32_t)((value > 0) ? value : fallback);
}

void PoolControllerModule::onReachTimeoutChanged_(void* ctx, const int32_t& value)
{
    PoolControllerModule* self = static_cast<PoolControllerModule*>(ctx);
    if (!self) return;
    self->monitor_.setTimeoutMs(effectiveMs_(value, PoolCtlDefaults::ReachabilityTimeoutMs));
    LOGI("reachability timeout=%lu ms", (unsigned long)self->monitor_.timeoutMs());
}

void PoolControllerModule::onClockPeriodChanged_(void* ctx, const int32_t& value)
{
    PoolControllerModule* self = static_cast<PoolControllerModule*>(ctx);
    if (!self) return;
    self->clock_.setPeriodMs(effectiveMs_(value, PoolCtlDefaults::ClockSyncPeriodMs));
}

void PoolControllerModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    reachTimeoutVar_.addHandler(onReachTimeoutChanged_, this);
    clockPeriodVar_.addHandler(onClockPeriodChanged_, this);
    cfg.registerVar(reachTimeoutVar_);
    cfg.registerVar(clockPeriodVar_);
    cfg.registerVar(clockOnStartVar_);

    logHub_ = services.get<LogHubService>("loghub");

    if (!services.add("poolctl", &poolSvc_)) {
        LOGE("service registration failed: poolctl");
    }
}

void PoolControllerModule::onConfigLoaded(ConfigStore&, ServiceRegistry& services)
{
    monitor_.setTimeoutMs(effectiveMs_(reachabilityTimeoutMs_, PoolCtlDefaults::ReachabilityTimeoutMs));
    clock_.setPeriodMs(effectiveMs_(clockSyncPeriodMs_, PoolCtlDefaults::ClockSyncPeriodMs));

    bus_ = services.get<PoolBusService>("poolbus");
    facade_.setBus(bus_);
    if (!facade_.hasBus()) {
        LOGW("PoolCtl has no PoolBusService");
    }

    // Registered here so the command module may be initialized in any order.
    cmdSvc_ = services.get<CommandService>("cmd");
    if (cmdSvc_ && cmdSvc_->registerHandler) {
        cmdSvc_->registerHandler(cmdSvc_->ctx, "poolctl.status", cmdStatus_, this);
        cmdSvc_->registerHandler(cmdSvc_->ctx, "poolctl.feature", cmdFeature_, this);
        cmdSvc_->registerHandler(cmdSvc_->ctx, "poolctl.body", cmdBody_, this);
        cmdSvc_->registerHandler(cmdSvc_->ctx, "poolctl.seek", cmdSeek_, this);
        cmdSvc_->registerHandler(cmdSvc_->ctx, "poolctl.heat_source", cmdHeatSource_, this);
        cmdSvc_->registerHandler(cmdSvc_->ctx, "poolctl.clock_sync", cmdClockSync_, this);
    }

    if (!bus_) return;
    if (!monitor_.attach(bus_)) {
        LOGE("monitor not started: no bus feed");
        return;
    }
    if (clockSyncOnStart_ && !clock_.start(true)) {
        LOGE("clock sync on start failed to launch");
    }
}

void PoolControllerModule::loop()
{
    if (!monitor_.isAttached()) return;
    (void)monitor_.step();
}

bool PoolControllerModule::shutdown(TickType_t waitTicks)
{
    if (stopped_) return true;
    stopped_ = true;

    facade_.stop();
    publisher_.close();

    bool ok = clock_.stop(waitTicks);
    if (!ok) LOGW("clock task did not stop");

    requestStop();
    if (!waitStopped(waitTicks)) {
        LOGW("monitor task did not stop");
        ok = false;
    } else {
        monitor_.detach();
    }

    LOGI("pool controller stopped");
    return ok;
}

PoolCtlStatus PoolControllerModule::guard_() const
{
    if (stopped_) return POOLCTL_ERR_STOPPED;
    if (!facade_.hasBus()) return POOLCTL_ERR_NOT_READY;
    return POOLCTL_OK;
}

PoolCtlStatus PoolControllerModule::setFeaturePower(PoolFeature feature, PoolPowerState state)
{
    PoolBusCircuit circuit = PoolBusCircuit::Count;
    if (!poolFeatureCircuit(feature, &circuit)) return POOLCTL_ERR_INVALID_ARG;

    const PoolCtlStatus g = guard_();
    if (g != POOLCTL_OK) return g;
    return facade_.setFeaturePower(feature, state);
}

PoolCtlStatus PoolControllerModule::setBodyPower(PoolBody body, PoolPowerState state)
{
    const PoolCtlStatus g = guard_();
    if (g != POOLCTL_OK) return g;
    return facade_.setBodyPower(body, state);
}

PoolCtlStatus PoolControllerModule::setSeekTemperature(PoolBody body, int16_t temp)
{
    const PoolCtlStatus g = guard_();
    if (g != POOLCTL_OK) return g;
    return facade_.setSeekTemperature(body, temp);
}

PoolCtlStatus PoolControllerModule::setHeatSource(PoolBody body, PoolHeatSource source)
{
    const PoolCtlStatus g = guard_();
    if (g != POOLCTL_OK) return g;
    return facade_.setHeatSource(body, source);
}

PoolCtlStatus PoolControllerModule::synchronizeClock()
{
    const PoolCtlStatus g = guard_();
    if (g != POOLCTL_OK) return g;
    return clock_.synchronizeClock();
}

bool PoolControllerModule::svcCurrentStatus_(void* ctx, PoolStatus* out, TickType_t waitTicks)
{
    PoolControllerModule* self = static_cast<PoolControllerModule*>(ctx);
    if (!self || !out) return false;
    return self->currentStatus(*out, waitTicks);
}

bool PoolControllerModule::svcAddListener_(void* ctx, PoolStatusListener cb, void* user, uint8_t* outId)
{
    PoolControllerModule* self = static_cast<PoolControllerModule*>(ctx);
    return self ? self->addListener(cb, user, outId) : false;
}

bool PoolControllerModule::svcRemoveListener_(void* ctx, uint8_t id)
{
    PoolControllerModule* self = static_cast<PoolControllerModule*>(ctx);
    return self ? self->removeListener(id) : false;
}

PoolCtlStatus PoolControllerModule::svcSetFeaturePower_(void* ctx, PoolFeature feature, PoolPowerState state)
{
    PoolControllerModule* self = static_cast<PoolControllerModule*>(ctx);
    return self ? self->setFeaturePower(feature, state) : POOLCTL_ERR_NOT_READY;
}

PoolCtlStatus PoolControllerModule::svcSetBodyPower_(void* ctx, PoolBody body, PoolPowerState state)
{
    PoolControllerModule* self = static_cast<PoolControllerModule*>(ctx);
    return self ? self->setBodyPower(body, state) : POOLCTL_ERR_NOT_READY;
}

PoolCtlStatus PoolControllerModule::svcSetSeekTemperature_(void* ctx, PoolBody body, int16_t temp)
{
    PoolControllerModule* self = static_cast<PoolControllerModule*>(ctx);
    return self ? self->setSeekTemperature(body, temp) : POOLCTL_ERR_NOT_READY;
}

PoolCtlStatus PoolControllerModule::svcSetHeatSource_(void* ctx, PoolBody body, PoolHeatSource source)
{
    PoolControllerModule* self = static_cast<PoolControllerModule*>(ctx);
    return self ? self->setHeatSource(body, source) : POOLCTL_ERR_NOT_READY;
}

PoolCtlStatus PoolControllerModule::svcSynchronizeClock_(void* ctx)
{
    PoolControllerModule* self = static_cast<PoolControllerModule*>(ctx);
    return self ? self->synchronizeClock() : POOLCTL_ERR_NOT_READY;
}

bool PoolControllerModule::cmdStatus_(void* userCtx, const CommandRequest&, char* reply, size_t replyLen)
{
    PoolControllerModule* self = static_cast<PoolControllerModule*>(userCtx);
    if (!self) return false;
    return self->handleStatus_(reply, replyLen);
}

bool PoolControllerModule::cmdFeature_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    PoolControllerModule* self = static_cast<PoolControllerModule*>(userCtx);
    if (!self) return false;
    return self->handleFeature_(req, reply, replyLen);
}

bool PoolControllerModule::cmdBody_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    PoolControllerModule* self = static_cast<PoolControllerModule*>(userCtx);
    if (!self) return false;
    return self->handleBody_(req, reply, replyLen);
}

bool PoolControllerModule::cmdSeek_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    PoolControllerModule* self = static_cast<PoolControllerModule*>(userCtx);
    if (!self) return false;
    return self->handleSeek_(req, reply, replyLen);
}

bool PoolControllerModule::cmdHeatSource_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    PoolControllerModule* self = static_cast<PoolControllerModule*>(userCtx);
    if (!self) return false;
    return self->handleHeatSource_(req, reply, replyLen);
}

bool PoolControllerModule::cmdClockSync_(void* userCtx, const CommandRequest&, char* reply, size_t replyLen)
{
    PoolControllerModule* self = static_cast<PoolControllerModule*>(userCtx);
    if (!self) return false;
    return self->handleClockSync_(reply, replyLen);
}

bool PoolControllerModule::handleStatus_(char* reply, size_t replyLen)
{
    PoolStatus st{};
    if (!publisher_.latest(st, 0)) {
        writeCmdError_(reply, replyLen, "poolctl.status", ErrorCode::NotReady);
        return false;
    }

    char json[Limits::PoolCtl::StatusJsonBuf];
    if (!writePoolStatusJson(st, json, sizeof(json))) {
        writeCmdError_(reply, replyLen, "poolctl.status", ErrorCode::Failed);
        return false;
    }

    const int wrote = POOLCTL_SNPRINTF_CHECKED(LOG_TAG, reply, replyLen, "{\"ok\":true,\"status\":%s}", json);
    if (wrote < 0 || (size_t)wrote >= replyLen) {
        writeCmdError_(reply, replyLen, "poolctl.status", ErrorCode::Failed);
        return false;
    }
    return true;
}

bool PoolControllerModule::handleFeature_(const CommandRequest& req, char* reply, size_t replyLen)
{
    StaticJsonDocument<Limits::JsonCmdPoolCtlBuf> doc;
    JsonObjectConst args;
    if (!parseCmdArgsObject_(req, doc, args)) {
        writeCmdError_(reply, replyLen, "poolctl.feature", ErrorCode::MissingArgs);
        return false;
    }
    if (!args.containsKey("feature") || !args.containsKey("state")) {
        writeCmdError_(reply, replyLen, "poolctl.feature", ErrorCode::MissingArgs);
        return false;
    }

    PoolFeature feature = PoolFeature::Light;
    if (!args["feature"].is<const char*>() || !poolFeatureFromStr(args["feature"].as<const char*>(), &feature)) {
        writeCmdError_(reply, replyLen, "poolctl.feature", ErrorCode::InvalidFeature);
        return false;
    }
    if (feature == PoolFeature::Heater) {
        writeCmdError_(reply, replyLen, "poolctl.feature", ErrorCode::FeatureReadOnly);
        return false;
    }

    PoolPowerState state = PoolPowerState::Off;
    if (!parsePowerState_(args["state"], &state)) {
        writeCmdError_(reply, replyLen, "poolctl.feature", ErrorCode::InvalidPowerState);
        return false;
    }

    const PoolCtlStatus st = setFeaturePower(feature, state);
    if (st != POOLCTL_OK) {
        LOGW("feature %s rejected (%s)", poolFeatureStr(feature), poolCtlStatusStr(st));
        writeCmdError_(reply, replyLen, "poolctl.feature", errorFromStatus_(st));
        return false;
    }

    snprintf(reply, replyLen, "{\"ok\":true,\"feature\":\"%s\",\"state\":\"%s\"}",
             poolFeatureStr(feature), poolPowerStateStr(state));
    return true;
}

bool PoolControllerModule::handleBody_(const CommandRequest& req, char* reply, size_t replyLen)
{
    StaticJsonDocument<Limits::JsonCmdPoolCtlBuf> doc;
    JsonObjectConst args;
    if (!parseCmdArgsObject_(req, doc, args)) {
        writeCmdError_(reply, replyLen, "poolctl.body", ErrorCode::MissingArgs);
        return false;
    }
    if (!args.containsKey("body") || !args.containsKey("state")) {
        writeCmdError_(reply, replyLen, "poolctl.body", ErrorCode::MissingArgs);
        return false;
    }

    PoolBody body = PoolBody::Pool;
    if (!parseBody_(args, &body)) {
        writeCmdError_(reply, replyLen, "poolctl.body", ErrorCode::InvalidBody);
        return false;
    }

    PoolPowerState state = PoolPowerState::Off;
    if (!parsePowerState_(args["state"], &state)) {
        writeCmdError_(reply, replyLen, "poolctl.body", ErrorCode::InvalidPowerState);
        return false;
    }

    const PoolCtlStatus st = setBodyPower(body, state);
    if (st != POOLCTL_OK) {
        LOGW("body %s rejected (%s)", poolBodyStr(body), poolCtlStatusStr(st));
        writeCmdError_(reply, replyLen, "poolctl.body", errorFromStatus_(st));
        return false;
    }

    snprintf(reply, replyLen, "{\"ok\":true,\"body\":\"%s\",\"state\":\"%s\"}",
             poolBodyStr(body), poolPowerStateStr(state));
    return true;
}

bool PoolControllerModule::handleSeek_(const CommandRequest& req, char* reply, size_t replyLen)
{
    StaticJsonDocument<Limits::JsonCmdPoolCtlBuf> doc;
    JsonObjectConst args;
    if (!parseCmdArgsObject_(req, doc, args)) {
        writeCmdError_(reply, replyLen, "poolctl.seek", ErrorCode::MissingArgs);
        return false;
    }
    if (!args.containsKey("body") || !args.containsKey("temp")) {
        writeCmdError_(reply, replyLen, "poolctl.seek", ErrorCode::MissingArgs);
        return false;
    }

    PoolBody body = PoolBody::Pool;
    if (!parseBody_(args, &body)) {
        writeCmdError_(reply, replyLen, "poolctl.seek", ErrorCode::InvalidBody);
        return false;
    }

    if (!args["temp"].is<int32_t>()) {
        writeCmdError_(reply, replyLen, "poolctl.seek", ErrorCode::InvalidTemperature);
        return false;
    }
    const int32_t temp = args["temp"].as<int32_t>();
    if (temp < PoolCtlDefaults::MinSeekTemp || temp > PoolCtlDefaults::MaxSeekTemp) {
        writeCmdError_(reply, replyLen, "poolctl.seek", ErrorCode::InvalidTemperature);
        return false;
    }

    const PoolCtlStatus st = setSeekTemperature(body, (int16_t)temp);
    if (st != POOLCTL_OK) {
        LOGW("seek %s rejected (%s)", poolBodyStr(body), poolCtlStatusStr(st));
        writeCmdError_(reply, replyLen, "poolctl.seek", errorFromStatus_(st));
        return false;
    }

    snprintf(reply, replyLen, "{\"ok\":true,\"body\":\"%s\",\"temp\":%ld}", poolBodyStr(body), (long)temp);
    return true;
}

bool PoolControllerModule::handleHeatSource_(const CommandRequest& req, char* reply, size_t replyLen)
{
    StaticJsonDocument<Limits::JsonCmdPoolCtlBuf> doc;
    JsonObjectConst args;
    if (!parseCmdArgsObject_(req, doc, args)) {
        writeCmdError_(reply, replyLen, "poolctl.heat_source", ErrorCode::MissingArgs);
        return false;
    }
    if (!args.containsKey("body") || !args.containsKey("source")) {
        writeCmdError_(reply, replyLen, "poolctl.heat_source", ErrorCode::MissingArgs);
        return false;
    }

    PoolBody body = PoolBody::Pool;
    if (!parseBody_(args, &body)) {
        writeCmdError_(reply, replyLen, "poolctl.heat_source", ErrorCode::InvalidBody);
        return false;
    }

    PoolHeatSource source = PoolHeatSource::Unheated;
    if (!args["source"].is<const char*>() ||
        !poolHeatSourceFromStr(args["source"].as<const char*>(), &source)) {
        writeCmdError_(reply, replyLen, "poolctl.heat_source", ErrorCode::InvalidHeatSource);
        return false;
    }

    const PoolCtlStatus st = setHeatSource(body, source);
    if (st != POOLCTL_OK) {
        LOGW("heat source %s rejected (%s)", poolBodyStr(body), poolCtlStatusStr(st));
        writeCmdError_(reply, replyLen, "poolctl.heat_source", errorFromStatus_(st));
        return false;
    }

    snprintf(reply, replyLen, "{\"ok\":true,\"body\":\"%s\",\"source\":\"%s\"}",
             poolBodyStr(body), poolHeatSourceStr(source));
    return true;
}

bool PoolControllerModule::handleClockSync_(char* reply, size_t replyLen)
{
    const PoolCtlStatus st = synchronizeClock();
    if (st != POOLCTL_OK) {
        LOGW("clock sync rejected (%s)", poolCtlStatusStr(st));
        writeCmdError_(reply, replyLen, "poolctl.clock_sync", errorFromStatus_(st));
        return false;
    }
    snprintf(reply, replyLen, "{\"ok\":true}");
    return true;
}
