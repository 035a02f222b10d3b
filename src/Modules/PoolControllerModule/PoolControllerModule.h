#pragma once
/**
 * @file PoolControllerModule.h
 * @brief Supervisory pool/spa controller: status monitoring, commands and clock sync.
 */

#include "Core/Module.h"
#include "Core/ConfigTypes.h"
#include "Core/Services/Services.h"
#include "Domain/PoolControllerDefaults.h"
#include "Modules/PoolControllerModule/PoolClockSync.h"
#include "Modules/PoolControllerModule/PoolCommandFacade.h"
#include "Modules/PoolControllerModule/PoolReachabilityMonitor.h"
#include "Modules/PoolControllerModule/PoolStatusPublisher.h"

struct CommandRequest;

/**
 * @brief Active module whose task runs the reachability monitor.
 *
 * The bus binding registers the "poolbus" service during init (a module or
 * plain code); it is looked up in `onConfigLoaded()`. Commands run on the
 * caller's task; statuses are observed through
 * `currentStatus()`, subscriptions or listeners.
 */
class PoolControllerModule : public Module {
public:
    ~PoolControllerModule() override { (void)shutdown(portMAX_DELAY); }

    const char* moduleId() const override { return "poolctl"; }
    const char* taskName() const override { return "poolctl"; }

    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

    uint16_t taskStackSize() const override { return Limits::PoolCtl::MonitorStackSize; }
    TickType_t loopDelayTicks() const override {
        return monitor_.isAttached() ? 0 : pdMS_TO_TICKS(100);
    }

    /** @brief Latest status, waiting up to `waitTicks` for the first one. */
    bool currentStatus(PoolStatus& out, TickType_t waitTicks) const {
        return publisher_.latest(out, waitTicks);
    }
    PoolStatusSubscription subscribe() { return publisher_.subscribe(); }
    bool addListener(PoolStatusListener cb, void* user, uint8_t* outId) {
        return publisher_.addListener(cb, user, outId);
    }
    bool removeListener(uint8_t id) { return publisher_.removeListener(id); }

    PoolCtlStatus setFeaturePower(PoolFeature feature, PoolPowerState state);
    PoolCtlStatus setBodyPower(PoolBody body, PoolPowerState state);
    PoolCtlStatus setSeekTemperature(PoolBody body, int16_t temp);
    PoolCtlStatus setHeatSource(PoolBody body, PoolHeatSource source);
    PoolCtlStatus synchronizeClock();

    /**
     * @brief Stop the monitor and clock tasks, close every subscription and
     *        release the bus feed. Later commands return POOLCTL_ERR_STOPPED.
     */
    bool shutdown(TickType_t waitTicks);

    bool isRunning() const { return monitor_.isAttached() && !stopped_; }
    uint32_t reachabilityTimeoutMs() const { return monitor_.timeoutMs(); }
    uint32_t clockSyncPeriodMs() const { return clock_.periodMs(); }
    bool clockSyncRunning() const { return clock_.isRunning(); }

private:
    const LogHubService* logHub_ = nullptr;
    const PoolBusService* bus_ = nullptr;
    const CommandService* cmdSvc_ = nullptr;

    PoolStatusPublisher publisher_;
    PoolReachabilityMonitor monitor_{publisher_};
    PoolCommandFacade facade_{monitor_.observed()};
    PoolClockSync clock_{facade_};
    volatile bool stopped_ = false;

    int32_t reachabilityTimeoutMs_ = PoolCtlDefaults::ReachabilityTimeoutMs;
    int32_t clockSyncPeriodMs_ = PoolCtlDefaults::ClockSyncPeriodMs;
    bool clockSyncOnStart_ = PoolCtlDefaults::ClockSyncOnStart;

    ConfigVariable<int32_t,1> reachTimeoutVar_{"reachability_timeout_ms", "poolctl", ConfigType::Int32,
                                               &reachabilityTimeoutMs_};
    ConfigVariable<int32_t,1> clockPeriodVar_{"clock_sync_period_ms", "poolctl", ConfigType::Int32,
                                              &clockSyncPeriodMs_};
    ConfigVariable<bool,0> clockOnStartVar_{"clock_sync_on_start", "poolctl", ConfigType::Bool,
                                            &clockSyncOnStart_};

    PoolControllerService poolSvc_{
        svcCurrentStatus_,
        svcAddListener_,
        svcRemoveListener_,
        svcSetFeaturePower_,
        svcSetBodyPower_,
        svcSetSeekTemperature_,
        svcSetHeatSource_,
        svcSynchronizeClock_,
        this
    };

    static void onReachTimeoutChanged_(void* ctx, const int32_t& value);
    static void onClockPeriodChanged_(void* ctx, const int32_t& value);

    static bool svcCurrentStatus_(void* ctx, PoolStatus* out, TickType_t waitTicks);
    static bool svcAddListener_(void* ctx, PoolStatusListener cb, void* user, uint8_t* outId);
    static bool svcRemoveListener_(void* ctx, uint8_t id);
    static PoolCtlStatus svcSetFeaturePower_(void* ctx, PoolFeature feature, PoolPowerState state);
    static PoolCtlStatus svcSetBodyPower_(void* ctx, PoolBody body, PoolPowerState state);
    static PoolCtlStatus svcSetSeekTemperature_(void* ctx, PoolBody body, int16_t temp);
    static PoolCtlStatus svcSetHeatSource_(void* ctx, PoolBody body, PoolHeatSource source);
    static PoolCtlStatus svcSynchronizeClock_(void* ctx);

    static bool cmdStatus_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdFeature_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdBody_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdSeek_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdHeatSource_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdClockSync_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);

    bool handleStatus_(char* reply, size_t replyLen);
    bool handleFeature_(const CommandRequest& req, char* reply, size_t replyLen);
    bool handleBody_(const CommandRequest& req, char* reply, size_t replyLen);
    bool handleSeek_(const CommandRequest& req, char* reply, size_t replyLen);
    bool handleHeatSource_(const CommandRequest& req, char* reply, size_t replyLen);
    bool handleClockSync_(char* reply, size_t replyLen);

    PoolCtlStatus guard_() const;
    static uint32_t effectiveMs_(int32_t value, int32_t fallback);
};
