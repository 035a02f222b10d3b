#pragma once
/**
 * @file LogDispatcherModule.h
 * @brief Module that dispatches log entries to sinks.
 */
#include "Core/Module.h"
#include "Core/ServiceRegistry.h"
#include "Core/Services/ILogger.h"
#include "Core/SystemLimits.h"
#include "Core/LogHub.h"

/**
 * @brief Active module whose task drains the log hub into every registered sink.
 */
class LogDispatcherModule : public Module {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "log.dispatcher"; }
    const char* taskName() const override { return "LogDispatch"; }

    /** @brief Depends on log hub. */
    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        return nullptr;
    }

    /** @brief Resolve the hub behind the "loghub" service and the sink registry. */
    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

    uint16_t taskStackSize() const override { return Limits::LogDispatchStackSize; }
    TickType_t loopDelayTicks() const override { return ready() ? 0 : pdMS_TO_TICKS(100); }

    bool ready() const { return _hub && _sinkReg; }

    /**
     * @brief Deliver queued entries to every sink. Waits up to `waitTicks` for
     *        the first entry, then drains without blocking.
     * @return Number of entries delivered.
     */
    uint16_t dispatchPending(TickType_t waitTicks);

private:
    LogHub* _hub = nullptr;
    const LogSinkRegistryService* _sinkReg = nullptr;

    void deliver_(const LogEntry& e);
};
