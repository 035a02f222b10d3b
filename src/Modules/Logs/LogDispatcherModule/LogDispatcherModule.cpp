/**
 * @file LogDispatcherModule.cpp
 * @brief Implementation file.
 */
#include "LogDispatcherModule.h"

void LogDispatcherModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    (void)cfg;

    auto hubSvc = services.get<LogHubService>("loghub");
    _sinkReg = services.get<LogSinkRegistryService>("logsinks");

    /// the dispatcher drains the LogHub behind the producer service
    if (!hubSvc || !hubSvc->ctx) return;
    _hub = static_cast<LogHub*>(hubSvc->ctx);
}

void LogDispatcherModule::loop() {
    if (!ready()) return;
    (void)dispatchPending(pdMS_TO_TICKS(100));
}

void LogDispatcherModule::deliver_(const LogEntry& e) {
    const int n = _sinkReg->count(_sinkReg->ctx);
    for (int i = 0; i < n; ++i) {
        LogSinkService sink = _sinkReg->get(_sinkReg->ctx, i);
        if (sink.write) sink.write(sink.ctx, e);
    }
}

uint16_t LogDispatcherModule::dispatchPending(TickType_t waitTicks) {
    if (!ready()) return 0;

    LogEntry e;
    uint16_t delivered = 0;
    TickType_t wait = waitTicks;
    while (_hub->dequeue(e, wait)) {
        deliver_(e);
        ++delivered;
        wait = 0;
    }
    return delivered;
}
