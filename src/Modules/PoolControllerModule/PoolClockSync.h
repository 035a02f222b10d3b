#pragma once
/**
 * @file PoolClockSync.h
 * @brief Pushes local time to the pool controller, once and then periodically.
 */
#include "Domain/PoolControllerDefaults.h"
#include "Modules/PoolControllerModule/PoolCommandFacade.h"
#include <FreeRTOS.h>
#include <semphr.h>
#include <task.h>

class PoolClockSync {
public:
    explicit PoolClockSync(PoolCommandFacade& facade) : facade_(facade) {}
    ~PoolClockSync();

    PoolClockSync(const PoolClockSync&) = delete;
    PoolClockSync& operator=(const PoolClockSync&) = delete;

    /**
     * @brief Set the controller clock now, then keep it set every period.
     *
     * The periodic task is started by the first call whose immediate exchange
     * succeeds. A failed exchange returns its status and starts nothing.
     */
    PoolCtlStatus synchronizeClock();

    /** @brief Start the periodic task; `syncFirst` runs one sync from that task right away. */
    bool start(bool syncFirst);

    /** @brief One clock-set exchange using the current local time. */
    PoolCtlStatus syncOnce();

    void setPeriodMs(uint32_t ms);
    uint32_t periodMs() const { return periodMs_; }

    bool isRunning() const { return task_ != nullptr; }
    uint32_t runs() const { return runs_; }

    /** @brief Wake and end the periodic task. False if it did not exit in time. */
    bool stop(TickType_t waitTicks);

private:
    PoolCommandFacade& facade_;
    TaskHandle_t task_ = nullptr;
    SemaphoreHandle_t stoppedSem_ = nullptr;
    volatile bool stopRequested_ = false;
    volatile bool syncFirst_ = false;
    volatile uint32_t periodMs_ = (uint32_t)PoolCtlDefaults::ClockSyncPeriodMs;
    volatile uint32_t runs_ = 0;

    static void taskFn_(void* pv);
    void run_();
};
