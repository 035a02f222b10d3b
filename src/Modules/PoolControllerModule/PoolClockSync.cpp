/**
 * @file PoolClockSync.cpp
 * @brief Implementation file.
 */
#include "PoolClockSync.h"
#include "Core/SystemLimits.h"
#define LOG_TAG "PoolClok"
#include "Core/ModuleLog.h"
#include <time.h>

PoolClockSync::~PoolClockSync()
{
    (void)stop(portMAX_DELAY);
    if (stoppedSem_) vSemaphoreDelete(stoppedSem_);
}

void PoolClockSync::setPeriodMs(uint32_t ms)
{
    if (ms == 0) return;
    periodMs_ = ms;
}

PoolCtlStatus PoolClockSync::syncOnce()
{
    const time_t now = time(nullptr);
    struct tm local;
    if (!localtime_r(&now, &local)) {
        LOGE("local time unavailable");
        return POOLCTL_ERR_NOT_READY;
    }

    const PoolCtlStatus st = facade_.setClock(local);
    runs_ = runs_ + 1;
    if (st == POOLCTL_OK) {
        LOGI("controller clock set to %04d-%02d-%02d %02d:%02d",
             local.tm_year + 1900, local.tm_mon + 1, local.tm_mday, local.tm_hour, local.tm_min);
    }
    return st;
}

PoolCtlStatus PoolClockSync::synchronizeClock()
{
    const PoolCtlStatus st = syncOnce();
    if (st != POOLCTL_OK) return st;
    if (!start(false)) {
        LOGW("periodic clock sync not started");
    }
    return st;
}

bool PoolClockSync::start(bool syncFirst)
{
    if (task_) return true;
    if (!stoppedSem_) stoppedSem_ = xSemaphoreCreateBinary();
    if (!stoppedSem_) return false;

    stopRequested_ = false;
    syncFirst_ = syncFirst;
    if (xTaskCreate(&PoolClockSync::taskFn_, "poolctl.clock", Limits::PoolCtl::ClockTaskStackSize,
                    this, 1, &task_) != pdPASS) {
        task_ = nullptr;
        LOGE("clock task create failed");
        return false;
    }
    LOGI("periodic clock sync every %lu ms", (unsigned long)periodMs_);
    return true;
}

bool PoolClockSync::stop(TickType_t waitTicks)
{
    if (!task_) return true;
    stopRequested_ = true;
    xTaskNotifyGive(task_);
    if (xSemaphoreTake(stoppedSem_, waitTicks) != pdTRUE) return false;
    task_ = nullptr;
    return true;
}

void PoolClockSync::taskFn_(void* pv)
{
    PoolClockSync* self = static_cast<PoolClockSync*>(pv);
    self->run_();
    xSemaphoreGive(self->stoppedSem_);
    vTaskDelete(nullptr);
}

void PoolClockSync::run_()
{
    if (syncFirst_ && !stopRequested_) {
        const PoolCtlStatus st = syncOnce();
        if (st != POOLCTL_OK) LOGW("clock sync failed: %s", poolCtlStatusStr(st));
    }

    // Fixed rate: deadlines advance by one period regardless of exchange duration.
    TickType_t next = xTaskGetTickCount() + pdMS_TO_TICKS(periodMs_);
    while (!stopRequested_) {
        const TickType_t now = xTaskGetTickCount();
        const TickType_t wait = ((int32_t)(next - now) > 0) ? (TickType_t)(next - now) : 0;
        (void)ulTaskNotifyTake(pdTRUE, wait);
        if (stopRequested_) break;
        if ((int32_t)(xTaskGetTickCount() - next) < 0) continue;

        const PoolCtlStatus st = syncOnce();
        if (st != POOLCTL_OK) LOGW("clock sync failed: %s", poolCtlStatusStr(st));
        next += pdMS_TO_TICKS(periodMs_);
    }
}
