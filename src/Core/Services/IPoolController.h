#pragma once
/**
 * @file IPoolController.h
 * @brief Pool controller service interface.
 */
#include <FreeRTOS.h>
#include <stdint.h>
#include "Core/PoolStatus.h"

/** @brief Result of a pool controller command. */
enum PoolCtlStatus : uint8_t {
    POOLCTL_OK = 0,
    POOLCTL_ERR_INVALID_ARG = 1,
    POOLCTL_ERR_IO = 2,
    POOLCTL_ERR_NOT_READY = 3,
    POOLCTL_ERR_STOPPED = 4
};

/** @brief Push-style status listener, called from the listener's own dispatch task. */
typedef void (*PoolStatusListener)(void* user, const PoolStatus& status);

/** @brief Service exposed by PoolControllerModule under the id "poolctl". */
struct PoolControllerService {
    /** Latest status; blocks up to `waitTicks` until the first status exists. */
    bool (*currentStatus)(void* ctx, PoolStatus* out, TickType_t waitTicks);
    bool (*addListener)(void* ctx, PoolStatusListener cb, void* user, uint8_t* outId);
    bool (*removeListener)(void* ctx, uint8_t id);
    PoolCtlStatus (*setFeaturePower)(void* ctx, PoolFeature feature, PoolPowerState state);
    PoolCtlStatus (*setBodyPower)(void* ctx, PoolBody body, PoolPowerState state);
    PoolCtlStatus (*setSeekTemperature)(void* ctx, PoolBody body, int16_t temp);
    PoolCtlStatus (*setHeatSource)(void* ctx, PoolBody body, PoolHeatSource source);
    PoolCtlStatus (*synchronizeClock)(void* ctx);
    void* ctx;
};

static inline const char* poolCtlStatusStr(PoolCtlStatus st)
{
    switch (st) {
    case POOLCTL_OK: return "ok";
    case POOLCTL_ERR_INVALID_ARG: return "invalid_arg";
    case POOLCTL_ERR_IO: return "io";
    case POOLCTL_ERR_NOT_READY: return "not_ready";
    case POOLCTL_ERR_STOPPED: return "stopped";
    default: return "unknown";
    }
}
