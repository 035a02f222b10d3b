#pragma once
/**
 * @file PoolObservedState.h
 * @brief Last observed body and feature circuits, shared with the command path.
 */
#include "Core/PoolStatus.h"
#include <FreeRTOS.h>
#include <semphr.h>

/** @brief Circuit state carried by the last system status seen on the feed. */
struct PoolObservedCircuits {
    bool known = false;
    bool bodyActive = false;
    PoolBody body = PoolBody::Pool;
    PoolFeatureMask features = 0;

    bool hasFeature(PoolFeature f) const { return (features & poolFeatureBit(f)) != 0; }
};

/**
 * @brief Locked cell written by the monitor on every system status.
 *
 * Updated whether or not the status gets published, so readers see circuit
 * changes before the heat status arrives.
 */
class PoolObservedState {
public:
    PoolObservedState();
    ~PoolObservedState();

    PoolObservedState(const PoolObservedState&) = delete;
    PoolObservedState& operator=(const PoolObservedState&) = delete;

    void store(const PoolObservedCircuits& circuits);
    PoolObservedCircuits load() const;
    /** @brief Back to unknown (no body, no feature). */
    void clear();

private:
    SemaphoreHandle_t lock_ = nullptr;
    PoolObservedCircuits circuits_{};
};
