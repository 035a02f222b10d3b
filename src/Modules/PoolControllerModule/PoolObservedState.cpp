/**
 * @file PoolObservedState.cpp
 * @brief Implementation file.
 */
#include "PoolObservedState.h"

PoolObservedState::PoolObservedState()
{
    lock_ = xSemaphoreCreateMutex();
}

PoolObservedState::~PoolObservedState()
{
    if (lock_) vSemaphoreDelete(lock_);
}

void PoolObservedState::store(const PoolObservedCircuits& circuits)
{
    xSemaphoreTake(lock_, portMAX_DELAY);
    circuits_ = circuits;
    xSemaphoreGive(lock_);
}

PoolObservedCircuits PoolObservedState::load() const
{
    xSemaphoreTake(lock_, portMAX_DELAY);
    const PoolObservedCircuits c = circuits_;
    xSemaphoreGive(lock_);
    return c;
}

void PoolObservedState::clear()
{
    store(PoolObservedCircuits{});
}
