#pragma once
/**
 * @file LogSinkRegistry.h
 * @brief Registry of log sinks.
 */
#include "Core/Services/ILogger.h"
#include "Core/SystemLimits.h"

/**
 * @brief Stores and enumerates registered log sinks.
 */
class LogSinkRegistry {
public:
    /** @brief Add a sink. Rejects sinks without a write callback and a full table. */
    bool add(LogSinkService sink);
    int count() const;
    /** @brief Sink by index, or an empty sink when out of range. */
    LogSinkService get(int idx) const;

private:
    LogSinkService sinks[Limits::MaxLogSinks]{};
    int n = 0;
};
