#pragma once
/**
 * @file LogHub.h
 * @brief Central log queue for asynchronous logging.
 */
#include "Core/Services/ILogger.h"
#include <FreeRTOS.h>
#include <queue.h>

/**
 * @brief Queue-based log hub for producers and consumers.
 *
 * Producers never block: an entry below the minimum level is discarded, an
 * entry that finds the queue full is counted in `dropped()`.
 */
class LogHub {
public:
    LogHub() = default;
    ~LogHub();

    LogHub(const LogHub&) = delete;
    LogHub& operator=(const LogHub&) = delete;

    /** @brief Create the log queue with a given length. No-op once created. */
    void init(int queueLen = 32);

    /** @brief Enqueue a log entry (non-blocking). False when the queue is full or missing. */
    bool enqueue(const LogEntry& e);
    /** @brief Dequeue a log entry (blocking up to waitTicks). */
    bool dequeue(LogEntry& out, TickType_t waitTicks);

    void setMinLevel(LogLevel lvl) { minLevel_ = lvl; }
    LogLevel minLevel() const { return minLevel_; }

    /** @brief Entries lost because the queue was full. */
    uint32_t dropped() const { return dropped_; }

private:
    QueueHandle_t q = nullptr;
    volatile LogLevel minLevel_ = LogLevel::Debug;
    volatile uint32_t dropped_ = 0;
};
