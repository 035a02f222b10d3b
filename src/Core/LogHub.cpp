/**
 * @file LogHub.cpp
 * @brief Implementation file.
 */
#include "Core/LogHub.h"

LogHub::~LogHub() {
    if (q) vQueueDelete(q);
}

void LogHub::init(int queueLen) {
    if (q) return;
    q = xQueueCreate(queueLen, sizeof(LogEntry));
}

bool LogHub::enqueue(const LogEntry& e) {
    if (!q) return false;
    if ((uint8_t)e.lvl < (uint8_t)minLevel_) return true;
    if (xQueueSend(q, &e, 0) == pdTRUE) return true;  ///< 0 => non-blocking
    dropped_ = dropped_ + 1;
    return false;
}

bool LogHub::dequeue(LogEntry& out, TickType_t waitTicks) {
    if (!q) return false;
    return xQueueReceive(q, &out, waitTicks) == pdTRUE;
}
