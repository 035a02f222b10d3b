/**
 * @file LogSinkRegistry.cpp
 * @brief Implementation file.
 */
#include "Core/LogSinkRegistry.h"

bool LogSinkRegistry::add(LogSinkService sink) {
    if (!sink.write) return false;
    if (n >= (int)Limits::MaxLogSinks) return false;
    sinks[n++] = sink;
    return true;
}

int LogSinkRegistry::count() const {
    return n;
}

LogSinkService LogSinkRegistry::get(int idx) const {
    if (idx < 0 || idx >= n) return LogSinkService{};
    return sinks[idx];
}
