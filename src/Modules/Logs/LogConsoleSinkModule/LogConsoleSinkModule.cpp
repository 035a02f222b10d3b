/**
 * @file LogConsoleSinkModule.cpp
 * @brief Implementation file.
 */
#include "LogConsoleSinkModule.h"
#include "Core/Log.h"
#include <stdio.h>
#include <time.h>

static const char* lvlColor(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "\x1b[90m";
        case LogLevel::Info:  return "\x1b[32m";
        case LogLevel::Warn:  return "\x1b[33m";
        case LogLevel::Error: return "\x1b[31m";
    }
    return "";
}

static const char* colorReset() { return "\x1b[0m"; }

static bool isSystemTimeValid()
{
    // Before the controller clock is set the epoch is near 1970.
    time_t now = time(nullptr);
    return (now > 1609459200); ///< 2021-01-01 00:00:00
}

static void formatUptime(char *out, size_t outSize, uint32_t ms)
{
    uint32_t s   = ms / 1000;
    uint32_t m   = s / 60;
    uint32_t h   = m / 60;

    uint32_t hh  = h % 24;
    uint32_t mm  = m % 60;
    uint32_t ss  = s % 60;
    uint32_t mmm = ms % 1000;

    snprintf(out, outSize, "%02lu:%02lu:%02lu.%03lu",
             (unsigned long)hh,
             (unsigned long)mm,
             (unsigned long)ss,
             (unsigned long)mmm);
}

static void formatTimestamp(char* out, size_t outSize, uint32_t tsMs)
{
    if (!isSystemTimeValid()) {
        formatUptime(out, outSize, tsMs);
        return;
    }

    time_t now = time(nullptr);
    struct tm t;
    localtime_r(&now, &t);
    snprintf(out, outSize,
             "%04d-%02d-%02d %02d:%02d:%02d.%03u",
             t.tm_year + 1900,
             t.tm_mon + 1,
             t.tm_mday,
             t.tm_hour,
             t.tm_min,
             t.tm_sec,
             (unsigned)(tsMs % 1000));
}

void LogConsoleSinkModule::formatLine(const LogEntry& e, char* out, size_t outLen)
{
    char ts[32];
    formatTimestamp(ts, sizeof(ts), e.ts_ms);
    snprintf(out, outLen, "[%s][%s][%s] %s", ts, Log::levelStr(e.lvl), e.tag, e.msg);
}

static void consoleSinkWrite(void*, const LogEntry& e) {
    char line[LOG_MSG_MAX + 48];
    LogConsoleSinkModule::formatLine(e, line, sizeof(line));
    printf("%s%s%s\n", lvlColor(e.lvl), line, colorReset());
    fflush(stdout);
}

void LogConsoleSinkModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    (void)cfg;

    auto sinks = services.get<LogSinkRegistryService>("logsinks");
    if (!sinks) return;

    LogSinkService sink{};
    sink.write = consoleSinkWrite;
    sink.ctx = nullptr;

    if (!sinks->add(sinks->ctx, sink)) {
        fprintf(stderr, "console log sink not registered\n");
    }
}
