#pragma once
/**
 * @file LogConsoleSinkModule.h
 * @brief Console log sink module.
 */
#include "Core/ModulePassive.h"
#include "Core/Services/ILogger.h"
#include "Core/ServiceRegistry.h"

/**
 * @brief Passive module that writes log entries to the console (stdout).
 */
class LogConsoleSinkModule : public ModulePassive {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "log.sink.console"; }

    /** @brief Depends on log hub. */
    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        return nullptr;
    }

    /** @brief Register the console log sink. */
    void init(ConfigStore& cfg, ServiceRegistry& services) override;

    /** @brief Format one entry as a console line (no trailing newline, no colors). */
    static void formatLine(const LogEntry& e, char* out, size_t outLen);
};
