#pragma once
/**
 * @file ModulePassive.h
 * @brief Base class for passive (no-task) modules.
 */
#include "Core/Module.h"

/**
 * @brief Base class for modules that only register services, commands or sinks.
 *
 * `ModuleManager::initAll` calls `init` and `onConfigLoaded` but never starts
 * a task for them, and `stopAll` skips them.
 */
class ModulePassive : public Module {
public:
    bool hasTask() const override { return false; }
    const char* taskName() const override { return ""; }
    uint16_t taskStackSize() const override { return 0; }

    /** @brief Never called because no task is created. */
    void loop() override {}
};
