#pragma once
/**
 * @file Module.h
 * @brief Base interface for all runtime modules.
 */
#include "ConfigStore.h"
#include "ServiceRegistry.h"
#include <FreeRTOS.h>
#include <semphr.h>
#include <task.h>

/**
 * @brief Base class for active modules backed by a FreeRTOS task.
 */
class Module {
public:
    /** @brief Virtual destructor. */
    virtual ~Module() {
        if (stoppedSem_) vSemaphoreDelete(stoppedSem_);
    }

    /** @brief Unique module identifier (used for dependency wiring). */
    virtual const char* moduleId() const = 0;
    /** @brief FreeRTOS task name for this module. */
    virtual const char* taskName() const = 0;

    /** @brief Number of declared dependencies. */
    virtual uint8_t dependencyCount() const { return 0; }
    /** @brief Dependency id at index, or nullptr if none. */
    virtual const char* dependency(uint8_t) const { return nullptr; }

    /** @brief Initialize module and register services/config. */
    virtual void init(ConfigStore& cfg, ServiceRegistry& services) = 0;
    /** @brief Called once every module registered its config variables. */
    virtual void onConfigLoaded(ConfigStore&, ServiceRegistry&) {}
    /** @brief Main module loop called from the module task. */
    virtual void loop() = 0;

    /** @brief Stack size for the FreeRTOS task. */
    virtual uint16_t taskStackSize() const { return 3072; }
    /** @brief Task priority for the FreeRTOS task. */
    virtual UBaseType_t taskPriority() const { return 1; }
    /** @brief Delay between two `loop()` calls. */
    virtual TickType_t loopDelayTicks() const { return pdMS_TO_TICKS(10); }

    /** @brief Create and start the FreeRTOS task for this module. */
    bool startTask() {
        if (taskHandle) return true;
        if (!stoppedSem_) stoppedSem_ = xSemaphoreCreateBinary();
        if (!stoppedSem_) return false;
        stopRequested_ = false;
        return xTaskCreate(taskEntry, taskName(), taskStackSize(),
                           this, taskPriority(), &taskHandle) == pdPASS;
    }

    /** @brief Ask the module task to leave its loop after the current iteration. */
    void requestStop() { stopRequested_ = true; }

    /** @brief Block until the module task exited (after `requestStop`). */
    bool waitStopped(TickType_t waitTicks) {
        if (!taskHandle) return true;
        if (!stoppedSem_ || xSemaphoreTake(stoppedSem_, waitTicks) != pdTRUE) return false;
        taskHandle = nullptr;
        return true;
    }

    /** @brief Get the FreeRTOS task handle for this module. */
    TaskHandle_t getTaskHandle() const { return taskHandle; }

    /** @brief Whether this module owns a task. */
    virtual bool hasTask() const { return true; }

protected:
    TaskHandle_t taskHandle = nullptr;

    /** @brief Whether a stop was requested. */
    bool stopRequested() const { return stopRequested_; }

    /** @brief Called from the module task right before it exits. */
    virtual void onTaskExit() {}

private:
    volatile bool stopRequested_ = false;
    SemaphoreHandle_t stoppedSem_ = nullptr;

    static void taskEntry(void* arg) {
        Module* self = static_cast<Module*>(arg);
        while (!self->stopRequested_) {
            self->loop();
            vTaskDelay(self->loopDelayTicks());
        }
        self->onTaskExit();
        xSemaphoreGive(self->stoppedSem_);
        vTaskDelete(nullptr);
    }
};
