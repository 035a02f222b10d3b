#pragma once

#include <stddef.h>
#include <stdint.h>

/**
 * @file SystemLimits.h
 * @brief Shared compile-time limits used across Core and modules.
 */

namespace Limits {

/** @brief Capacity of the stack args document of each `poolctl.*` command handler. */
constexpr size_t JsonCmdPoolCtlBuf = 256;
/** @brief JSON capacity for `ConfigStore::applyJson` root document (covers full multi-module patch). */
constexpr size_t JsonConfigApplyBuf = 2048;
/** @brief Maximum number of registered config variables in `ConfigStore` metadata table. */
constexpr size_t MaxConfigVars = 64;
/** @brief FreeRTOS log queue length used by `LogHub` (`LogHubModule::init`). */
constexpr uint8_t LogQueueLen = 32;
/** @brief Stack size of the log dispatcher task (`LogDispatcherModule::taskStackSize`). */
constexpr uint16_t LogDispatchStackSize = 4096;
/** @brief Maximum number of registered log sinks (`LogSinkRegistry`). */
constexpr uint8_t MaxLogSinks = 4;
/** @brief Reply buffer for `config.get` before it is copied to the caller's reply. */
constexpr size_t ConfigJsonBuf = 1024;

/** @brief Pool controller capacities and task sizing. */
namespace PoolCtl {
/** @brief Feed queue length requested from the bus binding (`PoolBusService::subscribe`). */
constexpr uint8_t FeedQueueLen = 16;
/** @brief Stack size of the monitor task (`PoolControllerModule::taskStackSize`). */
constexpr uint16_t MonitorStackSize = 4096;
/** @brief Stack size of the recurring clock sync task (`PoolClockSync::start`). */
constexpr uint16_t ClockTaskStackSize = 3072;
/** @brief Stack size of each push-style listener dispatch task (`PoolStatusPublisher::addListener`). */
constexpr uint16_t ListenerStackSize = 3072;
/** @brief Priority of the listener dispatch tasks. */
constexpr uint8_t ListenerPriority = 1;
/** @brief Maximum number of concurrently registered push-style listeners. */
constexpr uint8_t MaxListeners = 8;
/** @brief Reply buffer used by `poolctl.status` (`PoolControllerModule::handleStatus_`). */
constexpr size_t StatusJsonBuf = 512;
/** @brief Buffer for the human-readable status line (`formatPoolStatus`). */
constexpr size_t StatusTextBuf = 256;
}  // namespace PoolCtl

}  // namespace Limits
