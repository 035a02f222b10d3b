#pragma once
/**
 * @file IPoolBus.h
 * @brief Pool controller bus service interface and message catalog.
 *
 * The binding that owns the physical serial bus (framing, checksums, port
 * handling) registers a `PoolBusService` under the id "poolbus". Messages
 * cross the service boundary already decoded into `PoolBusMessage`, a POD
 * that can travel through a FreeRTOS queue by value.
 */
#include <FreeRTOS.h>
#include <queue.h>
#include <stdint.h>

/** @brief Kind of a decoded bus message. */
enum class PoolBusMessageKind : uint8_t {
    None = 0,
    SystemStatus,                   ///< periodic broadcast: clock, temps, circuits, heater relay
    HeatStatus,                     ///< seek temps and heat sources (also answers HeatStatusQuery)
    PumpStatus,                     ///< pump speed and power
    HeatStatusQuery,                ///< outbound
    PumpStatusRequest,              ///< outbound
    CircuitStateChangeRequest,      ///< outbound
    HeatConfigurationChangeRequest, ///< outbound
    ClockChangeRequest,             ///< outbound
    StateChangeResponse,            ///< acknowledgement of a change request
    Other                           ///< any traffic the binding decodes but the controller ignores
};

/** @brief Hardware circuit identifiers (bit index in `PoolBusSystemStatus::circuitsOn`). */
enum class PoolBusCircuit : uint8_t {
    Spa = 0,
    Aux1,
    Aux2,
    Aux3,
    Feature1,
    Pool,
    Feature2,
    Feature3,
    Feature4,
    HeatBoost,
    Count
};

/** @brief Hardware circuit power representation. */
enum class PoolBusCircuitPower : uint8_t { Off = 0, On = 1 };

/** @brief Hardware heat source identifiers. */
enum class PoolBusHeatSource : uint8_t { Unheated = 0, Heater = 1, SolarPref = 2, Solar = 3 };

/** @brief Result of a bus send/receive. */
enum PoolBusResult : uint8_t {
    POOLBUS_OK = 0,
    POOLBUS_ERR_IO = 1,
    POOLBUS_ERR_CLOSED = 2
};

struct PoolBusSystemStatus {
    uint8_t hour;
    uint8_t minute;
    int16_t airTemp;
    int16_t waterTemp;
    uint16_t circuitsOn;  ///< bit (1u << PoolBusCircuit) set when energized
    bool heaterOn;
};

struct PoolBusHeatStatus {
    int16_t poolSeekTemp;
    int16_t spaSeekTemp;
    PoolBusHeatSource poolHeatSource;
    PoolBusHeatSource spaHeatSource;
};

struct PoolBusPumpStatus {
    uint16_t speedRpm;
    uint16_t powerWatts;
};

struct PoolBusCircuitChange {
    PoolBusCircuit circuit;
    PoolBusCircuitPower power;
};

struct PoolBusClock {
    uint16_t year;
    uint8_t month;
    uint8_t day;
    uint8_t hour;
    uint8_t minute;
};

/** @brief Decoded bus message. Payload member selected by `kind`. */
struct PoolBusMessage {
    PoolBusMessageKind kind;
    union {
        PoolBusSystemStatus system;     ///< SystemStatus
        PoolBusHeatStatus heat;         ///< HeatStatus, HeatConfigurationChangeRequest
        PoolBusPumpStatus pump;         ///< PumpStatus
        PoolBusCircuitChange circuit;   ///< CircuitStateChangeRequest
        PoolBusClock clock;             ///< ClockChangeRequest
    };
};

/**
 * @brief Bus access service.
 *
 * - `subscribe` hands out a fan-out feed of every inbound message; the queue
 *   belongs to the binding and is released with `unsubscribe`.
 * - `send`/`receive` form the direct request/response primitive. `receive`
 *   blocks for the next inbound message, independently of any feed.
 * - `beginExchange`/`endExchange` are optional (may be null). When present the
 *   controller brackets each send+receive pair with them so a binding can keep
 *   other writers off the wire during an exchange.
 */
struct PoolBusService {
    QueueHandle_t (*subscribe)(void* ctx, uint8_t queueLen);
    void (*unsubscribe)(void* ctx, QueueHandle_t feed);
    PoolBusResult (*send)(void* ctx, const PoolBusMessage& msg);
    PoolBusResult (*receive)(void* ctx, PoolBusMessage& out);
    bool (*beginExchange)(void* ctx);
    void (*endExchange)(void* ctx);
    void* ctx;
};

static inline const char* poolBusMessageKindStr(PoolBusMessageKind kind)
{
    switch (kind) {
    case PoolBusMessageKind::None: return "None";
    case PoolBusMessageKind::SystemStatus: return "SystemStatus";
    case PoolBusMessageKind::HeatStatus: return "HeatStatus";
    case PoolBusMessageKind::PumpStatus: return "PumpStatus";
    case PoolBusMessageKind::HeatStatusQuery: return "HeatStatusQuery";
    case PoolBusMessageKind::PumpStatusRequest: return "PumpStatusRequest";
    case PoolBusMessageKind::CircuitStateChangeRequest: return "CircuitStateChangeRequest";
    case PoolBusMessageKind::HeatConfigurationChangeRequest: return "HeatConfigurationChangeRequest";
    case PoolBusMessageKind::ClockChangeRequest: return "ClockChangeRequest";
    case PoolBusMessageKind::StateChangeResponse: return "StateChangeResponse";
    case PoolBusMessageKind::Other: return "Other";
    default: return "Unknown";
    }
}

static inline bool poolBusCircuitOn(const PoolBusSystemStatus& s, PoolBusCircuit c)
{
    if (c >= PoolBusCircuit::Count) return false;
    return (s.circuitsOn & (uint16_t)(1u << (uint8_t)c)) != 0;
}

static inline PoolBusMessage poolBusHeatStatusQuery()
{
    PoolBusMessage m{};
    m.kind = PoolBusMessageKind::HeatStatusQuery;
    return m;
}

static inline PoolBusMessage poolBusPumpStatusRequest()
{
    PoolBusMessage m{};
    m.kind = PoolBusMessageKind::PumpStatusRequest;
    return m;
}

static inline PoolBusMessage poolBusCircuitChange(PoolBusCircuit circuit, PoolBusCircuitPower power)
{
    PoolBusMessage m{};
    m.kind = PoolBusMessageKind::CircuitStateChangeRequest;
    m.circuit.circuit = circuit;
    m.circuit.power = power;
    return m;
}

static inline PoolBusMessage poolBusHeatConfigurationChange(const PoolBusHeatStatus& cfg)
{
    PoolBusMessage m{};
    m.kind = PoolBusMessageKind::HeatConfigurationChangeRequest;
    m.heat = cfg;
    return m;
}

static inline PoolBusMessage poolBusClockChange(uint16_t year, uint8_t month, uint8_t day,
                                                uint8_t hour, uint8_t minute)
{
    PoolBusMessage m{};
    m.kind = PoolBusMessageKind::ClockChangeRequest;
    m.clock.year = year;
    m.clock.month = month;
    m.clock.day = day;
    m.clock.hour = hour;
    m.clock.minute = minute;
    return m;
}
