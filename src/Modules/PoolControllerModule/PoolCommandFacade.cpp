/**
 * @file PoolCommandFacade.cpp
 * @brief Implementation file.
 */
#include "PoolCommandFacade.h"
#include "PoolHardwareMap.h"
#define LOG_TAG "PoolCmds"
#include "Core/ModuleLog.h"

PoolCtlStatus PoolCommandFacade::ready_() const
{
    if (stopped_) return POOLCTL_ERR_STOPPED;
    if (!hasBus()) return POOLCTL_ERR_NOT_READY;
    return POOLCTL_OK;
}

bool PoolCommandFacade::observedActiveBody_() const
{
    const PoolObservedCircuits c = observed_.load();
    return c.known && c.bodyActive;
}

bool PoolCommandFacade::observedFeature_(PoolFeature f) const
{
    const PoolObservedCircuits c = observed_.load();
    return c.known && c.hasFeature(f);
}

PoolCtlStatus PoolCommandFacade::exchange(const PoolBusMessage& request, PoolBusMessageKind expected,
                                          PoolBusMessage& response)
{
    const PoolCtlStatus ready = ready_();
    if (ready != POOLCTL_OK) return ready;

    for (;;) {
        if (stopped_) return POOLCTL_ERR_STOPPED;

        const bool bracketed = (bus_->beginExchange != nullptr);
        if (bracketed && !bus_->beginExchange(bus_->ctx)) {
            LOGW("Exchange %s: bus refused exclusive access", poolBusMessageKindStr(request.kind));
            return POOLCTL_ERR_IO;
        }

        PoolBusResult res = bus_->send(bus_->ctx, request);
        if (res == POOLBUS_OK) {
            response = PoolBusMessage{};
            res = bus_->receive(bus_->ctx, response);
        }

        if (bracketed && bus_->endExchange) bus_->endExchange(bus_->ctx);

        if (res != POOLBUS_OK) {
            LOGW("Exchange %s failed (err=%u)", poolBusMessageKindStr(request.kind), (unsigned)res);
            return POOLCTL_ERR_IO;
        }
        if (response.kind == expected) return POOLCTL_OK;

        LOGW("Sent %s; got invalid response %s",
             poolBusMessageKindStr(request.kind), poolBusMessageKindStr(response.kind));
    }
}

PoolCtlStatus PoolCommandFacade::setCircuit_(PoolBusCircuit circuit, PoolBusCircuitPower power)
{
    PoolBusMessage resp{};
    return exchange(poolBusCircuitChange(circuit, power), PoolBusMessageKind::StateChangeResponse, resp);
}

PoolCtlStatus PoolCommandFacade::setFeaturePower(PoolFeature feature, PoolPowerState state)
{
    PoolBusCircuit circuit = PoolBusCircuit::Count;
    if (!poolFeatureCircuit(feature, &circuit)) {
        LOGW("%s power cannot be set", poolFeatureStr(feature));
        return POOLCTL_ERR_INVALID_ARG;
    }

    const PoolCtlStatus ready = ready_();
    if (ready != POOLCTL_OK) return ready;

    // Jets run on the body pump; with no body circulating the request is dropped.
    if (feature == PoolFeature::Jets && state == PoolPowerState::On && !observedActiveBody_()) {
        LOGD("jets on ignored: no active body");
        return POOLCTL_OK;
    }

    const PoolCtlStatus st = setCircuit_(circuit, poolPowerToBus(state));
    if (st == POOLCTL_OK) {
        LOGI("%s %s", poolFeatureStr(feature), poolPowerStateStr(state));
    }
    return st;
}

PoolCtlStatus PoolCommandFacade::setBodyPower(PoolBody body, PoolPowerState state)
{
    const PoolCtlStatus ready = ready_();
    if (ready != POOLCTL_OK) return ready;

    // Jets left on keep the pump running after the body is off.
    if (state == PoolPowerState::Off && observedFeature_(PoolFeature::Jets)) {
        const PoolCtlStatus st = setFeaturePower(PoolFeature::Jets, PoolPowerState::Off);
        if (st != POOLCTL_OK) return st;
    }

    PoolCtlStatus st = setCircuit_(poolBodyCircuit(body), poolPowerToBus(state));
    if (st != POOLCTL_OK) return st;

    // SPA has priority on the controller: POOL only runs once SPA is off.
    if (body == PoolBody::Pool && state == PoolPowerState::On) {
        st = setCircuit_(poolBodyCircuit(PoolBody::Spa), PoolBusCircuitPower::Off);
        if (st != POOLCTL_OK) return st;
    }

    LOGI("%s %s", poolBodyStr(body), poolPowerStateStr(state));
    return POOLCTL_OK;
}

PoolCtlStatus PoolCommandFacade::fetchHeatStatus_(PoolBusHeatStatus& out)
{
    PoolBusMessage resp{};
    const PoolCtlStatus st = exchange(poolBusHeatStatusQuery(), PoolBusMessageKind::HeatStatus, resp);
    if (st == POOLCTL_OK) out = resp.heat;
    return st;
}

void PoolCommandFacade::pollBestEffort_(const PoolBusMessage& msg)
{
    const PoolBusResult res = bus_->send(bus_->ctx, msg);
    if (res != POOLBUS_OK) {
        LOGW("poll %s not sent (err=%u)", poolBusMessageKindStr(msg.kind), (unsigned)res);
    }
}

PoolCtlStatus PoolCommandFacade::setHeatConfiguration_(const PoolBusHeatStatus& cfg)
{
    PoolBusMessage resp{};
    const PoolCtlStatus st = exchange(poolBusHeatConfigurationChange(cfg),
                                      PoolBusMessageKind::StateChangeResponse, resp);
    if (st != POOLCTL_OK) return st;

    // Prompt the controller so the monitor sees the new configuration quickly.
    pollBestEffort_(poolBusHeatStatusQuery());
    return POOLCTL_OK;
}

PoolCtlStatus PoolCommandFacade::setSeekTemperature(PoolBody body, int16_t temp)
{
    PoolBusHeatStatus cfg{};
    PoolCtlStatus st = fetchHeatStatus_(cfg);
    if (st != POOLCTL_OK) return st;

    if (body == PoolBody::Spa) {
        cfg.spaSeekTemp = temp;
    } else {
        cfg.poolSeekTemp = temp;
    }

    st = setHeatConfiguration_(cfg);
    if (st == POOLCTL_OK) {
        LOGI("%s seek temp %d", poolBodyStr(body), (int)temp);
    }
    return st;
}

PoolCtlStatus PoolCommandFacade::setHeatSource(PoolBody body, PoolHeatSource source)
{
    PoolBusHeatStatus cfg{};
    PoolCtlStatus st = fetchHeatStatus_(cfg);
    if (st != POOLCTL_OK) return st;

    if (body == PoolBody::Spa) {
        cfg.spaHeatSource = poolHeatSourceToBus(source);
    } else {
        cfg.poolHeatSource = poolHeatSourceToBus(source);
    }

    st = setHeatConfiguration_(cfg);
    if (st == POOLCTL_OK) {
        LOGI("%s heat source %s", poolBodyStr(body), poolHeatSourceStr(source));
    }
    return st;
}

PoolCtlStatus PoolCommandFacade::setClock(const struct tm& localTime)
{
    PoolBusMessage resp{};
    return exchange(poolBusClockChange((uint16_t)(localTime.tm_year + 1900),
                                       (uint8_t)(localTime.tm_mon + 1),
                                       (uint8_t)localTime.tm_mday,
                                       (uint8_t)localTime.tm_hour,
                                       (uint8_t)localTime.tm_min),
                    PoolBusMessageKind::StateChangeResponse, resp);
}
