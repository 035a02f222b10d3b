/**
 * @file FakePoolBus.cpp
 * @brief Implementation file.
 */
#include "FakePoolBus.h"

static constexpr uint8_t RESPONSE_QUEUE_LEN = 16;
static constexpr TickType_t RECEIVE_WAIT = pdMS_TO_TICKS(2000);

FakePoolBus::FakePoolBus()
    : svc_{subscribe_, unsubscribe_, send_, receive_, beginExchange_, endExchange_, this}
{
    lock_ = xSemaphoreCreateMutex();
    exchangeLock_ = xSemaphoreCreateMutex();
    responses_ = xQueueCreate(RESPONSE_QUEUE_LEN, sizeof(PoolBusMessage));
}

FakePoolBus::~FakePoolBus()
{
    if (feed_) vQueueDelete(feed_);
    if (responses_) vQueueDelete(responses_);
    if (exchangeLock_) vSemaphoreDelete(exchangeLock_);
    if (lock_) vSemaphoreDelete(lock_);
}

bool FakePoolBus::inject(const PoolBusMessage& msg)
{
    if (!feed_) return false;
    return xQueueSend(feed_, &msg, pdMS_TO_TICKS(100)) == pdTRUE;
}

void FakePoolBus::scriptResponse(const PoolBusMessage& msg)
{
    (void)xQueueSend(responses_, &msg, 0);
}

std::vector<PoolBusMessage> FakePoolBus::sent() const
{
    xSemaphoreTake(lock_, portMAX_DELAY);
    std::vector<PoolBusMessage> copy = sent_;
    xSemaphoreGive(lock_);
    return copy;
}

size_t FakePoolBus::sentCount() const
{
    xSemaphoreTake(lock_, portMAX_DELAY);
    const size_t n = sent_.size();
    xSemaphoreGive(lock_);
    return n;
}

void FakePoolBus::clearSent()
{
    xSemaphoreTake(lock_, portMAX_DELAY);
    sent_.clear();
    xSemaphoreGive(lock_);
}

void FakePoolBus::respond_(const PoolBusMessage& request)
{
    PoolBusMessage resp{};
    switch (request.kind) {
    case PoolBusMessageKind::HeatStatusQuery:
        resp.kind = PoolBusMessageKind::HeatStatus;
        resp.heat = heat_;
        break;
    case PoolBusMessageKind::HeatConfigurationChangeRequest:
        heat_ = request.heat;
        resp.kind = PoolBusMessageKind::StateChangeResponse;
        break;
    case PoolBusMessageKind::CircuitStateChangeRequest:
    case PoolBusMessageKind::ClockChangeRequest:
        resp.kind = PoolBusMessageKind::StateChangeResponse;
        break;
    default:
        return;
    }
    (void)xQueueSend(responses_, &resp, 0);
}

QueueHandle_t FakePoolBus::subscribe_(void* ctx, uint8_t queueLen)
{
    FakePoolBus* self = static_cast<FakePoolBus*>(ctx);
    if (self->feed_) return nullptr;
    self->feed_ = xQueueCreate(queueLen, sizeof(PoolBusMessage));
    return self->feed_;
}

void FakePoolBus::unsubscribe_(void* ctx, QueueHandle_t feed)
{
    FakePoolBus* self = static_cast<FakePoolBus*>(ctx);
    if (!feed || feed != self->feed_) return;
    vQueueDelete(self->feed_);
    self->feed_ = nullptr;
    self->unsubscribes_ = self->unsubscribes_ + 1;
}

PoolBusResult FakePoolBus::send_(void* ctx, const PoolBusMessage& msg)
{
    FakePoolBus* self = static_cast<FakePoolBus*>(ctx);
    if (self->failSends_) return POOLBUS_ERR_IO;
    if (self->sendBudget_ >= 0) {
        if (self->sendBudget_ == 0) return POOLBUS_ERR_IO;
        self->sendBudget_ = self->sendBudget_ - 1;
    }

    xSemaphoreTake(self->lock_, portMAX_DELAY);
    self->sent_.push_back(msg);
    xSemaphoreGive(self->lock_);

    if (self->autoRespond_ && self->inExchange_) self->respond_(msg);
    return POOLBUS_OK;
}

PoolBusResult FakePoolBus::receive_(void* ctx, PoolBusMessage& out)
{
    FakePoolBus* self = static_cast<FakePoolBus*>(ctx);
    self->receives_ = self->receives_ + 1;
    if (self->failReceives_) return POOLBUS_ERR_IO;
    if (xQueueReceive(self->responses_, &out, RECEIVE_WAIT) != pdTRUE) return POOLBUS_ERR_IO;
    return POOLBUS_OK;
}

bool FakePoolBus::beginExchange_(void* ctx)
{
    FakePoolBus* self = static_cast<FakePoolBus*>(ctx);
    if (self->exclusive_) xSemaphoreTake(self->exchangeLock_, portMAX_DELAY);
    if (self->inExchange_) self->overlap_ = true;
    self->inExchange_ = true;
    self->begins_ = self->begins_ + 1;
    return true;
}

void FakePoolBus::endExchange_(void* ctx)
{
    FakePoolBus* self = static_cast<FakePoolBus*>(ctx);
    self->inExchange_ = false;
    self->ends_ = self->ends_ + 1;
    if (self->exclusive_) xSemaphoreGive(self->exchangeLock_);
}
