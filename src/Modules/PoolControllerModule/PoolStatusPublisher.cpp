/**
 * @file PoolStatusPublisher.cpp
 * @brief Implementation file.
 */
#include "PoolStatusPublisher.h"
#define LOG_TAG "PoolPubl"
#include "Core/ModuleLog.h"

// ---------------------------------------------------------------------------
// PoolStatusChannel
// ---------------------------------------------------------------------------

PoolStatusChannel::PoolStatusChannel()
{
    lock_ = xSemaphoreCreateMutex();
    signal_ = xSemaphoreCreateBinary();
}

PoolStatusChannel::~PoolStatusChannel()
{
    if (signal_) vSemaphoreDelete(signal_);
    if (lock_) vSemaphoreDelete(lock_);
}

bool PoolStatusChannel::push(const PoolStatus& st)
{
    xSemaphoreTake(lock_, portMAX_DELAY);
    if (closed_) {
        xSemaphoreGive(lock_);
        return false;
    }
    items_.push_back(st);
    xSemaphoreGive(lock_);
    xSemaphoreGive(signal_);
    return true;
}

bool PoolStatusChannel::pop(PoolStatus& out, TickType_t waitTicks)
{
    TimeOut_t timeout;
    vTaskSetTimeOutState(&timeout);
    TickType_t remaining = waitTicks;

    for (;;) {
        xSemaphoreTake(lock_, portMAX_DELAY);
        if (closed_) {
            xSemaphoreGive(lock_);
            return false;
        }
        if (!items_.empty()) {
            out = items_.front();
            items_.pop_front();
            xSemaphoreGive(lock_);
            return true;
        }
        xSemaphoreGive(lock_);

        if (xTaskCheckForTimeOut(&timeout, &remaining) == pdTRUE) return false;
        // A stale signal only causes one extra pass through the loop.
        (void)xSemaphoreTake(signal_, remaining);
    }
}

void PoolStatusChannel::close()
{
    xSemaphoreTake(lock_, portMAX_DELAY);
    closed_ = true;
    items_.clear();
    xSemaphoreGive(lock_);
    xSemaphoreGive(signal_);
}

bool PoolStatusChannel::isClosed() const
{
    xSemaphoreTake(lock_, portMAX_DELAY);
    const bool c = closed_;
    xSemaphoreGive(lock_);
    return c;
}

size_t PoolStatusChannel::pending() const
{
    xSemaphoreTake(lock_, portMAX_DELAY);
    const size_t n = items_.size();
    xSemaphoreGive(lock_);
    return n;
}

// ---------------------------------------------------------------------------
// PoolStatusRegistry
// ---------------------------------------------------------------------------

PoolStatusRegistry::PoolStatusRegistry()
{
    lock_ = xSemaphoreCreateMutex();
    channels_ = std::make_shared<ChannelList>();
}

PoolStatusRegistry::~PoolStatusRegistry()
{
    if (lock_) vSemaphoreDelete(lock_);
}

std::shared_ptr<const PoolStatusRegistry::ChannelList> PoolStatusRegistry::snapshot() const
{
    xSemaphoreTake(lock_, portMAX_DELAY);
    std::shared_ptr<const ChannelList> list = channels_;
    xSemaphoreGive(lock_);
    return list;
}

bool PoolStatusRegistry::add(const std::shared_ptr<PoolStatusChannel>& ch)
{
    xSemaphoreTake(lock_, portMAX_DELAY);
    if (closed_) {
        xSemaphoreGive(lock_);
        return false;
    }
    std::shared_ptr<ChannelList> next = std::make_shared<ChannelList>(*channels_);
    next->push_back(ch);
    channels_ = next;
    xSemaphoreGive(lock_);
    return true;
}

bool PoolStatusRegistry::remove(const PoolStatusChannel* ch)
{
    if (!ch) return false;

    xSemaphoreTake(lock_, portMAX_DELAY);
    std::shared_ptr<ChannelList> next = std::make_shared<ChannelList>();
    next->reserve(channels_->size());
    bool found = false;
    for (const std::shared_ptr<PoolStatusChannel>& entry : *channels_) {
        if (entry.get() == ch) {
            found = true;
            continue;
        }
        next->push_back(entry);
    }
    if (found) channels_ = next;
    xSemaphoreGive(lock_);
    return found;
}

PoolStatusRegistry::ChannelList PoolStatusRegistry::closeAll()
{
    xSemaphoreTake(lock_, portMAX_DELAY);
    closed_ = true;
    ChannelList old = *channels_;
    channels_ = std::make_shared<ChannelList>();
    xSemaphoreGive(lock_);
    return old;
}

size_t PoolStatusRegistry::size() const
{
    xSemaphoreTake(lock_, portMAX_DELAY);
    const size_t n = channels_->size();
    xSemaphoreGive(lock_);
    return n;
}

// ---------------------------------------------------------------------------
// PoolStatusSubscription
// ---------------------------------------------------------------------------

void PoolStatusSubscription::close()
{
    if (ch_) {
        ch_->close();
        std::shared_ptr<PoolStatusRegistry> registry = registry_.lock();
        if (registry) registry->remove(ch_.get());
    }
    ch_.reset();
    registry_.reset();
}

// ---------------------------------------------------------------------------
// PoolStatusPublisher
// ---------------------------------------------------------------------------

PoolStatusPublisher::PoolStatusPublisher()
{
    latestMutex_ = xSemaphoreCreateMutex();
    listenerMutex_ = xSemaphoreCreateMutex();
    events_ = xEventGroupCreate();
    registry_ = std::make_shared<PoolStatusRegistry>();
}

PoolStatusPublisher::~PoolStatusPublisher()
{
    close();
    if (events_) vEventGroupDelete(events_);
    if (listenerMutex_) vSemaphoreDelete(listenerMutex_);
    if (latestMutex_) vSemaphoreDelete(latestMutex_);
}

void PoolStatusPublisher::publish(const PoolStatus& st)
{
    if (closed_) return;

    xSemaphoreTake(latestMutex_, portMAX_DELAY);
    latest_ = st;
    hasLatest_ = true;
    xSemaphoreGive(latestMutex_);
    xEventGroupSetBits(events_, HAS_STATUS_BIT);

    // A channel closed after the snapshot was taken just refuses the push.
    std::shared_ptr<const PoolStatusRegistry::ChannelList> snapshot = registry_->snapshot();
    for (const std::shared_ptr<PoolStatusChannel>& ch : *snapshot) {
        (void)ch->push(st);
    }
}

bool PoolStatusPublisher::latest(PoolStatus& out, TickType_t waitTicks) const
{
    if (!hasLatest()) {
        const EventBits_t bits = xEventGroupWaitBits(events_, HAS_STATUS_BIT | CLOSED_BIT,
                                                     pdFALSE, pdFALSE, waitTicks);
        if ((bits & HAS_STATUS_BIT) == 0) return false;
    }

    xSemaphoreTake(latestMutex_, portMAX_DELAY);
    const bool has = hasLatest_;
    if (has) out = latest_;
    xSemaphoreGive(latestMutex_);
    return has;
}

bool PoolStatusPublisher::hasLatest() const
{
    xSemaphoreTake(latestMutex_, portMAX_DELAY);
    const bool has = hasLatest_;
    xSemaphoreGive(latestMutex_);
    return has;
}

std::shared_ptr<PoolStatusChannel> PoolStatusPublisher::attach_()
{
    if (closed_) return nullptr;

    std::shared_ptr<PoolStatusChannel> ch = std::make_shared<PoolStatusChannel>();
    if (!ch->ok()) {
        LOGE("subscription alloc failed");
        return nullptr;
    }
    if (!registry_->add(ch)) return nullptr;

    LOGD("subscriber added (count=%u)", (unsigned)registry_->size());
    return ch;
}

PoolStatusSubscription PoolStatusPublisher::subscribe()
{
    return PoolStatusSubscription(attach_(), registry_);
}

bool PoolStatusPublisher::addListener(PoolStatusListener cb, void* user, uint8_t* outId)
{
    if (!cb) return false;

    std::shared_ptr<PoolStatusChannel> ch = attach_();
    if (!ch) return false;

    ListenerSlot* slot = nullptr;
    uint8_t id = 0;
    xSemaphoreTake(listenerMutex_, portMAX_DELAY);
    for (uint8_t i = 0; i < Limits::PoolCtl::MaxListeners; ++i) {
        if (listeners_[i].used) continue;
        slot = &listeners_[i];
        id = nextListenerId_++;
        if (nextListenerId_ == 0) nextListenerId_ = 1;
        slot->used = true;
        slot->id = id;
        slot->ch = ch;
        break;
    }
    xSemaphoreGive(listenerMutex_);

    if (!slot) {
        LOGW("listener table full (max=%u)", (unsigned)Limits::PoolCtl::MaxListeners);
        ch->close();
        registry_->remove(ch.get());
        return false;
    }

    ListenerTaskCtx* ctx = new ListenerTaskCtx{cb, user, ch};
    if (xTaskCreate(listenerTask_, "poolctl.lsn", Limits::PoolCtl::ListenerStackSize,
                    ctx, Limits::PoolCtl::ListenerPriority, nullptr) != pdPASS) {
        LOGE("listener task create failed");
        delete ctx;
        removeListener(id);
        return false;
    }

    if (outId) *outId = id;
    LOGI("listener %u added", (unsigned)id);
    return true;
}

bool PoolStatusPublisher::removeListener(uint8_t id)
{
    std::shared_ptr<PoolStatusChannel> ch;
    xSemaphoreTake(listenerMutex_, portMAX_DELAY);
    for (uint8_t i = 0; i < Limits::PoolCtl::MaxListeners; ++i) {
        if (!listeners_[i].used || listeners_[i].id != id) continue;
        ch = listeners_[i].ch;
        listeners_[i] = ListenerSlot{};
        break;
    }
    xSemaphoreGive(listenerMutex_);

    if (!ch) return false;
    ch->close();
    registry_->remove(ch.get());
    LOGI("listener %u removed", (unsigned)id);
    return true;
}

void PoolStatusPublisher::close()
{
    if (closed_) return;
    closed_ = true;

    const PoolStatusRegistry::ChannelList toClose = registry_->closeAll();
    xSemaphoreTake(listenerMutex_, portMAX_DELAY);
    for (uint8_t i = 0; i < Limits::PoolCtl::MaxListeners; ++i) {
        listeners_[i] = ListenerSlot{};
    }
    xSemaphoreGive(listenerMutex_);

    for (const std::shared_ptr<PoolStatusChannel>& ch : toClose) ch->close();
    xEventGroupSetBits(events_, CLOSED_BIT);
    LOGI("publisher closed (%u subscriptions)", (unsigned)toClose.size());
}

void PoolStatusPublisher::listenerTask_(void* pv)
{
    ListenerTaskCtx* ctx = static_cast<ListenerTaskCtx*>(pv);
    PoolStatus st{};
    while (ctx->ch->pop(st, portMAX_DELAY)) {
        ctx->cb(ctx->user, st);
    }
    delete ctx;
    vTaskDelete(nullptr);
}
