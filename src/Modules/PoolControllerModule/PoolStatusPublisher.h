#pragma once
/**
 * @file PoolStatusPublisher.h
 * @brief Latest-status cell and status fan-out to subscribers and listeners.
 */
#include "Core/PoolStatus.h"
#include "Core/Services/IPoolController.h"
#include "Core/SystemLimits.h"
#include <FreeRTOS.h>
#include <event_groups.h>
#include <semphr.h>
#include <task.h>
#include <deque>
#include <memory>
#include <utility>
#include <vector>

/**
 * @brief Unbounded FIFO of statuses for one consumer.
 *
 * Single producer (the publisher) and single consumer. Closing drops pending
 * items and wakes a blocked consumer.
 */
class PoolStatusChannel {
public:
    PoolStatusChannel();
    ~PoolStatusChannel();

    PoolStatusChannel(const PoolStatusChannel&) = delete;
    PoolStatusChannel& operator=(const PoolStatusChannel&) = delete;

    bool ok() const { return lock_ && signal_; }

    /** @brief Append a status. Returns false once closed. */
    bool push(const PoolStatus& st);
    /** @brief Pop the oldest status, waiting up to `waitTicks`. False on timeout or close. */
    bool pop(PoolStatus& out, TickType_t waitTicks);
    void close();
    bool isClosed() const;
    size_t pending() const;

private:
    SemaphoreHandle_t lock_ = nullptr;
    SemaphoreHandle_t signal_ = nullptr;
    std::deque<PoolStatus> items_;
    bool closed_ = false;
};

/**
 * @brief Copy-on-write list of open channels.
 *
 * `snapshot()` hands out the current list; `add`/`remove` swap in a new one
 * under the lock, so a publish in progress keeps iterating its own copy.
 * Shared by the publisher and every subscription it handed out.
 */
class PoolStatusRegistry {
public:
    using ChannelList = std::vector<std::shared_ptr<PoolStatusChannel>>;

    PoolStatusRegistry();
    ~PoolStatusRegistry();

    PoolStatusRegistry(const PoolStatusRegistry&) = delete;
    PoolStatusRegistry& operator=(const PoolStatusRegistry&) = delete;

    std::shared_ptr<const ChannelList> snapshot() const;
    /** @brief False once `closeAll()` ran. */
    bool add(const std::shared_ptr<PoolStatusChannel>& ch);
    bool remove(const PoolStatusChannel* ch);
    /** @brief Empty the list, reject later adds and return what was registered. */
    ChannelList closeAll();
    size_t size() const;

private:
    SemaphoreHandle_t lock_ = nullptr;
    std::shared_ptr<const ChannelList> channels_;
    bool closed_ = false;
};

/**
 * @brief Move-only handle on a status stream. Destruction closes it.
 *
 * Closing also drops the channel from the publisher's registry. The handle may
 * outlive the publisher.
 */
class PoolStatusSubscription {
public:
    PoolStatusSubscription() = default;
    PoolStatusSubscription(std::shared_ptr<PoolStatusChannel> ch, std::weak_ptr<PoolStatusRegistry> registry)
        : ch_(std::move(ch)), registry_(std::move(registry)) {}
    ~PoolStatusSubscription() { close(); }

    PoolStatusSubscription(PoolStatusSubscription&& other) noexcept
        : ch_(std::move(other.ch_)), registry_(std::move(other.registry_)) {}
    PoolStatusSubscription& operator=(PoolStatusSubscription&& other) noexcept {
        if (this != &other) {
            close();
            ch_ = std::move(other.ch_);
            registry_ = std::move(other.registry_);
        }
        return *this;
    }
    PoolStatusSubscription(const PoolStatusSubscription&) = delete;
    PoolStatusSubscription& operator=(const PoolStatusSubscription&) = delete;

    /** @brief Subscription is attached and not closed. */
    bool isOpen() const { return ch_ && !ch_->isClosed(); }

    /** @brief Next status in publish order. False on timeout, or when closed. */
    bool receive(PoolStatus& out, TickType_t waitTicks) {
        return ch_ ? ch_->pop(out, waitTicks) : false;
    }

    /** @brief Statuses published but not yet received. */
    size_t pending() const { return ch_ ? ch_->pending() : 0; }

    /** @brief Stop receiving and release the registration. Idempotent. */
    void close();

private:
    std::shared_ptr<PoolStatusChannel> ch_;
    std::weak_ptr<PoolStatusRegistry> registry_;
};

/**
 * @brief Holds the latest published status and delivers every publish to all
 *        open subscriptions.
 *
 * `publish()` is called by the monitor task only. Membership lives in a
 * `PoolStatusRegistry`; publish iterates a snapshot of it while other tasks
 * subscribe and close.
 */
class PoolStatusPublisher {
public:
    PoolStatusPublisher();
    ~PoolStatusPublisher();

    PoolStatusPublisher(const PoolStatusPublisher&) = delete;
    PoolStatusPublisher& operator=(const PoolStatusPublisher&) = delete;

    /** @brief Replace the latest status, wake waiters, then fan out. */
    void publish(const PoolStatus& st);

    /** @brief Latest status; blocks up to `waitTicks` until one exists. False on timeout or close. */
    bool latest(PoolStatus& out, TickType_t waitTicks) const;
    bool hasLatest() const;

    /** @brief New subscription receiving every later publish. Closed handle after `close()`. */
    PoolStatusSubscription subscribe();

    /** @brief Push-style listener served by its own dispatch task. */
    bool addListener(PoolStatusListener cb, void* user, uint8_t* outId);
    /** @brief Close a listener's subscription; its task exits after the current callback. */
    bool removeListener(uint8_t id);

    /** @brief Close every subscription and listener, reject new ones. */
    void close();
    bool isClosed() const { return closed_; }

    /** @brief Registered subscriptions and listeners. */
    size_t subscriberCount() const { return registry_->size(); }

private:
    static constexpr EventBits_t HAS_STATUS_BIT = (1u << 0);
    static constexpr EventBits_t CLOSED_BIT = (1u << 1);

    struct ListenerSlot {
        bool used = false;
        uint8_t id = 0;
        std::shared_ptr<PoolStatusChannel> ch;
    };

    struct ListenerTaskCtx {
        PoolStatusListener cb;
        void* user;
        std::shared_ptr<PoolStatusChannel> ch;
    };

    SemaphoreHandle_t latestMutex_ = nullptr;
    SemaphoreHandle_t listenerMutex_ = nullptr;
    EventGroupHandle_t events_ = nullptr;

    PoolStatus latest_{};
    bool hasLatest_ = false;

    std::shared_ptr<PoolStatusRegistry> registry_;
    ListenerSlot listeners_[Limits::PoolCtl::MaxListeners];
    uint8_t nextListenerId_ = 1;
    volatile bool closed_ = false;

    std::shared_ptr<PoolStatusChannel> attach_();
    static void listenerTask_(void* pv);
};
