#pragma once

#include "common/Logger.h"
#include "common/UniqueIdGenerator.h"
#include "reactive/IObservable.h"
#include <algorithm>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace SPC {

/**
 * @brief Shared subscriber bookkeeping for every observable in the controller
 *
 * Holds the latest value and a version counter. Deliveries are serialized by
 * a recursive delivery mutex, so a subscriber callback may publish into the
 * same observable on the same thread; the nested delivery sends the newer
 * value and the outer one skips subscribers that are already up to date.
 *
 * Instances must be owned by a std::shared_ptr (subscribe() uses
 * weak_from_this() to build the unsubscribe handle).
 */
template <typename T> class Publisher : public IObservable<T>, public std::enable_shared_from_this<Publisher<T>> {
public:
    using typename IObservable<T>::Callback;
    using typename IObservable<T>::Predicate;

    explicit Publisher(std::string id, AsyncResult<T> initial = AsyncResult<T>::pending())
        : id_(std::move(id)), value_(std::move(initial)) {}

    ~Publisher() override = default;

    Publisher(const Publisher &) = delete;
    Publisher &operator=(const Publisher &) = delete;

    const std::string &getId() const override {
        return id_;
    }

    AsyncResult<T> getCurrent() const override {
        std::lock_guard<std::mutex> lock(stateMutex_);
        return value_;
    }

    uint64_t getVersion() const override {
        std::lock_guard<std::mutex> lock(stateMutex_);
        return version_;
    }

    Subscription subscribe(Callback callback) override {
        std::weak_ptr<Publisher> weakSelf = this->weak_from_this();
        if (weakSelf.expired()) {
            throw std::logic_error("Publisher '" + id_ + "' must be owned by a std::shared_ptr to be subscribed to");
        }

        auto subscriber = std::make_shared<Subscriber>();
        subscriber->id = UniqueIdGenerator::generateSubscriptionId();
        subscriber->callback = std::move(callback);

        std::lock_guard<std::recursive_mutex> deliveryLock(deliveryMutex_);

        AsyncResult<T> current;
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            subscribers_.push_back(subscriber);
            current = value_;
            subscriber->lastDeliveredVersion = version_;
        }

        LOG_TRACE("Publisher: '{}' gained subscriber {} (current: {})", id_, subscriber->id, current.describe());
        invokeSafely(*subscriber, current);

        uint64_t subscriberId = subscriber->id;
        return Subscription([weakSelf, subscriberId]() {
            if (auto self = weakSelf.lock()) {
                self->unsubscribe(subscriberId);
            }
        });
    }

    std::optional<AsyncResult<T>> waitUntil(Predicate predicate, std::chrono::milliseconds timeout) const override {
        std::unique_lock<std::mutex> lock(stateMutex_);
        if (valueChanged_.wait_for(lock, timeout, [&] { return predicate(value_); })) {
            return value_;
        }
        return std::nullopt;
    }

    size_t getSubscriberCount() const {
        std::lock_guard<std::mutex> lock(stateMutex_);
        return subscribers_.size();
    }

protected:
    /**
     * @brief Replace the current value and deliver it to all subscribers
     */
    void publish(AsyncResult<T> value) {
        std::lock_guard<std::recursive_mutex> deliveryLock(deliveryMutex_);
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            value_ = std::move(value);
            ++version_;
        }
        valueChanged_.notify_all();
        deliverLatest();
    }

    /**
     * @brief Compute and publish a value under the delivery lock
     *
     * Derived observables use this so that computing from their inputs and
     * publishing the result happen atomically with respect to other deliveries.
     * A result equal to the current value is not published.
     *
     * @return true if a new value was published
     */
    template <typename Fn> bool publishComputed(Fn &&compute) {
        std::lock_guard<std::recursive_mutex> deliveryLock(deliveryMutex_);
        AsyncResult<T> next = compute();
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            if (value_ == next) {
                return false;
            }
        }
        publish(std::move(next));
        return true;
    }

private:
    struct Subscriber {
        uint64_t id = 0;
        Callback callback;
        // Guarded by deliveryMutex_
        uint64_t lastDeliveredVersion = 0;
        bool active = true;
    };

    void deliverLatest() {
        AsyncResult<T> current;
        uint64_t version = 0;
        std::vector<std::shared_ptr<Subscriber>> subscribers;
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            current = value_;
            version = version_;
            subscribers = subscribers_;
        }

        for (auto &subscriber : subscribers) {
            if (!subscriber->active || subscriber->lastDeliveredVersion >= version) {
                continue;
            }
            subscriber->lastDeliveredVersion = version;
            invokeSafely(*subscriber, current);
        }
    }

    void unsubscribe(uint64_t subscriberId) {
        // Waits for an in-flight delivery on another thread to finish
        std::lock_guard<std::recursive_mutex> deliveryLock(deliveryMutex_);
        std::lock_guard<std::mutex> lock(stateMutex_);

        auto it = std::find_if(subscribers_.begin(), subscribers_.end(),
                               [subscriberId](const auto &subscriber) { return subscriber->id == subscriberId; });
        if (it != subscribers_.end()) {
            (*it)->active = false;
            subscribers_.erase(it);
            LOG_TRACE("Publisher: '{}' dropped subscriber {} ({} remaining)", id_, subscriberId, subscribers_.size());
        }
    }

    void invokeSafely(Subscriber &subscriber, const AsyncResult<T> &value) {
        try {
            subscriber.callback(value);
        } catch (const std::exception &e) {
            LOG_ERROR("Publisher: Subscriber {} of '{}' threw: {}", subscriber.id, id_, e.what());
        }
    }

    const std::string id_;

    mutable std::mutex stateMutex_;
    mutable std::condition_variable valueChanged_;
    AsyncResult<T> value_;
    uint64_t version_ = 0;
    std::vector<std::shared_ptr<Subscriber>> subscribers_;

    std::recursive_mutex deliveryMutex_;
};

}  // namespace SPC
