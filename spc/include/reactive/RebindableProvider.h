#pragma once

#include "common/Logger.h"
#include "reactive/Publisher.h"
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace SPC {

/**
 * @brief Observable whose upstream can be swapped while it has subscribers
 *
 * Every Success from the current base is passed through the transform and the
 * transform's result is published. Pending and Failure from the base pass
 * through unchanged. Rebinding keeps all downstream subscribers attached;
 * values still in flight from the previous base are discarded by generation.
 */
template <typename In, typename Out> class RebindableProvider : public Publisher<Out> {
public:
    using Transform = std::function<AsyncResult<Out>(const In &)>;

    explicit RebindableProvider(std::string id) : Publisher<Out>(std::move(id)) {}

    ~RebindableProvider() override = default;

    /**
     * @brief Switch to a new upstream provider and transform
     *
     * The new base's current value is transformed and published before this
     * returns. Passing a null base detaches and publishes Pending.
     */
    void setBaseProvider(std::shared_ptr<IObservable<In>> base, Transform transform) {
        uint64_t generation = 0;
        Subscription previous;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            generation = ++generation_;
            transform_ = std::move(transform);
            base_ = base;
            previous = std::move(baseSubscription_);
        }
        // Cancel outside mutex_: it waits for the old base to finish delivering to us
        previous.cancel();

        if (!base) {
            LOG_DEBUG("RebindableProvider: '{}' detached from its base", this->getId());
            this->publish(AsyncResult<Out>::pending());
            return;
        }

        LOG_DEBUG("RebindableProvider: '{}' rebound to '{}' (generation {})", this->getId(), base->getId(),
                  generation);

        auto self = std::static_pointer_cast<RebindableProvider>(this->shared_from_this());
        std::weak_ptr<RebindableProvider> weakSelf = self;
        Subscription subscription = base->subscribe([weakSelf, generation](const AsyncResult<In> &value) {
            if (auto provider = weakSelf.lock()) {
                provider->onBaseValue(generation, value);
            }
        });

        Subscription superseded;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (generation_ == generation) {
                baseSubscription_ = std::move(subscription);
            } else {
                // A concurrent rebind won; drop ours after releasing the lock
                superseded = std::move(subscription);
            }
        }
    }

    std::shared_ptr<IObservable<In>> getBaseProvider() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return base_;
    }

private:
    void onBaseValue(uint64_t generation, const AsyncResult<In> &value) {
        this->publishComputed([&]() -> AsyncResult<Out> {
            Transform transform;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (generation != generation_) {
                    LOG_DEBUG("RebindableProvider: '{}' ignoring value from stale generation {}", this->getId(),
                              generation);
                    return this->getCurrent();
                }
                transform = transform_;
            }

            if (value.isFailure()) {
                return AsyncResult<Out>::failure(value.getError());
            }
            if (value.isPending() || !transform) {
                return AsyncResult<Out>::pending();
            }

            try {
                return transform(value.getValue());
            } catch (const std::exception &e) {
                LOG_ERROR("RebindableProvider: Transform for '{}' threw: {}", this->getId(), e.what());
                return AsyncResult<Out>::failure(ErrorKind::PROCESSING_FAILED, e.what());
            }
        });
    }

    mutable std::mutex mutex_;
    uint64_t generation_ = 0;
    Transform transform_;
    std::shared_ptr<IObservable<In>> base_;
    Subscription baseSubscription_;
};

}  // namespace SPC
