#pragma once

#include "common/Logger.h"
#include "reactive/Publisher.h"
#include <functional>
#include <memory>
#include <string>

namespace SPC {

/**
 * @brief Observable that recomputes from the latest values of two inputs
 *
 * Precedence: a Failure of the first input, then a Failure of the second,
 * then Pending if either input is Pending, otherwise Success of the combiner.
 * An exception thrown by the combiner becomes PROCESSING_FAILED.
 */
template <typename A, typename B, typename R> class CombinedProvider : public Publisher<R> {
public:
    using Combiner = std::function<R(const A &, const B &)>;

    CombinedProvider(std::string id, std::shared_ptr<IObservable<A>> first, std::shared_ptr<IObservable<B>> second,
                     Combiner combiner)
        : Publisher<R>(std::move(id)), first_(std::move(first)), second_(std::move(second)),
          combiner_(std::move(combiner)) {}

    ~CombinedProvider() override = default;

    /**
     * @brief Create a combined provider already subscribed to both inputs
     */
    static std::shared_ptr<CombinedProvider> create(std::string id, std::shared_ptr<IObservable<A>> first,
                                                    std::shared_ptr<IObservable<B>> second, Combiner combiner) {
        if (!first || !second) {
            throw std::invalid_argument("CombinedProvider '" + id + "' requires two inputs");
        }
        auto provider =
            std::make_shared<CombinedProvider>(std::move(id), std::move(first), std::move(second), std::move(combiner));
        provider->connect();
        return provider;
    }

    static AsyncResult<R> combine(const AsyncResult<A> &first, const AsyncResult<B> &second, const Combiner &combiner) {
        if (first.isFailure()) {
            return AsyncResult<R>::failure(first.getError());
        }
        if (second.isFailure()) {
            return AsyncResult<R>::failure(second.getError());
        }
        if (first.isPending() || second.isPending()) {
            return AsyncResult<R>::pending();
        }
        try {
            return AsyncResult<R>::success(combiner(first.getValue(), second.getValue()));
        } catch (const std::exception &e) {
            LOG_ERROR("CombinedProvider: Combiner threw: {}", e.what());
            return AsyncResult<R>::failure(ErrorKind::PROCESSING_FAILED, e.what());
        }
    }

private:
    void connect() {
        std::weak_ptr<CombinedProvider> weakSelf = std::static_pointer_cast<CombinedProvider>(this->shared_from_this());
        auto onInput = [weakSelf](const auto &) {
            if (auto self = weakSelf.lock()) {
                self->recompute();
            }
        };
        firstSubscription_ = first_->subscribe(onInput);
        secondSubscription_ = second_->subscribe(onInput);
        LOG_DEBUG("CombinedProvider: '{}' connected to '{}' and '{}'", this->getId(), first_->getId(),
                  second_->getId());
    }

    void recompute() {
        this->publishComputed([this]() { return combine(first_->getCurrent(), second_->getCurrent(), combiner_); });
    }

    std::shared_ptr<IObservable<A>> first_;
    std::shared_ptr<IObservable<B>> second_;
    Combiner combiner_;
    Subscription firstSubscription_;
    Subscription secondSubscription_;
};

}  // namespace SPC
