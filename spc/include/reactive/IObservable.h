#pragma once

#include "common/AsyncResult.h"
#include "reactive/Subscription.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace SPC {

/**
 * @brief Latest-value observable of an AsyncResult
 *
 * State-based, not event-based: a new subscriber immediately receives the
 * current value, then every later value. Intermediate values may be skipped
 * when updates race, but the last value delivered to each subscriber is always
 * the most recent one.
 */
template <typename T> class IObservable {
public:
    using Callback = std::function<void(const AsyncResult<T> &)>;
    using Predicate = std::function<bool(const AsyncResult<T> &)>;

    virtual ~IObservable() = default;

    /**
     * @brief Stable identifier, used in logs
     */
    virtual const std::string &getId() const = 0;

    virtual AsyncResult<T> getCurrent() const = 0;

    /**
     * @brief Number of values published so far (0 for the initial value)
     */
    virtual uint64_t getVersion() const = 0;

    /**
     * @brief Subscribe to value changes
     *
     * The callback runs synchronously once with the current value before this
     * returns, then on whichever thread publishes later values.
     */
    [[nodiscard]] virtual Subscription subscribe(Callback callback) = 0;

    /**
     * @brief Block until the current value satisfies the predicate
     * @return The satisfying value, or nullopt on timeout
     */
    virtual std::optional<AsyncResult<T>> waitUntil(Predicate predicate, std::chrono::milliseconds timeout) const = 0;
};

}  // namespace SPC
