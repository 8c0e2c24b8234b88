#pragma once

#include <functional>
#include <utility>

namespace SPC {

/**
 * @brief RAII handle for an observable subscription
 *
 * Destroying (or cancelling) the handle unsubscribes. Once cancel() returns the
 * callback is not invoked again, except by a delivery already running on the
 * calling thread.
 */
class Subscription {
public:
    Subscription() = default;

    explicit Subscription(std::function<void()> canceller) : canceller_(std::move(canceller)) {}

    ~Subscription() {
        cancel();
    }

    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;

    Subscription(Subscription &&other) noexcept : canceller_(std::move(other.canceller_)) {
        other.canceller_ = nullptr;
    }

    Subscription &operator=(Subscription &&other) noexcept {
        if (this != &other) {
            cancel();
            canceller_ = std::move(other.canceller_);
            other.canceller_ = nullptr;
        }
        return *this;
    }

    void cancel() {
        if (canceller_) {
            auto canceller = std::move(canceller_);
            canceller_ = nullptr;
            canceller();
        }
    }

    bool isActive() const {
        return static_cast<bool>(canceller_);
    }

private:
    std::function<void()> canceller_;
};

}  // namespace SPC
