#pragma once

#include "reactive/Publisher.h"
#include <memory>
#include <string>

namespace SPC {

/**
 * @brief Single-slot broadcast holder for the latest AsyncResult
 *
 * Every set() publishes, even when the new value equals the old one, so the
 * version counter reflects how many times the owner actually recomputed.
 */
template <typename T> class ResultCell : public Publisher<T> {
public:
    explicit ResultCell(std::string id, AsyncResult<T> initial = AsyncResult<T>::pending())
        : Publisher<T>(std::move(id), std::move(initial)) {}

    void set(AsyncResult<T> value) {
        this->publish(std::move(value));
    }

    void setPending() {
        set(AsyncResult<T>::pending());
    }

    void setSuccess(T value) {
        set(AsyncResult<T>::success(std::move(value)));
    }

    void setFailure(ErrorKind kind, std::string message) {
        set(AsyncResult<T>::failure(kind, std::move(message)));
    }

    static std::shared_ptr<ResultCell> create(std::string id, AsyncResult<T> initial = AsyncResult<T>::pending()) {
        return std::make_shared<ResultCell>(std::move(id), std::move(initial));
    }
};

}  // namespace SPC
