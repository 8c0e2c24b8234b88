// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-SPC-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of SPC (Survey Progress Controller).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
//
// Commercial License:
//   Individual: $100 cumulative
//   Enterprise: $500 cumulative
//   Contact: https://github.com/newmassrael
//
// Full terms: see LICENSE at the repository root

#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace SPC {

/**
 * @brief Classification of a Failure result
 *
 * Lets callers (and tests) tell an unsupported operation apart from a genuine
 * processing fault.
 */
enum class ErrorKind {
    SESSION_NOT_INITIALIZED,  // no session has begun, or no live command queue
    SUBMISSION_REJECTED,      // the command queue refused the command
    PROCESSING_FAILED,        // exception while the executor applied the command
    NOT_IMPLEMENTED,          // reserved operation with no behavior yet
    UPSTREAM_FAILED           // an input provider reported a failure
};

const char *errorKindToString(ErrorKind kind);

struct ResultError {
    ErrorKind kind = ErrorKind::PROCESSING_FAILED;
    std::string message;

    bool operator==(const ResultError &) const = default;
};

/**
 * @brief Latest known outcome of an asynchronous computation
 *
 * Exactly one of Pending, Success(value) or Failure(error). Instances are
 * values: a ResultCell overwrites its AsyncResult on every update, it never
 * buffers a history.
 */
template <typename T> class AsyncResult {
public:
    using ValueType = T;

    enum class Status { PENDING, SUCCESS, FAILURE };

    AsyncResult() = default;

    static AsyncResult pending() {
        return AsyncResult();
    }

    static AsyncResult success(T value) {
        AsyncResult result;
        result.state_.template emplace<1>(std::move(value));
        return result;
    }

    static AsyncResult failure(ResultError error) {
        AsyncResult result;
        result.state_.template emplace<2>(std::move(error));
        return result;
    }

    static AsyncResult failure(ErrorKind kind, std::string message) {
        return failure(ResultError{kind, std::move(message)});
    }

    Status getStatus() const {
        return static_cast<Status>(state_.index());
    }

    bool isPending() const {
        return state_.index() == 0;
    }

    bool isSuccess() const {
        return state_.index() == 1;
    }

    bool isFailure() const {
        return state_.index() == 2;
    }

    /**
     * @throws std::logic_error if the result is not a Success
     */
    const T &getValue() const {
        if (!isSuccess()) {
            throw std::logic_error("AsyncResult: getValue() called on a non-success result");
        }
        return std::get<1>(state_);
    }

    /**
     * @throws std::logic_error if the result is not a Failure
     */
    const ResultError &getError() const {
        if (!isFailure()) {
            throw std::logic_error("AsyncResult: getError() called on a non-failure result");
        }
        return std::get<2>(state_);
    }

    /**
     * @brief Map the success value, carrying Pending and Failure through unchanged
     */
    template <typename U, typename Fn> AsyncResult<U> transform(Fn &&fn) const {
        if (isSuccess()) {
            return AsyncResult<U>::success(fn(std::get<1>(state_)));
        }
        if (isFailure()) {
            return AsyncResult<U>::failure(std::get<2>(state_));
        }
        return AsyncResult<U>::pending();
    }

    bool operator==(const AsyncResult &other) const {
        return state_ == other.state_;
    }

    std::string describe() const {
        switch (getStatus()) {
        case Status::PENDING:
            return "Pending";
        case Status::SUCCESS:
            return "Success";
        case Status::FAILURE:
            return std::string("Failure(") + errorKindToString(getError().kind) + ": " + getError().message + ")";
        }
        return "Unknown";
    }

private:
    std::variant<std::monostate, T, ResultError> state_;
};

}  // namespace SPC
