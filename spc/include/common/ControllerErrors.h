#pragma once

#include "common/AsyncResult.h"
#include <stdexcept>
#include <string>

namespace SPC {

/**
 * @brief Base exception for faults raised inside the command executor
 *
 * The executor catches these at the per-command boundary and reports them as
 * Failure(kind(), what()) on the command's result sink. They never escape the
 * public controller API.
 */
class ControllerError : public std::runtime_error {
public:
    ControllerError(ErrorKind kind, const std::string &message) : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const {
        return kind_;
    }

    ResultError toResultError() const {
        return ResultError{kind_, what()};
    }

private:
    ErrorKind kind_;
};

/**
 * @brief Raised by reserved commands that have no behavior yet
 */
class NotImplementedError : public ControllerError {
public:
    explicit NotImplementedError(const std::string &operation)
        : ControllerError(ErrorKind::NOT_IMPLEMENTED, "Operation not implemented yet: " + operation) {}
};

/**
 * @brief Raised when a command needs Session State that does not exist yet
 */
class SessionNotInitializedError : public ControllerError {
public:
    explicit SessionNotInitializedError(const std::string &message = "session not initialized")
        : ControllerError(ErrorKind::SESSION_NOT_INITIALIZED, message) {}
};

}  // namespace SPC
