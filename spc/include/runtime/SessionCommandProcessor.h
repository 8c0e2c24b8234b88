#pragma once

#include "runtime/ICommandProcessor.h"
#include "runtime/SessionState.h"
#include <memory>
#include <string>

namespace SPC {

/**
 * @brief Single writer of one session's SessionState
 *
 * Each command is handled inside its own try/catch: ControllerError
 * subclasses resolve the sink with their own kind, any other exception with
 * PROCESSING_FAILED. A failing command never stops the worker.
 *
 * Commands tagged with another session are a no-op: logged at debug level,
 * sink left untouched.
 */
class SessionCommandProcessor : public ICommandProcessor {
public:
    SessionCommandProcessor() = default;
    ~SessionCommandProcessor() override = default;

    void process(ControllerCommand &command) override;

    bool hasSessionState() const {
        return state_ != nullptr;
    }

    /**
     * @brief Identity of the live Session State, empty before INITIALIZE
     */
    std::string getSessionId() const;

private:
    void dispatch(ControllerCommand &command);

    void handleInitialize(ControllerCommand &command);
    void handleReceiveQuestionList(ControllerCommand &command);
    void handleReserved(ControllerCommand &command);

    /**
     * @brief Push the derived question (or Pending) into the ephemeral cell
     */
    void recomputeAndNotify();

    static void resolveSink(const ControllerCommand &command, AsyncResult<Unit> result);

    std::unique_ptr<SessionState> state_;
};

}  // namespace SPC
