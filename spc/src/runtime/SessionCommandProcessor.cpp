#include "runtime/SessionCommandProcessor.h"
#include "common/ControllerErrors.h"
#include "common/Logger.h"
#include "runtime/QuestionDerivation.h"

namespace SPC {

std::string SessionCommandProcessor::getSessionId() const {
    return state_ ? state_->getSessionId() : std::string();
}

void SessionCommandProcessor::process(ControllerCommand &command) {
    LOG_DEBUG("SessionCommandProcessor: Processing #{} {} for session '{}'", command.sequenceNumber,
              ControllerCommand::typeToString(command.type), command.sessionId);
    try {
        dispatch(command);
    } catch (const ControllerError &e) {
        LOG_DEBUG("SessionCommandProcessor: {} failed with {}: {}", ControllerCommand::typeToString(command.type),
                  errorKindToString(e.kind()), e.what());
        resolveSink(command, AsyncResult<Unit>::failure(e.toResultError()));
    } catch (const std::exception &e) {
        LOG_ERROR("SessionCommandProcessor: {} failed: {}", ControllerCommand::typeToString(command.type), e.what());
        resolveSink(command, AsyncResult<Unit>::failure(ErrorKind::PROCESSING_FAILED, e.what()));
    }
}

void SessionCommandProcessor::dispatch(ControllerCommand &command) {
    if (command.type == ControllerCommand::Type::INITIALIZE) {
        handleInitialize(command);
        return;
    }

    if (!state_) {
        LOG_WARN("SessionCommandProcessor: Dropping {} for session '{}' - no session state yet",
                 ControllerCommand::typeToString(command.type), command.sessionId);
        throw SessionNotInitializedError();
    }

    if (command.sessionId != state_->getSessionId()) {
        LOG_DEBUG("SessionCommandProcessor: Ignoring {} for stale session '{}' (live session '{}')",
                  ControllerCommand::typeToString(command.type), command.sessionId, state_->getSessionId());
        return;
    }

    switch (command.type) {
    case ControllerCommand::Type::RECEIVE_QUESTION_LIST:
        handleReceiveQuestionList(command);
        break;
    case ControllerCommand::Type::RECOMPUTE_AND_NOTIFY:
        recomputeAndNotify();
        resolveSink(command, AsyncResult<Unit>::success(Unit{}));
        break;
    default:
        handleReserved(command);
        break;
    }
}

void SessionCommandProcessor::handleInitialize(ControllerCommand &command) {
    if (!command.ephemeralQuestionCell) {
        throw std::invalid_argument("INITIALIZE requires an ephemeral question cell");
    }
    if (state_) {
        LOG_WARN("SessionCommandProcessor: Re-initializing session '{}' as '{}'", state_->getSessionId(),
                 command.sessionId);
    }

    state_ = std::make_unique<SessionState>(command.sessionId, command.ephemeralQuestionCell);
    LOG_INFO("SessionCommandProcessor: Session '{}' initialized", command.sessionId);

    recomputeAndNotify();
    resolveSink(command, AsyncResult<Unit>::success(Unit{}));
}

void SessionCommandProcessor::handleReceiveQuestionList(ControllerCommand &command) {
    if (!state_->updateQuestionList(command.questions)) {
        LOG_DEBUG("SessionCommandProcessor: Question list for '{}' unchanged ({} questions)", state_->getSessionId(),
                  command.questions.size());
        resolveSink(command, AsyncResult<Unit>::success(Unit{}));
        return;
    }

    LOG_DEBUG("SessionCommandProcessor: Stored {} questions for '{}'", command.questions.size(),
              state_->getSessionId());
    recomputeAndNotify();
    resolveSink(command, AsyncResult<Unit>::success(Unit{}));
}

void SessionCommandProcessor::handleReserved(ControllerCommand &command) {
    throw NotImplementedError(ControllerCommand::typeToString(command.type));
}

void SessionCommandProcessor::recomputeAndNotify() {
    const auto &cell = state_->getEphemeralQuestionCell();
    try {
        cell->set(QuestionDerivation::computeEphemeralQuestionResult(*state_));
    } catch (const std::exception &e) {
        LOG_ERROR("SessionCommandProcessor: Cannot derive current question for '{}': {}", state_->getSessionId(),
                  e.what());
        cell->setFailure(ErrorKind::PROCESSING_FAILED, e.what());
    }
}

void SessionCommandProcessor::resolveSink(const ControllerCommand &command, AsyncResult<Unit> result) {
    if (command.resultSink) {
        command.resultSink->set(std::move(result));
    }
}

}  // namespace SPC
