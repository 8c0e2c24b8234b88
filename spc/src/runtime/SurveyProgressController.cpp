#include "runtime/SurveyProgressController.h"
#include "common/Logger.h"
#include "common/UniqueIdGenerator.h"
#include "reactive/DataProviders.h"
#include "runtime/SessionCommandProcessor.h"
#include <algorithm>
#include <iterator>

namespace SPC {

namespace {

constexpr const char *RESULT_PREFIX = "SurveyProgressController.";

AsyncResult<EphemeralSurveyQuestion> passThrough(const EphemeralSurveyQuestion &question) {
    return AsyncResult<EphemeralSurveyQuestion>::success(question);
}

}  // namespace

SurveyProgressController::SurveyProgressController() {
    ephemeralQuestionCell_ = ResultCell<EphemeralSurveyQuestion>::create(
        std::string(RESULT_PREFIX) + "ephemeral_question_" + DEFAULT_SESSION_ID,
        AsyncResult<EphemeralSurveyQuestion>::failure(ErrorKind::SESSION_NOT_INITIALIZED, "session not initialized"));

    // Until a session begins the monitored list is an empty in-memory list that forwards nothing
    monitoredQuestionList_ = DataProviders::transformNested<SurveyQuestionList, Unit>(
        std::string(RESULT_PREFIX) + "monitored_question_list",
        DataProviders::createInMemoryProvider(std::string(RESULT_PREFIX) + "empty_question_list",
                                              SurveyQuestionList{}),
        [](const SurveyQuestionList &) { return AsyncResult<Unit>::success(Unit{}); });

    ephemeralQuestion_ = DataProviders::transformNested<EphemeralSurveyQuestion, EphemeralSurveyQuestion>(
        std::string(RESULT_PREFIX) + "ephemeral_question", ephemeralQuestionCell_, passThrough);

    LOG_DEBUG("SurveyProgressController: Created");
}

SurveyProgressController::~SurveyProgressController() {
    // Stop forwarding before the queues go away; the transform captures this
    monitoredQuestionList_->setBaseProvider(nullptr, nullptr);

    std::shared_ptr<CommandQueue> active;
    std::vector<std::shared_ptr<CommandQueue>> retired;
    {
        std::lock_guard<std::mutex> lock(sessionMutex_);
        active = std::move(commandQueue_);
        retired = std::move(retiredQueues_);
    }

    if (active) {
        active->close();
    }
    LOG_DEBUG("SurveyProgressController: Shutting down ({} retired queues)", retired.size());
    // Queue destructors drain and join
    active.reset();
    retired.clear();
}

std::shared_ptr<IObservable<Unit>>
SurveyProgressController::beginSurveySession(std::shared_ptr<IObservable<SurveyQuestionList>> questionSource) {
    std::lock_guard<std::mutex> beginLock(beginMutex_);

    std::string sessionId = UniqueIdGenerator::generateSessionId("survey_session");
    auto cell = ResultCell<EphemeralSurveyQuestion>::create(std::string(RESULT_PREFIX) + "ephemeral_question_" +
                                                            sessionId);
    auto sink = ResultCell<Unit>::create(std::string(RESULT_PREFIX) + "begin_session_result_" + sessionId);

    std::vector<std::shared_ptr<CommandQueue>> reaped;
    AsyncResult<Unit> submitted;
    {
        std::lock_guard<std::mutex> lock(sessionMutex_);
        reapRetiredQueuesLocked(reaped);

        if (commandQueue_) {
            LOG_DEBUG("SurveyProgressController: Retiring queue of session '{}'", mostRecentSessionId_);
            commandQueue_->close();
            retiredQueues_.push_back(std::move(commandQueue_));
        }

        mostRecentSessionId_ = sessionId;
        ephemeralQuestionCell_ = cell;
        commandQueue_ =
            std::make_shared<CommandQueue>("survey_queue_" + sessionId, std::make_unique<SessionCommandProcessor>());

        // INITIALIZE must be the first command of the new queue, ahead of any forwarded list
        submitted = enqueueLocked(ControllerCommand::createInitialize(sessionId, cell, sink));
    }
    reaped.clear();

    if (submitted.isFailure()) {
        sink->set(submitted);
    }

    LOG_INFO("SurveyProgressController: Began session '{}'", sessionId);

    ephemeralQuestion_->setBaseProvider(cell, passThrough);

    if (!questionSource) {
        LOG_WARN("SurveyProgressController: Session '{}' has no question source", sessionId);
    }
    // Lists stay tagged with this session; once a later session begins they are dropped by the executor
    monitoredQuestionList_->setBaseProvider(questionSource, [this, sessionId](const SurveyQuestionList &questions) {
        forwardQuestionList(sessionId, questions);
        return AsyncResult<Unit>::success(Unit{});
    });

    return sink;
}

std::shared_ptr<IObservable<EphemeralSurveyQuestion>> SurveyProgressController::getCurrentQuestion() {
    return DataProviders::combineWith(std::string(RESULT_PREFIX) + "current_question", monitoredQuestionList_,
                                      ephemeralQuestion_,
                                      [](const Unit &, const EphemeralSurveyQuestion &question) { return question; });
}

std::shared_ptr<IObservable<Unit>> SurveyProgressController::finishSurveySession() {
    return submitReserved(ControllerCommand::Type::FINISH_SESSION, "finish_session_result_");
}

std::shared_ptr<IObservable<Unit>> SurveyProgressController::moveToNextQuestion() {
    return submitReserved(ControllerCommand::Type::MOVE_TO_NEXT_QUESTION, "move_to_next_result_");
}

std::shared_ptr<IObservable<Unit>> SurveyProgressController::moveToPreviousQuestion() {
    return submitReserved(ControllerCommand::Type::MOVE_TO_PREVIOUS_QUESTION, "move_to_previous_result_");
}

std::shared_ptr<IObservable<Unit>> SurveyProgressController::submitAnswer(const SelectedAnswer &answer) {
    return submitWithResult("submit_answer_result_",
                            [&answer](const std::string &sessionId, std::shared_ptr<ResultCell<Unit>> sink) {
                                return ControllerCommand::createSubmitAnswer(sessionId, answer, std::move(sink));
                            });
}

std::shared_ptr<IObservable<Unit>> SurveyProgressController::savePartialCompletion() {
    return submitReserved(ControllerCommand::Type::SAVE_PARTIAL_COMPLETION, "save_partial_completion_result_");
}

std::shared_ptr<IObservable<Unit>> SurveyProgressController::saveFullCompletion() {
    return submitReserved(ControllerCommand::Type::SAVE_FULL_COMPLETION, "save_full_completion_result_");
}

std::shared_ptr<IObservable<Unit>> SurveyProgressController::recomputeCurrentQuestion() {
    return submitReserved(ControllerCommand::Type::RECOMPUTE_AND_NOTIFY, "recompute_result_");
}

AsyncResult<Unit> SurveyProgressController::submitCommand(std::unique_ptr<ControllerCommand> command) {
    if (!command) {
        return AsyncResult<Unit>::failure(ErrorKind::SUBMISSION_REJECTED, "null command");
    }

    auto sink = command->resultSink;
    if (sink) {
        sink->setPending();
    }

    AsyncResult<Unit> outcome;
    {
        std::lock_guard<std::mutex> lock(sessionMutex_);
        outcome = enqueueLocked(std::move(command));
    }

    if (outcome.isFailure() && sink) {
        sink->set(outcome);
    }
    return outcome;
}

std::string SurveyProgressController::getActiveSessionId() const {
    std::lock_guard<std::mutex> lock(sessionMutex_);
    return mostRecentSessionId_;
}

bool SurveyProgressController::waitForPendingCommands(std::chrono::milliseconds timeout) const {
    std::shared_ptr<CommandQueue> queue;
    {
        std::lock_guard<std::mutex> lock(sessionMutex_);
        queue = commandQueue_;
    }
    return !queue || queue->waitForIdle(timeout);
}

size_t SurveyProgressController::getRetiredQueueCount() const {
    std::lock_guard<std::mutex> lock(sessionMutex_);
    return static_cast<size_t>(std::count_if(retiredQueues_.begin(), retiredQueues_.end(),
                                             [](const auto &queue) { return !queue->isDrained(); }));
}

std::shared_ptr<IObservable<Unit>> SurveyProgressController::submitReserved(ControllerCommand::Type type,
                                                                          const std::string &resultName) {
    return submitWithResult(resultName, [type](const std::string &sessionId, std::shared_ptr<ResultCell<Unit>> sink) {
        return ControllerCommand::create(type, sessionId, std::move(sink));
    });
}

std::shared_ptr<IObservable<Unit>> SurveyProgressController::submitWithResult(const std::string &resultName,
                                                                            const CommandFactory &makeCommand) {
    std::shared_ptr<ResultCell<Unit>> sink;
    AsyncResult<Unit> outcome;
    {
        std::lock_guard<std::mutex> lock(sessionMutex_);
        sink = ResultCell<Unit>::create(std::string(RESULT_PREFIX) + resultName + mostRecentSessionId_);
        outcome = enqueueLocked(makeCommand(mostRecentSessionId_, sink));
    }

    // Sinks start Pending; only a submission failure needs publishing
    if (outcome.isFailure()) {
        sink->set(outcome);
    }
    return sink;
}

AsyncResult<Unit> SurveyProgressController::enqueueLocked(std::unique_ptr<ControllerCommand> command) {
    if (!commandQueue_) {
        LOG_DEBUG("SurveyProgressController: Rejecting {} - no session",
                  ControllerCommand::typeToString(command->type));
        return AsyncResult<Unit>::failure(ErrorKind::SESSION_NOT_INITIALIZED, "session not initialized");
    }

    if (command->sessionId.empty()) {
        command->sessionId = mostRecentSessionId_;
    }

    const char *typeName = ControllerCommand::typeToString(command->type);
    if (!commandQueue_->trySubmit(std::move(command))) {
        LOG_WARN("SurveyProgressController: Queue '{}' rejected {}", commandQueue_->getName(), typeName);
        return AsyncResult<Unit>::failure(ErrorKind::SUBMISSION_REJECTED,
                                          std::string("command queue rejected ") + typeName);
    }
    return AsyncResult<Unit>::pending();
}

void SurveyProgressController::forwardQuestionList(const std::string &sessionId,
                                                   const SurveyQuestionList &questions) {
    AsyncResult<Unit> outcome = submitCommand(ControllerCommand::createReceiveQuestionList(sessionId, questions));
    if (outcome.isFailure()) {
        LOG_WARN("SurveyProgressController: Could not forward {} questions for '{}': {}", questions.size(),
                 sessionId, outcome.describe());
    }
}

void SurveyProgressController::reapRetiredQueuesLocked(std::vector<std::shared_ptr<CommandQueue>> &reaped) {
    auto drained = std::stable_partition(retiredQueues_.begin(), retiredQueues_.end(),
                                         [](const auto &queue) { return !queue->isDrained(); });
    std::move(drained, retiredQueues_.end(), std::back_inserter(reaped));
    retiredQueues_.erase(drained, retiredQueues_.end());
    if (!reaped.empty()) {
        LOG_DEBUG("SurveyProgressController: Reaped {} drained queues", reaped.size());
    }
}

}  // namespace SPC
