#pragma once

#include "SPCTypes.h"
#include "model/SurveyQuestion.h"
#include "reactive/IObservable.h"
#include "reactive/RebindableProvider.h"
#include "reactive/ResultCell.h"
#include "runtime/CommandQueue.h"
#include "runtime/ControllerCommand.h"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace SPC {

/**
 * @brief Public entry point for driving a survey session
 *
 * Every state change is a command executed by the active session's
 * CommandQueue, so callers never block on processing. Starting a new session
 * replaces the identity, the ephemeral question cell and the queue; commands
 * already queued for the previous session still drain but can no longer
 * affect what getCurrentQuestion() reports.
 *
 * Thread-safe. Methods never throw for session faults: they report them as
 * Failure results.
 */
class SPC_API SurveyProgressController {
public:
    static constexpr const char *DEFAULT_SESSION_ID = "default_session_id";

    SurveyProgressController();
    ~SurveyProgressController();

    SurveyProgressController(const SurveyProgressController &) = delete;
    SurveyProgressController &operator=(const SurveyProgressController &) = delete;

    /**
     * @brief Start a fresh session fed by the given question source
     *
     * Every value the source emits from now on is forwarded to the new
     * session. The returned observable resolves once the session is
     * initialized.
     */
    std::shared_ptr<IObservable<Unit>>
    beginSurveySession(std::shared_ptr<IObservable<SurveyQuestionList>> questionSource);

    /**
     * @brief Observable of the question to display
     *
     * Failure(SESSION_NOT_INITIALIZED) before any session, Pending until the
     * session has a question list, then Success. Follows later sessions.
     */
    std::shared_ptr<IObservable<EphemeralSurveyQuestion>> getCurrentQuestion();

    std::shared_ptr<IObservable<Unit>> finishSurveySession();
    std::shared_ptr<IObservable<Unit>> moveToNextQuestion();
    std::shared_ptr<IObservable<Unit>> moveToPreviousQuestion();
    std::shared_ptr<IObservable<Unit>> submitAnswer(const SelectedAnswer &answer);
    std::shared_ptr<IObservable<Unit>> savePartialCompletion();
    std::shared_ptr<IObservable<Unit>> saveFullCompletion();

    /**
     * @brief Re-derive the current question and notify observers
     */
    std::shared_ptr<IObservable<Unit>> recomputeCurrentQuestion();

    /**
     * @brief Submit a command to the active session without waiting for it
     *
     * A command with an empty sessionId is tagged with the active session.
     * The command's result sink is set to Pending before it is queued.
     *
     * @return Pending if queued, otherwise the Failure also written to the sink
     */
    AsyncResult<Unit> submitCommand(std::unique_ptr<ControllerCommand> command);

    /**
     * @brief Identity of the active session, DEFAULT_SESSION_ID before any
     */
    std::string getActiveSessionId() const;

    /**
     * @brief Block until the active session's queue has nothing left to do
     * @return false on timeout; true immediately if there is no session
     */
    bool waitForPendingCommands(std::chrono::milliseconds timeout) const;

    /**
     * @brief Number of queues from earlier sessions that are still draining
     */
    size_t getRetiredQueueCount() const;

private:
    using CommandFactory = std::function<std::unique_ptr<ControllerCommand>(
        const std::string &sessionId, std::shared_ptr<ResultCell<Unit>> resultSink)>;

    std::shared_ptr<IObservable<Unit>> submitReserved(ControllerCommand::Type type, const std::string &resultName);

    /**
     * @brief Name the result sink after the active session and enqueue the command in one step
     *
     * The sink id and the command's sessionId are read under the same lock as
     * the enqueue, so both always name the session whose queue got the command.
     */
    std::shared_ptr<IObservable<Unit>> submitWithResult(const std::string &resultName,
                                                        const CommandFactory &makeCommand);

    /**
     * @brief Tag and enqueue on the active queue; caller holds sessionMutex_
     * @return Pending if queued, otherwise the submission failure
     */
    AsyncResult<Unit> enqueueLocked(std::unique_ptr<ControllerCommand> command);

    // sessionId is the session that bound the emitting source, not the one active now
    void forwardQuestionList(const std::string &sessionId, const SurveyQuestionList &questions);

    void reapRetiredQueuesLocked(std::vector<std::shared_ptr<CommandQueue>> &reaped);

    // Serializes whole beginSurveySession calls, including the provider rebinds
    std::mutex beginMutex_;
    mutable std::mutex sessionMutex_;
    std::string mostRecentSessionId_ = DEFAULT_SESSION_ID;
    std::shared_ptr<ResultCell<EphemeralSurveyQuestion>> ephemeralQuestionCell_;
    std::shared_ptr<CommandQueue> commandQueue_;
    std::vector<std::shared_ptr<CommandQueue>> retiredQueues_;

    // Follows the caller's question source; emissions become RECEIVE_QUESTION_LIST commands
    std::shared_ptr<RebindableProvider<SurveyQuestionList, Unit>> monitoredQuestionList_;
    // Follows the most recent session's ephemeral question cell
    std::shared_ptr<RebindableProvider<EphemeralSurveyQuestion, EphemeralSurveyQuestion>> ephemeralQuestion_;
};

}  // namespace SPC
