#pragma once

#include "SPCTypes.h"
#include "model/SurveyQuestion.h"
#include "reactive/ResultCell.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace SPC {

/**
 * @brief Unit of work submitted to a session's command queue
 *
 * One struct for every variant: the type tag selects which payload fields are
 * meaningful. resultSink, when present, receives the outcome of processing
 * (or the submission failure if the command never reached a queue).
 */
struct ControllerCommand {
    enum class Type {
        INITIALIZE,
        RECEIVE_QUESTION_LIST,
        RECOMPUTE_AND_NOTIFY,
        FINISH_SESSION,
        MOVE_TO_NEXT_QUESTION,
        MOVE_TO_PREVIOUS_QUESTION,
        SUBMIT_ANSWER,
        SAVE_PARTIAL_COMPLETION,
        SAVE_FULL_COMPLETION
    };

    Type type;
    std::string sessionId;
    // Assigned by CommandQueue when the command is accepted
    uint64_t sequenceNumber = 0;

    // INITIALIZE
    std::shared_ptr<ResultCell<EphemeralSurveyQuestion>> ephemeralQuestionCell;
    // RECEIVE_QUESTION_LIST
    SurveyQuestionList questions;
    // SUBMIT_ANSWER
    std::optional<SelectedAnswer> selectedAnswer;

    std::shared_ptr<ResultCell<Unit>> resultSink;

    ControllerCommand(Type commandType, std::string targetSessionId)
        : type(commandType), sessionId(std::move(targetSessionId)) {}

    static std::unique_ptr<ControllerCommand>
    createInitialize(const std::string &sessionId, std::shared_ptr<ResultCell<EphemeralSurveyQuestion>> cell,
                     std::shared_ptr<ResultCell<Unit>> sink);

    static std::unique_ptr<ControllerCommand> createReceiveQuestionList(const std::string &sessionId,
                                                                        SurveyQuestionList questions);

    static std::unique_ptr<ControllerCommand> createRecomputeAndNotify(const std::string &sessionId);

    static std::unique_ptr<ControllerCommand> createSubmitAnswer(const std::string &sessionId, SelectedAnswer answer,
                                                                 std::shared_ptr<ResultCell<Unit>> sink);

    /**
     * @brief Create a payload-free command (reserved operations, recompute)
     */
    static std::unique_ptr<ControllerCommand> create(Type type, const std::string &sessionId,
                                                     std::shared_ptr<ResultCell<Unit>> sink = nullptr);

    /**
     * @brief True for the operations that are accepted but not implemented yet
     */
    bool isReserved() const;

    static const char *typeToString(Type type);
};

}  // namespace SPC
