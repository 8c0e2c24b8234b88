#include "runtime/ControllerCommand.h"

namespace SPC {

std::unique_ptr<ControllerCommand>
ControllerCommand::createInitialize(const std::string &sessionId,
                                    std::shared_ptr<ResultCell<EphemeralSurveyQuestion>> cell,
                                    std::shared_ptr<ResultCell<Unit>> sink) {
    auto command = std::make_unique<ControllerCommand>(Type::INITIALIZE, sessionId);
    command->ephemeralQuestionCell = std::move(cell);
    command->resultSink = std::move(sink);
    return command;
}

std::unique_ptr<ControllerCommand> ControllerCommand::createReceiveQuestionList(const std::string &sessionId,
                                                                                SurveyQuestionList questions) {
    auto command = std::make_unique<ControllerCommand>(Type::RECEIVE_QUESTION_LIST, sessionId);
    command->questions = std::move(questions);
    return command;
}

std::unique_ptr<ControllerCommand> ControllerCommand::createRecomputeAndNotify(const std::string &sessionId) {
    return std::make_unique<ControllerCommand>(Type::RECOMPUTE_AND_NOTIFY, sessionId);
}

std::unique_ptr<ControllerCommand> ControllerCommand::createSubmitAnswer(const std::string &sessionId,
                                                                         SelectedAnswer answer,
                                                                         std::shared_ptr<ResultCell<Unit>> sink) {
    auto command = std::make_unique<ControllerCommand>(Type::SUBMIT_ANSWER, sessionId);
    command->selectedAnswer = std::move(answer);
    command->resultSink = std::move(sink);
    return command;
}

std::unique_ptr<ControllerCommand> ControllerCommand::create(Type type, const std::string &sessionId,
                                                             std::shared_ptr<ResultCell<Unit>> sink) {
    auto command = std::make_unique<ControllerCommand>(type, sessionId);
    command->resultSink = std::move(sink);
    return command;
}

bool ControllerCommand::isReserved() const {
    switch (type) {
    case Type::FINISH_SESSION:
    case Type::MOVE_TO_NEXT_QUESTION:
    case Type::MOVE_TO_PREVIOUS_QUESTION:
    case Type::SUBMIT_ANSWER:
    case Type::SAVE_PARTIAL_COMPLETION:
    case Type::SAVE_FULL_COMPLETION:
        return true;
    default:
        return false;
    }
}

const char *ControllerCommand::typeToString(Type type) {
    switch (type) {
    case Type::INITIALIZE:
        return "INITIALIZE";
    case Type::RECEIVE_QUESTION_LIST:
        return "RECEIVE_QUESTION_LIST";
    case Type::RECOMPUTE_AND_NOTIFY:
        return "RECOMPUTE_AND_NOTIFY";
    case Type::FINISH_SESSION:
        return "FINISH_SESSION";
    case Type::MOVE_TO_NEXT_QUESTION:
        return "MOVE_TO_NEXT_QUESTION";
    case Type::MOVE_TO_PREVIOUS_QUESTION:
        return "MOVE_TO_PREVIOUS_QUESTION";
    case Type::SUBMIT_ANSWER:
        return "SUBMIT_ANSWER";
    case Type::SAVE_PARTIAL_COMPLETION:
        return "SAVE_PARTIAL_COMPLETION";
    case Type::SAVE_FULL_COMPLETION:
        return "SAVE_FULL_COMPLETION";
    }
    return "UNKNOWN";
}

}  // namespace SPC
