#include "runtime/SessionState.h"
#include <stdexcept>

namespace SPC {

SessionState::SessionState(std::string sessionId,
                           std::shared_ptr<ResultCell<EphemeralSurveyQuestion>> ephemeralQuestionCell)
    : sessionId_(std::move(sessionId)), ephemeralQuestionCell_(std::move(ephemeralQuestionCell)) {}

const SurveyQuestionList &SessionState::getQuestionList() const {
    if (!questionList_) {
        throw std::logic_error("Question list for session '" + sessionId_ + "' is not initialized");
    }
    return *questionList_;
}

bool SessionState::updateQuestionList(const SurveyQuestionList &questions) {
    if (questionList_ && *questionList_ == questions) {
        return false;
    }
    questionList_ = questions;
    return true;
}

}  // namespace SPC
