#include "runtime/QuestionDerivation.h"
#include <stdexcept>

namespace SPC {

namespace QuestionDerivation {

EphemeralSurveyQuestion deriveEphemeralQuestion(const SessionState &state) {
    const SurveyQuestionList &questions = state.getQuestionList();
    if (questions.empty()) {
        throw std::out_of_range("Question list for session '" + state.getSessionId() + "' is empty");
    }

    EphemeralSurveyQuestion ephemeral;
    ephemeral.question = questions.front();
    ephemeral.currentQuestionIndex = 0;
    ephemeral.totalQuestionCount = questions.size();
    return ephemeral;
}

AsyncResult<EphemeralSurveyQuestion> computeEphemeralQuestionResult(const SessionState &state) {
    if (!state.isQuestionListInitialized()) {
        return AsyncResult<EphemeralSurveyQuestion>::pending();
    }
    return AsyncResult<EphemeralSurveyQuestion>::success(deriveEphemeralQuestion(state));
}

}  // namespace QuestionDerivation

}  // namespace SPC
