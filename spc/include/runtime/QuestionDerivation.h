#pragma once

#include "common/AsyncResult.h"
#include "model/SurveyQuestion.h"
#include "runtime/SessionState.h"

namespace SPC {

namespace QuestionDerivation {

/**
 * @brief Derive the question to display from the session's question list
 *
 * Always the first question: navigation does not advance the index yet.
 *
 * @throws std::logic_error if the question list is not initialized
 * @throws std::out_of_range if the question list is empty
 */
EphemeralSurveyQuestion deriveEphemeralQuestion(const SessionState &state);

/**
 * @brief Pending while the list is uninitialized, otherwise the derived question
 *
 * Derivation errors propagate as exceptions.
 */
AsyncResult<EphemeralSurveyQuestion> computeEphemeralQuestionResult(const SessionState &state);

}  // namespace QuestionDerivation

}  // namespace SPC
