#pragma once

#include "model/SurveyQuestion.h"
#include "reactive/ResultCell.h"
#include <memory>
#include <optional>
#include <string>

namespace SPC {

/**
 * @brief Mutable per-session state, owned by the session's command processor
 *
 * Only the queue's worker thread touches an instance after construction.
 */
class SessionState {
public:
    SessionState(std::string sessionId, std::shared_ptr<ResultCell<EphemeralSurveyQuestion>> ephemeralQuestionCell);

    const std::string &getSessionId() const {
        return sessionId_;
    }

    const std::shared_ptr<ResultCell<EphemeralSurveyQuestion>> &getEphemeralQuestionCell() const {
        return ephemeralQuestionCell_;
    }

    bool isQuestionListInitialized() const {
        return questionList_.has_value();
    }

    /**
     * @throws std::logic_error if no question list has been received yet
     */
    const SurveyQuestionList &getQuestionList() const;

    /**
     * @brief Store a received question list
     * @return true if the list was uninitialized or differs from the stored one
     */
    bool updateQuestionList(const SurveyQuestionList &questions);

private:
    std::string sessionId_;
    std::shared_ptr<ResultCell<EphemeralSurveyQuestion>> ephemeralQuestionCell_;
    std::optional<SurveyQuestionList> questionList_;
};

}  // namespace SPC
