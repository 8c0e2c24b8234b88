#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace SPC {

/**
 * @brief Which survey question a SurveyQuestion represents
 */
enum class SurveyQuestionName {
    UNSPECIFIED,
    USER_TYPE,
    MARKET_FIT,
    NPS,
    PROMOTER_FEEDBACK,
    PASSIVE_FEEDBACK,
    DETRACTOR_FEEDBACK
};

const char *surveyQuestionNameToString(SurveyQuestionName name);

/**
 * @brief Parse a question name as written in question-list JSON
 * @return Parsed name, UNSPECIFIED for unknown text
 */
SurveyQuestionName parseSurveyQuestionName(const std::string &text);

struct SurveyQuestion {
    std::string questionId;
    SurveyQuestionName questionName = SurveyQuestionName::UNSPECIFIED;

    bool operator==(const SurveyQuestion &) const = default;
};

using SurveyQuestionList = std::vector<SurveyQuestion>;

/**
 * @brief The question currently shown to the user
 */
struct EphemeralSurveyQuestion {
    SurveyQuestion question;
    size_t currentQuestionIndex = 0;
    size_t totalQuestionCount = 0;

    bool operator==(const EphemeralSurveyQuestion &) const = default;
};

/**
 * @brief Answer options for the USER_TYPE question
 */
enum class UserTypeAnswer { USER_TYPE_UNSPECIFIED, LEARNER, TEACHER, PARENT, OTHER };

const char *userTypeAnswerToString(UserTypeAnswer answer);

bool isValidUserTypeAnswer(UserTypeAnswer answer);

/**
 * @brief Selectable USER_TYPE answers in declaration order
 */
std::vector<UserTypeAnswer> validUserTypeAnswers();

/**
 * @brief Answer payload for a SUBMIT_ANSWER command
 *
 * Exactly one of the answer fields is meaningful, depending on questionName:
 * userType for USER_TYPE, npsScore (0-10) for NPS, freeFormAnswer for the
 * feedback questions.
 */
struct SelectedAnswer {
    std::string questionId;
    SurveyQuestionName questionName = SurveyQuestionName::UNSPECIFIED;
    std::optional<UserTypeAnswer> userType;
    std::optional<int> npsScore;
    std::string freeFormAnswer;

    bool operator==(const SelectedAnswer &) const = default;
};

}  // namespace SPC
