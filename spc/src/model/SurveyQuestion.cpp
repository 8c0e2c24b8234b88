#include "model/SurveyQuestion.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace SPC {

namespace {

constexpr std::array<std::pair<SurveyQuestionName, const char *>, 7> QUESTION_NAMES = {{
    {SurveyQuestionName::UNSPECIFIED, "UNSPECIFIED"},
    {SurveyQuestionName::USER_TYPE, "USER_TYPE"},
    {SurveyQuestionName::MARKET_FIT, "MARKET_FIT"},
    {SurveyQuestionName::NPS, "NPS"},
    {SurveyQuestionName::PROMOTER_FEEDBACK, "PROMOTER_FEEDBACK"},
    {SurveyQuestionName::PASSIVE_FEEDBACK, "PASSIVE_FEEDBACK"},
    {SurveyQuestionName::DETRACTOR_FEEDBACK, "DETRACTOR_FEEDBACK"},
}};

}  // namespace

const char *surveyQuestionNameToString(SurveyQuestionName name) {
    for (const auto &[value, text] : QUESTION_NAMES) {
        if (value == name) {
            return text;
        }
    }
    return "UNSPECIFIED";
}

SurveyQuestionName parseSurveyQuestionName(const std::string &text) {
    std::string upper(text);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    for (const auto &[value, name] : QUESTION_NAMES) {
        if (upper == name) {
            return value;
        }
    }
    return SurveyQuestionName::UNSPECIFIED;
}

const char *userTypeAnswerToString(UserTypeAnswer answer) {
    switch (answer) {
    case UserTypeAnswer::LEARNER:
        return "LEARNER";
    case UserTypeAnswer::TEACHER:
        return "TEACHER";
    case UserTypeAnswer::PARENT:
        return "PARENT";
    case UserTypeAnswer::OTHER:
        return "OTHER";
    case UserTypeAnswer::USER_TYPE_UNSPECIFIED:
        return "USER_TYPE_UNSPECIFIED";
    }
    return "USER_TYPE_UNSPECIFIED";
}

bool isValidUserTypeAnswer(UserTypeAnswer answer) {
    return answer != UserTypeAnswer::USER_TYPE_UNSPECIFIED;
}

std::vector<UserTypeAnswer> validUserTypeAnswers() {
    std::vector<UserTypeAnswer> answers;
    for (auto answer : {UserTypeAnswer::USER_TYPE_UNSPECIFIED, UserTypeAnswer::LEARNER, UserTypeAnswer::TEACHER,
                        UserTypeAnswer::PARENT, UserTypeAnswer::OTHER}) {
        if (isValidUserTypeAnswer(answer)) {
            answers.push_back(answer);
        }
    }
    return answers;
}

}  // namespace SPC
