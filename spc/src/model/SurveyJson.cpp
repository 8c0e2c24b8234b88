#include "model/SurveyJson.h"
#include "common/Logger.h"

namespace SPC {

std::optional<SurveyQuestionList> SurveyJson::parseQuestionList(const json &document, std::string *errorOut) {
    auto fail = [errorOut](const std::string &message) -> std::optional<SurveyQuestionList> {
        if (errorOut) {
            *errorOut = message;
        }
        LOG_DEBUG("SurveyJson: {}", message);
        return std::nullopt;
    };

    if (!document.is_object() || !document.contains("questions")) {
        return fail("Question list document must be an object with a 'questions' array");
    }

    const auto &entries = document["questions"];
    if (!entries.is_array()) {
        return fail("'questions' must be an array");
    }

    SurveyQuestionList questions;
    questions.reserve(entries.size());

    for (size_t i = 0; i < entries.size(); ++i) {
        const auto &entry = entries[i];
        if (!entry.is_object()) {
            return fail("questions[" + std::to_string(i) + "] must be an object");
        }

        std::string questionId = JsonUtils::getString(entry, "id");
        if (questionId.empty()) {
            return fail("questions[" + std::to_string(i) + "] is missing a string 'id'");
        }

        SurveyQuestion question;
        question.questionId = questionId;
        question.questionName = parseSurveyQuestionName(JsonUtils::getString(entry, "name"));
        questions.push_back(std::move(question));
    }

    return questions;
}

std::optional<SurveyQuestionList> SurveyJson::parseQuestionList(const std::string &text, std::string *errorOut) {
    auto document = JsonUtils::parseJson(text, errorOut);
    if (!document) {
        return std::nullopt;
    }
    return parseQuestionList(*document, errorOut);
}

std::optional<SurveyQuestionList> SurveyJson::loadQuestionListFile(const std::string &path, std::string *errorOut) {
    auto document = JsonUtils::loadJsonFile(path, errorOut);
    if (!document) {
        return std::nullopt;
    }
    return parseQuestionList(*document, errorOut);
}

json SurveyJson::toJson(const SurveyQuestionList &questions) {
    json entries = json::array();
    for (const auto &question : questions) {
        entries.push_back({{"id", question.questionId}, {"name", surveyQuestionNameToString(question.questionName)}});
    }
    return json{{"questions", entries}};
}

}  // namespace SPC
