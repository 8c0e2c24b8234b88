#pragma once

#include "common/JsonUtils.h"
#include "model/SurveyQuestion.h"
#include <optional>
#include <string>

namespace SPC {

/**
 * @brief Question-list (de)serialization
 *
 * Format:
 * @code
 * { "questions": [ { "id": "q0", "name": "USER_TYPE" }, { "id": "q1", "name": "NPS" } ] }
 * @endcode
 * Unknown names are read as UNSPECIFIED. A missing or non-string "id" is an error.
 */
class SurveyJson {
public:
    static std::optional<SurveyQuestionList> parseQuestionList(const json &document, std::string *errorOut = nullptr);

    static std::optional<SurveyQuestionList> parseQuestionList(const std::string &text,
                                                               std::string *errorOut = nullptr);

    static std::optional<SurveyQuestionList> loadQuestionListFile(const std::string &path,
                                                                  std::string *errorOut = nullptr);

    static json toJson(const SurveyQuestionList &questions);
};

}  // namespace SPC
