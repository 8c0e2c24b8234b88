#include "model/SurveyJson.h"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

namespace SPC {

TEST(SurveyJsonTest, ParsesQuestionList) {
    std::string error;
    auto questions = SurveyJson::parseQuestionList(
        std::string(R"({"questions": [{"id": "q0", "name": "USER_TYPE"}, {"id": "q1", "name": "nps"}]})"), &error);

    ASSERT_TRUE(questions.has_value()) << error;
    ASSERT_EQ(questions->size(), 2u);
    EXPECT_EQ((*questions)[0], (SurveyQuestion{"q0", SurveyQuestionName::USER_TYPE}));
    EXPECT_EQ((*questions)[1], (SurveyQuestion{"q1", SurveyQuestionName::NPS}));
}

TEST(SurveyJsonTest, UnknownOrMissingNameIsUnspecified) {
    auto questions = SurveyJson::parseQuestionList(
        std::string(R"({"questions": [{"id": "a", "name": "FAVORITE_COLOR"}, {"id": "b"}]})"));

    ASSERT_TRUE(questions.has_value());
    EXPECT_EQ((*questions)[0].questionName, SurveyQuestionName::UNSPECIFIED);
    EXPECT_EQ((*questions)[1].questionName, SurveyQuestionName::UNSPECIFIED);
}

TEST(SurveyJsonTest, EmptyListIsValid) {
    auto questions = SurveyJson::parseQuestionList(std::string(R"({"questions": []})"));
    ASSERT_TRUE(questions.has_value());
    EXPECT_TRUE(questions->empty());
}

TEST(SurveyJsonTest, MissingIdIsAnError) {
    std::string error;
    auto questions = SurveyJson::parseQuestionList(std::string(R"({"questions": [{"name": "NPS"}]})"), &error);
    EXPECT_FALSE(questions.has_value());
    EXPECT_NE(error.find("id"), std::string::npos);
}

TEST(SurveyJsonTest, NonArrayQuestionsIsAnError) {
    std::string error;
    EXPECT_FALSE(SurveyJson::parseQuestionList(std::string(R"({"questions": {"id": "q0"}})"), &error).has_value());
    EXPECT_FALSE(error.empty());

    error.clear();
    EXPECT_FALSE(SurveyJson::parseQuestionList(std::string(R"([1, 2, 3])"), &error).has_value());
    EXPECT_FALSE(error.empty());
}

TEST(SurveyJsonTest, MalformedTextIsAnError) {
    std::string error;
    EXPECT_FALSE(SurveyJson::parseQuestionList(std::string("{\"questions\": ["), &error).has_value());
    EXPECT_FALSE(error.empty());
}

TEST(SurveyJsonTest, ToJsonProducesTheReadFormat) {
    SurveyQuestionList questions = {{"q0", SurveyQuestionName::MARKET_FIT}, {"q1", SurveyQuestionName::NPS}};
    json document = SurveyJson::toJson(questions);

    EXPECT_EQ(document["questions"][0]["id"], "q0");
    EXPECT_EQ(document["questions"][0]["name"], "MARKET_FIT");

    auto reread = SurveyJson::parseQuestionList(document);
    ASSERT_TRUE(reread.has_value());
    EXPECT_EQ(*reread, questions);
}

TEST(SurveyJsonTest, LoadsFromFile) {
    auto path = std::filesystem::temp_directory_path() / "spc_survey_json_test.json";
    {
        std::ofstream out(path);
        out << R"({"questions": [{"id": "only", "name": "DETRACTOR_FEEDBACK"}]})";
    }

    auto questions = SurveyJson::loadQuestionListFile(path.string());
    std::filesystem::remove(path);

    ASSERT_TRUE(questions.has_value());
    ASSERT_EQ(questions->size(), 1u);
    EXPECT_EQ(questions->front().questionName, SurveyQuestionName::DETRACTOR_FEEDBACK);
}

TEST(SurveyJsonTest, MissingFileIsAnError) {
    std::string error;
    EXPECT_FALSE(SurveyJson::loadQuestionListFile("/nonexistent/spc/questions.json", &error).has_value());
    EXPECT_NE(error.find("Failed to open"), std::string::npos);
}

}  // namespace SPC
