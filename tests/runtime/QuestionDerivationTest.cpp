#include "runtime/QuestionDerivation.h"
#include <gtest/gtest.h>

#include "common/TestUtils.h"

namespace SPC {

class QuestionDerivationTest : public ::testing::Test {
protected:
    void SetUp() override {
        cell_ = ResultCell<EphemeralSurveyQuestion>::create("derivation_cell");
        state_ = std::make_unique<SessionState>("derivation_session", cell_);
    }

    std::shared_ptr<ResultCell<EphemeralSurveyQuestion>> cell_;
    std::unique_ptr<SessionState> state_;
};

TEST_F(QuestionDerivationTest, UninitializedListIsPending) {
    EXPECT_FALSE(state_->isQuestionListInitialized());
    EXPECT_TRUE(QuestionDerivation::computeEphemeralQuestionResult(*state_).isPending());
    EXPECT_THROW(QuestionDerivation::deriveEphemeralQuestion(*state_), std::logic_error);
}

TEST_F(QuestionDerivationTest, DerivesFirstQuestionWithCounts) {
    auto questions = SPC::Test::Utils::makeQuestionList(3);
    state_->updateQuestionList(questions);

    auto ephemeral = QuestionDerivation::deriveEphemeralQuestion(*state_);
    EXPECT_EQ(ephemeral.question, questions[0]);
    EXPECT_EQ(ephemeral.currentQuestionIndex, 0u);
    EXPECT_EQ(ephemeral.totalQuestionCount, 3u);

    auto result = QuestionDerivation::computeEphemeralQuestionResult(*state_);
    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.getValue(), ephemeral);
}

// Known limitation: derivation does not track progress, it always shows the first question
TEST_F(QuestionDerivationTest, KnownLimitationAlwaysFirstQuestion) {
    state_->updateQuestionList(SPC::Test::Utils::makeQuestionList(5, "a"));
    state_->updateQuestionList(SPC::Test::Utils::makeQuestionList(5, "b"));

    EXPECT_EQ(QuestionDerivation::deriveEphemeralQuestion(*state_).question.questionId, "b0");
}

TEST_F(QuestionDerivationTest, EmptyListIsOutOfRange) {
    state_->updateQuestionList({});

    EXPECT_TRUE(state_->isQuestionListInitialized());
    EXPECT_THROW(QuestionDerivation::deriveEphemeralQuestion(*state_), std::out_of_range);
    EXPECT_THROW(QuestionDerivation::computeEphemeralQuestionResult(*state_), std::out_of_range);
}

TEST_F(QuestionDerivationTest, DerivationDoesNotTouchTheCell) {
    state_->updateQuestionList(SPC::Test::Utils::makeQuestionList(1));
    QuestionDerivation::computeEphemeralQuestionResult(*state_);
    EXPECT_EQ(cell_->getVersion(), 0u);
}

TEST(SessionStateTest, UpdateReportsWhetherListChanged) {
    SessionState state("s", ResultCell<EphemeralSurveyQuestion>::create("cell"));
    auto questions = SPC::Test::Utils::makeQuestionList(2);

    EXPECT_TRUE(state.updateQuestionList(questions));
    EXPECT_FALSE(state.updateQuestionList(questions));

    questions[1].questionName = SurveyQuestionName::DETRACTOR_FEEDBACK;
    EXPECT_TRUE(state.updateQuestionList(questions));
    EXPECT_EQ(state.getQuestionList(), questions);
}

TEST(SessionStateTest, EmptyListCountsAsInitialized) {
    SessionState state("s", ResultCell<EphemeralSurveyQuestion>::create("cell"));
    EXPECT_THROW(state.getQuestionList(), std::logic_error);

    EXPECT_TRUE(state.updateQuestionList({}));
    EXPECT_FALSE(state.updateQuestionList({}));
    EXPECT_TRUE(state.getQuestionList().empty());
}

}  // namespace SPC
