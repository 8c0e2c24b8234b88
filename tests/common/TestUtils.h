#pragma once

#include "model/SurveyQuestion.h"
#include <chrono>
#include <cstdlib>
#include <string>

namespace SPC {
namespace Test {
namespace Utils {

// Common Test Timing Constants
constexpr auto POLL_INTERVAL_MS = std::chrono::milliseconds(10);    // Polling interval for state checks
constexpr auto STANDARD_WAIT_MS = std::chrono::milliseconds(2000);  // Upper bound for async results to settle
constexpr auto SHORT_WAIT_MS = std::chrono::milliseconds(100);      // Used where nothing is expected to change

/**
 * @brief Check if running under ThreadSanitizer in Docker
 *
 * @return true if IN_DOCKER_TSAN is set to a truthy value (non-empty, not "0", not "false")
 */
inline bool isInDockerTsan() {
    const char *env = std::getenv("IN_DOCKER_TSAN");
    if (!env) {
        return false;
    }

    std::string value(env);
    return !value.empty() && value != "0" && value != "false";
}

/**
 * @brief Scale a wait for TSAN instrumentation overhead
 */
inline std::chrono::milliseconds scaledWait(std::chrono::milliseconds normal = STANDARD_WAIT_MS) {
    return isInDockerTsan() ? normal * 4 : normal;
}

/**
 * @brief Build a question list with ids "<prefix>0".."<prefix>N-1"
 */
inline SurveyQuestionList makeQuestionList(size_t count, const std::string &prefix = "q") {
    static const SurveyQuestionName names[] = {SurveyQuestionName::USER_TYPE, SurveyQuestionName::MARKET_FIT,
                                               SurveyQuestionName::NPS, SurveyQuestionName::PROMOTER_FEEDBACK};
    SurveyQuestionList questions;
    for (size_t i = 0; i < count; ++i) {
        questions.push_back(SurveyQuestion{prefix + std::to_string(i), names[i % 4]});
    }
    return questions;
}

}  // namespace Utils
}  // namespace Test
}  // namespace SPC
