// Survey Progress CLI Tool
// Loads a question list, runs one survey session and prints what the controller reports

#include "common/ControllerConfig.h"
#include "common/Logger.h"
#include "model/SurveyJson.h"
#include "reactive/ResultCell.h"
#include "runtime/SurveyProgressController.h"
#include <iostream>
#include <string>

namespace {

constexpr int EXIT_USAGE_ERROR = 1;
constexpr int EXIT_SESSION_FAILED = 2;

void printUsage(const char *programName) {
    std::cout << "Usage: " << programName << " <questions.json> [--log-dir DIR] [--log-level LEVEL]\n";
    std::cout << "       [--config CONFIG.json]\n\n";
    std::cout << "Begin a survey session over a question list and print the current question.\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  questions.json  {\"questions\": [{\"id\": \"q0\", \"name\": \"USER_TYPE\"}, ...]}\n";
    std::cout << "  --log-dir       Also write logs to DIR/spc.log\n";
    std::cout << "  --log-level     trace, debug, info, warn, error, critical or off\n";
    std::cout << "  --config        Controller config JSON (command line options take precedence)\n\n";
    std::cout << "Exit codes: 0 success, 1 usage or parse error, 2 session failure\n";
}

std::string describeQuestion(const SPC::EphemeralSurveyQuestion &current) {
    return current.question.questionId + " (" + SPC::surveyQuestionNameToString(current.question.questionName) +
           ") " + std::to_string(current.currentQuestionIndex + 1) + "/" +
           std::to_string(current.totalQuestionCount);
}

}  // namespace

int main(int argc, char **argv) {
    std::string questionsPath;
    std::string configPath;
    std::string logDir;
    std::string logLevelName;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--log-dir" || arg == "--log-level" || arg == "--config") && i + 1 < argc) {
            std::string value = argv[++i];
            if (arg == "--log-dir") {
                logDir = value;
            } else if (arg == "--log-level") {
                logLevelName = value;
            } else {
                configPath = value;
            }
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] != '-' && questionsPath.empty()) {
            questionsPath = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            printUsage(argv[0]);
            return EXIT_USAGE_ERROR;
        }
    }

    if (questionsPath.empty()) {
        printUsage(argv[0]);
        return EXIT_USAGE_ERROR;
    }

    SPC::ControllerConfig config;
    std::string error;
    if (!configPath.empty()) {
        auto document = SPC::JsonUtils::loadJsonFile(configPath, &error);
        auto loaded = document ? SPC::ControllerConfig::fromJson(*document, &error) : std::nullopt;
        if (!loaded) {
            std::cerr << "Error: invalid config " << configPath << ": " << error << "\n";
            return EXIT_USAGE_ERROR;
        }
        config = *loaded;
    }
    if (!logDir.empty()) {
        config.logDirectory = logDir;
        config.logToFile = true;
    }
    if (!logLevelName.empty()) {
        config.logLevel = SPC::parseLogLevel(logLevelName);
        if (!config.logLevel) {
            std::cerr << "Error: unknown log level: " << logLevelName << "\n";
            return EXIT_USAGE_ERROR;
        }
    }
    config.applyLogging();

    auto questions = SPC::SurveyJson::loadQuestionListFile(questionsPath, &error);
    if (!questions) {
        std::cerr << "Error: " << error << "\n";
        return EXIT_USAGE_ERROR;
    }
    LOG_INFO("survey_cli: Loaded {} questions from {}", questions->size(), questionsPath);

    SPC::SurveyProgressController controller;
    auto source = SPC::ResultCell<SPC::SurveyQuestionList>::create(
        "survey_cli.question_source", SPC::AsyncResult<SPC::SurveyQuestionList>::success(*questions));

    auto beginResult = controller.beginSurveySession(source);
    auto initialized =
        beginResult->waitUntil([](const auto &result) { return !result.isPending(); }, config.idleWaitTimeout);
    if (!initialized || initialized->isFailure()) {
        std::cerr << "Error: session did not start: "
                  << (initialized ? initialized->describe() : std::string("timed out")) << "\n";
        SPC::Logger::flush();
        return EXIT_SESSION_FAILED;
    }
    std::cout << "Session: " << controller.getActiveSessionId() << "\n";

    if (!controller.waitForPendingCommands(config.idleWaitTimeout)) {
        LOG_WARN("survey_cli: Commands still pending after {}ms", config.idleWaitTimeout.count());
    }
    auto currentQuestion = controller.getCurrentQuestion();
    auto current =
        currentQuestion->waitUntil([](const auto &result) { return !result.isPending(); }, config.idleWaitTimeout);
    if (!current || current->isFailure()) {
        std::cerr << "Error: no current question: " << (current ? current->describe() : std::string("timed out"))
                  << "\n";
        SPC::Logger::flush();
        return EXIT_SESSION_FAILED;
    }
    std::cout << "Current question: " << describeQuestion(current->getValue()) << "\n";

    auto moveResult = controller.moveToNextQuestion();
    auto moved = moveResult->waitUntil([](const auto &result) { return !result.isPending(); }, config.idleWaitTimeout);
    std::cout << "Move to next question: " << (moved ? moved->describe() : std::string("timed out")) << "\n";

    SPC::Logger::flush();
    return 0;
}
