#include <Sofa2Hrir/ConsoleLogger.h>
#include <iostream>

namespace sofa2hrir {

namespace {
const juce::String kDebugPrefix = "debug: ";
}

ConsoleLogger::ConsoleLogger(bool verbose) : verbose_(verbose) {}

void ConsoleLogger::logMessage(const juce::String& message) {
    if (!verbose_ && message.startsWith(kDebugPrefix))
        return;

    std::cerr << "[sofa2hrir] " << message << std::endl;
}

ScopedCurrentLogger::ScopedCurrentLogger(juce::Logger* logger)
    : previous_(juce::Logger::getCurrentLogger()) {
    juce::Logger::setCurrentLogger(logger);
}

ScopedCurrentLogger::~ScopedCurrentLogger() {
    juce::Logger::setCurrentLogger(previous_);
}

void logInfo(const juce::String& message) {
    juce::Logger::writeToLog(message);
}

void logDebug(const juce::String& message) {
    // Without an installed logger JUCE prints everything; keep tests quiet.
    if (juce::Logger::getCurrentLogger() != nullptr)
        juce::Logger::writeToLog(kDebugPrefix + message);
}

}  // namespace sofa2hrir
