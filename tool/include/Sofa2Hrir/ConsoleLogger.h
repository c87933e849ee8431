#pragma once

#include <juce_core/juce_core.h>

namespace sofa2hrir {

// Writes "[sofa2hrir] message" lines to stderr. Debug lines are dropped
// unless verbose.
class ConsoleLogger : public juce::Logger {
public:
    explicit ConsoleLogger(bool verbose);

    void logMessage(const juce::String& message) override;

private:
    bool verbose_;

    JUCE_DECLARE_NON_COPYABLE(ConsoleLogger)
};

// Installs a logger as juce::Logger's current logger for its lifetime.
class ScopedCurrentLogger {
public:
    explicit ScopedCurrentLogger(juce::Logger* logger);
    ~ScopedCurrentLogger();

private:
    juce::Logger* previous_;

    JUCE_DECLARE_NON_COPYABLE(ScopedCurrentLogger)
};

void logInfo(const juce::String& message);
void logDebug(const juce::String& message);

}  // namespace sofa2hrir
