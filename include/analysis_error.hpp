#pragma once

#include <stdexcept>
#include <string>

// Fatal failure of a pipeline run. Carries the stage that failed and, when
// known, the file being processed.
class AnalysisError : public std::runtime_error {
public:
    AnalysisError(const std::string& stage, const std::string& message, const std::string& file = "")
        : std::runtime_error(formatMessage(stage, message, file)), stage_(stage), file_(file) {}

    const std::string& stage() const { return stage_; }
    const std::string& file() const { return file_; }

private:
    std::string stage_;
    std::string file_;

    static std::string formatMessage(const std::string& stage, const std::string& message, const std::string& file) {
        std::string text = "Analysis failed during " + stage + ": " + message;
        if (!file.empty()) {
            text += " (file: " + file + ")";
        }
        return text;
    }
};
