#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include "analysis_types.hpp"

enum class GateDecision {
    Pass,
    Warn,
    Block
};

// Four independently capped contributions to a file risk score
struct RiskBreakdown {
    double complexity = 0.0;
    double changeVolume = 0.0;
    double criticalFunction = 0.0;
    double issueSeverity = 0.0;

    // Sum of the contributions, capped at 100
    double total() const;
};

// An issue attributed to a single file
struct FileIssue {
    int line = 0;
    Severity severity = Severity::Low;
    std::string description;
    std::string recommendation;
};

// Signals that feed a single file's risk computation.
// Absent values contribute nothing.
struct FileSignals {
    std::optional<double> changeVolume;
    std::optional<double> criticalFunction;
    std::vector<FileIssue> issues;
    FileChangeCounts changes;
};

struct FileDetail {
    std::string name;
    std::string path;
    std::string language;
    size_t lines = 0;
    double complexity = 0.0;
    double maintainability = 100.0;
    double riskScore = 0.0;
    GateDecision gate = GateDecision::Pass;
    RiskBreakdown breakdown;
    std::vector<FileIssue> issues;
    FileChangeCounts changes;
    std::vector<std::string> recommendations;
};

enum class RiskPriority {
    Critical,
    High,
    Medium,
    Low
};

struct RiskFinding {
    RiskPriority priority = RiskPriority::Low;
    std::string title;
    std::string description;
    std::string mitigation;
};

enum class RiskLevel {
    Low,
    Medium,
    High
};

struct RiskAssessment {
    std::vector<RiskFinding> findings;  // Sorted by priority, stable
    double score = 0.0;                 // 0 - 10
    RiskLevel level = RiskLevel::Low;
};

// Terminal value of a pipeline run. Plain data only, safe to persist or send.
struct AnalysisResult {
    std::string repoPath;
    size_t totalFiles = 0;
    size_t filesPassed = 0;
    size_t filesWarned = 0;
    size_t filesBlocked = 0;

    CodeAnalysisSummary codeAnalysis;
    SecuritySignals security;
    ChangeSignals changes;

    std::vector<RiskFinding> findings;
    double riskScore = 0.0;
    RiskLevel riskLevel = RiskLevel::Low;

    std::vector<FileDetail> fileDetails;

    bool complete = true;               // False when the run was cancelled or hit its deadline
    size_t skippedFiles = 0;            // Files not analyzed because of cancellation

    nlohmann::json insights = nlohmann::json::object();
};
