#pragma once

#include <string>
#include <vector>
#include "analysis_types.hpp"
#include "risk_types.hpp"

// Per-file risk scoring. All thresholds and caps are fixed: gate behavior
// depends on them exactly.
class FileRiskEngine {
public:
    static constexpr double kComplexityCap = 50.0;
    static constexpr double kChangeVolumeCap = 20.0;
    static constexpr double kCriticalFunctionCap = 20.0;
    static constexpr double kIssueSeverityCap = 30.0;
    static constexpr double kScoreCap = 100.0;

    static constexpr double kWarnThreshold = 30.0;
    static constexpr double kBlockThreshold = 60.0;

    virtual ~FileRiskEngine() = default;

    // Compute the full file detail (breakdown, score, gate, recommendations)
    virtual FileDetail evaluate(const FileRecord& file, const FileAnalysis& analysis, const FileSignals& signals) const;

    // min(complexity / 10 * 50, 50); a missing sample (0) contributes 0
    static double complexityContribution(double complexity);

    // Sum of severity weights, capped
    static double issueSeverityContribution(const std::vector<FileIssue>& issues);

    static RiskBreakdown computeBreakdown(double complexity, const FileSignals& signals);

    // PASS below 30, WARN below 60, BLOCK otherwise
    static GateDecision gateFor(double score);

    // max(100 - complexity * 5, 0). Display only.
    static double maintainability(double complexity);

    // Issues attributed to one file by the security scan
    static std::vector<FileIssue> issuesForFile(const SecuritySignals& security, const std::string& path);

private:
    std::vector<std::string> recommendations(GateDecision gate, double complexity,
                                             const std::vector<FileIssue>& issues) const;
};
