#pragma once

#include <optional>
#include <string>
#include <vector>
#include "analysis_types.hpp"
#include "risk_types.hpp"

// Repository-level risk assessment on a 0-10 scale.
//
// Security, complexity and change signals each add independent findings.
// An absent signal source adds nothing. The repository scale and its
// HIGH/MEDIUM/LOW levels are separate from the per-file 0-100 gate.
class RiskAssessor {
public:
    static constexpr double kCriticalVulnerabilityScore = 3.0;
    static constexpr double kHighVulnerabilityScore = 2.0;
    static constexpr double kSecretsScore = 2.5;
    static constexpr double kMaxComplexityScore = 1.5;
    static constexpr double kAverageComplexityScore = 1.0;
    static constexpr double kChangeVolumeScore = 1.0;
    static constexpr double kScoreCap = 10.0;

    static constexpr double kMaxComplexityThreshold = 20.0;
    static constexpr double kAverageComplexityThreshold = 10.0;
    static constexpr size_t kChangedFilesThreshold = 100;

    static constexpr double kHighLevelThreshold = 7.0;
    static constexpr double kMediumLevelThreshold = 4.0;

    virtual ~RiskAssessor() = default;

    virtual RiskAssessment assess(const std::optional<SecuritySignals>& security,
                                  const ComplexitySummary& complexity,
                                  const std::optional<ChangeSignals>& changes) const;

    static RiskLevel levelFor(double score);

    // Stable sort, CRITICAL first
    static void sortByPriority(std::vector<RiskFinding>& findings);

private:
    double assessSecurity(const SecuritySignals& security, std::vector<RiskFinding>& findings) const;
    double assessComplexity(const ComplexitySummary& complexity, std::vector<RiskFinding>& findings) const;
    double assessChanges(const ChangeSignals& changes, std::vector<RiskFinding>& findings) const;
};
