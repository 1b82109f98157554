#include "risk_assessor.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace {

int priorityRank(RiskPriority priority) {
    switch (priority) {
        case RiskPriority::Critical: return 0;
        case RiskPriority::High: return 1;
        case RiskPriority::Medium: return 2;
        case RiskPriority::Low: return 3;
    }
    return 4;
}

// Up to two decimals, trailing zeros dropped: 25 -> "25", 12.50 -> "12.5"
std::string formatNumber(double value) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << value;
    std::string text = out.str();
    text.erase(text.find_last_not_of('0') + 1);
    if (!text.empty() && text.back() == '.') {
        text.pop_back();
    }
    return text;
}

RiskFinding makeFinding(RiskPriority priority, std::string title, std::string description, std::string mitigation) {
    RiskFinding finding;
    finding.priority = priority;
    finding.title = std::move(title);
    finding.description = std::move(description);
    finding.mitigation = std::move(mitigation);
    return finding;
}

} // namespace

RiskAssessment RiskAssessor::assess(const std::optional<SecuritySignals>& security,
                                    const ComplexitySummary& complexity,
                                    const std::optional<ChangeSignals>& changes) const {
    RiskAssessment assessment;
    double score = 0.0;

    if (security) {
        score += assessSecurity(*security, assessment.findings);
    }
    score += assessComplexity(complexity, assessment.findings);
    if (changes) {
        score += assessChanges(*changes, assessment.findings);
    }

    score = std::min(score, kScoreCap);
    assessment.score = std::round(score * 100.0) / 100.0;
    assessment.level = levelFor(assessment.score);

    sortByPriority(assessment.findings);
    return assessment;
}

RiskLevel RiskAssessor::levelFor(double score) {
    if (score >= kHighLevelThreshold) {
        return RiskLevel::High;
    }
    if (score >= kMediumLevelThreshold) {
        return RiskLevel::Medium;
    }
    return RiskLevel::Low;
}

void RiskAssessor::sortByPriority(std::vector<RiskFinding>& findings) {
    std::stable_sort(findings.begin(), findings.end(), [](const RiskFinding& a, const RiskFinding& b) {
        return priorityRank(a.priority) < priorityRank(b.priority);
    });
}

double RiskAssessor::assessSecurity(const SecuritySignals& security, std::vector<RiskFinding>& findings) const {
    double score = 0.0;

    auto countSeverity = [&security](Severity severity) {
        return std::count_if(security.vulnerabilities.begin(), security.vulnerabilities.end(),
                             [severity](const Vulnerability& v) { return v.severity == severity; });
    };

    auto critical = countSeverity(Severity::Critical);
    if (critical > 0) {
        findings.push_back(makeFinding(
            RiskPriority::Critical,
            std::to_string(critical) + " Critical Security Vulnerabilities",
            "Critical security vulnerabilities must be fixed before release",
            "Review and fix all critical vulnerabilities immediately"));
        score += kCriticalVulnerabilityScore;
    }

    auto high = countSeverity(Severity::High);
    if (high > 0) {
        findings.push_back(makeFinding(
            RiskPriority::High,
            std::to_string(high) + " High Severity Vulnerabilities",
            "High severity security issues detected",
            "Address high severity issues before release"));
        score += kHighVulnerabilityScore;
    }

    if (!security.secrets.empty()) {
        findings.push_back(makeFinding(
            RiskPriority::Critical,
            std::to_string(security.secrets.size()) + " Potential Secrets Detected",
            "Hardcoded secrets found in code",
            "Remove all secrets and use environment variables or secret management"));
        score += kSecretsScore;
    }

    return score;
}

double RiskAssessor::assessComplexity(const ComplexitySummary& complexity, std::vector<RiskFinding>& findings) const {
    double score = 0.0;

    if (complexity.max > kMaxComplexityThreshold) {
        findings.push_back(makeFinding(
            RiskPriority::High,
            "High Code Complexity Detected",
            "Maximum complexity score of " + formatNumber(complexity.max) +
                " indicates potential maintainability issues",
            "Refactor complex functions to improve maintainability"));
        score += kMaxComplexityScore;
    }

    if (complexity.average > kAverageComplexityThreshold) {
        findings.push_back(makeFinding(
            RiskPriority::Medium,
            "Above Average Code Complexity",
            "Average complexity of " + formatNumber(complexity.average) +
                " may impact long-term maintenance",
            "Consider simplifying code structure where possible"));
        score += kAverageComplexityScore;
    }

    return score;
}

double RiskAssessor::assessChanges(const ChangeSignals& changes, std::vector<RiskFinding>& findings) const {
    if (changes.total <= kChangedFilesThreshold) {
        return 0.0;
    }

    findings.push_back(makeFinding(
        RiskPriority::Medium,
        "Large Number of Changes",
        std::to_string(changes.total) + " files changed - increases testing scope",
        "Ensure comprehensive testing coverage for all changes"));
    return kChangeVolumeScore;
}
