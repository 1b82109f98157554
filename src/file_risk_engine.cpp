#include "file_risk_engine.hpp"
#include <algorithm>
#include <cmath>

namespace {

double severityWeight(Severity severity) {
    switch (severity) {
        case Severity::Critical: return 15.0;
        case Severity::High: return 10.0;
        case Severity::Medium: return 5.0;
        case Severity::Low: return 2.0;
    }
    return 0.0;
}

double clampContribution(const std::optional<double>& value, double cap) {
    if (!value || std::isnan(*value)) {
        return 0.0;
    }
    return std::clamp(*value, 0.0, cap);
}

} // namespace

double RiskBreakdown::total() const {
    return std::min(complexity + changeVolume + criticalFunction + issueSeverity, FileRiskEngine::kScoreCap);
}

double FileRiskEngine::complexityContribution(double complexity) {
    if (!(complexity > 0.0)) {
        return 0.0;
    }
    return std::min((complexity / 10.0) * 50.0, kComplexityCap);
}

double FileRiskEngine::issueSeverityContribution(const std::vector<FileIssue>& issues) {
    double total = 0.0;
    for (const auto& issue : issues) {
        total += severityWeight(issue.severity);
    }
    return std::min(total, kIssueSeverityCap);
}

RiskBreakdown FileRiskEngine::computeBreakdown(double complexity, const FileSignals& signals) {
    RiskBreakdown breakdown;
    breakdown.complexity = complexityContribution(complexity);
    breakdown.changeVolume = clampContribution(signals.changeVolume, kChangeVolumeCap);
    breakdown.criticalFunction = clampContribution(signals.criticalFunction, kCriticalFunctionCap);
    breakdown.issueSeverity = issueSeverityContribution(signals.issues);
    return breakdown;
}

GateDecision FileRiskEngine::gateFor(double score) {
    if (score < kWarnThreshold) {
        return GateDecision::Pass;
    }
    if (score < kBlockThreshold) {
        return GateDecision::Warn;
    }
    return GateDecision::Block;
}

double FileRiskEngine::maintainability(double complexity) {
    return std::max(100.0 - complexity * 5.0, 0.0);
}

std::vector<FileIssue> FileRiskEngine::issuesForFile(const SecuritySignals& security, const std::string& path) {
    std::vector<FileIssue> issues;

    for (const auto& vulnerability : security.vulnerabilities) {
        if (vulnerability.file != path) {
            continue;
        }
        FileIssue issue;
        issue.line = vulnerability.line;
        issue.severity = vulnerability.severity;
        issue.description = vulnerability.description;
        issue.recommendation = vulnerability.recommendation.value_or("");
        issues.push_back(std::move(issue));
    }

    for (const auto& secret : security.secrets) {
        if (secret.file != path) {
            continue;
        }
        FileIssue issue;
        issue.line = secret.line;
        issue.severity = Severity::Critical;
        issue.description = "Potential hardcoded secret";
        issue.recommendation = "Move the value to an environment variable or a secret manager";
        issues.push_back(std::move(issue));
    }

    return issues;
}

FileDetail FileRiskEngine::evaluate(const FileRecord& file, const FileAnalysis& analysis,
                                    const FileSignals& signals) const {
    FileDetail detail;
    detail.name = file.name;
    detail.path = file.path;
    detail.language = file.language;
    detail.lines = file.lineCount;
    detail.complexity = analysis.complexity;
    detail.maintainability = maintainability(analysis.complexity);
    detail.breakdown = computeBreakdown(analysis.complexity, signals);
    detail.riskScore = detail.breakdown.total();
    detail.gate = gateFor(detail.riskScore);
    detail.issues = signals.issues;
    detail.changes = signals.changes;
    detail.recommendations = recommendations(detail.gate, analysis.complexity, signals.issues);
    return detail;
}

std::vector<std::string> FileRiskEngine::recommendations(GateDecision gate, double complexity,
                                                         const std::vector<FileIssue>& issues) const {
    std::vector<std::string> result;

    if (gate == GateDecision::Block) {
        result.push_back("Do not release until the risk score is below " +
                         std::to_string(static_cast<int>(kBlockThreshold)));
    } else if (gate == GateDecision::Warn) {
        result.push_back("Request an additional review before release");
    }

    if (complexity > 10.0) {
        result.push_back("Refactor complex functions to reduce cyclomatic complexity");
    }

    if (!issues.empty()) {
        result.push_back("Fix the " + std::to_string(issues.size()) + " reported issue" +
                         (issues.size() == 1 ? "" : "s") + " in this file");
    }

    if (result.empty()) {
        result.push_back("Review changes before deployment");
    }

    return result;
}
