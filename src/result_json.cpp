#include "result_json.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

using json = nlohmann::json;

std::string toString(GateDecision gate) {
    switch (gate) {
        case GateDecision::Pass: return "PASS";
        case GateDecision::Warn: return "WARN";
        case GateDecision::Block: return "BLOCK";
    }
    return "PASS";
}

std::string toString(RiskPriority priority) {
    switch (priority) {
        case RiskPriority::Critical: return "CRITICAL";
        case RiskPriority::High: return "HIGH";
        case RiskPriority::Medium: return "MEDIUM";
        case RiskPriority::Low: return "LOW";
    }
    return "LOW";
}

std::string toString(RiskLevel level) {
    switch (level) {
        case RiskLevel::Low: return "LOW";
        case RiskLevel::Medium: return "MEDIUM";
        case RiskLevel::High: return "HIGH";
    }
    return "LOW";
}

std::string toString(Severity severity) {
    switch (severity) {
        case Severity::Critical: return "CRITICAL";
        case Severity::High: return "HIGH";
        case Severity::Medium: return "MEDIUM";
        case Severity::Low: return "LOW";
    }
    return "LOW";
}

std::string toString(ComponentKind kind) {
    switch (kind) {
        case ComponentKind::Function: return "function";
        case ComponentKind::Method: return "method";
        case ComponentKind::Class: return "class";
        case ComponentKind::Struct: return "struct";
        case ComponentKind::Component: return "component";
    }
    return "function";
}

Severity severityFromString(const std::string& label) {
    std::string upper = label;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return std::toupper(c); });

    if (upper == "CRITICAL") return Severity::Critical;
    if (upper == "HIGH") return Severity::High;
    if (upper == "MEDIUM") return Severity::Medium;
    if (upper == "LOW") return Severity::Low;

    throw std::invalid_argument("Unknown severity: " + label);
}

void to_json(json& j, const ComponentRecord& component) {
    j = json{
        {"name", component.name},
        {"type", toString(component.kind)},
        {"lines", component.lines}
    };
    if (component.parameterCount) {
        j["arguments"] = *component.parameterCount;
    }
    if (component.methodCount) {
        j["methods"] = *component.methodCount;
    }
}

void to_json(json& j, const ComplexitySummary& summary) {
    j = json{
        {"average", summary.average},
        {"max", summary.max},
        {"samples", summary.samples}
    };
}

void to_json(json& j, const CodeAnalysisSummary& summary) {
    j = json{
        {"components", summary.components},
        {"total_components", summary.totalComponents},
        {"dependencies", summary.dependencies},
        {"complexity", summary.complexity},
        {"languages", summary.languages}
    };
}

void to_json(json& j, const Vulnerability& vulnerability) {
    j = json{
        {"severity", toString(vulnerability.severity)},
        {"file", vulnerability.file},
        {"line", vulnerability.line},
        {"description", vulnerability.description}
    };
    if (vulnerability.recommendation) {
        j["recommendation"] = *vulnerability.recommendation;
    }
}

void to_json(json& j, const SecretLocation& secret) {
    j = json{{"file", secret.file}, {"line", secret.line}};
}

void to_json(json& j, const SecuritySignals& security) {
    j = json{
        {"vulnerabilities", security.vulnerabilities},
        {"secrets_found", security.secrets}
    };
}

void to_json(json& j, const ChangeSignals& changes) {
    j = json{
        {"added", changes.added},
        {"deleted", changes.deleted},
        {"modified", changes.modified},
        {"total", changes.total},
        {"by_type", changes.byType}
    };
}

void to_json(json& j, const FileChangeCounts& changes) {
    j = json{
        {"added", changes.added},
        {"deleted", changes.deleted},
        {"modified", changes.modified},
        {"total", changes.total}
    };
}

void to_json(json& j, const RiskBreakdown& breakdown) {
    j = json{
        {"complexity", breakdown.complexity},
        {"change_volume", breakdown.changeVolume},
        {"critical_function", breakdown.criticalFunction},
        {"issue_severity", breakdown.issueSeverity}
    };
}

void to_json(json& j, const FileIssue& issue) {
    j = json{
        {"line", issue.line},
        {"severity", toString(issue.severity)},
        {"description", issue.description},
        {"recommendation", issue.recommendation}
    };
}

void to_json(json& j, const FileDetail& detail) {
    j = json{
        {"name", detail.name},
        {"path", detail.path},
        {"language", detail.language},
        {"lines", detail.lines},
        {"complexity", detail.complexity},
        {"maintainability", detail.maintainability},
        {"risk_score", detail.riskScore},
        {"gate_decision", toString(detail.gate)},
        {"risk_breakdown", detail.breakdown},
        {"issues", detail.issues},
        {"changes", detail.changes},
        {"recommendations", detail.recommendations}
    };
}

void to_json(json& j, const RiskFinding& finding) {
    j = json{
        {"priority", toString(finding.priority)},
        {"title", finding.title},
        {"description", finding.description},
        {"mitigation", finding.mitigation}
    };
}

void to_json(json& j, const AnalysisResult& result) {
    j = json{
        {"repo_path", result.repoPath},
        {"total_files", result.totalFiles},
        {"files_passed", result.filesPassed},
        {"files_warned", result.filesWarned},
        {"files_blocked", result.filesBlocked},
        {"code_analysis", result.codeAnalysis},
        {"security", result.security},
        {"changes", result.changes},
        {"risks", result.findings},
        {"risk_score", result.riskScore},
        {"risk_level", toString(result.riskLevel)},
        {"file_details", result.fileDetails},
        {"complete", result.complete},
        {"skipped_files", result.skippedFiles},
        {"ai_insights", result.insights}
    };
}

std::string toJsonText(const AnalysisResult& result, int indent) {
    return json(result).dump(indent, ' ', false, json::error_handler_t::replace);
}

void from_json(const json& j, Vulnerability& vulnerability) {
    vulnerability.severity = severityFromString(j.at("severity").get<std::string>());
    vulnerability.file = j.value("file", std::string());
    vulnerability.line = j.value("line", 0);
    vulnerability.description = j.value("description", std::string());

    auto it = j.find("recommendation");
    if (it != j.end() && it->is_string()) {
        vulnerability.recommendation = it->get<std::string>();
    } else {
        vulnerability.recommendation.reset();
    }
}

void from_json(const json& j, SecretLocation& secret) {
    secret.file = j.value("file", std::string());
    secret.line = j.value("line", 0);
}

void from_json(const json& j, SecuritySignals& security) {
    security.vulnerabilities = j.value("vulnerabilities", std::vector<Vulnerability>());
    security.secrets = j.value("secrets_found", std::vector<SecretLocation>());
}

void from_json(const json& j, ChangeSignals& changes) {
    changes.added = j.value("added", size_t{0});
    changes.deleted = j.value("deleted", size_t{0});
    changes.modified = j.value("modified", size_t{0});
    changes.total = j.value("total", size_t{0});
    changes.byType = j.value("by_type", std::map<std::string, size_t>());
}

void from_json(const json& j, FileChangeCounts& changes) {
    changes.added = j.value("added", size_t{0});
    changes.deleted = j.value("deleted", size_t{0});
    changes.modified = j.value("modified", size_t{0});
    changes.total = j.value("total", size_t{0});
}

void from_json(const json& j, FileSignals& signals) {
    auto changeVolume = j.find("change_volume");
    if (changeVolume != j.end() && changeVolume->is_number()) {
        signals.changeVolume = changeVolume->get<double>();
    }

    auto criticalFunction = j.find("critical_function");
    if (criticalFunction != j.end() && criticalFunction->is_number()) {
        signals.criticalFunction = criticalFunction->get<double>();
    }

    signals.changes = j.value("changes", FileChangeCounts());
}
