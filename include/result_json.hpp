#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "analysis_types.hpp"
#include "risk_types.hpp"

// JSON mapping for the pipeline's value types. Keys are snake_case; enums
// are written as upper-case labels (PASS, CRITICAL, ...) except component
// kinds, which are lower-case (function, class, ...).

std::string toString(GateDecision gate);
std::string toString(RiskPriority priority);
std::string toString(RiskLevel level);
std::string toString(Severity severity);
std::string toString(ComponentKind kind);

// Case-insensitive; throws std::invalid_argument for unknown labels
Severity severityFromString(const std::string& label);

void to_json(nlohmann::json& j, const ComponentRecord& component);
void to_json(nlohmann::json& j, const ComplexitySummary& summary);
void to_json(nlohmann::json& j, const CodeAnalysisSummary& summary);
void to_json(nlohmann::json& j, const Vulnerability& vulnerability);
void to_json(nlohmann::json& j, const SecretLocation& secret);
void to_json(nlohmann::json& j, const SecuritySignals& security);
void to_json(nlohmann::json& j, const ChangeSignals& changes);
void to_json(nlohmann::json& j, const FileChangeCounts& changes);
void to_json(nlohmann::json& j, const RiskBreakdown& breakdown);
void to_json(nlohmann::json& j, const FileIssue& issue);
void to_json(nlohmann::json& j, const FileDetail& detail);
void to_json(nlohmann::json& j, const RiskFinding& finding);
void to_json(nlohmann::json& j, const AnalysisResult& result);

// Serialized report. Invalid UTF-8 taken from file contents is written as U+FFFD.
std::string toJsonText(const AnalysisResult& result, int indent = 2);

// Collaborator inputs. Optional keys default when missing.
void from_json(const nlohmann::json& j, Vulnerability& vulnerability);
void from_json(const nlohmann::json& j, SecretLocation& secret);
void from_json(const nlohmann::json& j, SecuritySignals& security);
void from_json(const nlohmann::json& j, ChangeSignals& changes);
void from_json(const nlohmann::json& j, FileChangeCounts& changes);
void from_json(const nlohmann::json& j, FileSignals& signals);
