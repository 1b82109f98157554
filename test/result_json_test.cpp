#include <catch2/catch_test_macros.hpp>
#include "result_json.hpp"
#include <stdexcept>

using json = nlohmann::json;

TEST_CASE("Enum labels", "[ResultJson]") {
    REQUIRE(toString(GateDecision::Pass) == "PASS");
    REQUIRE(toString(GateDecision::Warn) == "WARN");
    REQUIRE(toString(GateDecision::Block) == "BLOCK");
    REQUIRE(toString(RiskPriority::Critical) == "CRITICAL");
    REQUIRE(toString(RiskLevel::Medium) == "MEDIUM");
    REQUIRE(toString(Severity::Low) == "LOW");
    REQUIRE(toString(ComponentKind::Method) == "method");
    REQUIRE(toString(ComponentKind::Component) == "component");
}

TEST_CASE("Severity labels are parsed case-insensitively", "[ResultJson]") {
    REQUIRE(severityFromString("CRITICAL") == Severity::Critical);
    REQUIRE(severityFromString("high") == Severity::High);
    REQUIRE(severityFromString("Medium") == Severity::Medium);
    REQUIRE(severityFromString("low") == Severity::Low);
    REQUIRE_THROWS_AS(severityFromString("urgent"), std::invalid_argument);
    REQUIRE_THROWS_AS(severityFromString(""), std::invalid_argument);
}

TEST_CASE("Components serialize optional counts only when known", "[ResultJson]") {
    ComponentRecord function("load", ComponentKind::Function, 12);
    function.parameterCount = 2;
    ComponentRecord plain("Widget", ComponentKind::Class);

    json withCounts = function;
    json withoutCounts = plain;

    REQUIRE(withCounts == json{{"name", "load"}, {"type", "function"}, {"lines", 12}, {"arguments", 2}});
    REQUIRE(withoutCounts == json{{"name", "Widget"}, {"type", "class"}, {"lines", 0}});
}

TEST_CASE("Analysis result keys", "[ResultJson]") {
    AnalysisResult result;
    result.repoPath = "/repo";
    result.totalFiles = 1;
    result.filesWarned = 1;
    result.riskScore = 1.5;

    FileDetail detail;
    detail.name = "big.cpp";
    detail.path = "src/big.cpp";
    detail.riskScore = 50.0;
    detail.gate = GateDecision::Warn;
    detail.breakdown.complexity = 50.0;
    result.fileDetails.push_back(detail);

    RiskFinding finding;
    finding.priority = RiskPriority::High;
    finding.title = "High Code Complexity Detected";
    result.findings.push_back(finding);

    json j = result;

    REQUIRE(j["repo_path"] == "/repo");
    REQUIRE(j["total_files"] == 1);
    REQUIRE(j["files_passed"] == 0);
    REQUIRE(j["files_warned"] == 1);
    REQUIRE(j["files_blocked"] == 0);
    REQUIRE(j["risk_score"] == 1.5);
    REQUIRE(j["risk_level"] == "LOW");
    REQUIRE(j["complete"] == true);
    REQUIRE(j["skipped_files"] == 0);
    REQUIRE(j["risks"][0]["priority"] == "HIGH");
    REQUIRE(j["risks"][0]["title"] == "High Code Complexity Detected");
    REQUIRE(j["file_details"][0]["gate_decision"] == "WARN");
    REQUIRE(j["file_details"][0]["risk_breakdown"]["complexity"] == 50.0);
    REQUIRE(j["file_details"][0]["risk_breakdown"]["change_volume"] == 0.0);
    REQUIRE(j["code_analysis"]["complexity"]["samples"] == 0);
    REQUIRE(j["security"]["secrets_found"].is_array());
    REQUIRE(j["changes"]["by_type"].is_object());
    REQUIRE(j.contains("ai_insights"));
}

TEST_CASE("Report text tolerates invalid UTF-8", "[ResultJson]") {
    AnalysisResult result;
    result.repoPath = "/repo";
    result.codeAnalysis.dependencies = {"r\xe9sum\xe9.h", "vector"};
    result.codeAnalysis.components.emplace_back("caf\xe9", ComponentKind::Function);

    std::string text;
    REQUIRE_NOTHROW(text = toJsonText(result));

    json parsed = json::parse(text);
    REQUIRE(parsed["code_analysis"]["dependencies"][0] == "r\xEF\xBF\xBDsum\xEF\xBF\xBD.h");
    REQUIRE(parsed["code_analysis"]["dependencies"][1] == "vector");
    REQUIRE(parsed["code_analysis"]["components"][0]["name"] == "caf\xEF\xBF\xBD");
    REQUIRE(parsed["repo_path"] == "/repo");

    SECTION("Indentation is configurable") {
        REQUIRE(toJsonText(result, -1).find('\n') == std::string::npos);
    }
}

TEST_CASE("Security signals from JSON", "[ResultJson]") {
    json j = json::parse(R"({
        "vulnerabilities": [
            {"severity": "high", "file": "app/db.py", "line": 12, "description": "SQL injection",
             "recommendation": "Use parameterized queries"},
            {"severity": "LOW", "file": "app/web.py", "description": "Verbose errors"}
        ],
        "secrets_found": [{"file": "settings.py", "line": 3}]
    })");

    SecuritySignals security = j.get<SecuritySignals>();

    REQUIRE(security.vulnerabilities.size() == 2);
    REQUIRE(security.vulnerabilities[0].severity == Severity::High);
    REQUIRE(security.vulnerabilities[0].line == 12);
    REQUIRE(security.vulnerabilities[0].recommendation == std::string("Use parameterized queries"));
    REQUIRE(security.vulnerabilities[1].severity == Severity::Low);
    REQUIRE(security.vulnerabilities[1].line == 0);
    REQUIRE_FALSE(security.vulnerabilities[1].recommendation.has_value());
    REQUIRE(security.secrets.size() == 1);
    REQUIRE(security.secrets[0].file == "settings.py");

    SECTION("Unknown severities are rejected") {
        json bad = json::parse(R"({"vulnerabilities": [{"severity": "urgent"}]})");
        REQUIRE_THROWS_AS(bad.get<SecuritySignals>(), std::invalid_argument);
    }

    SECTION("Missing lists default to empty") {
        SecuritySignals empty = json::object().get<SecuritySignals>();
        REQUIRE(empty.vulnerabilities.empty());
        REQUIRE(empty.secrets.empty());
    }
}

TEST_CASE("Change signals from JSON", "[ResultJson]") {
    ChangeSignals changes = json::parse(R"({"total": 150, "added": 20, "by_type": {"py": 100, "js": 50}})")
                                .get<ChangeSignals>();

    REQUIRE(changes.total == 150);
    REQUIRE(changes.added == 20);
    REQUIRE(changes.deleted == 0);
    REQUIRE(changes.modified == 0);
    REQUIRE(changes.byType.at("py") == 100);
}

TEST_CASE("Per-file signals from JSON", "[ResultJson]") {
    auto signals = json::parse(R"({
        "src/core.cpp": {"change_volume": 12.5, "critical_function": 20, "changes": {"modified": 3, "total": 3}},
        "src/util.cpp": {}
    })").get<std::map<std::string, FileSignals>>();

    REQUIRE(signals.size() == 2);
    REQUIRE(signals.at("src/core.cpp").changeVolume == 12.5);
    REQUIRE(signals.at("src/core.cpp").criticalFunction == 20.0);
    REQUIRE(signals.at("src/core.cpp").changes.modified == 3);
    REQUIRE_FALSE(signals.at("src/util.cpp").changeVolume.has_value());
    REQUIRE_FALSE(signals.at("src/util.cpp").criticalFunction.has_value());
}
