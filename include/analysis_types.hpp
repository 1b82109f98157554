#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <filesystem>

namespace fs = std::filesystem;

// A single source file handed over by ingestion. Never modified after creation.
struct FileRecord {
    std::string path;               // Path as reported by ingestion (used as identity)
    std::string name;               // File name without directories
    std::string language;           // Language label, e.g. "Python", "C++", "Unknown"
    std::string content;            // Raw file content
    size_t lineCount = 0;           // Number of lines in content
};

enum class ComponentKind {
    Function,
    Method,
    Class,
    Struct,
    Component
};

// One structural unit discovered by a language handler
struct ComponentRecord {
    std::string name;
    ComponentKind kind = ComponentKind::Function;
    int lines = 0;                          // Line span, 0 when unknown
    std::optional<int> parameterCount;      // Functions, when the handler knows it
    std::optional<int> methodCount;         // Classes, when the handler knows it

    ComponentRecord() = default;
    ComponentRecord(const std::string& n, ComponentKind k, int l = 0)
        : name(n), kind(k), lines(l) {}
};

// Structural facts extracted from one file.
// complexity == 0 means "no sample" (parse failure or fallback analysis),
// which is distinct from the lowest real complexity of 1.
struct FileAnalysis {
    std::vector<ComponentRecord> components;
    std::vector<std::string> dependencies;  // Deduplicated, first-seen order
    double complexity = 0.0;
    bool handled = false;                   // A registered handler produced these facts
    std::string error;                      // Set when analysis of the file failed

    bool hasComplexitySample() const { return complexity > 0.0; }
};

struct ComplexitySummary {
    double average = 0.0;                   // Rounded to 2 decimals
    double max = 0.0;
    size_t samples = 0;                     // Files that produced a complexity sample
};

// Repository-level structural aggregate
struct CodeAnalysisSummary {
    std::vector<ComponentRecord> components;    // First N components, in file order
    size_t totalComponents = 0;                 // True count before capping
    std::vector<std::string> dependencies;      // Union, first-seen order, capped
    ComplexitySummary complexity;
    std::map<std::string, size_t> languages;    // File count per language label
};

// Inputs from the security-scan collaborator

enum class Severity {
    Critical,
    High,
    Medium,
    Low
};

struct Vulnerability {
    Severity severity = Severity::Low;
    std::string file;
    int line = 0;
    std::string description;
    std::optional<std::string> recommendation;
};

struct SecretLocation {
    std::string file;
    int line = 0;
};

struct SecuritySignals {
    std::vector<Vulnerability> vulnerabilities;
    std::vector<SecretLocation> secrets;
};

// Input from the change-detection collaborator
struct ChangeSignals {
    size_t added = 0;
    size_t deleted = 0;
    size_t modified = 0;
    size_t total = 0;
    std::map<std::string, size_t> byType;
};

// Per-file change counts carried into the file detail
struct FileChangeCounts {
    size_t added = 0;
    size_t deleted = 0;
    size_t modified = 0;
    size_t total = 0;
};
