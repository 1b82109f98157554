#pragma once

#include <string>
#include <vector>
#include <regex>
#include "analysis_types.hpp"
#include "cancellation_token.hpp"

// Base class for language-specific structural analysis.
// Implementations hold no mutable state, so one instance can be shared by
// every worker thread.
class LanguageHandler {
public:
    virtual ~LanguageHandler() = default;

    // Extract components, dependencies and complexity from a file.
    // Parse failures never throw: they yield an empty analysis with complexity 0.
    // Throws AnalysisCancelled when the token fires before the work is done.
    virtual FileAnalysis analyze(const std::string& content, const std::string& path,
                                 const CancellationToken& cancel = CancellationToken()) const;

    virtual std::vector<ComponentRecord> extractComponents(const std::string& content) const = 0;
    virtual std::vector<std::string> extractDependencies(const std::string& content) const = 0;
    virtual double estimateComplexity(const std::string& content) const = 0;

    // Handler name used in diagnostics
    virtual std::string name() const = 0;
};

// Words that look like calls in C-family syntax but are never components
bool isControlKeyword(const std::string& word);

// Longest line handed to a pattern engine
constexpr size_t kMaxMatchedLineLength = 2000;

// Copy of content for the pattern engines: lines longer than maxLineLength
// are blanked and runs of blank lines collapse to one. std::regex recurses
// once per consumed character, so minified or generated text would
// otherwise exhaust the stack.
std::string prepareForMatching(const std::string& content, size_t maxLineLength = kMaxMatchedLineLength);

// Shared machinery for the pattern-based handlers. Subclasses supply
// pattern tables; matching runs over prepareForMatching(content) and checks
// the cancellation token between patterns.
class RegexLanguageHandler : public LanguageHandler {
public:
    FileAnalysis analyze(const std::string& content, const std::string& path,
                         const CancellationToken& cancel = CancellationToken()) const override;

    std::vector<ComponentRecord> extractComponents(const std::string& content) const override;
    std::vector<std::string> extractDependencies(const std::string& content) const override;
    double estimateComplexity(const std::string& content) const override;

protected:
    struct ComponentPattern {
        std::regex regex;
        size_t nameGroup;
        ComponentKind kind;
        size_t excludeGroup = 0;    // Match is dropped when this group took part (0: none)
    };

    struct DependencyPattern {
        std::regex regex;
        size_t group;
    };

    virtual const std::vector<ComponentPattern>& componentPatterns() const = 0;
    virtual const std::vector<DependencyPattern>& dependencyPatterns() const = 0;

    // Decision-point patterns; each match adds 1 to the baseline of 1
    virtual const std::vector<std::regex>& decisionPatterns() const;

    static std::regex makePattern(const char* pattern);

private:
    std::vector<ComponentRecord> componentsOf(const std::string& text, const CancellationToken& cancel) const;
    std::vector<std::string> dependenciesOf(const std::string& text, const CancellationToken& cancel) const;
    double complexityOf(const std::string& text, const CancellationToken& cancel) const;
};

// Python handler backed by a tree-sitter syntax walk
class PythonHandler : public LanguageHandler {
public:
    FileAnalysis analyze(const std::string& content, const std::string& path,
                         const CancellationToken& cancel = CancellationToken()) const override;

    std::vector<ComponentRecord> extractComponents(const std::string& content) const override;
    std::vector<std::string> extractDependencies(const std::string& content) const override;
    double estimateComplexity(const std::string& content) const override;

    std::string name() const override { return "python"; }
};

// Java handler (regex based)
class JavaHandler : public RegexLanguageHandler {
public:
    std::string name() const override { return "java"; }

protected:
    const std::vector<ComponentPattern>& componentPatterns() const override;
    const std::vector<DependencyPattern>& dependencyPatterns() const override;
};

// JavaScript and TypeScript handler (regex based)
class JavaScriptHandler : public RegexLanguageHandler {
public:
    std::string name() const override { return "javascript"; }

protected:
    const std::vector<ComponentPattern>& componentPatterns() const override;
    const std::vector<DependencyPattern>& dependencyPatterns() const override;
    const std::vector<std::regex>& decisionPatterns() const override;
};

// C and C++ handler (regex based)
class CppHandler : public RegexLanguageHandler {
public:
    std::string name() const override { return "cpp"; }

protected:
    const std::vector<ComponentPattern>& componentPatterns() const override;
    const std::vector<DependencyPattern>& dependencyPatterns() const override;
};
