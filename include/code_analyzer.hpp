#pragma once

#include <string>
#include <vector>
#include "analysis_types.hpp"
#include "cancellation_token.hpp"
#include "language_registry.hpp"

// Caps applied to the externally visible aggregate lists
struct CodeAnalyzerLimits {
    size_t componentCap = 100;          // Components exposed in the summary
    size_t dependencyCap = 50;          // Dependencies exposed in the summary
    size_t fallbackComponentCap = 10;   // Components reported for files without a handler
};

class CodeAnalyzer {
public:
    explicit CodeAnalyzer(const LanguageRegistry& registry,
                          const CodeAnalyzerLimits& limits = CodeAnalyzerLimits());
    virtual ~CodeAnalyzer() = default;

    // Analyze one file with its registered handler, or the fallback extractor
    // when no handler is registered for its language. Failures are reported
    // and produce an empty analysis with the error recorded. Only
    // AnalysisCancelled escapes, once the token fires.
    virtual FileAnalysis analyzeFile(const FileRecord& file,
                                     const CancellationToken& cancel = CancellationToken()) const;

    // Fold per-file analyses into repository-level metrics.
    // analyses[i] must belong to files[i].
    virtual CodeAnalysisSummary aggregate(const std::vector<FileRecord>& files,
                                          const std::vector<FileAnalysis>& analyses) const;

    // Analyze a batch sequentially and aggregate it
    CodeAnalysisSummary analyze(const std::vector<FileRecord>& files) const;

    const CodeAnalyzerLimits& limits() const { return limits_; }

private:
    const LanguageRegistry& registry_;
    CodeAnalyzerLimits limits_;

    // Generic function-like token scan for unsupported languages
    FileAnalysis fallbackAnalysis(const FileRecord& file, const CancellationToken& cancel) const;
};
