#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "analysis_types.hpp"
#include "risk_types.hpp"
#include "analysis_error.hpp"
#include "cancellation_token.hpp"
#include "code_analyzer.hpp"
#include "file_risk_engine.hpp"
#include "risk_assessor.hpp"
#include "pipeline_config.hpp"

// Optional enrichment collaborator (e.g. generated commentary). It sees the
// finished result read-only and cannot change scores or gate decisions.
class InsightProvider {
public:
    virtual ~InsightProvider() = default;

    virtual nlohmann::json enrich(const AnalysisResult& result) const = 0;
    virtual std::string name() const = 0;
};

// Everything one run consumes
struct AnalysisInput {
    std::string repoPath;                           // Provenance only
    std::vector<FileRecord> files;
    std::optional<SecuritySignals> security;        // Absent: no security findings
    std::optional<ChangeSignals> changes;           // Absent: all counts 0
    std::map<std::string, FileSignals> fileSignals; // Per-file change/critical-path signals, keyed by path
};

// Orchestrates CodeAnalyzer -> FileRiskEngine -> RiskAssessor -> gate counts
class AnalysisPipeline {
public:
    explicit AnalysisPipeline(const LanguageRegistry& registry,
                              const PipelineOptions& options = PipelineOptions());

    // Run the full pipeline. Throws AnalysisError when the batch is empty or
    // a batch-level stage fails. A cancelled or timed-out run returns a
    // partial result with complete == false.
    AnalysisResult run(const AnalysisInput& input, const CancellationToken& cancel = CancellationToken()) const;

    void setInsightProvider(std::shared_ptr<const InsightProvider> provider) { insightProvider_ = std::move(provider); }

    // Replace a stage. Throws std::invalid_argument on null.
    void setCodeAnalyzer(std::shared_ptr<const CodeAnalyzer> analyzer);
    void setFileRiskEngine(std::shared_ptr<const FileRiskEngine> engine);
    void setRiskAssessor(std::shared_ptr<const RiskAssessor> assessor);

    const PipelineOptions& options() const { return options_; }

private:
    PipelineOptions options_;
    std::shared_ptr<const CodeAnalyzer> analyzer_;
    std::shared_ptr<const FileRiskEngine> riskEngine_;
    std::shared_ptr<const RiskAssessor> riskAssessor_;
    std::shared_ptr<const InsightProvider> insightProvider_;

    // Result slot for one input file; each is written by exactly one worker
    struct FileOutcome {
        bool processed = false;
        FileAnalysis analysis;
        std::optional<FileDetail> detail;
    };

    void processFile(const AnalysisInput& input, size_t index, FileOutcome& outcome,
                     const CancellationToken& cancel) const;
    void runPerFileStage(const AnalysisInput& input, std::vector<FileOutcome>& outcomes,
                         const CancellationToken& cancel) const;
    nlohmann::json collectInsights(const AnalysisResult& result) const;

    static void countGates(AnalysisResult& result);
};
