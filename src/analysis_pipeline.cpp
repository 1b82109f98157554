#include "analysis_pipeline.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <thread>

AnalysisPipeline::AnalysisPipeline(const LanguageRegistry& registry, const PipelineOptions& options)
    : options_(options),
      analyzer_(std::make_shared<CodeAnalyzer>(registry, options.limits)),
      riskEngine_(std::make_shared<FileRiskEngine>()),
      riskAssessor_(std::make_shared<RiskAssessor>()) {
    if (options_.maxConcurrency == 0) {
        options_.maxConcurrency = 1;
    }
}

void AnalysisPipeline::setCodeAnalyzer(std::shared_ptr<const CodeAnalyzer> analyzer) {
    if (!analyzer) {
        throw std::invalid_argument("code analyzer must not be null");
    }
    analyzer_ = std::move(analyzer);
}

void AnalysisPipeline::setFileRiskEngine(std::shared_ptr<const FileRiskEngine> engine) {
    if (!engine) {
        throw std::invalid_argument("file risk engine must not be null");
    }
    riskEngine_ = std::move(engine);
}

void AnalysisPipeline::setRiskAssessor(std::shared_ptr<const RiskAssessor> assessor) {
    if (!assessor) {
        throw std::invalid_argument("risk assessor must not be null");
    }
    riskAssessor_ = std::move(assessor);
}

AnalysisResult AnalysisPipeline::run(const AnalysisInput& input, const CancellationToken& cancel) const {
    if (input.files.empty()) {
        throw AnalysisError("input", "no files to analyze");
    }

    auto startTime = std::chrono::steady_clock::now();
    CancellationToken token = options_.timeout ? cancel.withDeadline(startTime + *options_.timeout) : cancel;

    if (options_.verbose) {
        std::cout << "Analyzing " << input.files.size() << " files from " << input.repoPath << std::endl;
    }

    // Per-file stage: every worker writes only its own slots
    std::vector<FileOutcome> outcomes(input.files.size());
    runPerFileStage(input, outcomes, token);

    // Reduction over the processed files, in input order
    std::vector<FileRecord> processedFiles;
    std::vector<FileAnalysis> analyses;
    AnalysisResult result;
    result.repoPath = input.repoPath;
    result.totalFiles = input.files.size();

    try {
        for (size_t i = 0; i < outcomes.size(); ++i) {
            if (!outcomes[i].processed) {
                result.skippedFiles++;
                continue;
            }
            processedFiles.push_back(input.files[i]);
            analyses.push_back(std::move(outcomes[i].analysis));
            if (outcomes[i].detail) {
                result.fileDetails.push_back(std::move(*outcomes[i].detail));
            }
        }
    } catch (const std::exception& e) {
        throw AnalysisError("aggregation", e.what());
    }
    result.complete = result.skippedFiles == 0;

    if (!result.complete) {
        std::cerr << "Warning: Analysis interrupted, " << result.skippedFiles << " of "
                  << input.files.size() << " files were not analyzed" << std::endl;
    }

    try {
        result.codeAnalysis = analyzer_->aggregate(processedFiles, analyses);
    } catch (const std::exception& e) {
        throw AnalysisError("code_analysis", e.what());
    }

    result.security = input.security.value_or(SecuritySignals());
    result.changes = input.changes.value_or(ChangeSignals());

    try {
        RiskAssessment assessment = riskAssessor_->assess(input.security, result.codeAnalysis.complexity, input.changes);
        result.findings = std::move(assessment.findings);
        result.riskScore = assessment.score;
        result.riskLevel = assessment.level;
    } catch (const std::exception& e) {
        throw AnalysisError("risk_assessment", e.what());
    }

    countGates(result);

    result.insights = collectInsights(result);

    if (options_.verbose) {
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - startTime).count();
        std::cout << "Analysis completed in " << duration << "ms: "
                  << result.filesPassed << " passed, " << result.filesWarned << " warned, "
                  << result.filesBlocked << " blocked" << std::endl;
    }

    return result;
}

void AnalysisPipeline::processFile(const AnalysisInput& input, size_t index, FileOutcome& outcome,
                                   const CancellationToken& cancel) const {
    const FileRecord& file = input.files[index];

    try {
        outcome.analysis = analyzer_->analyzeFile(file, cancel);
    } catch (const AnalysisCancelled&) {
        // Abandoned mid-file: counted as skipped
        return;
    } catch (const std::exception& e) {
        std::cerr << "Error: Failed to analyze " << file.path << ": " << e.what() << std::endl;
        outcome.analysis = FileAnalysis();
        outcome.analysis.error = e.what();
        outcome.processed = true;
        return;
    }
    outcome.processed = true;

    try {
        FileSignals signals;
        auto it = input.fileSignals.find(file.path);
        if (it != input.fileSignals.end()) {
            signals = it->second;
        }
        if (input.security) {
            auto securityIssues = FileRiskEngine::issuesForFile(*input.security, file.path);
            signals.issues.insert(signals.issues.end(), securityIssues.begin(), securityIssues.end());
        }

        outcome.detail = riskEngine_->evaluate(file, outcome.analysis, signals);
    } catch (const std::exception& e) {
        // The file keeps its structural facts but gets no detail entry
        std::cerr << "Error: Failed to compute risk for " << file.path << ": " << e.what() << std::endl;
        outcome.detail.reset();
    }
}

void AnalysisPipeline::runPerFileStage(const AnalysisInput& input, std::vector<FileOutcome>& outcomes,
                                       const CancellationToken& cancel) const {
    std::atomic<size_t> nextIndex{0};

    auto worker = [&]() {
        while (!cancel.isCancelled()) {
            size_t index = nextIndex.fetch_add(1);
            if (index >= outcomes.size()) {
                return;
            }
            processFile(input, index, outcomes[index], cancel);
        }
    };

    unsigned int actualThreads = std::min(options_.maxConcurrency, static_cast<unsigned int>(outcomes.size()));
    std::vector<std::thread> workers;

    // Use the calling thread when only one worker is needed
    if (actualThreads <= 1) {
        worker();
        return;
    }

    for (unsigned int i = 0; i < actualThreads; ++i) {
        try {
            workers.emplace_back(worker);
        } catch (const std::system_error& e) {
            std::cerr << "Warning: Could not create worker thread: " << e.what() << std::endl;
            break;
        }
    }

    if (workers.empty()) {
        std::cerr << "Warning: Falling back to single-threaded analysis" << std::endl;
        worker();
        return;
    }

    for (auto& thread : workers) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void AnalysisPipeline::countGates(AnalysisResult& result) {
    for (const auto& detail : result.fileDetails) {
        switch (detail.gate) {
            case GateDecision::Pass: result.filesPassed++; break;
            case GateDecision::Warn: result.filesWarned++; break;
            case GateDecision::Block: result.filesBlocked++; break;
        }
    }
}

nlohmann::json AnalysisPipeline::collectInsights(const AnalysisResult& result) const {
    if (!insightProvider_) {
        return {{"status", "disabled"}};
    }

    try {
        return {
            {"status", "available"},
            {"provider", insightProvider_->name()},
            {"content", insightProvider_->enrich(result)}
        };
    } catch (const std::exception& e) {
        std::cerr << "Warning: Insight provider " << insightProvider_->name() << " failed: " << e.what() << std::endl;
        return {{"status", "unavailable"}, {"error", e.what()}};
    }
}
