#include "code_analyzer.hpp"
#include <iostream>
#include <regex>
#include <cmath>
#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace {

double roundTo2(double value) {
    return std::round(value * 100.0) / 100.0;
}

} // namespace

CodeAnalyzer::CodeAnalyzer(const LanguageRegistry& registry, const CodeAnalyzerLimits& limits)
    : registry_(registry), limits_(limits) {
}

FileAnalysis CodeAnalyzer::analyzeFile(const FileRecord& file, const CancellationToken& cancel) const {
    try {
        const LanguageHandler* handler = registry_.get(file.language);
        if (handler) {
            return handler->analyze(file.content, file.path, cancel);
        }
        return fallbackAnalysis(file, cancel);
    } catch (const AnalysisCancelled&) {
        throw;
    } catch (const std::exception& e) {
        std::cerr << "Warning: Failed to analyze " << file.path << ": " << e.what() << std::endl;
        FileAnalysis failed;
        failed.error = e.what();
        return failed;
    }
}

FileAnalysis CodeAnalyzer::fallbackAnalysis(const FileRecord& file, const CancellationToken& cancel) const {
    static const std::vector<std::regex> functionPatterns = {
        std::regex(R"(\bdef\s+(\w+))"),                              // Python style
        std::regex(R"(\bfunction\s+(\w+))"),                         // JavaScript style
        std::regex(R"(\b\w+\s+(\w+)\s*\([^)]{0,512}\)\s*\{)")        // C/Java style
    };

    FileAnalysis result;
    result.handled = false;

    const std::string text = prepareForMatching(file.content);
    for (const auto& pattern : functionPatterns) {
        cancel.throwIfCancelled();

        std::sregex_iterator it(text.begin(), text.end(), pattern);
        std::sregex_iterator end;

        for (; it != end && result.components.size() < limits_.fallbackComponentCap; ++it) {
            std::string name = it->str(1);
            if (!isControlKeyword(name)) {
                result.components.emplace_back(name, ComponentKind::Function);
            }
        }
    }

    // Complexity is not estimated for unsupported languages
    result.complexity = 0.0;
    return result;
}

CodeAnalysisSummary CodeAnalyzer::aggregate(const std::vector<FileRecord>& files,
                                            const std::vector<FileAnalysis>& analyses) const {
    if (files.size() != analyses.size()) {
        throw std::logic_error("Aggregation input mismatch: " + std::to_string(files.size()) +
                               " files but " + std::to_string(analyses.size()) + " analyses");
    }

    CodeAnalysisSummary summary;
    std::unordered_set<std::string> seenDependencies;
    double complexitySum = 0.0;

    for (size_t i = 0; i < analyses.size(); ++i) {
        const FileAnalysis& analysis = analyses[i];

        summary.languages[files[i].language]++;
        summary.totalComponents += analysis.components.size();

        for (const auto& component : analysis.components) {
            if (summary.components.size() >= limits_.componentCap) {
                break;
            }
            summary.components.push_back(component);
        }

        for (const auto& dependency : analysis.dependencies) {
            if (seenDependencies.insert(dependency).second && summary.dependencies.size() < limits_.dependencyCap) {
                summary.dependencies.push_back(dependency);
            }
        }

        // Files without a sample are left out, not counted as zero
        if (analysis.hasComplexitySample()) {
            complexitySum += analysis.complexity;
            summary.complexity.max = std::max(summary.complexity.max, analysis.complexity);
            summary.complexity.samples++;
        }
    }

    if (summary.complexity.samples > 0) {
        summary.complexity.average = roundTo2(complexitySum / static_cast<double>(summary.complexity.samples));
        summary.complexity.max = roundTo2(summary.complexity.max);
    }

    return summary;
}

CodeAnalysisSummary CodeAnalyzer::analyze(const std::vector<FileRecord>& files) const {
    std::vector<FileAnalysis> analyses;
    analyses.reserve(files.size());
    for (const auto& file : files) {
        analyses.push_back(analyzeFile(file));
    }
    return aggregate(files, analyses);
}
