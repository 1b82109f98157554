#include <iostream>
#include <fstream>
#include <map>
#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include "analysis_pipeline.hpp"
#include "language_registry.hpp"
#include "pattern_matcher.hpp"
#include "pipeline_config.hpp"
#include "result_json.hpp"
#include "source_loader.hpp"

using json = nlohmann::json;

namespace {

json readJsonFile(const std::string& path, const std::string& what) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open " + what + " file: " + path);
    }
    try {
        return json::parse(file);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Failed to parse " + what + " file " + path + ": " + e.what());
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        CLI::App app{"riskgate - Release risk analysis and PASS/WARN/BLOCK gate for source trees"};

        std::vector<std::string> inputs;
        std::string outputFile;
        std::string configFile;
        std::string securityFile;
        std::string changesFile;
        std::string fileSignalsFile;
        std::string includePatterns;
        std::string excludePatterns;
        unsigned int threads = 0;
        long long timeoutMs = -1;
        bool verbose = false;

        app.add_option("-i,--input", inputs, "Source directory or files to analyze (required)")
            ->required()
            ->check(CLI::ExistingPath);

        app.add_option("-o,--output", outputFile, "Write the JSON result to this file (default: stdout)");

        app.add_option("-c,--config", configFile, "JSON configuration file")
            ->check(CLI::ExistingFile);

        app.add_option("--security", securityFile, "Security scan results (JSON)")
            ->check(CLI::ExistingFile);

        app.add_option("--changes", changesFile, "Change detection totals (JSON)")
            ->check(CLI::ExistingFile);

        app.add_option("--file-signals", fileSignalsFile,
                       "Per-file change volume and critical-path signals, keyed by path (JSON)")
            ->check(CLI::ExistingFile);

        app.add_option("--include", includePatterns,
                       "Comma-separated list of glob patterns for files to include (e.g. *.py,src/**/*.js)");

        app.add_option("--exclude", excludePatterns,
                       "Comma-separated list of glob patterns for files to exclude (e.g. *_test.py)");

        app.add_option("--threads", threads, "Number of worker threads (default: number of CPU cores)")
            ->check(CLI::Range(1u, 256u));

        app.add_option("--timeout-ms", timeoutMs, "Abandon per-file analysis after this many milliseconds")
            ->check(CLI::NonNegativeNumber);

        app.add_flag("-v,--verbose", verbose, "Enable verbose output");

        CLI11_PARSE(app, argc, argv);

        // Configuration file first, then command-line overrides
        PipelineOptions options;
        if (!configFile.empty()) {
            options = loadPipelineOptions(configFile);
        }
        if (threads > 0) {
            options.maxConcurrency = threads;
        }
        if (timeoutMs >= 0) {
            options.timeout = std::chrono::milliseconds(timeoutMs);
        }
        options.verbose = options.verbose || verbose;

        // Load sources
        PatternMatcher matcher;
        matcher.setIncludePatterns(includePatterns);
        matcher.setExcludePatterns(excludePatterns);
        SourceLoader loader(matcher);

        AnalysisInput input;
        std::vector<fs::path> looseFiles;
        for (const auto& path : inputs) {
            if (fs::is_directory(path)) {
                auto records = loader.loadDirectory(path);
                input.files.insert(input.files.end(),
                                   std::make_move_iterator(records.begin()),
                                   std::make_move_iterator(records.end()));
            } else {
                looseFiles.emplace_back(path);
            }
        }
        if (!looseFiles.empty()) {
            auto records = loader.loadFiles(looseFiles);
            input.files.insert(input.files.end(),
                               std::make_move_iterator(records.begin()),
                               std::make_move_iterator(records.end()));
        }
        input.repoPath = inputs.size() == 1 && fs::is_directory(inputs.front()) ? inputs.front() : "Uploaded Files";

        // External signals
        if (!securityFile.empty()) {
            input.security = readJsonFile(securityFile, "security").get<SecuritySignals>();
        }
        if (!changesFile.empty()) {
            input.changes = readJsonFile(changesFile, "changes").get<ChangeSignals>();
        }
        if (!fileSignalsFile.empty()) {
            input.fileSignals = readJsonFile(fileSignalsFile, "file signals").get<std::map<std::string, FileSignals>>();
        }

        if (options.verbose) {
            std::cout << "Loaded " << input.files.size() << " files" << std::endl;
        }

        // Run
        LanguageRegistry registry = LanguageRegistry::withDefaults();
        AnalysisPipeline pipeline(registry, options);
        AnalysisResult result = pipeline.run(input);

        std::string report = toJsonText(result);
        if (outputFile.empty()) {
            std::cout << report << std::endl;
        } else {
            std::ofstream out(outputFile);
            if (!out) {
                std::cerr << "Error: Failed to write result to " << outputFile << std::endl;
                return 1;
            }
            out << report << std::endl;
            if (options.verbose) {
                std::cout << "Result written to " << outputFile << std::endl;
            }
        }

        if (options.verbose) {
            std::cout << "Repository risk: " << toString(result.riskLevel) << " (" << result.riskScore << "/10)" << std::endl;
        }

        return result.filesBlocked > 0 ? 2 : 0;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
