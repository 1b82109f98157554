#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <thread>
#include <nlohmann/json.hpp>
#include "code_analyzer.hpp"

namespace fs = std::filesystem;

// Pipeline configuration
struct PipelineOptions {
    unsigned int maxConcurrency = std::thread::hardware_concurrency();  // Worker threads for per-file work
    CodeAnalyzerLimits limits;                                           // Aggregate list caps
    std::optional<std::chrono::milliseconds> timeout;                    // Deadline for the per-file stage
    bool verbose = false;                                                // Progress output on stdout
};

// Read options from a JSON object. Missing keys keep their defaults,
// a key with the wrong type throws std::runtime_error naming the key.
//
// {
//   "max_concurrency": 8,
//   "component_cap": 100,
//   "dependency_cap": 50,
//   "fallback_component_cap": 10,
//   "timeout_ms": 30000,
//   "verbose": false
// }
PipelineOptions pipelineOptionsFromJson(const nlohmann::json& config, PipelineOptions options = PipelineOptions());

// Load options from a JSON file
PipelineOptions loadPipelineOptions(const fs::path& configPath);
