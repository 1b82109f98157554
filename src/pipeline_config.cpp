#include "pipeline_config.hpp"
#include <fstream>
#include <stdexcept>

namespace {

using json = nlohmann::json;

template <typename T>
void readKey(const json& config, const char* key, T& target) {
    auto it = config.find(key);
    if (it == config.end() || it->is_null()) {
        return;
    }
    try {
        target = it->get<T>();
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid value for configuration key '") + key + "': " + e.what());
    }
}

} // namespace

PipelineOptions pipelineOptionsFromJson(const nlohmann::json& config, PipelineOptions options) {
    if (!config.is_object()) {
        throw std::runtime_error("Configuration must be a JSON object");
    }

    readKey(config, "max_concurrency", options.maxConcurrency);
    readKey(config, "component_cap", options.limits.componentCap);
    readKey(config, "dependency_cap", options.limits.dependencyCap);
    readKey(config, "fallback_component_cap", options.limits.fallbackComponentCap);
    readKey(config, "verbose", options.verbose);

    long long timeoutMs = -1;
    readKey(config, "timeout_ms", timeoutMs);
    if (timeoutMs >= 0) {
        options.timeout = std::chrono::milliseconds(timeoutMs);
    }

    if (options.maxConcurrency == 0) {
        options.maxConcurrency = 1;
    }

    return options;
}

PipelineOptions loadPipelineOptions(const fs::path& configPath) {
    std::ifstream file(configPath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open configuration file: " + configPath.string());
    }

    json config;
    try {
        file >> config;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Failed to parse configuration file " + configPath.string() + ": " + e.what());
    }

    return pipelineOptionsFromJson(config);
}
