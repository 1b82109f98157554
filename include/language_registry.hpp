#pragma once

#include <string>
#include <vector>
#include <memory>
#include <unordered_map>
#include "language_handler.hpp"

// Maps language labels to handlers. Built explicitly and passed to the
// analyzer; there is no process-wide instance.
class LanguageRegistry {
public:
    LanguageRegistry() = default;

    // Registry with the built-in handlers for Python, Java, JavaScript,
    // TypeScript, C, C++ and C/C++
    static LanguageRegistry withDefaults();

    // Register a handler for a label. Registering a label again replaces the handler.
    void registerHandler(const std::string& language, std::shared_ptr<const LanguageHandler> handler);

    // Look up the handler for a label. Returns nullptr for unknown labels.
    const LanguageHandler* get(const std::string& language) const;

    // Registered labels, sorted
    std::vector<std::string> supportedLanguages() const;

    size_t size() const { return handlers_.size(); }

private:
    std::unordered_map<std::string, std::shared_ptr<const LanguageHandler>> handlers_;
};
