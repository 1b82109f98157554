#include "language_registry.hpp"
#include <algorithm>
#include <stdexcept>

LanguageRegistry LanguageRegistry::withDefaults() {
    LanguageRegistry registry;

    auto javascript = std::make_shared<JavaScriptHandler>();
    auto cpp = std::make_shared<CppHandler>();

    registry.registerHandler("Python", std::make_shared<PythonHandler>());
    registry.registerHandler("Java", std::make_shared<JavaHandler>());
    registry.registerHandler("JavaScript", javascript);
    registry.registerHandler("TypeScript", javascript);
    registry.registerHandler("C", cpp);
    registry.registerHandler("C++", cpp);
    registry.registerHandler("C/C++", cpp);

    return registry;
}

void LanguageRegistry::registerHandler(const std::string& language, std::shared_ptr<const LanguageHandler> handler) {
    if (!handler) {
        throw std::invalid_argument("Cannot register a null handler for language: " + language);
    }
    handlers_[language] = std::move(handler);
}

const LanguageHandler* LanguageRegistry::get(const std::string& language) const {
    auto it = handlers_.find(language);
    if (it == handlers_.end()) {
        return nullptr;
    }
    return it->second.get();
}

std::vector<std::string> LanguageRegistry::supportedLanguages() const {
    std::vector<std::string> languages;
    languages.reserve(handlers_.size());
    for (const auto& entry : handlers_) {
        languages.push_back(entry.first);
    }
    std::sort(languages.begin(), languages.end());
    return languages;
}
