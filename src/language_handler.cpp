#include "language_handler.hpp"
#include <iostream>
#include <algorithm>
#include <cctype>
#include <iterator>
#include <unordered_set>

namespace {

// Ternaries are only counted when written with whitespace around the '?'
// and not directly after '<' or ',', which keeps optional chaining, nullish
// coalescing and generic wildcards (Map<String, ? extends T>) out.
const char* const kTernaryPattern = R"([^<,\s]\s{1,64}\?\s)";

bool isBlank(const std::string& content, size_t start, size_t end) {
    for (size_t i = start; i < end; ++i) {
        if (!std::isspace(static_cast<unsigned char>(content[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

bool isControlKeyword(const std::string& word) {
    static const std::unordered_set<std::string> keywords = {
        "if", "for", "while", "switch", "catch", "return", "sizeof"
    };
    return keywords.count(word) > 0;
}

std::string prepareForMatching(const std::string& content, size_t maxLineLength) {
    std::string text;
    text.reserve(content.size());

    bool previousBlank = false;
    size_t start = 0;
    while (start < content.size()) {
        size_t end = content.find('\n', start);
        bool lastLine = end == std::string::npos;
        if (lastLine) {
            end = content.size();
        }

        bool blank = end - start > maxLineLength || isBlank(content, start, end);
        if (!blank) {
            text.append(content, start, end - start);
            if (!lastLine) {
                text += '\n';
            }
        } else if (!previousBlank && !lastLine) {
            text += '\n';
        }
        previousBlank = blank;

        if (lastLine) {
            break;
        }
        start = end + 1;
    }

    return text;
}

FileAnalysis LanguageHandler::analyze(const std::string& content, const std::string& path,
                                      const CancellationToken& cancel) const {
    FileAnalysis result;
    try {
        cancel.throwIfCancelled();
        result.components = extractComponents(content);
        cancel.throwIfCancelled();
        result.dependencies = extractDependencies(content);
        cancel.throwIfCancelled();
        result.complexity = estimateComplexity(content);
        result.handled = true;
    } catch (const AnalysisCancelled&) {
        throw;
    } catch (const std::exception& e) {
        std::cerr << "Warning: " << name() << " handler could not parse " << path << ": " << e.what() << std::endl;
        result = FileAnalysis();
        result.handled = true;
        result.error = e.what();
    }
    return result;
}

// RegexLanguageHandler implementation

std::regex RegexLanguageHandler::makePattern(const char* pattern) {
    return std::regex(pattern, std::regex::ECMAScript | std::regex::optimize);
}

const std::vector<std::regex>& RegexLanguageHandler::decisionPatterns() const {
    static const std::vector<std::regex> patterns = {
        makePattern(R"(\bif\s*\()"),
        makePattern(R"(\bfor\s*\()"),
        makePattern(R"(\bwhile\s*\()"),
        makePattern(R"(\bswitch\s*\()"),
        makePattern(R"(\bcatch\s*\()"),
        makePattern(kTernaryPattern)
    };
    return patterns;
}

FileAnalysis RegexLanguageHandler::analyze(const std::string& content, const std::string& path,
                                           const CancellationToken& cancel) const {
    FileAnalysis result;
    try {
        const std::string text = prepareForMatching(content);
        result.components = componentsOf(text, cancel);
        result.dependencies = dependenciesOf(text, cancel);
        result.complexity = complexityOf(text, cancel);
        result.handled = true;
    } catch (const AnalysisCancelled&) {
        throw;
    } catch (const std::exception& e) {
        // Pattern engines can still fail on pathological input; treat it as a parse failure
        std::cerr << "Warning: " << name() << " handler could not parse " << path << ": " << e.what() << std::endl;
        result = FileAnalysis();
        result.handled = true;
        result.error = e.what();
    }
    return result;
}

std::vector<ComponentRecord> RegexLanguageHandler::extractComponents(const std::string& content) const {
    return componentsOf(prepareForMatching(content), CancellationToken());
}

std::vector<std::string> RegexLanguageHandler::extractDependencies(const std::string& content) const {
    return dependenciesOf(prepareForMatching(content), CancellationToken());
}

double RegexLanguageHandler::estimateComplexity(const std::string& content) const {
    return complexityOf(prepareForMatching(content), CancellationToken());
}

std::vector<ComponentRecord> RegexLanguageHandler::componentsOf(const std::string& text,
                                                                const CancellationToken& cancel) const {
    std::vector<ComponentRecord> components;

    for (const auto& pattern : componentPatterns()) {
        cancel.throwIfCancelled();

        std::sregex_iterator it(text.begin(), text.end(), pattern.regex);
        std::sregex_iterator end;
        for (; it != end; ++it) {
            if (pattern.excludeGroup != 0 && (*it)[pattern.excludeGroup].matched) {
                continue;
            }
            if (!(*it)[pattern.nameGroup].matched) {
                continue;
            }
            std::string name = it->str(pattern.nameGroup);
            if (!isControlKeyword(name)) {
                components.emplace_back(name, pattern.kind);
            }
        }
    }

    return components;
}

std::vector<std::string> RegexLanguageHandler::dependenciesOf(const std::string& text,
                                                              const CancellationToken& cancel) const {
    std::vector<std::string> dependencies;

    for (const auto& pattern : dependencyPatterns()) {
        cancel.throwIfCancelled();

        std::sregex_iterator it(text.begin(), text.end(), pattern.regex);
        std::sregex_iterator end;
        for (; it != end; ++it) {
            if (!(*it)[pattern.group].matched) {
                continue;
            }
            std::string dependency = it->str(pattern.group);
            if (std::find(dependencies.begin(), dependencies.end(), dependency) == dependencies.end()) {
                dependencies.push_back(dependency);
            }
        }
    }

    return dependencies;
}

double RegexLanguageHandler::complexityOf(const std::string& text, const CancellationToken& cancel) const {
    double complexity = 1.0;

    for (const auto& pattern : decisionPatterns()) {
        cancel.throwIfCancelled();

        std::sregex_iterator it(text.begin(), text.end(), pattern);
        std::sregex_iterator end;
        complexity += static_cast<double>(std::distance(it, end));
    }

    return complexity;
}

// JavaHandler implementation

const std::vector<RegexLanguageHandler::ComponentPattern>& JavaHandler::componentPatterns() const {
    static const std::vector<ComponentPattern> patterns = {
        {makePattern(R"(\b(?:class|interface|enum|record)\s+(\w+))"), 1, ComponentKind::Class},
        {makePattern(
            R"(\b(?:public|private|protected)\s+(?:static\s+)?(?:final\s+)?(?:synchronized\s+)?)"
            R"((?:[\w.]+(?:<[^{;()]{0,256}?>)?(?:\[\])*\s+)?(\w+)\s*\([^)]{0,512}\)\s*)"
            R"((?:throws\s+[\w.,\s]{1,256}?)?\s*\{)"), 1, ComponentKind::Method}
    };
    return patterns;
}

const std::vector<RegexLanguageHandler::DependencyPattern>& JavaHandler::dependencyPatterns() const {
    static const std::vector<DependencyPattern> patterns = {
        {makePattern(R"(\bimport\s+(?:static\s+)?([\w.]+(?:\.\*)?)\s*;)"), 1}
    };
    return patterns;
}

// JavaScriptHandler implementation

const std::vector<std::regex>& JavaScriptHandler::decisionPatterns() const {
    static const std::vector<std::regex> patterns = {
        makePattern(R"(\bif\s*\()"),
        makePattern(R"(\bfor\s*\()"),
        makePattern(R"(\bwhile\s*\()"),
        makePattern(R"(\bswitch\s*\()"),
        makePattern(R"(\bcatch\s*[({])"),
        makePattern(kTernaryPattern)
    };
    return patterns;
}

const std::vector<RegexLanguageHandler::ComponentPattern>& JavaScriptHandler::componentPatterns() const {
    static const std::vector<ComponentPattern> patterns = {
        {makePattern(R"(\bfunction\s*\*?\s*(\w+)\s*\()"), 1, ComponentKind::Function},
        {makePattern(R"(\b(?:const|let|var)\s+(\w+)\s*=\s*(?:async\s+)?\([^)]{0,512}\)\s*=>)"),
         1, ComponentKind::Function},
        {makePattern(R"(\bclass\s+(\w+))"), 1, ComponentKind::Class},
        {makePattern(R"(\bconst\s+(\w+)\s*:\s*React\.FC\b)"), 1, ComponentKind::Component},
        {makePattern(R"(\b(?:const|function)\s+(\w+)\s*=[^\n]{0,512}?React\.(?:Component|FC)\b)"),
         1, ComponentKind::Component}
    };
    return patterns;
}

const std::vector<RegexLanguageHandler::DependencyPattern>& JavaScriptHandler::dependencyPatterns() const {
    static const std::vector<DependencyPattern> patterns = {
        {makePattern(R"(\bimport\s+[^;'"]{0,512}?\s*\bfrom\s*['"]([^'"\n]+)['"])"), 1},
        {makePattern(R"(\bimport\s+['"]([^'"\n]+)['"])"), 1},
        {makePattern(R"(\brequire\s*\(\s*['"]([^'"\n]+)['"]\s*\))"), 1}
    };
    return patterns;
}

// CppHandler implementation

const std::vector<RegexLanguageHandler::ComponentPattern>& CppHandler::componentPatterns() const {
    static const std::vector<ComponentPattern> patterns = {
        {makePattern(R"(\b(\w+)\s*\([^)]{0,512}\)\s*(?:const\s*)?(?:noexcept\s*)?(?:override\s*)?(?:final\s*)?\{)"),
         1, ComponentKind::Function},
        // Only definitions: a body or base list must follow the name. enum class is skipped.
        {makePattern(R"((\benum\s+)?\bclass\s+(\w+)\b(?=\s*(?:final\s*)?(?::[^;{]{0,512})?\{))"),
         2, ComponentKind::Class, 1},
        {makePattern(R"(\bstruct\s+(\w+)\b(?=\s*(?:final\s*)?(?::[^;{]{0,512})?\{))"),
         1, ComponentKind::Struct}
    };
    return patterns;
}

const std::vector<RegexLanguageHandler::DependencyPattern>& CppHandler::dependencyPatterns() const {
    static const std::vector<DependencyPattern> patterns = {
        {makePattern(R"(#\s*include\s*[<"]([^>"\n]+)[>"])"), 1}
    };
    return patterns;
}
