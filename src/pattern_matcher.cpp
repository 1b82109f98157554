#include "pattern_matcher.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

PatternMatcher::PatternMatcher() {
    for (const char* name : {".git", ".svn", "node_modules", "__pycache__", "venv", "env",
                             "build", "dist", "target", ".idea", ".vscode", "bin", "obj"}) {
        addIgnoredDirectory(name);
    }
}

void PatternMatcher::addIgnoredDirectory(const std::string& name) {
    ignoredDirectories_.insert(name);
}

void PatternMatcher::addIgnorePattern(const std::string& pattern) {
    ignorePatterns_.push_back(compile(pattern));
}

void PatternMatcher::addIncludePattern(const std::string& pattern) {
    includePatterns_.push_back(compile(pattern));
}

void PatternMatcher::setIncludePatterns(const std::string& patternsStr) {
    includePatterns_.clear();
    for (const auto& pattern : splitPatternString(patternsStr)) {
        addIncludePattern(pattern);
    }
}

void PatternMatcher::setExcludePatterns(const std::string& patternsStr) {
    for (const auto& pattern : splitPatternString(patternsStr)) {
        addIgnorePattern(pattern);
    }
}

bool PatternMatcher::shouldProcess(const fs::path& relativePath) const {
    if (isIgnored(relativePath)) {
        return false;
    }
    return isIncluded(relativePath);
}

bool PatternMatcher::isIgnored(const fs::path& relativePath) const {
    // Any directory component on the ignore list hides everything below it
    fs::path parent = relativePath.parent_path();
    for (const auto& part : parent) {
        if (ignoredDirectories_.count(part.string()) > 0) {
            return true;
        }
    }

    return matchesAny(relativePath, ignorePatterns_);
}

bool PatternMatcher::isIncluded(const fs::path& relativePath) const {
    if (includePatterns_.empty()) {
        return true;
    }
    return matchesAny(relativePath, includePatterns_);
}

bool PatternMatcher::matchesAny(const fs::path& relativePath, const std::vector<CompiledPattern>& patterns) {
    const std::string pathStr = relativePath.generic_string();
    const std::string fileName = relativePath.filename().string();

    for (const auto& compiled : patterns) {
        const std::string& subject = compiled.matchFileName ? fileName : pathStr;
        if (std::regex_match(subject, compiled.regex)) {
            return true;
        }
    }
    return false;
}

PatternMatcher::CompiledPattern PatternMatcher::compile(const std::string& pattern) {
    CompiledPattern compiled;
    compiled.pattern = pattern;
    compiled.regex = patternToRegex(pattern);
    compiled.matchFileName = pattern.find('/') == std::string::npos;
    return compiled;
}

std::regex PatternMatcher::patternToRegex(const std::string& pattern) {
    std::string regexStr;

    for (size_t i = 0; i < pattern.size(); ++i) {
        const char c = pattern[i];

        if (c == '*') {
            if (i + 1 < pattern.size() && pattern[i + 1] == '*') {
                if (i + 2 < pattern.size() && pattern[i + 2] == '/') {
                    // **/ matches zero or more directories
                    regexStr += "(?:.*/)?";
                    i += 2;
                } else {
                    regexStr += ".*";
                    i++;
                }
            } else {
                regexStr += "[^/]*";
            }
        } else if (c == '?') {
            regexStr += "[^/]";
        } else if (c == '.' || c == '(' || c == ')' || c == '[' || c == ']' || c == '{' || c == '}' ||
                   c == '+' || c == '^' || c == '$' || c == '|' || c == '\\') {
            regexStr += '\\';
            regexStr += c;
        } else {
            regexStr += c;
        }
    }

    // A trailing '/' names a directory: match everything below it
    if (!pattern.empty() && pattern.back() == '/') {
        regexStr += ".*";
    }

    return std::regex(regexStr);
}

std::vector<std::string> PatternMatcher::splitPatternString(const std::string& patternsStr) {
    std::vector<std::string> patterns;
    std::stringstream ss(patternsStr);
    std::string pattern;

    while (std::getline(ss, pattern, ',')) {
        pattern.erase(pattern.begin(), std::find_if(pattern.begin(), pattern.end(),
            [](unsigned char ch) { return !std::isspace(ch); }));
        pattern.erase(std::find_if(pattern.rbegin(), pattern.rend(),
            [](unsigned char ch) { return !std::isspace(ch); }).base(), pattern.end());

        if (!pattern.empty()) {
            patterns.push_back(pattern);
        }
    }

    return patterns;
}
