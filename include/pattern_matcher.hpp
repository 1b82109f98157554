#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <regex>
#include <unordered_set>

namespace fs = std::filesystem;

// Decides which files under a source tree are loaded for analysis.
// Paths are matched relative to the tree root, with '/' separators.
class PatternMatcher {
public:
    // Ignores the usual VCS, dependency and build directories
    PatternMatcher();

    // Ignore any path that has a directory with this exact name
    void addIgnoredDirectory(const std::string& name);

    // Glob patterns: '*' and '?' stay within one path segment, '**' spans
    // directories. A pattern without '/' is matched against the file name.
    void addIgnorePattern(const std::string& pattern);
    void addIncludePattern(const std::string& pattern);

    // Comma-separated pattern lists, e.g. "*.py,src/**/*.js"
    void setIncludePatterns(const std::string& patternsStr);
    void setExcludePatterns(const std::string& patternsStr);

    // Not ignored, and included when include patterns are set
    bool shouldProcess(const fs::path& relativePath) const;

    bool isIgnored(const fs::path& relativePath) const;
    bool isIncluded(const fs::path& relativePath) const;

    bool hasIncludePatterns() const { return !includePatterns_.empty(); }

private:
    struct CompiledPattern {
        std::string pattern;
        std::regex regex;
        bool matchFileName;     // Pattern has no '/', compare against the file name only
    };

    std::unordered_set<std::string> ignoredDirectories_;
    std::vector<CompiledPattern> ignorePatterns_;
    std::vector<CompiledPattern> includePatterns_;

    static CompiledPattern compile(const std::string& pattern);
    static std::regex patternToRegex(const std::string& pattern);
    static std::vector<std::string> splitPatternString(const std::string& patternsStr);
    static bool matchesAny(const fs::path& relativePath, const std::vector<CompiledPattern>& patterns);
};
