#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "analysis_types.hpp"
#include "pattern_matcher.hpp"

namespace fs = std::filesystem;

// Builds FileRecords from a source tree or an explicit file list for the
// command-line driver. No encoding detection is performed: content is read
// as raw bytes.
class SourceLoader {
public:
    static constexpr uintmax_t kDefaultMaxFileSize = 10 * 1024 * 1024; // 10 MiB

    explicit SourceLoader(const PatternMatcher& patternMatcher, uintmax_t maxFileSize = kDefaultMaxFileSize);

    // Load every supported, non-ignored file below root, sorted by path.
    // Throws std::runtime_error if root is not a directory.
    std::vector<FileRecord> loadDirectory(const fs::path& root) const;

    // Load an ad-hoc set of files. Missing, oversized or unreadable files are
    // reported and skipped.
    std::vector<FileRecord> loadFiles(const std::vector<fs::path>& paths) const;

    // Read one file. Throws std::runtime_error when it cannot be read.
    FileRecord loadFile(const fs::path& filePath) const;

    // Language label for a file extension, "Unknown" when unmapped
    static std::string detectLanguage(const fs::path& filePath);

    static bool isSupportedExtension(const fs::path& filePath);

    // Newline count, plus one for a final line without a trailing newline
    static size_t countLines(const std::string& content);

private:
    const PatternMatcher& patternMatcher_;
    uintmax_t maxFileSize_;

    bool withinSizeLimit(const fs::path& filePath) const;
    std::string readFile(const fs::path& filePath) const;
};
