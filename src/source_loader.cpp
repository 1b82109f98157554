#include "source_loader.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace {

std::string lowerExtension(const fs::path& filePath) {
    std::string ext = filePath.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
    return ext;
}

} // namespace

SourceLoader::SourceLoader(const PatternMatcher& patternMatcher, uintmax_t maxFileSize)
    : patternMatcher_(patternMatcher), maxFileSize_(maxFileSize) {
}

std::string SourceLoader::detectLanguage(const fs::path& filePath) {
    static const std::unordered_map<std::string, std::string> languageMap = {
        {".py", "Python"},
        {".java", "Java"},
        {".js", "JavaScript"},
        {".jsx", "JavaScript"},
        {".ts", "TypeScript"},
        {".tsx", "TypeScript"},
        {".c", "C"},
        {".cpp", "C++"},
        {".cc", "C++"},
        {".h", "C/C++"},
        {".hpp", "C++"},
        {".go", "Go"},
        {".rs", "Rust"},
        {".rb", "Ruby"},
        {".php", "PHP"},
        {".html", "HTML"},
        {".css", "CSS"},
        {".scss", "SCSS"},
        {".json", "JSON"},
        {".xml", "XML"},
        {".yaml", "YAML"},
        {".yml", "YAML"},
        {".md", "Markdown"},
        {".sh", "Shell"}
    };

    auto it = languageMap.find(lowerExtension(filePath));
    return it != languageMap.end() ? it->second : "Unknown";
}

bool SourceLoader::isSupportedExtension(const fs::path& filePath) {
    static const std::unordered_set<std::string> supported = {
        ".py", ".java", ".js", ".jsx", ".ts", ".tsx",
        ".c", ".cpp", ".cc", ".h", ".hpp",
        ".go", ".rs", ".rb", ".php",
        ".html", ".css", ".scss", ".sass",
        ".json", ".xml", ".yaml", ".yml",
        ".md", ".txt", ".sh", ".bat"
    };
    return supported.count(lowerExtension(filePath)) > 0;
}

size_t SourceLoader::countLines(const std::string& content) {
    size_t count = std::count(content.begin(), content.end(), '\n');
    if (!content.empty() && content.back() != '\n') {
        ++count;
    }
    return count;
}

std::vector<FileRecord> SourceLoader::loadDirectory(const fs::path& root) const {
    if (!fs::exists(root) || !fs::is_directory(root)) {
        throw std::runtime_error("Invalid directory: " + root.string());
    }

    std::vector<fs::path> candidates;
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(root, fs::directory_options::skip_permission_denied, ec);
         it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            std::cerr << "Warning: Error scanning " << root << ": " << ec.message() << std::endl;
            break;
        }
        if (!it->is_regular_file()) {
            continue;
        }

        fs::path relative = it->path().lexically_relative(root);
        if (patternMatcher_.shouldProcess(relative) && isSupportedExtension(it->path())) {
            candidates.push_back(it->path());
        }
    }

    // Directory iteration order is unspecified; sort for reproducible runs
    std::sort(candidates.begin(), candidates.end());
    return loadFiles(candidates);
}

std::vector<FileRecord> SourceLoader::loadFiles(const std::vector<fs::path>& paths) const {
    std::vector<FileRecord> records;
    records.reserve(paths.size());

    for (const auto& path : paths) {
        try {
            if (!fs::is_regular_file(path)) {
                std::cerr << "Warning: Skipping " << path << ": not a regular file" << std::endl;
                continue;
            }
            if (!withinSizeLimit(path)) {
                std::cerr << "Warning: Skipping " << path << ": larger than " << maxFileSize_ << " bytes" << std::endl;
                continue;
            }
            records.push_back(loadFile(path));
        } catch (const std::exception& e) {
            std::cerr << "Warning: Failed to load file " << path << ": " << e.what() << std::endl;
        }
    }

    return records;
}

FileRecord SourceLoader::loadFile(const fs::path& filePath) const {
    FileRecord record;
    record.path = filePath.string();
    record.name = filePath.filename().string();
    record.language = detectLanguage(filePath);
    record.content = readFile(filePath);
    record.lineCount = countLines(record.content);
    return record;
}

bool SourceLoader::withinSizeLimit(const fs::path& filePath) const {
    std::error_code ec;
    uintmax_t size = fs::file_size(filePath, ec);
    if (ec) {
        throw std::runtime_error("Error getting file size: " + ec.message());
    }
    return size <= maxFileSize_;
}

std::string SourceLoader::readFile(const fs::path& filePath) const {
    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + filePath.string());
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error("Failed to read file: " + filePath.string());
    }
    return buffer.str();
}
