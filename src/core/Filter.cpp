#include "Filter.hpp"
#include <algorithm>
#include <cctype>

// ExtensionFilter类的实现
ExtensionFilter::ExtensionFilter(const std::vector<std::string>& extensionList) {
    for (const auto& extension : extensionList) {
        addExtension(extension);
    }
}

std::string ExtensionFilter::normalize(const std::string& extension) {
    std::string normalized = extension;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (!normalized.empty() && normalized.front() != '.') {
        normalized.insert(normalized.begin(), '.');
    }
    return normalized;
}

void ExtensionFilter::addExtension(const std::string& extension) {
    if (!extension.empty()) {
        extensions.insert(normalize(extension));
    }
}

bool ExtensionFilter::removeExtension(const std::string& extension) {
    return extensions.erase(normalize(extension)) > 0;
}

bool ExtensionFilter::isExtensionIncluded(const std::string& extension) const {
    return extensions.find(normalize(extension)) != extensions.end();
}

bool ExtensionFilter::match(const Asset& asset) const {
    if (extensions.empty()) {
        return true;
    }
    std::string extension = fs::path(asset.getLogicalPath()).extension().string();
    if (extension.empty()) {
        return false;
    }
    return isExtensionIncluded(extension);
}

std::string ExtensionFilter::getFilterDescription() const {
    std::string desc = "Extension Filter: ";
    if (extensions.empty()) {
        desc += "all extensions";
        return desc;
    }
    bool first = true;
    for (const auto& extension : extensions) {
        if (!first) {
            desc += ", ";
        }
        desc += extension;
        first = false;
    }
    return desc;
}

// PatternFilter类的实现
PatternFilter::PatternFilter(const std::vector<std::string>& patterns) {
    for (const auto& pattern : patterns) {
        addExcludePattern(pattern);
    }
}

std::string PatternFilter::globToRegex(const std::string& glob) {
    std::string regex;
    for (size_t i = 0; i < glob.size(); ++i) {
        char c = glob[i];
        if (c == '*') {
            if (i + 1 < glob.size() && glob[i + 1] == '*') {
                // "**/" 匹配零个或多个完整路径段
                if (i + 2 < glob.size() && glob[i + 2] == '/') {
                    regex += "(?:.*/)?";
                    i += 2;
                } else {
                    regex += ".*";
                    i += 1;
                }
            } else {
                regex += "[^/]*";
            }
        } else if (c == '?') {
            regex += "[^/]";
        } else if (std::string("\\^$.|+()[]{}").find(c) != std::string::npos) {
            regex += '\\';
            regex += c;
        } else {
            regex += c;
        }
    }
    return regex;
}

void PatternFilter::addExcludePattern(const std::string& pattern) {
    if (pattern.empty()) {
        return;
    }
    // 不含 '/' 的模式匹配任意目录下的文件名
    std::string regex = globToRegex(pattern);
    if (pattern.find('/') == std::string::npos) {
        regex = "(?:.*/)?" + regex;
    }
    excludePatterns.emplace_back(regex);
    excludePatternStrings.push_back(pattern);
}

bool PatternFilter::removeExcludePattern(const std::string& pattern) {
    auto it = std::find(excludePatternStrings.begin(), excludePatternStrings.end(), pattern);
    if (it == excludePatternStrings.end()) {
        return false;
    }
    size_t index = static_cast<size_t>(it - excludePatternStrings.begin());
    excludePatternStrings.erase(it);
    excludePatterns.erase(excludePatterns.begin() + static_cast<long>(index));
    return true;
}

void PatternFilter::clearExcludePatterns() {
    excludePatterns.clear();
    excludePatternStrings.clear();
}

bool PatternFilter::isExcluded(const std::string& logicalPath) const {
    for (const auto& pattern : excludePatterns) {
        if (std::regex_match(logicalPath, pattern)) {
            return true;
        }
    }
    return false;
}

bool PatternFilter::match(const Asset& asset) const {
    return !isExcluded(asset.getLogicalPath());
}

std::string PatternFilter::getFilterDescription() const {
    std::string desc = "Pattern Filter: Excluded Patterns (" +
        std::to_string(excludePatternStrings.size()) + "): ";
    for (size_t i = 0; i < excludePatternStrings.size(); ++i) {
        desc += excludePatternStrings[i];
        if (i < excludePatternStrings.size() - 1) {
            desc += ", ";
        }
    }
    return desc;
}
