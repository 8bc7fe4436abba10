#pragma once
#include <string>
#include <vector>
#include <set>
#include <regex>
#include "models/Asset.hpp"

// 资产过滤器：决定哪些资产参与自动备份
class AssetFilter {
public:
    virtual ~AssetFilter() = default;
    virtual bool match(const Asset& asset) const = 0;

    virtual std::string getFilterDescription() const = 0;
};

// 扩展名白名单，大小写不敏感，可带或不带前导点
class ExtensionFilter : public AssetFilter {
private:
    std::set<std::string> extensions;

    static std::string normalize(const std::string& extension);

public:
    ExtensionFilter() = default;
    explicit ExtensionFilter(const std::vector<std::string>& extensionList);

    void addExtension(const std::string& extension);
    bool removeExtension(const std::string& extension);
    bool isExtensionIncluded(const std::string& extension) const;
    const std::set<std::string>& getExtensions() const {
        return this->extensions;
    }

    // 列表为空时匹配所有资产
    bool match(const Asset& asset) const override;

    std::string getFilterDescription() const override;
};

// 按逻辑路径排除：* 匹配单个路径段内的字符，** 跨越路径段，? 匹配单个字符
class PatternFilter : public AssetFilter {
private:
    std::vector<std::regex> excludePatterns;
    std::vector<std::string> excludePatternStrings;

public:
    PatternFilter() = default;
    explicit PatternFilter(const std::vector<std::string>& patterns);

    void addExcludePattern(const std::string& pattern);
    bool removeExcludePattern(const std::string& pattern);
    void clearExcludePatterns();
    const std::vector<std::string>& getExcludePatterns() const {
        return this->excludePatternStrings;
    }

    bool isExcluded(const std::string& logicalPath) const;

    bool match(const Asset& asset) const override;

    std::string getFilterDescription() const override;

    static std::string globToRegex(const std::string& glob);
};
