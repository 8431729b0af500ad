#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "ojcore/language/language_spec.hpp"

namespace ojcore {

/**
 * @brief 将语言标识符规范化：去掉首尾空白并转为小写
 * 纯函数，不依赖注册表
 */
std::string normalize_language_id(const std::string &identifier);

/**
 * @brief 语言注册表
 * 保存评测系统支持的所有语言，以及别名到规范标识符的映射。
 * 注册表在构造完成之后只读，因此可以被多个评测线程同时访问。
 */
struct language_registry {
    language_registry() = default;

    /**
     * @brief 用一组语言描述构造注册表
     * @throw configuration_error 如果语言标识符或别名重复、或者语言缺少运行命令
     */
    explicit language_registry(const std::vector<language_spec> &languages);

    /**
     * @brief 只包含内置语言的注册表
     */
    static language_registry builtin();

    /**
     * @brief 查找语言标识符（或别名）对应的规范标识符，大小写不敏感
     * @return 找不到时返回空
     */
    std::optional<std::string> canonical_id(const std::string &identifier) const;

    /**
     * @brief 查找语言标识符（或别名）对应的语言描述
     * @throw not_supported_error 如果注册表中没有这门语言
     */
    const language_spec &resolve(const std::string &identifier) const;

    bool supports(const std::string &identifier) const;

    /**
     * @brief 所有语言的规范标识符，按字典序排列
     */
    std::vector<std::string> identifiers() const;

    /**
     * @brief 所有语言使用的沙箱镜像，去重
     */
    std::set<std::string> images() const;

    /**
     * @brief 返回一个只包含指定语言的注册表
     * 无法识别的语言会被忽略并打印警告
     */
    language_registry restrict_to(const std::vector<std::string> &supported) const;

    bool empty() const;

private:
    std::map<std::string, language_spec> languages;
    std::map<std::string, std::string> aliases;
};

}  // namespace ojcore
