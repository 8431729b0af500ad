#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <vector>
#include "ojcore/config.hpp"
#include "ojcore/language/language_spec.hpp"

namespace ojcore {

/**
 * @brief 源代码检查的结果
 */
struct validation_result {
    bool accepted = true;

    /**
     * @brief 拒绝的原因，通过检查时为空
     */
    std::string reason;

    static validation_result accept();
    static validation_result reject(const std::string &reason);
};

/**
 * @brief 在运行选手程序之前对源代码进行静态检查
 * 1. 源代码长度不能超过限制
 * 2. 对于 Python 这类动态语言，不能导入被禁止的模块（按 "import X" 和 "from X" 子串匹配）
 * 3. 不能包含被禁止的代码片段（大小写不敏感的子串匹配，对所有语言生效）
 * 4. 对于 Java 这类语言，必须包含一个 public class
 *
 * 这只是语法层面的匹配，可以通过别名、字符串拼接或者反射绕过，
 * 选手程序的隔离由沙箱执行器负责。
 */
struct security_validator {
    security_validator(const security_config &config, int64_t max_source_size);

    validation_result validate(const std::string &source, const language_spec &language) const;

private:
    bool should_scan_imports(const language_spec &language) const;

    std::vector<std::string> blocked_imports;
    std::vector<std::string> blocked_patterns;  // 已转为小写
    std::set<std::string> import_scan_languages;
    int64_t max_source_size;
};

}  // namespace ojcore
