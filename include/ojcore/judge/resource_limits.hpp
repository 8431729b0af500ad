#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include "ojcore/config.hpp"
#include "ojcore/language/language_spec.hpp"

namespace ojcore {

/**
 * @brief 将内存限制字符串转换为字节数
 * 后缀 k, m, g 分别表示 1024, 1024^2, 1024^3，大小写不敏感；没有后缀表示字节数。
 * 比如 "128m" 为 134217728，"1g" 为 1073741824，"512" 为 512。
 * @throw configuration_error 如果字符串格式不正确，或者值为 0
 */
int64_t parse_memory_limit(const std::string &text);

/**
 * @brief 选手程序的内存限制下限，Docker 不接受低于 6MB 的 --memory
 */
const int64_t MIN_MEMORY_LIMIT = 6 * 1024 * 1024;

/**
 * @brief 解析选手程序的内存限制
 * @throw configuration_error 如果字符串格式不正确，或者小于 MIN_MEMORY_LIMIT
 */
int64_t parse_program_memory_limit(const std::string &text);

/**
 * @brief 一次评测的资源限制
 * 在评测开始前由 resource_limit_resolver 计算一次，之后不再修改
 */
struct resource_limits {
    /**
     * @brief 运行时间限制，单位为秒，至少为 1
     */
    int time_limit = 5;

    /**
     * @brief 内存限制，单位为字节
     */
    int64_t memory_limit = 128 * 1024 * 1024;

    /**
     * @brief 编译时间限制，单位为秒，解释型语言没有编译时间限制
     */
    std::optional<int> compile_timeout;

    int64_t max_source_size = 65536;

    int64_t max_output_size = 1024 * 1024;

    /**
     * @brief 选手程序能写入的单个文件的最大大小，单位为字节
     */
    int64_t max_file_size = 10 * 1024 * 1024;
};

/**
 * @brief 题目对资源限制的覆盖
 */
struct problem_overrides {
    /**
     * @brief 题目的时间限制，单位为秒，不大于 0 视为没有设置
     */
    std::optional<int> time_limit;

    /**
     * @brief 题目的内存限制，比如 256m
     */
    std::optional<std::string> memory_limit;
};

/**
 * @brief 计算资源限制
 * 优先级从高到低：题目的限制，语言的默认限制，全局默认限制
 */
struct resource_limit_resolver {
    explicit resource_limit_resolver(const judge_config &config);

    int resolve_time_limit(const language_spec &language, std::optional<int> problem_override = std::nullopt) const;

    /**
     * @throw configuration_error 如果某一级的内存限制字符串格式不正确
     */
    int64_t resolve_memory_limit(const language_spec &language, const std::optional<std::string> &problem_override = std::nullopt) const;

    /**
     * @return 语言不需要编译时返回空
     */
    std::optional<int> resolve_compile_timeout(const language_spec &language) const;

    resource_limits resolve(const language_spec &language, const problem_overrides &overrides = {}) const;

private:
    const language_limits *find_limits(const language_spec &language) const;

    int default_time_limit;
    std::string default_memory_limit;
    int default_compile_timeout;
    int64_t max_source_size;
    int64_t max_output_size;
    int64_t max_file_size;

    // 键为规范标识符
    std::map<std::string, language_limits> limits;
};

}  // namespace ojcore
