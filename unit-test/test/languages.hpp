#pragma once

#include "ojcore/config.hpp"
#include "ojcore/language/language_registry.hpp"

/**
 * 测试用的语言
 * 只依赖 /bin/sh，在任何 POSIX 系统上都可以运行
 */
namespace ojcore::test {

/**
 * @brief 解释型语言 shell，运行命令为 sh {file}
 */
language_spec shell_language();

/**
 * @brief 需要编译的语言 shellc
 * 编译时用 sh -n 检查语法并把源代码复制到 {output}，运行命令为 sh {output}
 */
language_spec compiled_shell_language();

/**
 * @brief 包含 shell、shellc 和所有内置语言的注册表
 */
language_registry test_registry();

/**
 * @brief 测试用的配置，shell 和 shellc 的时间限制为 1 秒
 */
judge_config test_config();

/**
 * @brief 在 PATH 中查找程序，找不到时测试应当跳过
 */
bool has_program(const std::string &program);

}  // namespace ojcore::test
