#pragma once

#include <fmt/core.h>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fmt {
template <>
struct formatter<std::filesystem::path> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const std::filesystem::path &p, FormatContext &ctx) const {
        return format_to(ctx.out(), "{}", p.string());
    }
};
}  // namespace fmt

namespace ojcore {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 根据 key 来查找环境变量
 * @return 环境变量的值，不存在时返回空
 */
std::optional<std::string> get_env(const std::string &key);

/**
 * @brief 在 PATH 中查找可执行文件，相当于 which 命令
 * @param program 程序名，如果包含 '/' 则直接检查该路径
 * @return 可执行文件的完整路径，找不到时返回空
 */
std::optional<std::filesystem::path> find_executable(const std::string &program);

/**
 * @brief 按逗号切分字符串，并去掉每一项的首尾空白字符，忽略空项
 */
std::vector<std::string> split_list(const std::string &text);

/**
 * @brief 计时器，从构造时开始计时
 * 使用 steady_clock，不受系统时间调整影响
 */
struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

    /**
     * @brief 经过的时间，单位为秒
     */
    double seconds() const;

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace ojcore
