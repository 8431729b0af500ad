#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

namespace ojcore {

struct judge_exception : std::exception {
    judge_exception();
    explicit judge_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const judge_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统不支持该编程语言
 * 语言标识符（包括别名）无法在语言注册表中找到时抛出
 */
struct not_supported_error : public judge_exception {
    explicit not_supported_error(const std::string &language);

    const std::string language;
};

/**
 * @brief 表示选手提交在运行前就被拒绝
 * 比如代码过长、包含被禁止的 import 或者危险调用。
 * reason 是返回给调用方的结构化原因，提交不会被部分执行。
 */
struct validation_error : public judge_exception {
    explicit validation_error(const std::string &reason);

    const std::string reason;
};

/**
 * @brief 表示配置错误
 * 比如内存限制字符串格式不正确、配置文件格式不正确
 */
struct configuration_error : public judge_exception {
    configuration_error();
    explicit configuration_error(const std::string &message);
};

/**
 * @brief 表示评测系统的基础设施错误
 * 一般是容器运行时（Docker）出错，或者无法创建临时文件
 */
struct infrastructure_error : public judge_exception {
    infrastructure_error();
    explicit infrastructure_error(const std::string &message);
};

/**
 * @brief 表示当前选择的评测后端完全不可用
 * 评测引擎会抛出这个异常，而不是把评测后端的故障误报成选手代码的错误。
 */
struct judge_unavailable_error : public infrastructure_error {
    explicit judge_unavailable_error(const std::string &message);
};

/**
 * @brief 表示选手程序编译错误
 * 只在执行器内部使用，执行器会把它转换成 COMPILATION_ERROR 的执行结果
 */
struct compilation_error : public std::runtime_error {
    explicit compilation_error(const std::string &what, const std::string &error_log);

    const std::string error_log;
};

}  // namespace ojcore
