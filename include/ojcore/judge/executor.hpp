#pragma once

#include <string>
#include "ojcore/judge/resource_limits.hpp"

namespace ojcore {

/**
 * @brief 执行器结束选手程序的方式
 */
enum class termination {
    /**
     * @brief 选手程序自行退出（无论返回值是否为 0）
     */
    EXITED,

    /**
     * @brief 选手程序超出时间限制被杀死
     */
    TIME_LIMIT,

    /**
     * @brief 编译失败或者编译超时，选手程序没有运行
     */
    COMPILATION_FAILED,

    /**
     * @brief 评测系统自身的问题导致选手程序无法运行，比如解释器不存在、容器创建失败
     */
    SYSTEM_FAILURE
};

const char *get_termination_name(termination reason);

/**
 * @brief 一次运行的结果，创建后不再修改
 */
struct execution_outcome {
    std::string stdout_text;

    std::string stderr_text;

    /**
     * @brief 运行的时钟时间，单位为秒
     * 超时的情况下为时间限制，而不是实际运行时间
     */
    double elapsed = 0;

    /**
     * @brief 选手程序是否正常退出且返回值为 0
     */
    bool success = false;

    termination reason = termination::EXITED;

    int exit_code = -1;

    /**
     * @brief 评测系统自身出错时的结果：stdout 为空，stderr 为错误信息，运行时间为 0
     */
    static execution_outcome failure(const std::string &message);

    /**
     * @brief 超出时间限制的结果，运行时间等于时间限制
     */
    static execution_outcome time_limit_exceeded(int time_limit);

    /**
     * @brief 编译失败的结果，stderr 为编译器的输出
     */
    static execution_outcome compilation_failed(const std::string &error_log);
};

/**
 * @brief 执行器，编译并运行一份选手代码
 * 本地执行器和沙箱执行器是这个接口的两种实现，评测引擎不区分二者。
 * 实现必须是线程安全的：不同的评测线程会同时调用 run。
 */
struct executor {
    virtual ~executor();

    /**
     * @brief 执行器的名字，比如 local、sandbox
     */
    virtual std::string name() const = 0;

    /**
     * @brief 执行器当前是否可用
     * 比如沙箱执行器在无法连接容器运行时的时候不可用
     */
    virtual bool available() const = 0;

    /**
     * @brief 编译并运行选手代码
     * 选手代码导致的问题以及评测系统内部的错误都通过返回值报告，这个函数不抛出异常。
     * @param source 选手代码
     * @param language 语言标识符，可以是别名
     * @param input 喂给选手程序 stdin 的数据
     * @param limits 资源限制
     */
    virtual execution_outcome run(const std::string &source, const std::string &language, const std::string &input, const resource_limits &limits) const = 0;
};

}  // namespace ojcore
