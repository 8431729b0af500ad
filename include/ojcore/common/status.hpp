#pragma once

#include <string>

namespace ojcore {

/**
 * @brief 表示数据点或整个提交的评测结果
 * PENDING 和 JUDGING 只用于提交的生命周期，数据点的评测结果一定是终止状态之一。
 */
enum class status {
    /**
     * @brief 提交正在等待评测，评测引擎还未被调用
     */
    PENDING = 0,

    /**
     * @brief 评测引擎正在评测该提交
     */
    JUDGING = 1,

    /**
     * @brief 程序正常退出，且去掉首尾空白字符后的输出和标准输出完全一致
     */
    ACCEPTED = 2,

    /**
     * @brief 程序正常退出，但输出和标准输出不一致
     */
    WRONG_ANSWER = 3,

    /**
     * @brief 程序运行时间超出限制
     * 执行器按时钟时间强制结束程序
     */
    TIME_LIMIT_EXCEEDED = 4,

    /**
     * @brief 程序非正常退出且有错误输出
     */
    RUNTIME_ERROR = 5,

    /**
     * @brief 程序编译错误
     * 同一个提交的编译结果对所有数据点都相同，因此出现编译错误后不再评测后续数据点
     */
    COMPILATION_ERROR = 6,

    /**
     * @brief 程序非正常退出且没有任何错误输出，无法分类的失败
     */
    ERROR = 7
};

const char *get_display_message(status);

/**
 * @brief 状态的标识符，比如 TIME_LIMIT_EXCEEDED，用于序列化
 */
const char *get_status_name(status);

/**
 * @brief 根据标识符解析状态
 * @throw std::invalid_argument 如果标识符不存在
 */
status parse_status(const std::string &name);

/**
 * @brief 状态是否是终止状态（除了 PENDING 和 JUDGING 之外的状态）
 */
bool is_terminal(status);

}  // namespace ojcore
