#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "ojcore/common/status.hpp"
#include "ojcore/judge/judge_engine.hpp"

namespace ojcore {

/**
 * @brief 一次提交，由调用方持有
 * 生命周期：PENDING -> JUDGING -> 终止状态，
 * 终止状态为 ACCEPTED, WRONG_ANSWER, TIME_LIMIT_EXCEEDED, RUNTIME_ERROR, COMPILATION_ERROR, ERROR 之一。
 * 进入终止状态之后不会再改变。
 */
struct submission {
    std::string sub_id;

    std::string prob_id;

    std::string language;

    std::string source;

    std::vector<test_case> test_cases;

    problem_overrides overrides;

    /**
     * @brief 提交当前的状态
     */
    status state = status::PENDING;

    /**
     * @brief 评测结果，评测完成后才有值
     */
    std::optional<judge_verdict> verdict;

    /**
     * @brief 提交没有被评测的原因，比如没有通过安全检查、语言不受支持、评测后端不可用
     */
    std::string error;

    /**
     * @brief 开始评测，PENDING -> JUDGING
     * @throw std::logic_error 如果当前状态不是 PENDING
     */
    void begin_judging();

    /**
     * @brief 完成评测，JUDGING -> 评测结果的状态
     * @throw std::logic_error 如果当前状态不是 JUDGING
     */
    void finish(judge_verdict result);

    /**
     * @brief 评测没有完成，JUDGING -> ERROR
     * @throw std::logic_error 如果当前状态不是 JUDGING
     */
    void fail(const std::string &reason);
};

void from_json(const nlohmann::json &j, test_case &tc);

void to_json(nlohmann::json &j, const execution_outcome &outcome);

void to_json(nlohmann::json &j, const test_case_result &result);

void to_json(nlohmann::json &j, const judge_verdict &verdict);

/**
 * @brief 读取提交记录：id, problemId, language, source, testCases, timeLimit, memoryLimit
 */
void from_json(const nlohmann::json &j, submission &submit);

void to_json(nlohmann::json &j, const submission &submit);

}  // namespace ojcore
