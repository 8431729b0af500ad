#include "ojcore/judge/judge_engine.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include <boost/algorithm/string/trim.hpp>
#include "ojcore/common/exceptions.hpp"

namespace ojcore {
using namespace std;

double judge_verdict::score() const {
    if (total_tests == 0) return 0;
    return 100.0 * passed_tests / total_tests;
}

int judge_verdict::points_earned() const {
    int sum = 0;
    for (auto &result : results)
        if (result.result == status::ACCEPTED) sum += result.points;
    return sum;
}

status classify(const execution_outcome &outcome, const string &expected_output) {
    switch (outcome.reason) {
        case termination::TIME_LIMIT:
            return status::TIME_LIMIT_EXCEEDED;
        case termination::COMPILATION_FAILED:
            return status::COMPILATION_ERROR;
        case termination::SYSTEM_FAILURE:
            // 评测系统自身的故障不能算作选手程序的运行错误
            return status::ERROR;
        default:
            break;
    }

    if (outcome.success) {
        if (boost::algorithm::trim_copy(outcome.stdout_text) == boost::algorithm::trim_copy(expected_output))
            return status::ACCEPTED;
        return status::WRONG_ANSWER;
    }
    if (!outcome.stderr_text.empty())
        return status::RUNTIME_ERROR;
    return status::ERROR;
}

judge_engine::judge_engine(const language_registry &registry, const resource_limit_resolver &resolver, const security_validator &validator, const executor &exec)
    : registry(registry), resolver(resolver), validator(validator), exec(exec) {}

const executor &judge_engine::get_executor() const {
    return exec;
}

judge_verdict judge_engine::judge(const string &source, const string &language_id, const vector<test_case> &test_cases, const problem_overrides &overrides) const {
    const language_spec &language = registry.resolve(language_id);

    if (!exec.available())
        throw judge_unavailable_error(fmt::format("Executor '{}' is unavailable", exec.name()));

    validation_result validation = validator.validate(source, language);
    if (!validation.accepted)
        throw validation_error(validation.reason);

    // 资源限制对一次提交只计算一次
    resource_limits limits = resolver.resolve(language, overrides);

    judge_verdict verdict;
    verdict.total_tests = test_cases.size();
    for (auto &tc : test_cases) verdict.total_points += tc.points;

    LOG(INFO) << "Judging " << language.id << " submission with " << test_cases.size() << " test cases on "
              << exec.name() << " executor, time limit " << limits.time_limit << "s, memory limit " << limits.memory_limit;

    bool failed = false;
    for (auto &tc : test_cases) {
        execution_outcome outcome = exec.run(source, language.id, tc.input, limits);
        status result = classify(outcome, tc.expected_output);

        verdict.max_time = max(verdict.max_time, outcome.elapsed);
        if (result == status::ACCEPTED)
            ++verdict.passed_tests;
        else if (!failed) {
            // 第一个没有通过的测试数据决定提交的结果，之后的结果不会覆盖它
            verdict.overall = result;
            failed = true;
        }

        test_case_result record;
        record.test_case_id = tc.id;
        record.ordinal = tc.ordinal;
        record.result = result;
        record.expected_output = tc.expected_output;
        record.points = tc.points;

        if (result == status::COMPILATION_ERROR) {
            // 编译结果对所有测试数据都一样，不再运行剩下的测试数据
            verdict.overall = status::COMPILATION_ERROR;
            verdict.compilation_error = outcome.stderr_text;
            record.outcome = move(outcome);
            verdict.results.push_back(move(record));
            LOG(INFO) << "Compilation error, skipping remaining test cases";
            break;
        }

        DLOG(INFO) << "Test case " << tc.id << ": " << get_status_name(result);
        record.outcome = move(outcome);
        verdict.results.push_back(move(record));
    }

    LOG(INFO) << "Judged " << language.id << " submission: " << get_status_name(verdict.overall) << ", "
              << verdict.passed_tests << "/" << verdict.total_tests << " passed";
    return verdict;
}

}  // namespace ojcore
