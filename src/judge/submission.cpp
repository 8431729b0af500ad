#include "ojcore/judge/submission.hpp"
#include <fmt/core.h>
#include <stdexcept>

namespace ojcore {
using namespace std;
using namespace nlohmann;

void submission::begin_judging() {
    if (state != status::PENDING)
        throw logic_error(fmt::format("Submission {} cannot start judging in state {}", sub_id, get_status_name(state)));
    state = status::JUDGING;
}

void submission::finish(judge_verdict result) {
    if (state != status::JUDGING)
        throw logic_error(fmt::format("Submission {} cannot finish in state {}", sub_id, get_status_name(state)));
    state = result.overall;
    verdict = move(result);
}

void submission::fail(const string &reason) {
    if (state != status::JUDGING)
        throw logic_error(fmt::format("Submission {} cannot fail in state {}", sub_id, get_status_name(state)));
    state = status::ERROR;
    error = reason;
}

void from_json(const json &j, test_case &tc) {
    j.at("input").get_to(tc.input);
    j.at("expectedOutput").get_to(tc.expected_output);
    if (j.count("id"))
        j.at("id").get_to(tc.id);
    if (j.count("ordinal"))
        j.at("ordinal").get_to(tc.ordinal);
    if (j.count("isSample"))
        j.at("isSample").get_to(tc.is_sample);
    if (j.count("points"))
        j.at("points").get_to(tc.points);
}

void to_json(json &j, const execution_outcome &outcome) {
    j = {{"stdout", outcome.stdout_text},
         {"stderr", outcome.stderr_text},
         {"elapsed", outcome.elapsed},
         {"success", outcome.success},
         {"termination", get_termination_name(outcome.reason)},
         {"exitCode", outcome.exit_code}};
}

void to_json(json &j, const test_case_result &result) {
    j = {{"testCaseId", result.test_case_id},
         {"ordinal", result.ordinal},
         {"status", get_status_name(result.result)},
         {"executionTime", result.outcome.elapsed},
         {"actualOutput", result.outcome.stdout_text},
         {"expectedOutput", result.expected_output},
         {"errorMessage", result.outcome.stderr_text},
         {"points", result.points}};
}

void to_json(json &j, const judge_verdict &verdict) {
    j = {{"status", get_status_name(verdict.overall)},
         {"passedTests", verdict.passed_tests},
         {"totalTests", verdict.total_tests},
         {"score", verdict.score()},
         {"maxTime", verdict.max_time},
         {"pointsEarned", verdict.points_earned()},
         {"totalPoints", verdict.total_points},
         {"results", verdict.results}};
    if (verdict.compilation_error)
        j["compilationError"] = *verdict.compilation_error;
    else
        j["compilationError"] = nullptr;
}

void from_json(const json &j, submission &submit) {
    j.at("id").get_to(submit.sub_id);
    j.at("language").get_to(submit.language);
    j.at("source").get_to(submit.source);
    if (j.count("problemId"))
        j.at("problemId").get_to(submit.prob_id);
    if (j.count("testCases"))
        j.at("testCases").get_to(submit.test_cases);
    if (j.count("timeLimit") && !j.at("timeLimit").is_null())
        submit.overrides.time_limit = j.at("timeLimit").get<int>();
    if (j.count("memoryLimit") && !j.at("memoryLimit").is_null())
        submit.overrides.memory_limit = j.at("memoryLimit").get<string>();

    // 没有显式给出顺序的测试数据按出现的顺序编号
    for (size_t i = 0; i < submit.test_cases.size(); ++i) {
        auto &tc = submit.test_cases[i];
        if (!j.at("testCases").at(i).count("ordinal")) tc.ordinal = i;
        if (!j.at("testCases").at(i).count("id")) tc.id = (int)i + 1;
    }
}

void to_json(json &j, const submission &submit) {
    j = {{"id", submit.sub_id},
         {"problemId", submit.prob_id},
         {"language", submit.language},
         {"status", get_status_name(submit.state)}};
    if (submit.verdict)
        j["verdict"] = *submit.verdict;
    else
        j["verdict"] = nullptr;
    if (!submit.error.empty())
        j["error"] = submit.error;
}

}  // namespace ojcore
