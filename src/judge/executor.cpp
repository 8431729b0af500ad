#include "ojcore/judge/executor.hpp"

namespace ojcore {
using namespace std;

const char *get_termination_name(termination reason) {
    switch (reason) {
        case termination::EXITED: return "EXITED";
        case termination::TIME_LIMIT: return "TIME_LIMIT";
        case termination::COMPILATION_FAILED: return "COMPILATION_FAILED";
        case termination::SYSTEM_FAILURE: return "SYSTEM_FAILURE";
    }
    return "UNKNOWN";
}

execution_outcome execution_outcome::failure(const string &message) {
    execution_outcome outcome;
    outcome.stderr_text = message;
    outcome.elapsed = 0;
    outcome.success = false;
    outcome.reason = termination::SYSTEM_FAILURE;
    return outcome;
}

execution_outcome execution_outcome::time_limit_exceeded(int time_limit) {
    execution_outcome outcome;
    outcome.stderr_text = "Time limit exceeded";
    outcome.elapsed = time_limit;
    outcome.success = false;
    outcome.reason = termination::TIME_LIMIT;
    return outcome;
}

execution_outcome execution_outcome::compilation_failed(const string &error_log) {
    execution_outcome outcome;
    outcome.stderr_text = error_log;
    outcome.success = false;
    outcome.reason = termination::COMPILATION_FAILED;
    return outcome;
}

executor::~executor() = default;

}  // namespace ojcore
