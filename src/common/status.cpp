#include "ojcore/common/status.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace ojcore {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::PENDING, "Pending")
    (status::JUDGING, "Judging")
    (status::ACCEPTED, "Accepted")
    (status::WRONG_ANSWER, "Wrong Answer")
    (status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (status::RUNTIME_ERROR, "Runtime Error")
    (status::COMPILATION_ERROR, "Compilation Error")
    (status::ERROR, "System Error");

static const unordered_map<status, const char *> status_name = boost::assign::map_list_of
    (status::PENDING, "PENDING")
    (status::JUDGING, "JUDGING")
    (status::ACCEPTED, "ACCEPTED")
    (status::WRONG_ANSWER, "WRONG_ANSWER")
    (status::TIME_LIMIT_EXCEEDED, "TIME_LIMIT_EXCEEDED")
    (status::RUNTIME_ERROR, "RUNTIME_ERROR")
    (status::COMPILATION_ERROR, "COMPILATION_ERROR")
    (status::ERROR, "ERROR");
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

const char *get_status_name(status stat) {
    return status_name.at(stat);
}

status parse_status(const string &name) {
    for (auto &[stat, text] : status_name)
        if (name == text) return stat;
    throw invalid_argument("Unrecognized status " + name);
}

bool is_terminal(status stat) {
    return stat != status::PENDING && stat != status::JUDGING;
}

}  // namespace ojcore
