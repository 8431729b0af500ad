#include "ojcore/common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace ojcore {
using namespace std;

judge_exception::judge_exception()
    : judge_exception("") {}

judge_exception::judge_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *judge_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const judge_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

not_supported_error::not_supported_error(const string &language)
    : judge_exception("Language '" + language + "' not supported"), language(language) {}

validation_error::validation_error(const string &reason)
    : judge_exception("Submission rejected: " + reason), reason(reason) {}

configuration_error::configuration_error()
    : judge_exception() {}

configuration_error::configuration_error(const string &message)
    : judge_exception(message) {}

infrastructure_error::infrastructure_error()
    : judge_exception() {}

infrastructure_error::infrastructure_error(const string &message)
    : judge_exception(message) {}

judge_unavailable_error::judge_unavailable_error(const string &message)
    : infrastructure_error(message) {}

compilation_error::compilation_error(const string &what, const string &error_log)
    : runtime_error(what), error_log(error_log) {}

}  // namespace ojcore
