#include "ojcore/common/utils.hpp"
#include <unistd.h>
#include <boost/algorithm/string.hpp>
#include <cstdlib>

namespace ojcore {
using namespace std;
namespace fs = std::filesystem;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

optional<string> get_env(const string &key) {
    char *result = getenv(key.c_str());
    if (!result) return nullopt;
    return string(result);
}

static bool is_executable_file(const fs::path &path) {
    error_code ec;
    return fs::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
}

optional<fs::path> find_executable(const string &program) {
    if (program.empty()) return nullopt;
    if (program.find('/') != string::npos) {
        if (is_executable_file(program)) return fs::path(program);
        return nullopt;
    }

    vector<string> dirs;
    string path = get_env("PATH", "/usr/local/bin:/usr/bin:/bin");
    boost::split(dirs, path, boost::is_any_of(":"));
    for (auto &dir : dirs) {
        if (dir.empty()) continue;
        fs::path candidate = fs::path(dir) / program;
        if (is_executable_file(candidate)) return candidate;
    }
    return nullopt;
}

vector<string> split_list(const string &text) {
    vector<string> items, result;
    boost::split(items, text, boost::is_any_of(","));
    for (auto &item : items) {
        string trimmed = boost::algorithm::trim_copy(item);
        if (!trimmed.empty()) result.push_back(trimmed);
    }
    return result;
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

double elapsed_time::seconds() const {
    return duration<chrono::duration<double>>().count();
}

}  // namespace ojcore
