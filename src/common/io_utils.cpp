#include "ojcore/common/io_utils.hpp"
#include <glog/logging.h>
#include <errno.h>
#include <stdlib.h>
#include <fstream>
#include <system_error>
#include <vector>

namespace ojcore {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(filesystem::path const &path, const string &def) {
    if (!filesystem::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path, ios::out | ios::trunc | ios::binary);
    if (!fout)
        throw system_error(errno, system_category(), "unable to open " + path.string());
    fout.write(content.data(), content.size());
    if (!fout)
        throw system_error(errno, system_category(), "unable to write " + path.string());
}

string assert_safe_path(const string &subpath) {
    if (subpath.empty() || subpath.find("..") != string::npos || subpath.front() == '/')
        throw runtime_error("subpath is not safe " + subpath);
    return subpath;
}

scoped_temp_directory::scoped_temp_directory(const string &prefix, const fs::path &parent) : valid(false) {
    fs::path base = parent.empty() ? fs::temp_directory_path() : parent;
    fs::create_directories(base);
    string pattern = (base / (prefix + "XXXXXX")).string();
    vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');
    if (!mkdtemp(buf.data()))
        throw system_error(errno, system_category(), "unable to create temporary directory in " + base.string());
    dir = fs::path(buf.data());
    valid = true;
}

scoped_temp_directory::scoped_temp_directory(scoped_temp_directory &&other) : valid(false) {
    *this = move(other);
}

scoped_temp_directory::~scoped_temp_directory() {
    release();
}

scoped_temp_directory &scoped_temp_directory::operator=(scoped_temp_directory &&other) {
    swap(dir, other.dir);
    swap(valid, other.valid);
    return *this;
}

const fs::path &scoped_temp_directory::path() const {
    return dir;
}

void scoped_temp_directory::release() {
    if (!valid) return;
    valid = false;
    error_code ec;
    fs::remove_all(dir, ec);
    if (ec) LOG(WARNING) << "Unable to remove temporary directory " << dir << ": " << ec.message();
}

}  // namespace ojcore
