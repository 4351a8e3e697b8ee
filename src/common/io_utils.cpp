#include "arbiter/common/io_utils.hpp"
#include <fmt/core.h>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cerrno>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace arbiter {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path, ios::binary);
    if (!fin)
        throw system_error(errno, system_category(), "unable to open " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(const fs::path &path, const string &def) {
    if (!fs::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path, ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to create " + path.string());
    fout.write(content.data(), content.size());
    fout.close();
    if (!fout)
        throw system_error(errno, system_category(), "unable to write " + path.string());
}

string assert_safe_path(const string &subpath) {
    if (subpath.find("..") != string::npos || subpath.find('/') != string::npos)
        throw runtime_error("subpath is not safe " + subpath);
    return subpath;
}

fs::path unique_path(const fs::path &dir, const string &prefix, const string &suffix) {
    // boost::uuids::random_generator 不是线程安全的，每次调用都构造一个新的生成器
    boost::uuids::random_generator generator;
    while (true) {
        fs::path candidate = dir / fmt::format("{}{}{}", prefix, boost::uuids::to_string(generator()), suffix);
        if (!fs::exists(candidate)) return candidate;
    }
}

}  // namespace arbiter
