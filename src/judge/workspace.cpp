#include "arbiter/judge/workspace.hpp"
#include <glog/logging.h>
#include <stdlib.h>
#include <cerrno>
#include <cstring>
#include <vector>
#include "arbiter/common/exceptions.hpp"
#include "arbiter/common/io_utils.hpp"
#include "arbiter/config.hpp"

namespace arbiter {
using namespace std;
namespace fs = std::filesystem;

workspace::workspace(const string &prefix, const fs::path &root) {
    string pattern = (root / (prefix + "XXXXXX")).string();
    vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (!mkdtemp(buffer.data()))
        throw workspace_error("unable to create workspace " + pattern + ": " + strerror(errno));
    dir = fs::path(buffer.data());
    DLOG(INFO) << "Created workspace " << dir;
}

workspace::workspace(const string &prefix) : workspace(prefix, RUN_DIR) {}

workspace::~workspace() {
    error_code ec;
    fs::remove_all(dir, ec);
    if (ec) LOG(ERROR) << "Unable to delete workspace " << dir << ": " << ec.message();
}

const fs::path &workspace::path() const {
    return dir;
}

fs::path workspace::file(const string &filename) const {
    try {
        return dir / assert_safe_path(filename);
    } catch (runtime_error &ex) {
        throw workspace_error(ex.what());
    }
}

fs::path workspace::write(const string &filename, const string &content) const {
    fs::path target = file(filename);
    try {
        write_file_content(target, content);
    } catch (system_error &ex) {
        throw workspace_error(ex.what());
    }
    return target;
}

}  // namespace arbiter
