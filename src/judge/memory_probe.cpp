#include "arbiter/judge/memory_probe.hpp"
#include <glog/logging.h>
#include <unistd.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include "arbiter/common/defer.hpp"
#include "arbiter/common/io_utils.hpp"
#include "arbiter/config.hpp"

namespace arbiter {
using namespace std;
namespace fs = std::filesystem;

memory_probe::memory_probe(fs::path time_command) : time_command(move(time_command)) {}

memory_probe memory_probe::detect(const fs::path &time_command) {
    if (!time_command.empty() && access(time_command.c_str(), X_OK) == 0) {
        LOG(INFO) << "Memory usage is measured by " << time_command;
        return memory_probe(time_command);
    }
    LOG(WARNING) << "GNU time is not available at " << time_command << ", memory usage will not be measured";
    return disabled();
}

memory_probe memory_probe::detect() {
    return detect(TIME_COMMAND_PATH);
}

memory_probe memory_probe::disabled() {
    return memory_probe(fs::path());
}

bool memory_probe::available() const {
    return !time_command.empty();
}

vector<string> memory_probe::wrap(const vector<string> &argv, const fs::path &side_file) const {
    if (!available()) return argv;
    vector<string> wrapped = {time_command.string(), "-o", side_file.string(), "-f", "%M"};
    wrapped.insert(wrapped.end(), argv.begin(), argv.end());
    return wrapped;
}

optional<long> memory_probe::read_peak(const fs::path &side_file) const {
    if (!available()) return nullopt;

    defer {
        error_code ec;
        fs::remove(side_file, ec);
    };

    string content;
    try {
        content = read_file_content(side_file, "");
    } catch (system_error &ex) {
        LOG(WARNING) << "Unable to read memory report " << side_file << ": " << ex.what();
        return nullopt;
    }

    vector<string> lines;
    boost::algorithm::split(lines, content, boost::is_any_of("\r\n"));

    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        string line = boost::algorithm::trim_copy(*it);
        if (line.empty()) continue;
        try {
            return boost::lexical_cast<long>(line);
        } catch (boost::bad_lexical_cast &) {
            DLOG(INFO) << "Unrecognized memory report " << line << " in " << side_file;
            return nullopt;
        }
    }
    return nullopt;
}

}  // namespace arbiter
