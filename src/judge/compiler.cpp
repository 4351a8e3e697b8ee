#include "arbiter/judge/compiler.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/trim.hpp>
#include "arbiter/config.hpp"
#include "arbiter/judge/process.hpp"

namespace arbiter {
using namespace std;
namespace fs = std::filesystem;

compile_result compile_program(const language &lang, const fs::path &src, const fs::path &exe, const fs::path &workdir) {
    auto args = resolve_command(lang.compile_command, command_paths{src, exe, workdir});
    if (!args) return {true, nullopt};

    process_options options;
    options.cwd = workdir;
    options.timeout = COMPILE_TIME_LIMIT;
    options.output_limit = OUTPUT_LIMIT;

    execution_outcome outcome = run_process(*args, options);
    string output = boost::algorithm::trim_copy(outcome.stdout_text + outcome.stderr_text);

    if (!outcome.succeeded()) {
        if (outcome.timed_out)
            LOG(INFO) << "Compilation of " << src << " exceeded time limit " << COMPILE_TIME_LIMIT.count() << "ms";
        else
            LOG(INFO) << "Compilation of " << src << " failed with language " << lang.key;
        return {false, output};
    }

    DLOG(INFO) << "Compiled " << src << " in " << outcome.wall_time.count() << "ms";
    if (output.empty()) return {true, nullopt};
    return {true, output};
}

}  // namespace arbiter
