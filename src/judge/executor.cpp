#include "arbiter/judge/executor.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/trim.hpp>
#include "arbiter/common/io_utils.hpp"
#include "arbiter/config.hpp"
#include "arbiter/judge/process.hpp"

namespace arbiter {
using namespace std;
namespace fs = std::filesystem;

static optional<string> non_empty(string text) {
    if (text.empty()) return nullopt;
    return text;
}

execution_result execute_program(const execution_request &request, const memory_probe &probe) {
    execution_result result;

    auto args = resolve_command(request.lang.run_command, request.paths);
    if (!args) {
        LOG(ERROR) << "Language " << request.lang.key << " does not have a run command";
        result.status = status::SYSTEM_ERROR;
        result.error = "Run command not configured.";
        return result;
    }

    fs::path side_file = unique_path(request.paths.workdir, "time-", ".txt");

    process_options options;
    options.cwd = request.paths.workdir;
    options.input = request.input;
    options.timeout = request.time_limit;
    options.output_limit = OUTPUT_LIMIT;

    execution_outcome outcome = run_process(probe.wrap(*args, side_file), options);

    result.time_ms = outcome.wall_time.count();
    result.memory_kb = probe.read_peak(side_file);

    result.raw_output = outcome.stdout_text;
    string output = boost::algorithm::trim_copy(outcome.stdout_text);
    result.error = non_empty(boost::algorithm::trim_copy(outcome.stderr_text));

    if (outcome.timed_out) {
        result.status = status::TIME_LIMIT_EXCEEDED;
        result.output = output;
    } else if (!outcome.succeeded()) {
        result.status = status::RUNTIME_ERROR;
        result.output = output;
    } else if (request.memory_limit_kb && result.memory_kb && *result.memory_kb > *request.memory_limit_kb) {
        result.status = status::MEMORY_LIMIT_EXCEEDED;
        result.output = non_empty(output);
    } else {
        result.status = status::OK;
        result.output = non_empty(output);
    }

    DLOG(INFO) << "Program " << (*args)[0] << " finished: " << get_display_message(result.status)
               << ", time " << *result.time_ms << "ms"
               << ", memory " << (result.memory_kb ? to_string(*result.memory_kb) + "KB" : string("unknown"));
    return result;
}

}  // namespace arbiter
