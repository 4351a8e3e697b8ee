#include "arbiter/config.hpp"

namespace arbiter {
using namespace std;

size_t OUTPUT_LIMIT = 64 * 1024;                            // 64KiB
chrono::milliseconds COMPILE_TIME_LIMIT(10000);             // 10s
chrono::milliseconds CHECKER_TIME_LIMIT(2000);              // 2s
chrono::milliseconds DEFAULT_TIME_LIMIT(2000);              // 2s
filesystem::path TIME_COMMAND_PATH("/usr/bin/time");
filesystem::path RUN_DIR("/tmp");

}  // namespace arbiter
