#include "arbiter/common/utils.hpp"

namespace arbiter {
using namespace std;

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace arbiter
