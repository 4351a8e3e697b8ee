#include "arbiter/worker.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "arbiter/common/exceptions.hpp"

namespace arbiter {
using namespace std;

worker_pool::worker_pool(const engine &eng, size_t worker_count, size_t queue_capacity)
    : eng(eng), jobs(queue_capacity) {
    if (worker_count == 0) worker_count = 1;
    for (size_t i = 0; i < worker_count; ++i)
        workers.emplace_back([this, i] { worker_loop(i); });
    LOG(INFO) << "Started " << worker_count << " judge workers";
}

worker_pool::~worker_pool() {
    stop();
}

future<judge_report> worker_pool::submit(judge_request request, result_callback on_result) {
    job j{move(request), move(on_result), promise<judge_report>()};
    future<judge_report> result = j.promise.get_future();
    if (!jobs.push(move(j)))
        throw internal_error("worker pool has been stopped");
    return result;
}

void worker_pool::stop() {
    jobs.close();
    for (auto &worker : workers)
        if (worker.joinable()) worker.join();
}

size_t worker_pool::pending() {
    return jobs.size();
}

/**
 * @brief 评测 worker 的主循环
 * 从评测队列中取出评测请求并评测，队列关闭且为空时退出
 */
void worker_pool::worker_loop(size_t worker_id) {
    while (auto j = jobs.pop()) {
        try {
            judge_report report;
            try {
                report = eng.judge_submission(j->request, j->on_result);
            } catch (judge_exception &ex) {
                LOG(ERROR) << "Worker " << worker_id << " failed to judge problem " << j->request.prob.id << ": " << ex;
                report = make_system_error_report(ex.what());
            } catch (std::exception &ex) {
                LOG(ERROR) << "Worker " << worker_id << " failed to judge problem " << j->request.prob.id << ": " << ex.what() << endl
                           << boost::diagnostic_information(ex);
                report = make_system_error_report(ex.what());
            }
            j->promise.set_value(move(report));
        } catch (...) {
            // 无法转换为评测结果的异常交给调用方处理
            j->promise.set_exception(current_exception());
        }
    }
    DLOG(INFO) << "Worker " << worker_id << " exited";
}

}  // namespace arbiter
