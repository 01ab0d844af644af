#include "worker.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"

namespace arena {
using namespace std;

worker_pool::worker_pool(judge_service &service, size_t workers)
    : service(service) {
    for (size_t i = 0; i < max<size_t>(workers, 1); ++i)
        threads.emplace_back([this, i] { worker_loop(i); });
}

worker_pool::~worker_pool() {
    stop();
}

future<submit_response> worker_pool::enqueue(const submit_request &request, const cancellation_token &token) {
    auto task = make_unique<job>();
    task->request = request;
    task->token = token;
    future<submit_response> result = task->promise.get_future();
    if (!jobs.push(move(task)))
        throw grading_rejected("Worker pool has been stopped");
    return result;
}

void worker_pool::stop() {
    jobs.close();
    for (auto &thread : threads)
        if (thread.joinable()) thread.join();
}

void worker_pool::worker_loop(size_t worker_id) {
    LOG(INFO) << "Worker " << worker_id << " started";

    unique_ptr<job> task;
    while (jobs.pop(task)) {
        const submit_request &request = task->request;
        try {
            if (task->token.cancelled()) throw grading_cancelled();
            task->promise.set_value(service.submit(request, task->token));
        } catch (judge_exception &ex) {
            LOG(WARNING) << "Worker " << worker_id << " rejected submission of user " << request.user_id
                         << " on problem " << request.problem_id << ": " << ex.what();
            task->promise.set_exception(current_exception());
        } catch (exception &ex) {
            LOG(ERROR) << "Worker " << worker_id << " failed to judge submission of user " << request.user_id
                       << " on problem " << request.problem_id << ": " << ex.what();
            task->promise.set_exception(current_exception());
        }
    }

    LOG(INFO) << "Worker " << worker_id << " exited";
}

}  // namespace arena
