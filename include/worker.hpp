#pragma once

#include <future>
#include <memory>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "judge/judge_service.hpp"

/**
 * 评测 worker
 * 提交请求进入队列后由多个 worker 线程并发评测，每个 worker 同一时间只评测一份提交，
 * 不同提交之间没有共享的可变状态，只有比赛成绩的写回通过存储串行化。
 * 评测结果通过 std::future 返回给调用方。
 */
namespace arena {

struct worker_pool {
    /**
     * @param service 评测服务，必须比 worker_pool 活得更久
     * @param workers worker 线程数
     */
    worker_pool(judge_service &service, std::size_t workers);

    /**
     * @brief 停止所有 worker，等待已经在队列中的提交评测完成
     */
    ~worker_pool();

    worker_pool(const worker_pool &) = delete;
    worker_pool &operator=(const worker_pool &) = delete;

    /**
     * @brief 将提交加入评测队列
     * @param token 取消标记，可以在评测开始前或者评测中取消
     * @return 评测结果，评测失败时 future 中保存对应的异常
     * @throw grading_rejected worker 已经停止
     */
    std::future<submit_response> enqueue(const submit_request &request, const cancellation_token &token = cancellation_token());

    /**
     * @brief 停止接受新的提交
     * 调用该函数后，worker 在评测完队列中剩余的提交后退出。
     */
    void stop();

private:
    struct job {
        submit_request request;
        cancellation_token token;
        std::promise<submit_response> promise;
    };

    void worker_loop(std::size_t worker_id);

    judge_service &service;
    concurrent_queue<std::unique_ptr<job>> jobs;
    std::vector<std::thread> threads;
};

}  // namespace arena
