#pragma once

#include <atomic>
#include <memory>

namespace arena {

/**
 * @brief 提交级别的取消标记
 * 拷贝之间共享同一个标记：调用方保留一份，评测线程持有另一份。
 * 沙箱在等待子进程时轮询该标记，被取消后会杀死进程树并清理临时文件。
 */
struct cancellation_token {
    cancellation_token();

    void cancel() const;

    bool cancelled() const;

private:
    std::shared_ptr<std::atomic<bool>> flag;
};

}  // namespace arena
