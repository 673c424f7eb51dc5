#pragma once

#include <atomic>

namespace arbiter {

/**
 * @brief 取消标记，由汇总器设置一次，所有 worker 只读
 * worker 在每个挂起点（启动进程前、等待进程时）检查该标记，
 * 发现被取消后杀死自己持有的子进程并抛出 judge_cancelled。
 */
struct cancellation_token {
    void cancel() noexcept;

    bool cancelled() const noexcept;

    /**
     * @brief 若已取消，抛出 judge_cancelled
     */
    void throw_if_cancelled() const;

private:
    std::atomic<bool> flag{false};
};

}  // namespace arbiter
