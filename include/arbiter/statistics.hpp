#pragma once

#include <cstddef>

namespace arbiter {

/**
 * @brief 评测过程中出现的错误和警告的计数
 * 错误表示题目配置有问题（比较器缺失、崩溃、无法启动程序等），
 * 警告表示可疑但不影响评测结果的情况。
 * 每个 worker 独占一个实例，汇总器在持有锁时合并。
 */
struct judge_statistics {
    std::size_t errors = 0;
    std::size_t warnings = 0;

    void merge(const judge_statistics &other) {
        errors += other.errors;
        warnings += other.warnings;
    }
};

}  // namespace arbiter
