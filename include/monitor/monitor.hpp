#pragma once

#include <cstddef>
#include <vector>
#include "arbiter/report.hpp"
#include "arbiter/submission.hpp"
#include "arbiter/testcase.hpp"

namespace arbiter {

/**
 * @brief 执行监控行为
 * 汇总器在持有锁时调用 monitor 的方法，同一时刻只会有一个方法被调用。
 * 默认实现不做任何事情。
 */
struct monitor {
    virtual ~monitor();

    /**
     * @brief 监控上报当前已经开始评测一个提交
     * @param sub 提交
     * @param testcases 要评测的测试点数量
     */
    virtual void start_submission(const submission &sub, std::size_t testcases);

    /**
     * @brief 监控上报当前已经开始评测某个测试点
     * @param sub 测试点所属的提交
     * @param tc 测试点
     */
    virtual void start_testcase(const submission &sub, const testcase &tc);

    /**
     * @brief 监控上报当前某个测试点已经评测结束
     * 被懒评测丢弃的测试点不会上报
     * @param sub 测试点所属的提交
     * @param report 测试点的评测报告
     */
    virtual void end_testcase(const submission &sub, const testcase_report &report);

    /**
     * @brief 监控上报当前已经完成一个提交的评测
     * @param sub 提交
     * @param outcome 提交的评测结果
     */
    virtual void end_submission(const submission &sub, const submission_run_outcome &outcome);
};

}  // namespace arbiter
