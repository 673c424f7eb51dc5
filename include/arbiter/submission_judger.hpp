#pragma once

#include <cstddef>
#include <vector>
#include "arbiter/options.hpp"
#include "arbiter/problem.hpp"
#include "arbiter/report.hpp"
#include "arbiter/submission.hpp"
#include "arbiter/testcase.hpp"
#include "common/cancellation.hpp"
#include "monitor/monitor.hpp"

namespace arbiter {

/**
 * @brief 并发评测一个提交的所有测试点，并汇总为提交的评测结果
 *
 * 每个测试点是一个评测任务，由 jobs 个 worker 线程从并发队列中取出执行。
 * 提交的评测结果是所有被采用的测试点结果中优先级最高的结果，
 * 优先级相同时取测试点顺序靠前的测试点，因此汇总结果与测试点的完成顺序无关。
 *
 * 懒评测：在没有开启 verbose 和 table 时，若某个测试点的评测结果达到最高优先级
 * （对于 TIME_LIMIT_EXCEEDED，还要求程序因为超过硬时限被杀死），
 * 那么提交的评测结果已经确定，此时取消所有正在进行的评测任务并清空队列，
 * 被取消的评测任务的结果将被丢弃。
 */
struct submission_judger {
    /**
     * @param prob 题目配置
     * @param options 评测选项
     * @param mon 评测进度的监控
     */
    submission_judger(const problem &prob, const judge_options &options, monitor &mon);

    /**
     * @brief 评测提交的所有测试点
     * @param sub 提交
     * @param testcases 测试点列表，测试点顺序决定优先级相同时选取的测试点
     * @return 提交的评测结果
     */
    submission_run_outcome judge_all(const submission &sub, const std::vector<testcase> &testcases);

private:
    struct judge_state;

    const problem &prob;
    const judge_options &options;
    monitor &mon;

    /**
     * @brief 评测结果是否可以使评测提前结束
     */
    bool should_abort(const execution_result &result) const;

    /**
     * @brief worker 线程的主循环
     */
    void worker_loop(judge_state &state, const submission &sub, const std::vector<testcase> &testcases);

    /**
     * @brief 在持有锁时将一个测试点的评测结果合并到 outcome 中
     */
    void fold(judge_state &state, const submission &sub, testcase_report report);
};

}  // namespace arbiter
