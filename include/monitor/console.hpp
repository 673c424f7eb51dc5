#pragma once

#include <cstdio>
#include "arbiter/options.hpp"
#include "monitor/monitor.hpp"

namespace arbiter {

/**
 * @brief 在终端上输出评测进度
 * 每个测试点输出一行 "运行时间 评测结果"，测试点不符合预期或者开启 verbose 时附带诊断信息；
 * 提交评测结束时输出汇总行以及决定评测结果的测试点的诊断信息。
 */
struct console_monitor : public monitor {
    console_monitor(const judge_options &options, std::FILE *out = stderr);

    void start_submission(const submission &sub, std::size_t testcases) override;

    void end_testcase(const submission &sub, const testcase_report &report) override;

    void end_submission(const submission &sub, const submission_run_outcome &outcome) override;

private:
    const judge_options &options;
    std::FILE *out;
};

}  // namespace arbiter
