#pragma once

#include <optional>
#include <string>
#include <vector>
#include "arbiter/problem.hpp"
#include "arbiter/statistics.hpp"
#include "arbiter/submission.hpp"
#include "arbiter/testcase.hpp"
#include "arbiter/verdict.hpp"
#include "common/cancellation.hpp"

namespace arbiter {

/**
 * @brief 测试模式下一个测试点的运行状态
 */
enum class test_status {
    /**
     * @brief 在时间限制内正常退出
     */
    DONE,

    /**
     * @brief 正常退出，但超过了时间限制，计入警告
     */
    DONE_TLE,

    /**
     * @brief 非正常退出，计入错误
     */
    RUN_TIME_ERROR,

    /**
     * @brief 超过硬时限被杀死，计入错误
     */
    ABORTED
};

const char *get_display_message(test_status status);

/**
 * @brief 测试模式下一个测试点的运行报告
 */
struct test_report {
    std::string name;
    test_status status = test_status::DONE;
    double duration = 0;
    std::optional<int> exit_code;

    /**
     * @brief 交互题由交互器给出评测结果，非 ACCEPTED 计入错误
     */
    std::optional<arbiter::verdict> interactive_verdict;
};

/**
 * @brief 测试模式：在每个测试点上运行选手程序，但不比较输出
 * 选手程序的 stdout 和 stderr 直接输出到终端，用于手动检查程序行为。
 * 测试点依次运行，不进行并发。
 */
struct submission_tester {
    explicit submission_tester(const problem &prob);

    /**
     * @brief 在测试点上运行选手程序
     * @param sub 提交
     * @param tc 测试点
     * @param stats 错误和警告计数
     * @param token 取消标记
     * @throw spawn_error 若无法启动选手程序
     */
    test_report test(const submission &sub, const testcase &tc, judge_statistics &stats, const cancellation_token &token) const;

    /**
     * @brief 依次在所有测试点上运行选手程序，并在终端上输出每个测试点的运行状态
     * 无法启动选手程序时计入错误并跳过该测试点
     */
    std::vector<test_report> test_all(const submission &sub, const std::vector<testcase> &testcases, judge_statistics &stats) const;

private:
    const problem &prob;
};

}  // namespace arbiter
