#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "arbiter/execution_result.hpp"
#include "arbiter/run.hpp"
#include "arbiter/statistics.hpp"
#include "arbiter/verdict.hpp"

namespace arbiter {

/**
 * @brief 一个测试点的评测报告，由汇总器发送给 monitor
 */
struct testcase_report {
    /**
     * @brief 测试点名称
     */
    std::string name;

    /**
     * @brief 测试点在提交的测试点列表中的下标
     */
    std::size_t index = 0;

    arbiter::verdict result = verdict::ACCEPTED;

    /**
     * @brief 要显示的评测结果，如 TLE (aborted)
     */
    std::string print_verdict;

    double duration = 0;

    bool timeout_expired = false;

    /**
     * @brief 交互题无法区分非 ACCEPTED 结果时为 true
     */
    bool ambiguous = false;

    /**
     * @brief 要显示的诊断信息，包括裁剪后的 stdout、stderr 和 feedback 文件
     */
    std::string data;

    std::vector<feedback_artifact> artifacts;

    /**
     * @brief 评测结果是否符合提交的期望结果
     */
    bool got_expected = true;
};

/**
 * @brief 一个提交在所有测试点上的评测结果
 */
struct submission_run_outcome {
    /**
     * @brief 所有被评测的测试点中优先级最高的评测结果，没有评测任何测试点时为 ACCEPTED
     */
    arbiter::verdict result = verdict::ACCEPTED;

    int priority = 0;

    std::string print_verdict = get_verdict_name(verdict::ACCEPTED);

    /**
     * @brief 所有被评测的测试点中运行时间的最大值
     */
    double duration = 0;

    /**
     * @brief 决定提交评测结果的测试点，即按测试点顺序第一个取得最高优先级的测试点
     * 没有评测任何测试点时为空
     */
    std::optional<testcase_report> representative;

    /**
     * @brief 评测结果被采用的测试点数量
     */
    std::size_t judged = 0;

    /**
     * @brief 因为懒评测被跳过或者结果被丢弃的测试点数量
     */
    std::size_t skipped = 0;

    /**
     * @brief 是否因为懒评测提前结束
     */
    bool aborted = false;

    judge_statistics statistics;

    /**
     * @brief 测试点名称到是否通过的映射，只有开启 table 选项时才记录
     */
    std::map<std::string, bool> table;

    /**
     * @brief 提交的评测结果是否符合期望结果
     */
    bool got_expected = true;
};

/**
 * @brief 根据测试点的运行结果和 feedback 文件生成要显示的诊断信息
 * stdout 和 stderr 都存在时分别加上标签，否则只显示其中一个；
 * feedback 文件以 "文件名:" 为标签附加在最后。
 * @param result 测试点的运行结果
 * @param artifacts feedback 文件
 * @param interactive 是否为交互题，交互题的 out 为选手程序的 stderr
 */
std::string format_report_data(const execution_result &result, const std::vector<feedback_artifact> &artifacts, bool interactive);

}  // namespace arbiter
