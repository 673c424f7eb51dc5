#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "arbiter/execution_result.hpp"
#include "arbiter/process_runner.hpp"
#include "arbiter/statistics.hpp"
#include "arbiter/testcase.hpp"
#include "arbiter/validator.hpp"
#include "common/cancellation.hpp"

namespace arbiter {

/**
 * @brief 一次交互的运行结果
 */
struct interaction_result {
    /**
     * @brief 选手程序的运行结果，err 为选手程序的 stderr
     */
    execution_result submission;

    /**
     * @brief 交互器的运行结果，err 为交互器的 stderr 与 feedback 文件的合并结果
     */
    execution_result validator;

    /**
     * @brief 交互器是否先于选手程序退出
     */
    bool validator_first = false;

    /**
     * @brief 从启动第一个进程到最后一个进程退出的时钟时间
     */
    double duration = 0;

    /**
     * @brief 是否因为超过硬时限而杀死了进程
     */
    bool timeout_expired = false;
};

/**
 * @brief 交互题的一次交互
 * 交互器的 stdout 连接到选手程序的 stdin，选手程序的 stdout 连接到交互器的 stdin。
 *
 * 为了准确判断哪个进程先退出，评测系统持有每个管道的写端直到写入该管道的进程退出，
 * 避免一方退出后另一方立刻读到 EOF 并退出，造成两个进程退出顺序的竞争。
 * 选手程序到交互器的管道读端同样由评测系统持有，直到交互器以非 ACCEPTED 退出，
 * 避免交互器判定 AC 后选手程序因为 SIGPIPE 崩溃。
 * 交互器到选手程序的管道读端由评测系统持有直到两个进程都退出，
 * 选手程序读完需要的输入后提前退出时，交互器之后的写入不会因为 SIGPIPE 崩溃。
 */
struct interactive_session {
    /**
     * @param submission_cmd 选手程序的命令
     * @param interactor 交互器，与比较器的参数约定相同
     */
    interactive_session(const command &submission_cmd, const output_validator &interactor);

    /**
     * @brief 运行一次交互
     * 超过硬时限时两个进程都会被杀死。
     *
     * @param tc 测试点，测试点的输入只传给交互器
     * @param feedbackdir 交互器的 feedback 文件夹
     * @param extra_flags 测试点传给交互器的额外参数
     * @param hard_timeout 硬时限（单位为秒）
     * @param token 取消标记
     * @throw spawn_error 若无法启动任意一个进程，此时已经启动的进程会被杀死
     * @throw judge_cancelled 若评测被取消
     */
    interaction_result run(const testcase &tc, const std::filesystem::path &feedbackdir, const std::vector<std::string> &extra_flags,
                           double hard_timeout, const cancellation_token &token) const;

private:
    const command &submission_cmd;
    const output_validator &interactor;
};

/**
 * @brief 根据一次交互的结果计算测试点的评测结果
 *
 * precise 为 true 时：
 *   1. 交互器先退出且判定错误：WRONG_ANSWER；交互器先退出且崩溃：VALIDATOR_CRASH
 *   2. 运行时间超过时间限制：TIME_LIMIT_EXCEEDED
 *   3. 选手程序非正常退出：RUN_TIME_ERROR
 *   4. 否则由交互器决定：ACCEPTED、WRONG_ANSWER 或 VALIDATOR_CRASH
 * precise 为 false 时无法判断哪个进程先退出，只有交互器判定正确且选手程序在时限内正常退出
 * 才是 ACCEPTED，交互器未超时而崩溃为 VALIDATOR_CRASH，其他情况都是 ambiguous 的 WRONG_ANSWER。
 *
 * @param result 交互的运行结果
 * @param time_limit 时间限制
 * @param precise 是否能准确判断哪个进程先退出
 * @param stats 交互器崩溃时错误计数加一
 * @return 带有评测结果的运行结果，out 为选手程序的 stderr，err 为交互器的输出
 */
execution_result judge_interaction(const interaction_result &result, double time_limit, bool precise, judge_statistics &stats);

}  // namespace arbiter
