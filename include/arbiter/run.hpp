#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "arbiter/execution_result.hpp"
#include "arbiter/options.hpp"
#include "arbiter/problem.hpp"
#include "arbiter/statistics.hpp"
#include "arbiter/submission.hpp"
#include "arbiter/testcase.hpp"
#include "common/cancellation.hpp"

namespace arbiter {

/**
 * @brief 比较器留在 feedback 文件夹中的文件
 */
struct feedback_artifact {
    std::string name;
    std::string content;
};

/**
 * @brief 检查被判定为 ACCEPTED 的输出的格式，返回所有可疑之处
 * 比较器通常忽略空白，这些问题不影响评测结果，只作为警告提示。
 */
std::vector<std::string> check_output_sanity(const std::string &content);

/**
 * @brief 表示一个提交在一个测试点上的评测
 * 一个 testcase_run 只被一个 worker 持有，临时文件夹也只被该 worker 访问。
 */
struct testcase_run {
    testcase_run(const problem &prob, const submission &sub, const testcase &tc, const judge_options &options);

    const testcase &get_testcase() const;

    /**
     * @brief 选手程序的输出文件 RUN_DIR/runs/<submission>/<testcase>.out
     */
    const std::filesystem::path &get_output_path() const;

    /**
     * @brief 比较器的 feedback 文件夹 RUN_DIR/runs/<submission>/<testcase>.feedbackdir
     */
    const std::filesystem::path &get_feedback_dir() const;

    /**
     * @brief 评测该测试点
     * 1. 清空 feedback 文件夹，运行选手程序（交互题运行交互）
     * 2. 运行时间超过时间限制：TIME_LIMIT_EXCEEDED
     * 3. 选手程序非正常退出：RUN_TIME_ERROR
     * 4. 否则运行比较器：ACCEPTED、WRONG_ANSWER 或者 VALIDATOR_CRASH
     * 无法启动程序或者比较器配置错误时评测结果为 VALIDATOR_CRASH，并计入错误。
     *
     * @param stats 当前 worker 的错误和警告计数
     * @param token 取消标记
     * @return 带有评测结果的运行结果，result 一定不为空
     * @throw judge_cancelled 若评测被取消
     */
    execution_result run(judge_statistics &stats, const cancellation_token &token);

    /**
     * @brief 读取并删除 feedback 文件夹中剩余的所有文件
     * 不是普通文件的项目计入警告，不是 UTF-8 文本的文件计入错误，这两种项目都会被跳过。
     * 内容为空的文件被删除但不返回。
     */
    std::vector<feedback_artifact> collect_feedback(judge_statistics &stats);

private:
    const problem &prob;
    const submission &sub;
    const testcase &tc;
    const judge_options &options;
    std::filesystem::path out_path;
    std::filesystem::path feedbackdir;

    execution_result run_batch(judge_statistics &stats, const cancellation_token &token);

    execution_result run_interactive(judge_statistics &stats, const cancellation_token &token);

    void validate(execution_result &result, judge_statistics &stats, const cancellation_token &token);

    /**
     * @brief 对 ACCEPTED 的输出运行 check_output_sanity，每一项问题计入一个警告
     */
    void check_output(judge_statistics &stats);

    void cleanup_output();
};

}  // namespace arbiter
