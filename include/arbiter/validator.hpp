#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "arbiter/execution_result.hpp"
#include "arbiter/process_runner.hpp"
#include "arbiter/testcase.hpp"
#include "common/cancellation.hpp"

namespace arbiter {

/**
 * @brief 比较器写入 feedback 文件夹的评测信息，追加到比较器的 stderr 之后
 */
extern const char *JUDGE_MESSAGE_FILE;

/**
 * @brief 比较器写入 feedback 文件夹的错误信息，存在时代替比较器的 stderr
 */
extern const char *JUDGE_ERROR_FILE;

/**
 * @brief 表示题目的输出比较器（output validator）
 * 比较器的调用约定与 Kattis/DOMjudge 一致：
 *   validator <input> <answer|/dev/null> <feedbackdir> [flags...] < output
 * 退出码 42 表示正确，43 表示错误，其他情况表示比较器崩溃。
 * 交互题的交互器也使用相同的参数约定，只是 stdin/stdout 连接到选手程序。
 */
struct output_validator {
    /**
     * @brief 比较器名称，用于日志
     */
    std::string name;

    /**
     * @brief 比较器的命令，评测时在其后追加测试点相关的参数
     */
    command cmd;

    /**
     * @brief 题目级别的比较器参数，在测试点的参数之前传入
     */
    std::vector<std::string> flags;

    /**
     * @brief 构造调用比较器的完整命令
     * @param tc 测试点
     * @param feedbackdir 比较器的 feedback 文件夹
     * @param extra_flags 测试点的额外参数
     */
    command build_command(const testcase &tc, const std::filesystem::path &feedbackdir, const std::vector<std::string> &extra_flags) const;

    /**
     * @brief 以选手程序的输出作为 stdin 运行比较器
     * 比较器的运行时限为 VALIDATOR_TIME_LIMIT。
     * 运行结束后 judgemessage.txt、judgeerror.txt 将被合并到结果的 err 中并删除。
     *
     * @param tc 测试点
     * @param output_path 选手程序的输出文件
     * @param feedbackdir 比较器的 feedback 文件夹
     * @param extra_flags 测试点的额外参数
     * @param token 取消标记
     * @return 比较器的运行结果，用 classify_validator 判断比较器的判定结果
     * @throw spawn_error 若无法启动比较器
     * @throw judge_cancelled 若评测被取消
     */
    execution_result run(const testcase &tc, const std::filesystem::path &output_path, const std::filesystem::path &feedbackdir,
                         const std::vector<std::string> &extra_flags, const cancellation_token &token) const;
};

/**
 * @brief 读取比较器写入 feedback 文件夹中的 judgemessage.txt 和 judgeerror.txt 并删除
 * judgemessage.txt 的内容追加到 result.err 之后，judgeerror.txt 的内容代替 result.err
 */
void merge_judge_messages(execution_result &result, const std::filesystem::path &feedbackdir);

}  // namespace arbiter
