#pragma once

#include <cstddef>
#include <filesystem>

namespace arbiter {

/**
 * @brief 比较器（output validator）及交互器的退出码约定
 * 与 Kattis、DOMjudge 的约定一致：42 表示答案正确，43 表示答案错误，
 * 其他所有退出码（包括因信号退出）都表示比较器本身崩溃。
 */
enum error_codes {
    E_ACCEPTED = 42,
    E_WRONG_ANSWER = 43
};

/**
 * @brief 比较器的运行时限（单位为秒）
 * 比较器超时被视为比较器崩溃
 */
extern double VALIDATOR_TIME_LIMIT;

/**
 * @brief 选手程序输出文件超过该大小（字节）时，评测结束后删除该文件
 * 仅用于控制磁盘占用，不影响评测结果
 */
extern std::size_t OUTPUT_CLEANUP_THRESHOLD;

/**
 * @brief 评测的临时文件根目录
 * RUN_DIR 的文件结构如下：
 *
 * RUN_DIR
 * └── runs
 *     └── hello-world // 选手提交名
 *         ├── sample1.out // 选手程序的 stdout 输出
 *         ├── sample1.feedbackdir // 比较器的 feedback 文件夹，每次评测前清空
 *         │   ├── judgemessage.txt // 比较器的输出信息
 *         │   └── judgeerror.txt // 比较器的错误信息
 *         └── ...
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，评测结束后不会删除选手程序的输出文件，
 * 以便手动检查测试产生的文件内容是否符合预期。
 */
extern bool DEBUG;

}  // namespace arbiter
