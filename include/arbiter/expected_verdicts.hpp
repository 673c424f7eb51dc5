#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "arbiter/statistics.hpp"
#include "arbiter/verdict.hpp"

/**
 * 选手提交可以通过源代码中的注释声明自己期望的评测结果，比如
 *   // @EXPECTED_RESULTS@: WRONG_ANSWER, TIME_LIMIT_EXCEEDED
 * 这里的评测结果也可以使用 DOMjudge 的名称，如 CORRECT、TIMELIMIT、RUN-ERROR。
 * 位于 submissions/<verdict>/ 文件夹下的提交的期望结果由文件夹名决定。
 */
namespace arbiter {

extern const char *EXPECTED_RESULTS_KEY;

/**
 * @brief 在文本中查找 @EXPECTED_RESULTS@ 注释并解析期望结果
 * 匹配大小写不敏感，只解析第一处注释。
 * 不合法的评测结果会被忽略并计入错误。
 * @param text 源代码文本
 * @param stats 错误计数
 * @return 期望结果，若文本中不存在注释返回空
 */
std::optional<std::vector<verdict>> parse_expected_results(const std::string &text, judge_statistics &stats);

/**
 * @brief 若提交位于 submissions/<verdict>/ 文件夹下，返回该文件夹对应的评测结果
 * @param path 提交的源文件或源文件夹路径
 */
std::optional<verdict> verdict_from_directory(const std::filesystem::path &path);

/**
 * @brief 计算提交的期望结果
 * 依次扫描 path（文件或者文件夹下的所有文件）中的 @EXPECTED_RESULTS@ 注释，
 * 提交位于 submissions/<verdict>/ 下时文件夹名优先于注释。
 * 都不存在时默认为 ACCEPTED。
 * @param path 提交的源文件或源文件夹路径
 * @param stats 错误和警告计数
 */
std::vector<verdict> get_expected_verdicts(const std::filesystem::path &path, judge_statistics &stats);

/**
 * @brief 交互题无法准确判断先退出的进程时，WRONG_ANSWER、TIME_LIMIT_EXCEEDED、
 * RUN_TIME_ERROR 不可区分。若 expected 包含其中任意一个，将三者都加入 expected
 */
void expand_ambiguous_verdicts(std::vector<verdict> &expected);

/**
 * @brief 测试点的评测结果是否符合预期
 * ACCEPTED 的测试点总是符合预期；
 * ambiguous 的结果与 WRONG_ANSWER、TIME_LIMIT_EXCEEDED、RUN_TIME_ERROR 中任意一个匹配即可
 */
bool testcase_got_expected(const std::vector<verdict> &expected, verdict v, bool ambiguous);

/**
 * @brief 提交的最终评测结果是否符合预期
 */
bool submission_got_expected(const std::vector<verdict> &expected, verdict v, bool ambiguous);

}  // namespace arbiter
