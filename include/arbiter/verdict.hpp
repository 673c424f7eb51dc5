#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace arbiter {

/**
 * @brief 表示一个测试点或整个提交的评测结果
 * 每个评测结果都有一个优先级，汇总提交结果时取优先级最高的评测结果，
 * 优先级越高表示结果越"坏"，ACCEPTED 的优先级最低。
 */
enum class verdict {
    /**
     * @brief 选手程序在时限内正常退出，且比较器认为输出正确
     */
    ACCEPTED,

    /**
     * @brief 比较器认为选手程序的输出不正确
     * 对于交互题，也可能是交互器先退出并判定错误
     */
    WRONG_ANSWER,

    /**
     * @brief 选手程序运行时间超过时间限制
     * 若选手程序因超过硬时限而被杀死，显示为 TLE (aborted)
     */
    TIME_LIMIT_EXCEEDED,

    /**
     * @brief 选手程序以非零退出码退出或者因为信号崩溃
     */
    RUN_TIME_ERROR,

    /**
     * @brief 比较器崩溃、比较器缺失或者无法启动进程
     * 表示题目配置有问题，而不是选手程序有问题，
     * 每次出现都会计入错误计数。
     */
    VALIDATOR_CRASH
};

/**
 * @brief 评测结果的优先级
 * ACCEPTED 为 0，WRONG_ANSWER 与 RUN_TIME_ERROR 为 99，
 * TIME_LIMIT_EXCEEDED 与 VALIDATOR_CRASH 为 100
 */
int get_priority(verdict v);

/**
 * @brief 所有评测结果中的最高优先级
 */
int get_max_priority();

/**
 * @brief 评测结果是否属于最高优先级，懒评测遇到这类结果时可以提前结束
 */
bool is_max_priority(verdict v);

/**
 * @brief 评测结果的标准名称，如 WRONG_ANSWER
 */
const char *get_verdict_name(verdict v);

/**
 * @brief 评测结果的显示名称，如 Wrong Answer
 */
const char *get_display_message(verdict v);

/**
 * @brief 根据标准名称解析评测结果
 * @param name 评测结果的标准名称，大小写敏感
 * @return 评测结果，若 name 不是合法的标准名称则返回空
 */
std::optional<verdict> parse_verdict(const std::string &name);

/**
 * @brief 按优先级无关的固定顺序列出所有评测结果
 */
const std::vector<verdict> &all_verdicts();

std::ostream &operator<<(std::ostream &os, verdict v);

}  // namespace arbiter
