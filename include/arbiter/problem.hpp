#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "arbiter/validator.hpp"

namespace arbiter {

/**
 * @brief 题目的评测配置
 * 时间限制和硬时限只在题目级别配置，所有测试点共用
 */
struct problem {
    /**
     * @brief 题目名称，用于日志和报告
     */
    std::string name;

    /**
     * @brief 时间限制（单位为秒）
     * 选手程序运行时间超过时间限制时评测结果为 TIME_LIMIT_EXCEEDED
     */
    double time_limit = 1;

    /**
     * @brief 硬时限（单位为秒），超过硬时限的程序将被杀死
     * 必须不小于时间限制，默认为 int(1.5 * time_limit + 1)
     */
    double timeout = 2;

    /**
     * @brief 是否为交互题
     */
    bool interactive = false;

    /**
     * @brief 交互题能否准确判断选手程序和交互器哪个先退出
     * Linux 下默认为 true，其他平台默认为 false，可以在题目配置中强制指定。
     * 为 false 时所有非 ACCEPTED 的交互结果都无法区分，统一视为 WRONG_ANSWER。
     */
    bool precise_interactive_diagnosis = default_precise_interactive_diagnosis();

    /**
     * @brief 题目的输出比较器，合法的配置有且只有一个比较器
     * 对于交互题，该比较器即为交互器
     */
    std::vector<output_validator> validators;

    /**
     * @brief 返回唯一的比较器
     * @throw configuration_error 若没有配置比较器或者配置了多个比较器
     */
    const output_validator &validator() const;

    static bool default_precise_interactive_diagnosis();
};

/**
 * @brief 根据时间限制计算默认的硬时限 int(1.5 * time_limit + 1)
 */
double default_timeout(double time_limit);

void from_json(const nlohmann::json &j, output_validator &value);

/**
 * @brief 从 json 中读取题目配置
 * @code{.json}
 * {
 *     "name": "hello",
 *     "time_limit": 1.0,
 *     "timeout": 3,
 *     "interactive": false,
 *     "validators": [
 *         { "name": "default", "command": ["/usr/lib/judge/default_validator"], "flags": ["case_sensitive"] }
 *     ]
 * }
 * @endcode
 * @throw configuration_error 若 time_limit 不为正数或者 timeout 小于 time_limit
 */
void from_json(const nlohmann::json &j, problem &value);

/**
 * @brief 从 json 文件读取题目配置
 * @throw configuration_error 若文件不存在或者配置不合法
 */
problem load_problem(const std::filesystem::path &path);

}  // namespace arbiter
