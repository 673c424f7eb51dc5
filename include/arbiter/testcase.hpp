#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace arbiter {

/**
 * @brief 表示一个测试点
 * 测试点在评测过程中只读，可以被多个 worker 同时访问
 */
struct testcase {
    /**
     * @brief 测试点名称，如 secret/01-small
     * 用于报告评测结果，也用于决定测试点在 RUN_DIR 中的临时文件路径
     */
    std::string name;

    /**
     * @brief 输入数据路径
     */
    std::filesystem::path in_path;

    /**
     * @brief 标准输出路径，不存在时比较器收到 /dev/null
     */
    std::optional<std::filesystem::path> ans_path;

    /**
     * @brief 该测试点传给比较器的额外参数，如 case_sensitive
     */
    std::vector<std::string> validator_flags;
};

}  // namespace arbiter
