#pragma once

#include <cstddef>

namespace arbiter {

/**
 * @brief 评测一个提交时的选项
 */
struct judge_options {
    /**
     * @brief 并发评测测试点的 worker 数量，为 0 时使用 CPU 核数
     */
    std::size_t jobs = 0;

    /**
     * @brief 是否显示所有测试点的详细信息
     * 开启时不进行懒评测
     */
    bool verbose = false;

    /**
     * @brief 是否记录每个测试点是否通过
     * 开启时不进行懒评测
     */
    bool table = false;

    /**
     * @brief 是否在评测结果中附带选手程序的完整错误输出，并保留过大的输出文件
     */
    bool show_errors = false;
};

}  // namespace arbiter
