#pragma once

#include <string>
#include <vector>
#include "arbiter/process_runner.hpp"
#include "arbiter/verdict.hpp"

namespace arbiter {

/**
 * @brief 表示一个待评测的选手提交
 * 选手程序已经编译完成，评测系统只负责运行 cmd
 */
struct submission {
    /**
     * @brief 提交名称，如 accepted/hello.cpp
     * 用于报告评测结果，也用于决定提交在 RUN_DIR 中的临时文件夹
     */
    std::string name;

    /**
     * @brief 运行选手程序的命令
     */
    command cmd;

    /**
     * @brief 该提交允许得到的评测结果，参见 expected_verdicts.hpp
     * 默认为 ACCEPTED
     */
    std::vector<verdict> expected_verdicts = {verdict::ACCEPTED};
};

}  // namespace arbiter
