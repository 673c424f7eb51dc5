#pragma once

#include <optional>
#include <string>
#include "arbiter/verdict.hpp"

namespace arbiter {

/**
 * @brief 进程的退出状态
 */
enum class exec_status {
    /**
     * @brief 进程以退出码 0 正常退出
     */
    OK,

    /**
     * @brief 进程以非零退出码退出
     * 比较器返回 42/43 时也是这个状态，由 classify_validator 进一步区分
     */
    NONZERO_EXIT,

    /**
     * @brief 进程超过硬时限被评测系统杀死
     */
    TIMED_OUT,

    /**
     * @brief 进程因为信号退出，exit_code 为信号编号的相反数
     */
    CRASHED
};

const char *get_display_message(exec_status status);

/**
 * @brief 比较器的判定结果
 */
enum class validator_status {
    ACCEPTED,
    REJECTED,
    CRASHED
};

/**
 * @brief 表示一次进程运行的结果
 * 由 run_process 产生，评测该测试点的 testcase_run 再补充评测结果 result。
 */
struct execution_result {
    exec_status status = exec_status::OK;

    /**
     * @brief 进程退出码，超时被杀死时不存在
     */
    std::optional<int> exit_code;

    /**
     * @brief 从启动进程到进程退出的时钟时间
     * 单位为秒
     */
    double duration = 0;

    /**
     * @brief 进程是否因为超过硬时限而被杀死
     * 仅超过软时限（时间限制）的程序该项为 false
     */
    bool timeout_expired = false;

    /**
     * @brief 捕获到的 stdout，重定向到文件时不存在
     * 对于交互题，保存选手程序的 stderr
     */
    std::optional<std::string> out;

    /**
     * @brief 捕获到的 stderr
     * 对于比较器，保存比较器的 stderr 以及 judgemessage.txt、judgeerror.txt 的内容
     */
    std::optional<std::string> err;

    /**
     * @brief 评测结果，由 testcase_run 填写
     */
    std::optional<arbiter::verdict> result;

    /**
     * @brief 若非空，显示该字符串代替评测结果的标准名称，比如 TLE (aborted)
     */
    std::string print_verdict_override;

    /**
     * @brief 交互题在无法确定哪个进程先退出时，所有非 ACCEPTED 结果都不可区分
     * 此时 result 为 WRONG_ANSWER，且该项为 true
     */
    bool ambiguous = false;

    /**
     * @brief 进程是否以退出码 0 正常退出
     */
    bool ok() const;

    /**
     * @brief 要显示的评测结果
     */
    std::string print_verdict() const;
};

/**
 * @brief 根据比较器的退出码判断比较器的判定结果
 * 退出码 42 表示正确，43 表示错误，其他情况都视为比较器崩溃
 */
validator_status classify_validator(const execution_result &result);

}  // namespace arbiter
