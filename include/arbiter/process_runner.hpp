#pragma once

#include <sys/types.h>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "arbiter/execution_result.hpp"
#include "common/cancellation.hpp"
#include "common/io_utils.hpp"

/**
 * 这个头文件包含运行外部程序的函数
 * 评测系统运行的所有程序（选手程序、比较器、交互器）都是不透明的命令，
 * 由调用方提供可执行文件路径和参数列表。
 */
namespace arbiter {

/**
 * @brief 表示一个要执行的命令
 */
struct command {
    /**
     * @brief 外部命令的路径 (argv[0]) 和参数
     */
    std::vector<std::string> argv;

    /**
     * @brief 运行命令的工作路径，为空时继承评测系统的工作路径
     */
    std::filesystem::path cwd;

    /**
     * @brief 用于日志的命令名，为 argv[0] 的文件名
     */
    std::string name() const;
};

/**
 * @brief 子进程的输入输出重定向方式
 */
struct process_io {
    /**
     * @brief 作为子进程 stdin 的文件，为空时使用 /dev/null
     */
    std::filesystem::path stdin_file;

    /**
     * @brief 若非空，子进程的 stdout 写入该文件，否则捕获 stdout
     */
    std::optional<std::filesystem::path> stdout_file;

    /**
     * @brief 是否捕获子进程的 stdout 和 stderr
     * 为 false 时子进程直接继承评测系统的 stdout 和 stderr（测试模式）
     */
    bool capture_output = true;

    /**
     * @brief 是否裁剪捕获到的输出，参见 crop_output
     */
    bool crop = true;
};

/**
 * @brief 表示一个由评测系统创建的子进程
 * 子进程位于独立的进程组中，杀死子进程时会杀死整个进程组，
 * 确保选手程序 fork 出来的子进程不会留驻系统。
 * 析构时若子进程还没有被回收，则杀死并回收子进程。
 */
struct child_process {
    child_process();
    explicit child_process(pid_t pid);
    child_process(child_process &&);
    ~child_process();

    child_process &operator=(child_process &&);

    pid_t pid() const;

    /**
     * @brief 子进程是否存在且还没有被回收
     */
    bool running() const;

    /**
     * @brief 非阻塞地检查子进程是否已经退出
     * 子进程退出后，回收之前先杀死进程组内残留的进程
     * @return 若子进程已经退出并被回收，返回 true
     */
    bool try_wait();

    /**
     * @brief 阻塞等待子进程退出并回收
     */
    void wait();

    /**
     * @brief 向子进程所在的进程组发送 SIGKILL
     * 子进程已经被回收时什么也不做，进程组 id 可能已经被其他进程复用
     */
    void kill();

    /**
     * @brief 子进程的 wait status，只有在子进程被回收后才有意义
     */
    int wait_status() const;

private:
    /**
     * @brief 子进程已经退出但还未被回收时调用，杀死进程组并回收子进程
     */
    void reap();

    pid_t id;
    bool reaped;
    int status;
};

/**
 * @brief 从若干管道读出子进程的输出直到 EOF
 * 同时读取多个管道，避免子进程因为某个管道写满而阻塞
 */
struct pipe_reader {
    /**
     * @brief 添加一个要读取的管道读端
     * @param fd 管道读端
     * @param sink 读到的数据追加到 sink 中，sink 的生命周期必须长于 pipe_reader
     */
    void add(scoped_fd &&fd, std::string *sink);

    /**
     * @brief 等待至多 timeout_ms 毫秒，读取所有可读管道中的数据
     * 没有需要读取的管道时相当于睡眠 timeout_ms 毫秒
     */
    void pump(int timeout_ms);

    /**
     * @brief 持续读取直到所有管道都读到 EOF，或者超过 timeout_ms 毫秒
     * 超时后仍未结束的管道将被关闭
     */
    void drain(int timeout_ms);

    /**
     * @brief 是否所有管道都已经读到 EOF
     */
    bool finished() const;

private:
    struct stream {
        scoped_fd fd;
        std::string *sink;
    };

    std::vector<stream> streams;
};

/**
 * @brief 启动子进程
 * 子进程会被放入以自身 pid 为 id 的新进程组。
 * @param cmd 要执行的命令
 * @param stdin_fd 子进程的 stdin，为 -1 时继承
 * @param stdout_fd 子进程的 stdout，为 -1 时继承
 * @param stderr_fd 子进程的 stderr，为 -1 时继承
 * @return 子进程
 * @throw spawn_error 若 fork 失败，或者 exec 失败（比如可执行文件不存在）
 */
child_process spawn_process(const command &cmd, int stdin_fd, int stdout_fd, int stderr_fd);

/**
 * @brief 在硬时限内运行程序
 * 在进程退出、超过硬时限或者评测被取消之前一直阻塞。
 * 超过硬时限时整个进程组将被杀死，结果为 TIMED_OUT 且 timeout_expired 为 true。
 *
 * @param cmd 要执行的命令
 * @param io 输入输出重定向方式
 * @param hard_timeout 硬时限（单位为秒）
 * @param token 取消标记，启动进程前和等待进程时都会检查
 * @return 运行结果
 * @throw spawn_error 若无法启动程序
 * @throw judge_cancelled 若评测被取消，此时子进程已被杀死
 */
execution_result run_process(const command &cmd, const process_io &io, double hard_timeout, const cancellation_token &token);

/**
 * @brief 根据子进程的 wait status 填写运行结果的状态和退出码
 */
void fill_exit_status(execution_result &result, int wait_status);

}  // namespace arbiter
