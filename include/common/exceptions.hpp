#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace arbiter {

struct arbiter_exception : std::exception {
    arbiter_exception();
    explicit arbiter_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const arbiter_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 一般是评测系统自身调用系统函数失败
 */
struct internal_error : public arbiter_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示无法启动子进程
 * 比如可执行文件不存在、输入数据无法打开、fork 失败。
 * 这类错误只影响当前测试点，不会影响其他测试点的评测。
 */
struct spawn_error : public arbiter_exception {
    spawn_error();
    explicit spawn_error(const std::string &message);
};

/**
 * @brief 表示题目配置错误
 * 比如没有配置比较器，或者配置了多个比较器，时间限制不合法
 */
struct configuration_error : public arbiter_exception {
    configuration_error();
    explicit configuration_error(const std::string &message);
};

/**
 * @brief 表示评测已经被取消（懒评测提前结束）
 * 抛出该异常前，当前评测任务持有的所有子进程都已经被杀死并回收
 */
struct judge_cancelled : public arbiter_exception {
    judge_cancelled();
};

}  // namespace arbiter
