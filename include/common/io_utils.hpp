#pragma once

#include <filesystem>
#include <string>

namespace arbiter {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

bool utf8_check_is_valid(const std::string &string);

/**
 * @brief 删除文件夹内的所有文件和子文件夹，文件夹本身保留
 * 若文件夹不存在则创建该文件夹
 * @param dir 要被清空的文件夹
 */
void clear_directory(const std::filesystem::path &dir);

/**
 * @brief 裁剪要显示给用户的程序输出
 * 超过 10 行时只保留前 8 行，之后最多保留 1000 个字符。
 * 裁剪只影响显示，评测结果不会依赖被裁剪的文本。
 */
std::string crop_output(const std::string &output);

/**
 * @brief 将一段输出格式化成附加在标签之后的文本
 * 单行文本接在标签同一行，多行文本另起一行
 */
std::string format_data(const std::string &data);

/**
 * @brief 管理一个文件描述符，析构时关闭
 * 只能移动，不能复制
 */
struct scoped_fd {
    scoped_fd();
    explicit scoped_fd(int fd);
    scoped_fd(scoped_fd &&);
    ~scoped_fd();

    scoped_fd &operator=(scoped_fd &&);

    int get() const;

    bool valid() const;

    /**
     * @brief 立即关闭文件描述符
     */
    void reset();

private:
    int fd;
};

/**
 * @brief 创建一对设置了 O_CLOEXEC 的管道
 * 多个 worker 线程会并发 fork，不设置 O_CLOEXEC 的话管道会泄漏到
 * 其他 worker 的子进程中，导致读端永远读不到 EOF。
 * @param read_end 管道读端
 * @param write_end 管道写端
 */
void make_pipe(scoped_fd &read_end, scoped_fd &write_end);

}  // namespace arbiter
