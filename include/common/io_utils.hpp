#pragma once

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <string>

namespace hjudge {

/**
 * @brief 读取文件的全部内容
 * @param path 文件路径
 * @return 文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文件的全部内容
 * @param path 文件路径
 * @param def 若文件不存在，返回 def
 */
std::string read_file_content(const std::filesystem::path &path, const std::string &def);

/**
 * @brief 读取文件的前 limit 个字节
 * 用于读取用户程序的输出，避免巨大的输出文件占满内存
 * @param truncated 若文件比 limit 长，设置为 true
 */
std::string read_file_prefix(const std::filesystem::path &path, std::size_t limit, bool *truncated = nullptr);

/**
 * @brief 覆盖写入文件
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 获取文件大小，文件不存在时返回 0
 */
std::int64_t file_size_or_zero(const std::filesystem::path &path);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 这里用于确保计算目录时不会出现目录遍历攻击，评测数据的文件名、
 * 提交答案的文件名都来自外部，如果文件名包含 "../" 或者是绝对路径，
 * 最后有可能导致评测机上的其他文件被覆盖。
 * @param subpath 被检查的文件名
 * @return subpath 本身
 */
std::string assert_safe_path(const std::string &subpath);

struct scoped_file_lock {
    scoped_file_lock();
    scoped_file_lock(const std::filesystem::path &path, bool shared);
    scoped_file_lock(scoped_file_lock &&) noexcept;
    scoped_file_lock(const scoped_file_lock &) = delete;
    ~scoped_file_lock();

    scoped_file_lock &operator=(scoped_file_lock &&) noexcept;

    std::filesystem::path file() const;

    void release();

private:
    int fd = -1;
    bool valid = false;
    std::filesystem::path lock_file;
};

/**
 * @brief 锁文件夹
 * 通过创建文件夹，并对文件夹根目录下的 .lock 文件加锁实现。
 * 同步评测数据时加写锁，评测时加读锁。
 * @param dir 要被加锁的文件夹
 * @param shared 是否是共享锁，真为共享锁（读锁），假为独占锁（写锁）
 * @return 文件锁
 */
scoped_file_lock lock_directory(const std::filesystem::path &dir, bool shared);

std::time_t last_write_time(const std::filesystem::path &path);

void last_write_time(const std::filesystem::path &path, std::time_t time);

}  // namespace hjudge
