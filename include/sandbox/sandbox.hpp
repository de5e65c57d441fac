#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include "sandbox/container.hpp"
#include "sandbox/limiter.hpp"

namespace hjudge::sandbox {

enum class sandbox_state {
    /**
     * @brief 容器已经创建，还没有运行过命令
     */
    CREATED,
    READY,
    EXECUTING,
    DESTROYED
};

/**
 * @brief 创建沙箱时的公共参数，来自评测机配置
 */
struct sandbox_options {
    std::string image;

    /**
     * @brief 沙箱工作目录的父目录
     */
    std::filesystem::path run_dir;

    std::chrono::microseconds poll_interval = std::chrono::milliseconds(5);

    std::int64_t memory_limit = 512LL << 20;
    std::int64_t pids_limit = 64;
};

/**
 * @brief 一个沙箱，即一个长期运行的容器和挂载到容器内的宿主机工作目录
 * 沙箱由获取它的评测流水线独占，不能跨线程共享。
 */
struct sandbox {
    /**
     * @brief 容器名，形如 hjudge-<tag>-<uuid>
     */
    std::string name;
    std::string container_id;
    std::filesystem::path host_dir;
    std::string mount_point;
    sandbox_state state = sandbox_state::CREATED;

    /**
     * @brief 容器被强制终止后需要在下次运行前重新启动
     */
    bool needs_restart = false;

    /**
     * @brief 获取沙箱内文件在宿主机上的路径
     * @throw internal_error 如果 name 是绝对路径或者包含 ..
     */
    std::filesystem::path path(const std::string &name) const;

    /**
     * @brief 在沙箱工作目录中写入文件
     * @param persistent 为真时文件在 reset 之后仍然保留，用于编译产物等
     */
    void put_file(const std::string &name, const std::string &content, bool persistent = false);

    /**
     * @brief 将宿主机上的文件复制到沙箱工作目录中
     * @throw internal_error 如果源文件不存在或者无法复制
     */
    void copy_file(const std::filesystem::path &from, const std::string &name, bool persistent = false);

    std::string read_file(const std::string &name) const;

    /**
     * @brief 读取文件的前 limit 个字节
     */
    std::string read_file(const std::string &name, std::size_t limit, bool *truncated = nullptr) const;

    bool exists(const std::string &name) const;

    std::int64_t file_size(const std::string &name) const;

    /**
     * @brief 将文件标记为持久文件
     */
    void keep(const std::string &name);

    /**
     * @brief 删除工作目录中除持久文件以外的所有文件
     */
    void reset();

private:
    std::set<std::string> persistent;
};

/**
 * @brief 管理沙箱的创建、运行和销毁
 * 可以被多个 worker 线程同时使用，每个沙箱同一时间只能被一个线程使用。
 */
struct sandbox_runner {
    sandbox_runner(container_runtime &runtime, const sandbox_options &options);

    /**
     * @brief 创建并启动一个沙箱
     * 创建失败时已经创建的容器和目录会被清理。
     * @param tag 容器名的一部分，用于区分沙箱的用途
     * @param cpuset 绑定的 CPU 核心，为空表示不绑定
     * @throw sandbox_error 如果容器无法创建或者启动
     */
    std::unique_ptr<sandbox> acquire(const std::string &tag, const std::string &cpuset = "");

    /**
     * @brief 在沙箱内运行命令
     * 程序被强制终止后容器会在下次运行前重新启动，持久文件不受影响。
     * @throw sandbox_error 如果沙箱已经被销毁或者容器无法重新启动
     */
    execution_result run(sandbox &box, const std::string &command, const execution_limits &limits);

    /**
     * @brief 销毁沙箱，删除容器和工作目录
     * 多次调用只有第一次生效。
     */
    void release(sandbox &box) noexcept;

    /**
     * @brief 当前未销毁的沙箱数
     */
    int active() const;

    /**
     * @brief 同时存在的沙箱数的最大值
     */
    int peak() const;

private:
    container_runtime &runtime;
    sandbox_options options;
    resource_limiter limiter;
    std::atomic<int> active_count{0}, peak_count{0};
};

/**
 * @brief 在作用域结束时自动销毁沙箱
 * @code{.cpp}
 *     scoped_sandbox box(runner, runner.acquire("compile"));
 *     runner.run(*box, "g++ a.cpp", limits);
 * @endcode
 */
struct scoped_sandbox {
    scoped_sandbox(sandbox_runner &runner, std::unique_ptr<sandbox> &&box);
    scoped_sandbox(const scoped_sandbox &) = delete;
    scoped_sandbox(scoped_sandbox &&) noexcept;
    ~scoped_sandbox();

    sandbox &operator*() const;
    sandbox *operator->() const;
    sandbox *get() const;

private:
    sandbox_runner *runner;
    std::unique_ptr<sandbox> box;
};

}  // namespace hjudge::sandbox
