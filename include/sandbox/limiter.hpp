#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "sandbox/container.hpp"

namespace hjudge::sandbox {

/**
 * @brief 程序结束的原因
 */
enum class termination_cause {
    NORMAL_EXIT,
    TIME_LIMIT_EXCEEDED,
    MEMORY_LIMIT_EXCEEDED,
    OUTPUT_LIMIT_EXCEEDED,

    /**
     * @brief 程序本身返回非 0 或者被信号终止
     */
    RUNTIME_ERROR,

    /**
     * @brief 沙箱无法启动或者监控程序，与用户程序无关
     */
    SANDBOX_INTERNAL_ERROR
};

const char *get_display_message(termination_cause cause);

/**
 * @brief 一次运行的资源限制，小于等于 0 的限制表示不限制
 */
struct execution_limits {
    /**
     * @brief CPU 时间限制（秒）
     */
    double cpu_time = -1;

    /**
     * @brief 时钟时间限制（秒），用于限制 sleep 等不占用 CPU 的程序
     */
    double wall_time = -1;

    /**
     * @brief 内存限制（字节）
     */
    std::int64_t memory = -1;

    /**
     * @brief 输出限制（字节），标准输出、标准错误和 output_files 的总大小超出后程序会被终止
     */
    std::int64_t output = -1;

    /**
     * @brief 执行结果中最多保留多少字节的标准输出和标准错误
     */
    std::size_t capture = 1 << 16;

    /**
     * @brief 需要计入输出限制的文件，相对于沙箱工作目录
     */
    std::vector<std::string> output_files;
};

/**
 * @brief 一次运行的结果，创建后不再修改
 */
struct execution_result {
    termination_cause cause = termination_cause::NORMAL_EXIT;
    int exit_code = -1;

    /**
     * @brief 用于评测的运行时间（秒），能读取到 CPU 时间时为 CPU 时间，否则为时钟时间
     */
    double time = 0;
    double cpu_time = 0;
    double wall_time = 0;

    /**
     * @brief 本次运行的内存峰值（字节），不包含页缓存和运行前已经存在的内存
     */
    std::int64_t memory = 0;

    std::string stdout_text, stderr_text;
    bool output_truncated = false;

    /**
     * @brief 程序是否被强制终止，此时容器已经停止，下次运行前需要重新启动
     */
    bool killed = false;

    /**
     * @brief SANDBOX_INTERNAL_ERROR 的原因
     */
    std::string error;
};

/**
 * @brief 在容器内运行命令并限制资源
 * 超出限制时终止整个容器（容器内的所有进程，包括用户程序 fork 出的子进程）。
 * 同一个容器同一时间只能有一个 execute 调用。
 */
struct resource_limiter {
    resource_limiter(container_runtime &runtime, std::chrono::microseconds poll_interval);

    /**
     * @brief 运行命令直到结束或者被强制终止
     * @param container_id 容器 id
     * @param host_dir 容器工作目录在宿主机上的路径，用于读取输出
     * @param workdir 容器内的工作目录
     * @param command 通过 sh -c 执行的命令
     * @param limits 资源限制
     */
    execution_result execute(const std::string &container_id,
                             const std::filesystem::path &host_dir,
                             const std::string &workdir,
                             const std::string &command,
                             const execution_limits &limits);

    /**
     * @brief 容器内存限制比运行的内存限制多出的部分，留给 sh 和容器内的常驻进程
     * 页缓存会在达到容器限制时被回收，不会导致 OOM。
     */
    static constexpr std::int64_t MEMORY_HEADROOM = 32LL << 20;

    static constexpr const char *STDOUT_FILE = ".stdout";
    static constexpr const char *STDERR_FILE = ".stderr";

private:
    container_runtime &runtime;
    std::chrono::microseconds poll_interval;
};

}  // namespace hjudge::sandbox
