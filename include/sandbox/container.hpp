#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace hjudge::sandbox {

/**
 * @brief 创建容器所需的参数
 */
struct container_spec {
    std::string name;
    std::string image;

    /**
     * @brief 宿主机上的工作目录，挂载到容器内的 mount_point
     */
    std::filesystem::path host_dir;
    std::string mount_point = "/sandbox";

    /**
     * @brief 容器的初始进程，只用于让容器保持运行
     */
    std::vector<std::string> keepalive = {"tail", "-f", "/dev/null"};

    std::int64_t memory_limit = 512LL << 20;
    std::int64_t pids_limit = 64;
    std::int64_t stack_limit = 8277716992LL;

    /**
     * @brief 绑定的 CPU 核心，如 "0" 或 "0,1"，为空表示不绑定
     */
    std::string cpuset;

    std::map<std::string, std::string> tmpfs = {{"/tmp", "rw,exec,size=256m"}};
};

struct container_state {
    bool running = false;
    int pid = 0;
    bool oom_killed = false;
    int exit_code = 0;
};

struct exec_state {
    bool running = false;
    int exit_code = 0;
    int pid = 0;
};

/**
 * @brief 容器的资源使用情况，数据来自容器的 cgroup
 */
struct resource_usage {
    /**
     * @brief 是否能读取到 CPU 时间，读取不到时只能用时钟时间判断超时
     */
    bool cpu_available = false;

    /**
     * @brief 容器创建以来累计使用的 CPU 时间（纳秒）
     */
    std::int64_t cpu_time_ns = 0;

    /**
     * @brief 当前内存使用量（字节），不包含页缓存
     * cgroup v2 为 memory.current 减去 memory.stat 中的 file，
     * cgroup v1 为 memory.usage_in_bytes 减去 memory.stat 中的 total_cache。
     */
    std::int64_t memory_bytes = 0;

    /**
     * @brief 容器创建以来触发 OOM killer 的次数
     */
    std::int64_t oom_kills = 0;
};

/**
 * @brief 容器运行时的抽象
 * 生产环境下通过 Docker Engine API 实现，测试时可以替换为假的实现。
 * 所有方法在失败时抛出 sandbox_error。
 */
struct container_runtime {
    virtual ~container_runtime();

    /**
     * @brief 创建容器（不启动）
     * @return 容器 id
     */
    virtual std::string create_container(const container_spec &spec) = 0;

    virtual void start_container(const std::string &id) = 0;

    /**
     * @brief 使用 SIGKILL 终止容器内的所有进程
     */
    virtual void kill_container(const std::string &id) = 0;

    /**
     * @brief 强制删除容器，容器不存在时不报错
     */
    virtual void remove_container(const std::string &id) = 0;

    /**
     * @brief 修改容器的内存限制（同时修改 swap 限制，禁止使用 swap）
     */
    virtual void update_memory_limit(const std::string &id, std::int64_t bytes) = 0;

    virtual container_state inspect_container(const std::string &id) = 0;

    /**
     * @brief 在容器内创建并后台启动一个进程
     * @return exec id
     */
    virtual std::string start_exec(const std::string &id, const std::vector<std::string> &command, const std::string &workdir) = 0;

    virtual exec_state inspect_exec(const std::string &exec_id) = 0;

    virtual resource_usage read_usage(const std::string &id) = 0;
};

}  // namespace hjudge::sandbox
