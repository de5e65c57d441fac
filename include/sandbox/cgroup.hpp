#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include "sandbox/container.hpp"

namespace hjudge::sandbox {

/**
 * @brief 解析 /proc/<pid>/cgroup 的内容
 * @return 控制器名到 cgroup 路径的映射，cgroup v2 的统一层级使用空字符串作为键
 * @code
 *     12:memory:/docker/abc      ->  {"memory": "/docker/abc"}
 *     4:cpu,cpuacct:/docker/abc  ->  {"cpu": ..., "cpuacct": ..., "cpu,cpuacct": ...}
 *     0::/system.slice/docker-abc.scope  ->  {"": "/system.slice/docker-abc.scope"}
 * @endcode
 */
std::map<std::string, std::string> parse_proc_cgroup(const std::string &content);

/**
 * @brief 从 "key value" 每行一个的文件内容中读取 key 对应的整数
 * 用于 cpu.stat、memory.stat、memory.events、memory.oom_control
 */
std::optional<std::int64_t> parse_keyed_value(const std::string &content, const std::string &key);

/**
 * @brief 读取容器的 cgroup 统计信息
 * 容器的 cgroup 由 docker 创建和销毁，这里只读取 sysfs 中的统计文件，
 * 同时支持 cgroup v1 和 cgroup v2。
 */
struct cgroup_probe {
    /**
     * @param pid 容器内任意进程在宿主机上的 pid
     * @param root cgroup 文件系统的挂载点
     * @throw sandbox_error 如果找不到进程所在的 cgroup
     */
    explicit cgroup_probe(int pid, const std::filesystem::path &root = "/sys/fs/cgroup");

    cgroup_probe(const std::map<std::string, std::string> &cgroups, const std::filesystem::path &root);

    resource_usage read() const;

    bool unified() const;

private:
    bool v2 = false;
    std::filesystem::path unified_dir, memory_dir, cpu_dir;
};

}  // namespace hjudge::sandbox
