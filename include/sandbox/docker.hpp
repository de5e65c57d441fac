#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include "sandbox/cgroup.hpp"
#include "sandbox/container.hpp"

namespace hjudge::sandbox {

/**
 * @brief 构造 Docker Engine API 创建容器的请求体
 * 容器禁用网络、根文件系统只读、限制内存和进程数、只允许使用一个核心。
 */
nlohmann::json build_create_body(const container_spec &spec);

/**
 * @brief 通过 unix socket 调用 Docker Engine API 的容器运行时
 */
struct docker_runtime : public container_runtime {
    /**
     * @param socket Docker 守护进程的 unix socket 路径
     * @param api_version API 版本前缀
     */
    explicit docker_runtime(const std::string &socket, const std::string &api_version = "v1.41");

    std::string create_container(const container_spec &spec) override;
    void start_container(const std::string &id) override;
    void kill_container(const std::string &id) override;
    void remove_container(const std::string &id) override;
    void update_memory_limit(const std::string &id, std::int64_t bytes) override;
    container_state inspect_container(const std::string &id) override;
    std::string start_exec(const std::string &id, const std::vector<std::string> &command, const std::string &workdir) override;
    exec_state inspect_exec(const std::string &exec_id) override;
    resource_usage read_usage(const std::string &id) override;

private:
    nlohmann::json call(const std::string &method, const std::string &path, const nlohmann::json &body = nullptr, long expected_status = 200);

    std::string socket, api_version;

    /**
     * @brief 缓存每个容器的 cgroup 位置，容器重启后 pid 变化需要清除
     */
    std::mutex probes_mutex;
    std::map<std::string, std::shared_ptr<cgroup_probe>> probes;
};

}  // namespace hjudge::sandbox
