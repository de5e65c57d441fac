#include "sandbox/docker.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"
#include "common/net_utils.hpp"

namespace hjudge::sandbox {
using namespace std;
using namespace nlohmann;

container_runtime::~container_runtime() = default;

json build_create_body(const container_spec &spec) {
    json host_config = {
        {"Binds", json::array({spec.host_dir.string() + ":" + spec.mount_point + ":rw"})},
        {"NetworkMode", "none"},
        {"ReadonlyRootfs", true},
        {"Memory", spec.memory_limit},
        {"MemorySwap", spec.memory_limit},
        {"PidsLimit", spec.pids_limit},
        {"CpuPeriod", 1000000},
        {"CpuQuota", 1000000},
        {"Ulimits", json::array({json{{"Name", "stack"}, {"Soft", spec.stack_limit}, {"Hard", spec.stack_limit}}})},
        {"Tmpfs", spec.tmpfs},
        {"AutoRemove", false},
        {"Privileged", false}};
    if (!spec.cpuset.empty())
        host_config["CpusetCpus"] = spec.cpuset;

    return {
        {"Image", spec.image},
        {"Cmd", spec.keepalive},
        {"WorkingDir", spec.mount_point},
        {"NetworkDisabled", true},
        {"AttachStdin", false},
        {"AttachStdout", false},
        {"AttachStderr", false},
        {"Tty", false},
        {"OpenStdin", false},
        {"HostConfig", host_config}};
}

docker_runtime::docker_runtime(const string &socket, const string &api_version)
    : socket(socket), api_version(api_version) {}

json docker_runtime::call(const string &method, const string &path, const json &body, long expected_status) {
    net::http_request req;
    req.method = method;
    req.url = "http://localhost/" + api_version + path;
    req.unix_socket = socket;
    if (!body.is_null()) {
        req.body = body.dump();
        req.content_type = "application/json";
    }

    net::http_response resp;
    try {
        resp = net::request(req);
    } catch (network_error &ex) {
        throw sandbox_error(string("docker daemon is unreachable: ") + ex.what());
    }

    if (resp.status_code != expected_status) {
        string message = resp.body;
        try {
            message = get_value_def<string>(json::parse(resp.body), resp.body, "message");
        } catch (json::exception &) {
            // 响应不是 json，直接使用响应内容
        }
        throw sandbox_error() << method << " " << path << " failed with status " << resp.status_code << ": " << message;
    }

    if (resp.body.empty()) return nullptr;
    try {
        return json::parse(resp.body);
    } catch (json::exception &ex) {
        throw sandbox_error() << method << " " << path << " returned malformed json: " << ex.what();
    }
}

string docker_runtime::create_container(const container_spec &spec) {
    json resp = call("POST", "/containers/create?name=" + spec.name, build_create_body(spec), 201);
    string id = get_value<string>(resp, "Id");
    for (auto &warning : get_value_def<vector<string>>(resp, {}, "Warnings"))
        LOG(WARNING) << "Docker warning when creating container " << spec.name << ": " << warning;
    return id;
}

void docker_runtime::start_container(const string &id) {
    {
        scoped_lock guard(probes_mutex);
        probes.erase(id);
    }
    try {
        call("POST", "/containers/" + id + "/start", nullptr, 204);
    } catch (sandbox_error &) {
        // 304 表示容器已经在运行
        if (!inspect_container(id).running) throw;
    }
}

void docker_runtime::kill_container(const string &id) {
    try {
        call("POST", "/containers/" + id + "/kill?signal=SIGKILL", nullptr, 204);
    } catch (sandbox_error &) {
        // 409 表示容器已经停止
        if (inspect_container(id).running) throw;
    }
}

void docker_runtime::remove_container(const string &id) {
    {
        scoped_lock guard(probes_mutex);
        probes.erase(id);
    }
    net::http_request req;
    req.method = "DELETE";
    req.url = "http://localhost/" + api_version + "/containers/" + id + "?force=true&v=true";
    req.unix_socket = socket;
    net::http_response resp;
    try {
        resp = net::request(req);
    } catch (network_error &ex) {
        throw sandbox_error(string("docker daemon is unreachable: ") + ex.what());
    }
    if (resp.status_code != 204 && resp.status_code != 404)
        throw sandbox_error() << "unable to remove container " << id << ", status code=" << resp.status_code << ": " << resp.body;
}

void docker_runtime::update_memory_limit(const string &id, int64_t bytes) {
    call("POST", "/containers/" + id + "/update", {{"Memory", bytes}, {"MemorySwap", bytes}}, 200);
}

container_state docker_runtime::inspect_container(const string &id) {
    json resp = call("GET", "/containers/" + id + "/json");
    container_state state;
    state.running = get_value_def(resp, false, "State", "Running");
    state.pid = get_value_def(resp, 0, "State", "Pid");
    state.oom_killed = get_value_def(resp, false, "State", "OOMKilled");
    state.exit_code = get_value_def(resp, 0, "State", "ExitCode");
    return state;
}

string docker_runtime::start_exec(const string &id, const vector<string> &command, const string &workdir) {
    json create = {
        {"AttachStdin", false},
        {"AttachStdout", false},
        {"AttachStderr", false},
        {"Tty", false},
        {"Cmd", command},
        {"WorkingDir", workdir}};
    string exec_id = get_value<string>(call("POST", "/containers/" + id + "/exec", create, 201), "Id");
    call("POST", "/exec/" + exec_id + "/start", {{"Detach", true}, {"Tty", false}}, 200);
    return exec_id;
}

exec_state docker_runtime::inspect_exec(const string &exec_id) {
    json resp = call("GET", "/exec/" + exec_id + "/json");
    exec_state state;
    state.running = get_value_def(resp, false, "Running");
    state.exit_code = get_value_def(resp, -1, "ExitCode");
    state.pid = get_value_def(resp, 0, "Pid");
    return state;
}

resource_usage docker_runtime::read_usage(const string &id) {
    shared_ptr<cgroup_probe> probe;
    {
        scoped_lock guard(probes_mutex);
        if (probes.count(id)) probe = probes.at(id);
    }
    if (!probe) {
        container_state state = inspect_container(id);
        if (!state.running || state.pid <= 0)
            throw sandbox_error() << "container " << id << " is not running";
        probe = make_shared<cgroup_probe>(state.pid);
        scoped_lock guard(probes_mutex);
        probes[id] = probe;
    }
    return probe->read();
}

}  // namespace hjudge::sandbox
