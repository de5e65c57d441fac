#include "sandbox/cgroup.hpp"
#include <boost/algorithm/string.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <vector>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace hjudge::sandbox {
using namespace std;
namespace fs = std::filesystem;

map<string, string> parse_proc_cgroup(const string &content) {
    map<string, string> result;
    istringstream in(content);
    string line;
    while (getline(in, line)) {
        // hierarchy-ID:controller-list:cgroup-path
        size_t first = line.find(':');
        if (first == string::npos) continue;
        size_t second = line.find(':', first + 1);
        if (second == string::npos) continue;
        string controllers = line.substr(first + 1, second - first - 1);
        string path = line.substr(second + 1);
        if (controllers.empty()) {
            result[""] = path;
            continue;
        }
        result[controllers] = path;
        vector<string> names;
        boost::split(names, controllers, boost::is_any_of(","));
        for (auto &name : names) result[name] = path;
    }
    return result;
}

optional<int64_t> parse_keyed_value(const string &content, const string &key) {
    istringstream in(content);
    string token;
    while (in >> token) {
        if (token != key) continue;
        int64_t value;
        if (in >> value) return value;
        return nullopt;
    }
    return nullopt;
}

static optional<int64_t> read_int64(const fs::path &path) {
    ifstream fin(path);
    int64_t value;
    if (fin >> value) return value;
    return nullopt;
}

cgroup_probe::cgroup_probe(int pid, const fs::path &root)
    : cgroup_probe(parse_proc_cgroup(read_file_content("/proc/" + to_string(pid) + "/cgroup", "")), root) {}

cgroup_probe::cgroup_probe(const map<string, string> &cgroups, const fs::path &root) {
    if (cgroups.count("memory")) {
        memory_dir = root / "memory" / fs::path(cgroups.at("memory")).relative_path();
        if (cgroups.count("cpuacct")) {
            // cpu 和 cpuacct 通常挂载在同一个层级 cpu,cpuacct 下
            string mount = "cpuacct";
            for (auto &[controllers, path] : cgroups)
                if (controllers.find(',') != string::npos && controllers.find("cpuacct") != string::npos)
                    mount = controllers;
            cpu_dir = root / mount / fs::path(cgroups.at("cpuacct")).relative_path();
        }
    } else if (cgroups.count("")) {
        v2 = true;
        unified_dir = root / fs::path(cgroups.at("")).relative_path();
    } else {
        throw sandbox_error("unable to locate cgroup of sandbox process");
    }
}

bool cgroup_probe::unified() const {
    return v2;
}

resource_usage cgroup_probe::read() const {
    resource_usage usage;
    if (v2) {
        if (auto usec = parse_keyed_value(read_file_content(unified_dir / "cpu.stat", ""), "usage_usec")) {
            usage.cpu_available = true;
            usage.cpu_time_ns = *usec * 1000;
        }
        // 页缓存可以被回收，不计入程序的内存使用
        int64_t current = read_int64(unified_dir / "memory.current").value_or(0);
        int64_t file = parse_keyed_value(read_file_content(unified_dir / "memory.stat", ""), "file").value_or(0);
        usage.memory_bytes = max<int64_t>(current - file, 0);
        usage.oom_kills = parse_keyed_value(read_file_content(unified_dir / "memory.events", ""), "oom_kill").value_or(0);
    } else {
        if (!cpu_dir.empty()) {
            if (auto ns = read_int64(cpu_dir / "cpuacct.usage")) {
                usage.cpu_available = true;
                usage.cpu_time_ns = *ns;
            }
        }
        int64_t current = read_int64(memory_dir / "memory.usage_in_bytes").value_or(0);
        string stat = read_file_content(memory_dir / "memory.stat", "");
        int64_t cache = parse_keyed_value(stat, "total_cache").value_or(parse_keyed_value(stat, "cache").value_or(0));
        usage.memory_bytes = max<int64_t>(current - cache, 0);
        usage.oom_kills = parse_keyed_value(read_file_content(memory_dir / "memory.oom_control", ""), "oom_kill").value_or(0);
    }
    return usage;
}

}  // namespace hjudge::sandbox
