#include "sandbox/limiter.hpp"
#include <glog/logging.h>
#include <boost/assign.hpp>
#include <algorithm>
#include <thread>
#include <unordered_map>
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace hjudge::sandbox {
using namespace std;
namespace fs = std::filesystem;

// clang-format off
static const unordered_map<termination_cause, const char *> cause_string = boost::assign::map_list_of
    (termination_cause::NORMAL_EXIT, "Normal Exit")
    (termination_cause::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (termination_cause::MEMORY_LIMIT_EXCEEDED, "Memory Limit Exceeded")
    (termination_cause::OUTPUT_LIMIT_EXCEEDED, "Output Limit Exceeded")
    (termination_cause::RUNTIME_ERROR, "Runtime Error")
    (termination_cause::SANDBOX_INTERNAL_ERROR, "Sandbox Internal Error");
// clang-format on

const char *get_display_message(termination_cause cause) {
    return cause_string.at(cause);
}

resource_limiter::resource_limiter(container_runtime &runtime, chrono::microseconds poll_interval)
    : runtime(runtime), poll_interval(poll_interval) {}

static execution_result internal_error_result(const string &error) {
    execution_result result;
    result.cause = termination_cause::SANDBOX_INTERNAL_ERROR;
    result.error = error;
    return result;
}

/**
 * @brief 运行过程中的采样结果
 */
struct watch_state {
    int64_t peak_memory = 0;
    double cpu_time = 0;
    bool cpu_available = false;
    bool oom = false;
    int64_t output_size = 0;
};

static int64_t output_size(const fs::path &host_dir, const execution_limits &limits) {
    int64_t size = file_size_or_zero(host_dir / resource_limiter::STDOUT_FILE) +
                   file_size_or_zero(host_dir / resource_limiter::STDERR_FILE);
    for (auto &file : limits.output_files)
        size += file_size_or_zero(host_dir / file);
    return size;
}

static void sample(const resource_usage &baseline, const resource_usage &usage, watch_state &state) {
    // 容器内常驻进程的内存在运行前就已经存在，不属于本次运行
    state.peak_memory = max(state.peak_memory, usage.memory_bytes - baseline.memory_bytes);
    state.cpu_available = baseline.cpu_available && usage.cpu_available;
    if (state.cpu_available)
        state.cpu_time = max(state.cpu_time, (usage.cpu_time_ns - baseline.cpu_time_ns) / 1e9);
    if (usage.oom_kills > baseline.oom_kills)
        state.oom = true;
}

/**
 * @brief 根据采样结果判断是否超出限制
 * 优先级：内存超限 > 超时 > 输出超限
 * 容器的 OOM 计数是内存超限的主要依据，采样只能发现还没有触发 OOM 的超限。
 */
static termination_cause violation(const watch_state &state, double wall_time, const execution_limits &limits) {
    if (state.oom || (limits.memory > 0 && state.peak_memory > limits.memory))
        return termination_cause::MEMORY_LIMIT_EXCEEDED;
    if (limits.cpu_time > 0 && state.cpu_available && state.cpu_time > limits.cpu_time)
        return termination_cause::TIME_LIMIT_EXCEEDED;
    if (limits.wall_time > 0 && wall_time > limits.wall_time)
        return termination_cause::TIME_LIMIT_EXCEEDED;
    if (limits.output > 0 && state.output_size > limits.output)
        return termination_cause::OUTPUT_LIMIT_EXCEEDED;
    return termination_cause::NORMAL_EXIT;
}

execution_result resource_limiter::execute(const string &container_id,
                                           const fs::path &host_dir,
                                           const string &workdir,
                                           const string &command,
                                           const execution_limits &limits) {
    // 先重定向 sh 本身的输入输出，再执行命令，命令内部的重定向（如 < in > out）会覆盖这里的设置
    vector<string> wrapped = {
        "sh", "-c",
        string("exec </dev/null >") + STDOUT_FILE + " 2>" + STDERR_FILE + "; eval \"$1\"",
        "sh", command};

    resource_usage baseline;
    string exec_id;
    try {
        fs::remove(host_dir / STDOUT_FILE);
        fs::remove(host_dir / STDERR_FILE);
        if (limits.memory > 0)
            runtime.update_memory_limit(container_id, limits.memory + MEMORY_HEADROOM);
        baseline = runtime.read_usage(container_id);
        exec_id = runtime.start_exec(container_id, wrapped, workdir);
    } catch (exception &ex) {
        LOG(ERROR) << "Unable to start command in container " << container_id << ": " << ex.what();
        return internal_error_result(ex.what());
    }

    elapsed_time timer;
    watch_state state;
    termination_cause cause = termination_cause::NORMAL_EXIT;
    exec_state exec;
    bool killed = false;

    try {
        while (true) {
            exec = runtime.inspect_exec(exec_id);
            sample(baseline, runtime.read_usage(container_id), state);
            state.output_size = output_size(host_dir, limits);
            double wall_time = timer.duration<chrono::microseconds>().count() / 1e6;

            cause = violation(state, wall_time, limits);
            if (cause != termination_cause::NORMAL_EXIT) {
                if (exec.running) {
                    DLOG(INFO) << "Killing container " << container_id << ": " << get_display_message(cause);
                    runtime.kill_container(container_id);
                    killed = true;
                    exec = runtime.inspect_exec(exec_id);
                }
                break;
            }
            if (!exec.running) break;
            this_thread::sleep_for(poll_interval);
        }
    } catch (exception &ex) {
        LOG(ERROR) << "Lost track of command in container " << container_id << ": " << ex.what();
        try {
            runtime.kill_container(container_id);
        } catch (exception &kill_ex) {
            LOG(ERROR) << "Unable to kill container " << container_id << ": " << kill_ex.what();
        }
        auto result = internal_error_result(ex.what());
        result.killed = true;
        return result;
    }

    execution_result result;
    result.wall_time = timer.duration<chrono::microseconds>().count() / 1e6;
    result.cpu_time = state.cpu_time;
    result.time = state.cpu_available ? state.cpu_time : result.wall_time;
    result.memory = state.peak_memory;
    result.killed = killed;
    result.exit_code = exec.running ? -1 : exec.exit_code;

    if (cause == termination_cause::NORMAL_EXIT && result.exit_code != 0)
        cause = termination_cause::RUNTIME_ERROR;
    result.cause = cause;

    if (cause == termination_cause::TIME_LIMIT_EXCEEDED) {
        double limit = limits.cpu_time > 0 ? limits.cpu_time : limits.wall_time;
        result.time = max(result.time, limit);
    } else if (cause == termination_cause::MEMORY_LIMIT_EXCEEDED) {
        result.memory = max(result.memory, limits.memory);
    }

    bool truncated_out = false, truncated_err = false;
    result.stdout_text = read_file_prefix(host_dir / STDOUT_FILE, limits.capture, &truncated_out);
    result.stderr_text = read_file_prefix(host_dir / STDERR_FILE, limits.capture, &truncated_err);
    result.output_truncated = truncated_out || truncated_err;
    return result;
}

}  // namespace hjudge::sandbox
