#include "worker.hpp"
#include <glog/logging.h>
#include <pthread.h>
#include <atomic>
#include <system_error>
#include "common/defer.hpp"
#include "judge/pipeline.hpp"
#include "monitor/monitor.hpp"

namespace hjudge {
using namespace std;

void stop_workers(worker_context &ctx) {
    ctx.stopping = true;
}

submission_report judge_task(int worker_id, const server::delivery &d, worker_context &ctx, const string &cpuset) {
    const task &t = d.t;
    LOG(INFO) << "Worker " << worker_id << " starts judging task " << t.id;
    call_monitor([&](monitor &m) { m.start_task(worker_id, t); });

    submission_report report;
    report.result = status::SYSTEM_ERROR;
    defer {
        // 即使评测崩溃也要发送 end_task，避免监控中的任务数只增不减
        call_monitor([&](monitor &m) { m.end_task(worker_id, t, report.result); });
    };

    judge_pipeline pipeline(t, ctx.config, ctx.platform, ctx.runner, cpuset);
    report = pipeline.run();
    LOG(INFO) << "Task " << t.id << " finished with " << get_display_message(report.result) << ", score " << report.score;

    if (!ctx.platform.send_result(t, report))
        LOG(WARNING) << "Result of task " << t.id << " is not delivered, acknowledging anyway";
    ctx.consumer.ack(d.delivery_tag);
    return report;
}

static void worker_loop(int worker_id, worker_context &ctx, const string &cpuset) {
    call_monitor([&](monitor &m) { m.worker_state_changed(worker_id, worker_state::START, ""); });

    while (!ctx.stopping) {
        auto slot = ctx.controller.acquire();
        server::delivery d;
        if (!ctx.consumer.next(d)) break;

        call_monitor([&](monitor &m) { m.worker_state_changed(worker_id, worker_state::JUDGING, ""); });
        try {
            judge_task(worker_id, d, ctx, cpuset);
            call_monitor([&](monitor &m) { m.worker_state_changed(worker_id, worker_state::IDLE, ""); });
        } catch (std::exception &ex) {
            // 评测流水线本身不抛出异常，这里只可能是发送结果时的意外错误
            LOG(ERROR) << "Worker " << worker_id << " has crashed when judging task " << d.t.id << ": " << ex.what();
            string message = ex.what();
            call_monitor([&](monitor &m) { m.worker_state_changed(worker_id, worker_state::CRASHED, message); });
            call_monitor([&](monitor &m) { m.report_error(worker_id, message); });
            ctx.consumer.ack(d.delivery_tag);
        }
    }

    call_monitor([&](monitor &m) { m.worker_state_changed(worker_id, worker_state::STOPPED, ""); });
}

thread start_worker(int worker_id, worker_context &ctx) {
    const auto &cores = ctx.config.cores;
    string cpuset = cores.empty() ? "" : to_string(cores[worker_id % cores.size()]);

    thread thd([worker_id, &ctx, cpuset] {
        worker_loop(worker_id, ctx, cpuset);
    });

    if (!cores.empty()) {
        // 要求操作系统将 worker 线程放在指定的核心上运行
        cpu_set_t set;
        CPU_ZERO(&set);
        CPU_SET(cores[worker_id % cores.size()], &set);
        int ret = pthread_setaffinity_np(thd.native_handle(), sizeof(cpu_set_t), &set);
        if (ret != 0) {
            stop_workers(ctx);
            ctx.consumer.stop();
            thd.join();
            throw system_error(ret, generic_category(), "unable to set affinity of worker " + to_string(worker_id));
        }
    }

    return thd;
}

}  // namespace hjudge
