#pragma once

#include <atomic>
#include <thread>
#include "common/concurrency_controller.hpp"
#include "config.hpp"
#include "judge/report.hpp"
#include "sandbox/sandbox.hpp"
#include "server/platform.hpp"
#include "server/task_consumer.hpp"

/**
 * 评测 worker 相关函数
 * 消费者线程从消息队列中拉取任务放入缓冲区，每个 worker 先获取一个并发槽位，
 * 再从缓冲区取出一个任务，运行评测流水线，发送评测结果，最后请求确认消息。
 * 槽位在确认请求发出之后才释放，因此同时评测的任务数不会超过 max_tasks_sametime。
 */
namespace hjudge {

/**
 * @brief worker 共享的组件，由主线程创建，生命周期长于所有 worker
 */
struct worker_context {
    const judger_config &config;
    server::platform &platform;
    sandbox::sandbox_runner &runner;
    server::task_consumer &consumer;
    concurrency_controller &controller;

    /**
     * @brief 为 true 时 worker 不再获取新任务
     */
    std::atomic<bool> stopping{false};
};

/**
 * @brief 停止使用 ctx 的所有 worker
 * 调用该函数后，worker 在完成当前任务后退出，不再获取新任务。
 */
void stop_workers(worker_context &ctx);

/**
 * @brief 评测一个任务，发送评测结果并请求确认消息
 * @param worker_id 执行评测的 worker 编号
 * @param cpuset 沙箱绑定的 CPU 核心
 * @return 评测报告
 */
submission_report judge_task(int worker_id, const server::delivery &d, worker_context &ctx, const std::string &cpuset = "");

/**
 * @brief 启动评测 worker 线程
 * 若配置了 cores，第 i 个 worker 线程和它的沙箱都绑定到 cores[i % cores.size()]。
 * @param worker_id worker 编号
 * @return 产生的线程
 */
std::thread start_worker(int worker_id, worker_context &ctx);

}  // namespace hjudge
