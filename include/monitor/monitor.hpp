#pragma once

#include <functional>
#include <memory>
#include <string>
#include "common/status.hpp"
#include "judge/task.hpp"

namespace hjudge {

/**
 * @brief worker 线程的状态
 */
enum class worker_state {
    START = 0,
    JUDGING = 1,
    IDLE = 2,
    CRASHED = 3,
    STOPPED = 4
};

/**
 * @brief 执行监控行为
 * 所有回调都可能被多个线程同时调用。
 */
struct monitor {
    virtual ~monitor();

    /**
     * @brief 监控上报某个 worker 已经开始评测一个任务
     * @param worker_id 执行评测任务的 Worker 编号
     */
    virtual void start_task(int worker_id, const task &t);

    /**
     * @brief 监控上报某个任务已经评测结束
     * @param result 评测报告的最终结果
     */
    virtual void end_task(int worker_id, const task &t, status result);

    /**
     * @brief 监控上报消息队列中的一个任务因为格式错误被拒绝
     */
    virtual void task_rejected(const std::string &reason);

    /**
     * @brief 监控上报评测结果在多次重试后仍然无法发送给评测网站
     */
    virtual void report_delivery_failed(const task &t, const std::string &reason);

    virtual void sandbox_created(const std::string &name);

    virtual void sandbox_destroyed(const std::string &name);

    /**
     * @brief 监控上报当前某个 Worker 的状态
     * @param worker_id Worker 编号
     * @param state Worker 的新状态
     * @param information 如果 Worker 崩溃，则为错误原因，用于日志记录
     */
    virtual void worker_state_changed(int worker_id, worker_state state, const std::string &information);

    /**
     * @brief 监控上报系统错误
     * @param worker_id 出错的 Worker 编号，不属于任何 Worker 时为 -1
     */
    virtual void report_error(int worker_id, const std::string &message);
};

/**
 * @brief 注册监控，必须在 worker 启动之前完成
 */
void register_monitor(std::unique_ptr<monitor> &&m);

/**
 * @brief 移除所有已注册的监控
 */
void clear_monitors();

/**
 * @brief 依次调用所有已注册的监控，监控本身抛出的异常只记录日志
 */
void call_monitor(const std::function<void(monitor &)> &callback);

const char *get_display_message(worker_state state);

}  // namespace hjudge
