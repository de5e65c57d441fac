#pragma once

#include "metrics.hpp"
#include "monitor/monitor.hpp"

namespace hjudge {

/**
 * @brief 通过 Prometheus 导出评测机的运行状态
 */
struct prometheus_monitor : public monitor {
    prometheus::Family<prometheus::Counter> &tasks_started, &tasks_ended, &tasks_rejected, &report_delivery_failures, &sandboxes_created, &sandboxes_destroyed, &errors;
    prometheus::Family<prometheus::Gauge> &worker_status;

    explicit prometheus_monitor(std::shared_ptr<prometheus::Registry> registry);

    void start_task(int worker_id, const task &t) override;
    void end_task(int worker_id, const task &t, status result) override;
    void task_rejected(const std::string &reason) override;
    void report_delivery_failed(const task &t, const std::string &reason) override;
    void sandbox_created(const std::string &name) override;
    void sandbox_destroyed(const std::string &name) override;
    void worker_state_changed(int worker_id, worker_state state, const std::string &info) override;
    void report_error(int worker_id, const std::string &message) override;
};

}  // namespace hjudge
