#include "monitor/prometheus.hpp"

namespace hjudge {
using namespace std;

static const char *kind_label(const task &t) {
    return t.kind == task_kind::IDE_RUN ? "ide_run" : "local";
}

prometheus_monitor::prometheus_monitor(shared_ptr<prometheus::Registry> registry)
    : tasks_started(prometheus::BuildCounter()
                        .Name("hjudge_tasks_started")
                        .Help("The number of tasks that has started judging")
                        .Register(*registry)),
      tasks_ended(prometheus::BuildCounter()
                      .Name("hjudge_tasks_ended")
                      .Help("The number of tasks that has finished judging")
                      .Register(*registry)),
      tasks_rejected(prometheus::BuildCounter()
                         .Name("hjudge_tasks_rejected")
                         .Help("The number of malformed task messages rejected")
                         .Register(*registry)),
      report_delivery_failures(prometheus::BuildCounter()
                                   .Name("hjudge_report_delivery_failures")
                                   .Help("The number of reports that could not be delivered after retrying")
                                   .Register(*registry)),
      sandboxes_created(prometheus::BuildCounter()
                            .Name("hjudge_sandboxes_created")
                            .Help("The number of sandbox containers created")
                            .Register(*registry)),
      sandboxes_destroyed(prometheus::BuildCounter()
                              .Name("hjudge_sandboxes_destroyed")
                              .Help("The number of sandbox containers destroyed")
                              .Register(*registry)),
      errors(prometheus::BuildCounter()
                 .Name("hjudge_errors")
                 .Help("The number of system errors reported")
                 .Register(*registry)),
      worker_status(prometheus::BuildGauge()
                        .Name("hjudge_workers_status")
                        .Help("Show status of each worker (0:START   ; 1:JUDGING   ; 2:IDLE   ; 3:CRASHED   ; 4:STOPPED)")
                        .Register(*registry)) {}

void prometheus_monitor::start_task(int worker_id, const task &t) {
    tasks_started.Add({{"worker_id", to_string(worker_id)},
                       {"kind", kind_label(t)}})
        .Increment();
}

void prometheus_monitor::end_task(int worker_id, const task &t, status result) {
    tasks_ended.Add({{"worker_id", to_string(worker_id)},
                     {"kind", kind_label(t)},
                     {"status", get_display_message(result)}})
        .Increment();
}

void prometheus_monitor::task_rejected(const string &) {
    tasks_rejected.Add({}).Increment();
}

void prometheus_monitor::report_delivery_failed(const task &t, const string &) {
    report_delivery_failures.Add({{"kind", kind_label(t)}}).Increment();
}

void prometheus_monitor::sandbox_created(const string &) {
    sandboxes_created.Add({}).Increment();
}

void prometheus_monitor::sandbox_destroyed(const string &) {
    sandboxes_destroyed.Add({}).Increment();
}

void prometheus_monitor::worker_state_changed(int worker_id, worker_state state, const string &) {
    worker_status.Add({{"worker_id", to_string(worker_id)}}).Set(static_cast<int>(state));
}

void prometheus_monitor::report_error(int worker_id, const string &) {
    errors.Add({{"worker_id", to_string(worker_id)}}).Increment();
}

}  // namespace hjudge
