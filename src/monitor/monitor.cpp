#include "monitor/monitor.hpp"
#include <glog/logging.h>
#include <boost/assign.hpp>
#include <unordered_map>
#include <vector>

namespace hjudge {
using namespace std;

monitor::~monitor() = default;

void monitor::start_task(int, const task &) {}

void monitor::end_task(int, const task &, status) {}

void monitor::task_rejected(const string &) {}

void monitor::report_delivery_failed(const task &, const string &) {}

void monitor::sandbox_created(const string &) {}

void monitor::sandbox_destroyed(const string &) {}

void monitor::worker_state_changed(int, worker_state, const string &) {}

void monitor::report_error(int, const string &) {}

static vector<unique_ptr<monitor>> monitors;

void register_monitor(unique_ptr<monitor> &&m) {
    monitors.push_back(move(m));
}

void clear_monitors() {
    monitors.clear();
}

void call_monitor(const function<void(monitor &)> &callback) {
    for (auto &m : monitors) {
        try {
            callback(*m);
        } catch (std::exception &ex) {
            LOG(ERROR) << "Monitor has crashed when reporting monitoring information, " << ex.what();
        }
    }
}

// clang-format off
static const unordered_map<worker_state, const char *> state_string = boost::assign::map_list_of
    (worker_state::START, "start")
    (worker_state::JUDGING, "judging")
    (worker_state::IDLE, "idle")
    (worker_state::CRASHED, "crashed")
    (worker_state::STOPPED, "stopped");
// clang-format on

const char *get_display_message(worker_state state) {
    return state_string.at(state);
}

}  // namespace hjudge
