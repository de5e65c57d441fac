#include "sandbox/sandbox.hpp"
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cctype>
#include <vector>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "monitor/monitor.hpp"

namespace hjudge::sandbox {
using namespace std;
namespace fs = std::filesystem;

fs::path sandbox::path(const string &name) const {
    return host_dir / assert_safe_path(name);
}

void sandbox::put_file(const string &name, const string &content, bool persistent) {
    fs::path p = path(name);
    if (p.has_parent_path()) fs::create_directories(p.parent_path());
    write_file_content(p, content);
    if (persistent) keep(name);
}

void sandbox::copy_file(const fs::path &from, const string &name, bool persistent) {
    fs::path p = path(name);
    error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);
    fs::copy_file(from, p, fs::copy_options::overwrite_existing, ec);
    if (ec) BOOST_THROW_EXCEPTION(internal_error() << "unable to copy " << from.string() << " to sandbox " << this->name << ": " << ec.message());
    if (persistent) keep(name);
}

string sandbox::read_file(const string &name) const {
    return read_file_content(path(name));
}

string sandbox::read_file(const string &name, size_t limit, bool *truncated) const {
    return read_file_prefix(path(name), limit, truncated);
}

bool sandbox::exists(const string &name) const {
    return fs::exists(path(name));
}

int64_t sandbox::file_size(const string &name) const {
    return file_size_or_zero(path(name));
}

void sandbox::keep(const string &name) {
    // 只保留顶层的文件名，子目录整个保留
    fs::path p(assert_safe_path(name));
    persistent.insert(p.begin()->string());
}

void sandbox::reset() {
    error_code ec;
    vector<fs::path> garbage;
    for (auto &entry : fs::directory_iterator(host_dir, ec))
        if (!persistent.count(entry.path().filename().string()))
            garbage.push_back(entry.path());
    if (ec) BOOST_THROW_EXCEPTION(sandbox_error() << "unable to list " << host_dir.string() << ": " << ec.message());

    for (auto &p : garbage) {
        fs::remove_all(p, ec);
        if (ec) BOOST_THROW_EXCEPTION(sandbox_error() << "unable to clean " << p.string() << ": " << ec.message());
    }
}

sandbox_runner::sandbox_runner(container_runtime &runtime, const sandbox_options &options)
    : runtime(runtime), options(options), limiter(runtime, options.poll_interval) {}

/**
 * @brief 容器名只能包含 [a-zA-Z0-9_.-]
 */
static string sanitize_tag(const string &tag) {
    string result = tag;
    for (char &c : result)
        if (!isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '.' && c != '-') c = '_';
    return result;
}

unique_ptr<sandbox> sandbox_runner::acquire(const string &tag, const string &cpuset) {
    auto box = make_unique<sandbox>();
    box->name = "hjudge-" + sanitize_tag(tag) + "-" + boost::lexical_cast<string>(boost::uuids::random_generator()());
    box->host_dir = options.run_dir / box->name;

    container_spec spec;
    spec.name = box->name;
    spec.image = options.image;
    spec.host_dir = box->host_dir;
    spec.memory_limit = options.memory_limit;
    spec.pids_limit = options.pids_limit;
    spec.cpuset = cpuset;
    box->mount_point = spec.mount_point;

    try {
        fs::create_directories(box->host_dir);
        // 容器内的用户不一定是 root，需要能够写入工作目录
        fs::permissions(box->host_dir, fs::perms::all);
        box->container_id = runtime.create_container(spec);
        runtime.start_container(box->container_id);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unable to create sandbox " << box->name << ": " << ex.what();
        if (!box->container_id.empty()) {
            try {
                runtime.remove_container(box->container_id);
            } catch (sandbox_error &remove_ex) {
                LOG(ERROR) << "Unable to remove container " << box->container_id << ": " << remove_ex.what();
            }
        }
        error_code ec;
        fs::remove_all(box->host_dir, ec);
        BOOST_THROW_EXCEPTION(sandbox_error() << "unable to create sandbox " << box->name << ": " << ex.what());
    }

    int now = ++active_count;
    int peak = peak_count.load();
    while (now > peak && !peak_count.compare_exchange_weak(peak, now))
        ;
    DLOG(INFO) << "Sandbox " << box->name << " created, container id " << box->container_id;
    call_monitor([&](monitor &m) { m.sandbox_created(box->name); });
    return box;
}

execution_result sandbox_runner::run(sandbox &box, const string &command, const execution_limits &limits) {
    if (box.state == sandbox_state::DESTROYED)
        BOOST_THROW_EXCEPTION(sandbox_error() << "sandbox " << box.name << " has been destroyed");

    if (box.needs_restart) {
        runtime.start_container(box.container_id);
        box.needs_restart = false;
    }

    box.state = sandbox_state::EXECUTING;
    execution_result result = limiter.execute(box.container_id, box.host_dir, box.mount_point, command, limits);
    box.state = sandbox_state::READY;
    if (result.killed || result.cause == termination_cause::SANDBOX_INTERNAL_ERROR)
        box.needs_restart = true;
    return result;
}

void sandbox_runner::release(sandbox &box) noexcept {
    if (box.state == sandbox_state::DESTROYED) return;
    box.state = sandbox_state::DESTROYED;

    try {
        runtime.remove_container(box.container_id);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unable to remove container " << box.container_id << " of sandbox " << box.name << ": " << ex.what();
    }
    error_code ec;
    fs::remove_all(box.host_dir, ec);
    if (ec) LOG(ERROR) << "Unable to remove sandbox directory " << box.host_dir << ": " << ec.message();

    --active_count;
    DLOG(INFO) << "Sandbox " << box.name << " destroyed";
    call_monitor([&](monitor &m) { m.sandbox_destroyed(box.name); });
}

int sandbox_runner::active() const {
    return active_count.load();
}

int sandbox_runner::peak() const {
    return peak_count.load();
}

scoped_sandbox::scoped_sandbox(sandbox_runner &runner, unique_ptr<sandbox> &&box)
    : runner(&runner), box(move(box)) {}

scoped_sandbox::scoped_sandbox(scoped_sandbox &&other) noexcept
    : runner(other.runner), box(move(other.box)) {}

scoped_sandbox::~scoped_sandbox() {
    if (box) runner->release(*box);
}

sandbox &scoped_sandbox::operator*() const {
    return *box;
}

sandbox *scoped_sandbox::operator->() const {
    return box.get();
}

sandbox *scoped_sandbox::get() const {
    return box.get();
}

}  // namespace hjudge::sandbox
