#include <glog/logging.h>
#include <curl/curl.h>
#include <pthread.h>
#include <signal.h>
#include <sys/stat.h>
#include <boost/program_options.hpp>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>
#include <vector>
#include "common/concurrency_controller.hpp"
#include "config.hpp"
#include "metrics.hpp"
#include "monitor/prometheus.hpp"
#include "sandbox/docker.hpp"
#include "sandbox/sandbox.hpp"
#include "server/http_platform.hpp"
#include "server/rabbitmq.hpp"
#include "server/task_consumer.hpp"
#include "worker.hpp"
using namespace std;

static void setup_logging(const hjudge::judger_config& config, bool debug) {
    string level = debug ? "debug" : config.logging_level;
    if (level == "debug") {
        FLAGS_minloglevel = google::GLOG_INFO;
        FLAGS_v = 1;
    } else if (level == "info") {
        FLAGS_minloglevel = google::GLOG_INFO;
    } else if (level == "warning") {
        FLAGS_minloglevel = google::GLOG_WARNING;
    } else if (level == "error") {
        FLAGS_minloglevel = google::GLOG_ERROR;
    } else {
        LOG(FATAL) << "Unrecognized logging level " << level;
    }

    filesystem::create_directories(config.log_dir);
    FLAGS_log_dir = config.log_dir.string();
    FLAGS_alsologtostderr = true;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("hjudge-worker options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>()->default_value("config.json"), "set the configuration file path. If the file does not exist, a template will be written to it.")
        ("debug", "force debug logging regardless of logging_level in configuration.")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "hjudge-worker: Consume judging tasks from message queue, judge them in docker containers" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "hjudge-worker 1.0" << endl;
        return EXIT_SUCCESS;
    }

    filesystem::path config_path = vm["config"].as<string>();
    optional<hjudge::judger_config> loaded;
    try {
        loaded = hjudge::load_config(config_path);
    } catch (std::exception& e) {
        LOG(FATAL) << "Configuration file " << config_path << " is malformed: " << e.what();
    }

    if (!loaded) {
        hjudge::write_config_template(config_path);
        cout << "Configuration file " << config_path << " does not exist, a template has been written. "
             << "Edit it and start again." << endl;
        return EXIT_SUCCESS;
    }
    const hjudge::judger_config& config = *loaded;

    setup_logging(config, vm.count("debug") > 0);

    // 沙箱工作目录需要能够被容器内的用户读写，不能被 umask 屏蔽
    umask(0);
    filesystem::create_directories(config.run_dir);
    filesystem::create_directories(config.data_dir);

    CHECK(curl_global_init(CURL_GLOBAL_ALL) == CURLE_OK) << "Unable to initialize libcurl";

    // 所有线程都屏蔽 SIGINT 和 SIGTERM，由主线程通过 sigwait 处理
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    CHECK(pthread_sigmask(SIG_BLOCK, &signals, nullptr) == 0) << "Unable to block signals";

    unique_ptr<prometheus::Exposer> exposer;
    if (!config.metrics_address.empty()) {
        exposer = hjudge::metrics::expose(config.metrics_address);
        hjudge::register_monitor(make_unique<hjudge::prometheus_monitor>(hjudge::metrics::global_registry()));
        LOG(INFO) << "Exposing metrics on " << config.metrics_address;
    }

    hjudge::sandbox::docker_runtime runtime(config.docker_socket);
    hjudge::sandbox::sandbox_options options;
    options.image = config.docker_image;
    options.run_dir = config.run_dir;
    options.poll_interval = chrono::milliseconds(config.poll_interval_ms);
    hjudge::sandbox::sandbox_runner runner(runtime, options);

    hjudge::server::http_platform platform(config);

    unique_ptr<hjudge::server::rabbitmq> broker;
    try {
        broker = make_unique<hjudge::server::rabbitmq>(config.broker_url, config.queue, config.prefetch_count + config.max_tasks_sametime);
    } catch (std::exception& e) {
        LOG(FATAL) << "Unable to connect to message queue " << config.broker_url << ": " << e.what();
    }

    hjudge::server::task_consumer consumer(*broker, config.prefetch_count);
    hjudge::concurrency_controller controller(config.max_tasks_sametime);
    hjudge::worker_context context{config, platform, runner, consumer, controller};

    // 消息队列断开时 consumer 自行重连，不会退出
    thread consumer_thread([&] { consumer.run(); });

    vector<thread> worker_threads;
    for (int i = 0; i < config.max_tasks_sametime; ++i)
        worker_threads.push_back(hjudge::start_worker(i, context));
    LOG(INFO) << "Started " << config.max_tasks_sametime << " workers consuming queue " << config.queue;

    int signum = 0;
    sigwait(&signals, &signum);
    LOG(WARNING) << "Received signal " << signum << ", stopping workers";
    hjudge::stop_workers(context);
    consumer.stop();

    for (auto& th : worker_threads)
        th.join();
    consumer.shutdown();
    consumer_thread.join();

    LOG(INFO) << "Peak concurrency " << controller.peak() << ", peak sandboxes " << runner.peak();
    hjudge::clear_monitors();
    curl_global_cleanup();
    return 0;
}
