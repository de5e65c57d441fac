#include "config.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <fstream>
#include <stdexcept>
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace hjudge {
using namespace std;
using namespace nlohmann;

string judger_config::suburl(const string &suburl) const {
    size_t start = 0;
    while (start < suburl.size() && suburl[start] == '/') ++start;
    return web_api_url + suburl.substr(start);
}

void judger_config::validate() const {
    if (prefetch_count < 2)
        throw invalid_argument("prefetch_count must be at least 2");
    if (max_tasks_sametime < 1)
        throw invalid_argument("max_tasks_sametime must be at least 1");
    if (!boost::algorithm::ends_with(web_api_url, "/"))
        throw invalid_argument("web_api_url must end with '/'");
    if (judger_uuid.empty())
        throw invalid_argument("judger_uuid must not be empty");
    if (docker_image.empty())
        throw invalid_argument("docker_image must not be empty");
    if (poll_interval_ms <= 0)
        throw invalid_argument("poll_interval_ms must be positive");
    if (wall_time_factor < 1)
        throw invalid_argument("wall_time_factor must be at least 1");
    if (result_retry_times < 1)
        throw invalid_argument("result_retry_times must be at least 1");
    for (int core : cores)
        if (core < 0) throw invalid_argument("cores must not contain negative ids");
}

void from_json(const json &j, judger_config &config) {
    judger_config def;
    config.broker_url = get_value_def(j, def.broker_url, "broker_url");
    config.queue = get_value_def(j, def.queue, "queue");
    config.data_dir = get_value_def(j, def.data_dir.string(), "data_dir");
    config.web_api_url = get_value_def(j, def.web_api_url, "web_api_url");
    config.judger_uuid = get_value_def(j, def.judger_uuid, "judger_uuid");
    config.docker_image = get_value_def(j, def.docker_image, "docker_image");
    config.docker_socket = get_value_def(j, def.docker_socket, "docker_socket");
    config.run_dir = get_value_def(j, def.run_dir.string(), "run_dir");
    config.logging_level = get_value_def(j, def.logging_level, "logging_level");
    config.log_dir = get_value_def(j, def.log_dir.string(), "log_dir");
    config.prefetch_count = get_value_def(j, def.prefetch_count, "prefetch_count");
    config.max_tasks_sametime = get_value_def(j, def.max_tasks_sametime, "max_tasks_sametime");
    config.cores = get_value_def(j, def.cores, "cores");
    config.poll_interval_ms = get_value_def(j, def.poll_interval_ms, "poll_interval_ms");
    config.wall_time_factor = get_value_def(j, def.wall_time_factor, "wall_time_factor");
    config.result_retry_times = get_value_def(j, def.result_retry_times, "result_retry_times");
    config.result_retry_interval_ms = get_value_def(j, def.result_retry_interval_ms, "result_retry_interval_ms");
    config.http_timeout_ms = get_value_def(j, def.http_timeout_ms, "http_timeout_ms");
    config.metrics_address = get_value_def(j, def.metrics_address, "metrics_address");
}

void to_json(json &j, const judger_config &config) {
    j = {
        {"broker_url", config.broker_url},
        {"queue", config.queue},
        {"data_dir", config.data_dir.string()},
        {"web_api_url", config.web_api_url},
        {"judger_uuid", config.judger_uuid},
        {"docker_image", config.docker_image},
        {"docker_socket", config.docker_socket},
        {"run_dir", config.run_dir.string()},
        {"logging_level", config.logging_level},
        {"log_dir", config.log_dir.string()},
        {"prefetch_count", config.prefetch_count},
        {"max_tasks_sametime", config.max_tasks_sametime},
        {"cores", config.cores},
        {"poll_interval_ms", config.poll_interval_ms},
        {"wall_time_factor", config.wall_time_factor},
        {"result_retry_times", config.result_retry_times},
        {"result_retry_interval_ms", config.result_retry_interval_ms},
        {"http_timeout_ms", config.http_timeout_ms},
        {"metrics_address", config.metrics_address}};
}

optional<judger_config> load_config(const filesystem::path &path) {
    if (!filesystem::exists(path)) return nullopt;
    judger_config config;
    try {
        config = json::parse(read_file_content(path)).get<judger_config>();
    } catch (json::exception &ex) {
        throw invalid_argument("malformed configuration file " + path.string() + ": " + ex.what());
    }
    config.validate();
    return config;
}

void write_config_template(const filesystem::path &path) {
    if (path.has_parent_path())
        filesystem::create_directories(path.parent_path());
    write_file_content(path, json(judger_config()).dump(4) + "\n");
}

}  // namespace hjudge
