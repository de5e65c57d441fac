#include "server/http_platform.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <chrono>
#include <set>
#include <thread>
#include <tuple>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"
#include "monitor/monitor.hpp"
#include "server/protocol.hpp"

namespace hjudge::server {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

platform::~platform() = default;

http_platform::http_platform(const judger_config &config)
    : http_platform(
          config,
          [&config](const string &url, const map<string, string> &fields) {
              return net::post_form(url, fields, config.http_timeout_ms / 1000.0);
          },
          [](const string &url, const map<string, string> &fields, const fs::path &path) {
              net::download_file(url, fields, path);
          }) {}

http_platform::http_platform(const judger_config &config, transport_t transport, downloader_t downloader)
    : config(config), transport(move(transport)), downloader(move(downloader)) {}

json http_platform::call(const string &suburl, map<string, string> fields) {
    fields["uuid"] = config.judger_uuid;
    string url = config.suburl(suburl);
    net::http_response resp = transport(url, fields);

    if (resp.status_code >= 500)
        BOOST_THROW_EXCEPTION(network_error() << "POST " << url << " failed with status code " << resp.status_code);
    if (resp.status_code < 200 || resp.status_code >= 300)
        BOOST_THROW_EXCEPTION(platform_error() << "POST " << url << " failed with status code " << resp.status_code << ": " << resp.body);

    json body;
    try {
        body = json::parse(resp.body);
    } catch (json::exception &) {
        BOOST_THROW_EXCEPTION(platform_error() << "Invalid response from " << url << ": " << resp.body);
    }

    int64_t code;
    try {
        code = get_value<int64_t>(body, "code");
    } catch (invalid_argument &) {
        BOOST_THROW_EXCEPTION(platform_error() << "Invalid response from " << url << ": " << resp.body);
    }
    if (code != 0) {
        string message = body.count("message") && body["message"].is_string() ? body["message"].get<string>() : "<Not available>";
        BOOST_THROW_EXCEPTION(platform_error() << "Received failing message from " << url << ": " << message);
    }
    return body.count("data") ? body["data"] : json();
}

language_config http_platform::get_language_config(const string &lang_id) {
    json data = call("api/judge/get_lang_config_as_json", {{"lang_id", lang_id}});
    // 语言配置可能以 JSON 字符串的形式返回
    if (data.is_string()) {
        try {
            data = json::parse(data.get<string>());
        } catch (json::exception &ex) {
            BOOST_THROW_EXCEPTION(platform_error() << "Malformed language config of " << lang_id << ": " << ex.what());
        }
    }
    try {
        language_config lang = data.get<language_config>();
        lang.id = lang_id;
        return lang;
    } catch (json::exception &ex) {
        BOOST_THROW_EXCEPTION(platform_error() << "Malformed language config of " << lang_id << ": " << ex.what());
    } catch (invalid_argument &ex) {
        BOOST_THROW_EXCEPTION(platform_error() << "Malformed language config of " << lang_id << ": " << ex.what());
    }
}

problem_info http_platform::get_problem_info(int64_t problem_id) {
    json data = call("api/judge/get_problem_info", {{"problem_id", to_string(problem_id)}});
    try {
        return data.get<problem_info>();
    } catch (json::exception &ex) {
        BOOST_THROW_EXCEPTION(platform_error() << "Malformed problem info of " << problem_id << ": " << ex.what());
    } catch (invalid_argument &ex) {
        BOOST_THROW_EXCEPTION(platform_error() << "Malformed problem info of " << problem_id << ": " << ex.what());
    }
}

void http_platform::sync_problem_files(int64_t problem_id, const fs::path &dir) {
    auto lock = lock_directory(dir, false);
    json files = call("api/judge/get_file_list", {{"problem_id", to_string(problem_id)}});
    if (!files.is_array())
        BOOST_THROW_EXCEPTION(platform_error() << "Malformed file list of problem " << problem_id);

    set<string> names;
    for (auto &file : files) names.insert(assert_safe_path(get_value<string>(file, "name")));

    for (auto &entry : fs::directory_iterator(dir)) {
        string name = entry.path().filename().string();
        if (entry.path() == lock.file() || names.count(name)) continue;
        LOG(INFO) << "Removing stale testdata file " << entry.path();
        fs::remove_all(entry.path());
    }

    for (auto &file : files) {
        string name = get_value<string>(file, "name");
        time_t remote_time = static_cast<time_t>(get_value<double>(file, "last_modified_time"));
        fs::path local = dir / name;
        if (fs::exists(local) && hjudge::last_write_time(local) == remote_time) continue;

        LOG(INFO) << "Downloading testdata file " << name << " of problem " << problem_id;
        downloader(config.suburl("api/judge/download_file"),
                   {{"uuid", config.judger_uuid}, {"problem_id", to_string(problem_id)}, {"filename", name}},
                   local);
        hjudge::last_write_time(local, remote_time);
    }
}

pair<string, map<string, string>> http_platform::status_update(const task &t, const submission_report &report, const string &message, bool final) const {
    // 程序输出和 Special Judge 的信息不一定是合法的 UTF-8
    if (t.kind == task_kind::IDE_RUN) {
        return {"api/ide/update", {{"run_id", t.run_id}, {"message", sanitize_utf8(message)}, {"status", final ? "done" : "running"}}};
    }

    string extra_status = final && report.result == status::COMPILE_ERROR ? "compile_error" : "";
    return {"api/judge/update",
            {{"submission_id", to_string(t.submission_id)},
             {"judge_result", encode_judge_result(report).dump(-1, ' ', false, json::error_handler_t::replace)},
             {"message", sanitize_utf8(message)},
             {"extra_status", extra_status}}};
}

void http_platform::send_progress(const task &t, const submission_report &report, const string &message) {
    string suburl;
    map<string, string> fields;
    try {
        tie(suburl, fields) = status_update(t, report, message, false);
    } catch (std::exception &ex) {
        LOG(WARNING) << "Unable to encode progress of task " << t.id << ": " << ex.what();
        return;
    }
    for (int attempt = 1; attempt <= PROGRESS_ATTEMPTS; ++attempt) {
        try {
            call(suburl, fields);
            return;
        } catch (network_error &ex) {
            LOG(WARNING) << "Unable to send progress of task " << t.id << " (attempt " << attempt << "): " << ex.what();
        } catch (platform_error &ex) {
            LOG(WARNING) << "Unable to send progress of task " << t.id << ": " << ex.what();
            return;
        }
    }
}

bool http_platform::send_result(const task &t, const submission_report &report) {
    string suburl, reason;
    map<string, string> fields;
    try {
        tie(suburl, fields) = status_update(t, report, report.message, true);
    } catch (std::exception &ex) {
        reason = string("unable to encode result: ") + ex.what();
        LOG(ERROR) << "Failed to send result of task " << t.id << ": " << reason;
        call_monitor([&](monitor &m) { m.report_delivery_failed(t, reason); });
        return false;
    }

    chrono::milliseconds interval(config.result_retry_interval_ms);
    for (int attempt = 1; attempt <= config.result_retry_times; ++attempt) {
        try {
            call(suburl, fields);
            return true;
        } catch (network_error &ex) {
            reason = ex.what();
            LOG(WARNING) << "Unable to send result of task " << t.id << " (attempt " << attempt << "/" << config.result_retry_times << "): " << reason;
        } catch (platform_error &ex) {
            reason = ex.what();
            break;
        } catch (std::exception &ex) {
            // 其他错误不重试
            reason = ex.what();
            break;
        }
        if (attempt < config.result_retry_times) {
            this_thread::sleep_for(interval);
            interval = min<chrono::milliseconds>(interval * 2, chrono::seconds(30));
        }
    }

    LOG(ERROR) << "Failed to send result of task " << t.id << ": " << reason;
    call_monitor([&](monitor &m) { m.report_delivery_failed(t, reason); });
    return false;
}

}  // namespace hjudge::server
