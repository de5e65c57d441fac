#pragma once

#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include "common/net_utils.hpp"
#include "config.hpp"
#include "server/platform.hpp"

namespace hjudge::server {

/**
 * @brief 通过 HTTP API 访问评测网站
 * 所有请求都是表单形式的 POST 请求，并附带评测机的 uuid。
 * 评测网站的响应格式为 {"code": 0, "message": "", "data": ...}，code 不为 0 表示请求失败。
 */
struct http_platform : public platform {
    /**
     * @brief 发送表单请求的函数，参数为 url 和表单字段
     */
    using transport_t = std::function<net::http_response(const std::string &, const std::map<std::string, std::string> &)>;

    /**
     * @brief 下载文件的函数，参数为 url、表单字段和保存路径
     */
    using downloader_t = std::function<void(const std::string &, const std::map<std::string, std::string> &, const std::filesystem::path &)>;

    explicit http_platform(const judger_config &config);
    http_platform(const judger_config &config, transport_t transport, downloader_t downloader);

    language_config get_language_config(const std::string &lang_id) override;
    problem_info get_problem_info(std::int64_t problem_id) override;
    void sync_problem_files(std::int64_t problem_id, const std::filesystem::path &dir) override;
    void send_progress(const task &t, const submission_report &report, const std::string &message) override;
    bool send_result(const task &t, const submission_report &report) override;

    /**
     * @brief 发送进度最多尝试的次数
     */
    static constexpr int PROGRESS_ATTEMPTS = 2;

private:
    /**
     * @brief 调用评测网站 API
     * @param suburl 如 api/judge/update
     * @return 响应中的 data 字段
     * @throw network_error 如果连接失败或者评测网站返回 5xx
     * @throw platform_error 如果评测网站返回了错误
     */
    nlohmann::json call(const std::string &suburl, std::map<std::string, std::string> fields);

    /**
     * @brief 构造发送评测状态的请求
     */
    std::pair<std::string, std::map<std::string, std::string>> status_update(const task &t, const submission_report &report, const std::string &message, bool final) const;

    const judger_config &config;
    transport_t transport;
    downloader_t downloader;
};

}  // namespace hjudge::server
