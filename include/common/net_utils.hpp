#pragma once

#include <filesystem>
#include <map>
#include <string>

namespace hjudge::net {

struct http_request {
    /**
     * @brief 请求方法，如 GET、POST、DELETE
     */
    std::string method = "GET";
    std::string url;

    /**
     * @brief 若不为空，则通过该 unix socket 连接（用于 Docker Engine API）
     */
    std::string unix_socket;
    std::string body;
    std::string content_type;

    /**
     * @brief 最大限制请求时间，单位为秒
     */
    double timeout = 10.0;
};

struct http_response {
    long status_code = 0;
    std::string body;
};

/**
 * @brief 发送 HTTP 请求
 * 只有在连接失败、超时等传输层错误时抛出异常，HTTP 状态码由调用者检查
 * @throw network_error 如果请求没有得到响应
 */
http_response request(const http_request &req);

/**
 * @brief 将表单编码为 application/x-www-form-urlencoded
 */
std::string encode_form(const std::map<std::string, std::string> &fields);

/**
 * @brief 发送表单形式的 POST 请求
 * @param url POST 请求地址
 * @param fields 表单字段
 * @param timeout 最大限制请求时间，单位为秒
 * @throw network_error 如果请求失败
 */
http_response post_form(const std::string &url, const std::map<std::string, std::string> &fields, double timeout = 10.0);

/**
 * @brief 以 POST 表单请求下载文件到本地路径 path
 * @throw network_error 如果请求失败或者状态码不是 2xx
 */
void download_file(const std::string &url, const std::map<std::string, std::string> &fields, const std::filesystem::path &path, double timeout = 60.0);

}  // namespace hjudge::net
