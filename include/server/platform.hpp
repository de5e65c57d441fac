#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include "judge/report.hpp"
#include "judge/task.hpp"

namespace hjudge::server {

/**
 * @brief 评测网站
 * 评测机从评测网站获取题目信息、语言配置和评测数据，并将评测进度和评测结果发送回去。
 */
struct platform {
    virtual ~platform();

    /**
     * @throw network_error, platform_error
     */
    virtual language_config get_language_config(const std::string &lang_id) = 0;

    /**
     * @throw network_error, platform_error
     */
    virtual problem_info get_problem_info(std::int64_t problem_id) = 0;

    /**
     * @brief 将题目的评测数据同步到 dir
     * 删除本地多余的文件，下载修改时间和评测网站不一致的文件。
     */
    virtual void sync_problem_files(std::int64_t problem_id, const std::filesystem::path &dir) = 0;

    /**
     * @brief 发送评测进度，失败时只记录日志
     */
    virtual void send_progress(const task &t, const submission_report &report, const std::string &message) = 0;

    /**
     * @brief 发送最终评测结果，失败时会重试
     * @return 评测结果是否成功发送
     */
    virtual bool send_result(const task &t, const submission_report &report) = 0;
};

}  // namespace hjudge::server
