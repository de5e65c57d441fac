#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "common/status.hpp"
#include "judge/report.hpp"
#include "judge/task.hpp"
#include "server/broker.hpp"

/**
 * 这个头文件负责旧评测系统（Celery）的消息格式
 * 1. 将消息队列中的 Celery 任务解码为评测任务
 * 2. 将评测报告编码为评测网站能够识别的 judge_result
 */
namespace hjudge::server {

constexpr const char *LOCAL_JUDGE_TASK = "judgers.local.run";
constexpr const char *IDE_RUN_TASK = "judgers.ide_run.run";
constexpr const char *REMOTE_JUDGE_TASK = "judgers.remote.run";

/**
 * @brief 解码 Celery 任务
 * 支持 Celery 消息协议 v2（任务名在消息头的 task 字段中，消息体为 [args, kwargs, embed]）
 * 和 v1（消息体为包含 task、id、args、kwargs 的对象）。
 * @throw protocol_error 如果缺少任务名、任务不受支持或者参数缺失、类型错误
 */
task decode_task(const broker_message &message);

/**
 * @brief 将评测报告编码为评测网站的 judge_result 格式
 * 测试点信息中不合法的 UTF-8 字节替换为 U+FFFD。
 * @code{.json}
 * {
 *     "子任务名": {
 *         "score": 10,
 *         "status": "accepted",
 *         "testcases": [
 *             {"full_score": 10, "input": "1.in", "memory_cost": 1024, "message": "OK!",
 *              "output": "1.out", "score": 10, "status": "accepted", "time_cost": 3}
 *         ]
 *     }
 * }
 * @endcode
 */
nlohmann::json encode_judge_result(const submission_report &report);

/**
 * @brief 数据点在评测网站中的状态名
 */
const char *legacy_status(status s);

/**
 * @brief 子任务在评测网站中的状态名，未通过的子任务统一为 unaccepted
 */
const char *legacy_subtask_status(status s);

}  // namespace hjudge::server
