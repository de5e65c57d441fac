#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "judge/task.hpp"

namespace hjudge {

/**
 * @brief 一个数据点的评测结果
 */
struct testcase_result {
    /**
     * @brief 输入文件名和标准输出文件名
     */
    std::string input, output;

    std::int64_t full_score = 0;
    std::int64_t score = 0;
    status result = status::WAITING;

    /**
     * @brief 运行时间（毫秒）
     */
    std::int64_t time = 0;

    /**
     * @brief 内存峰值（字节）
     */
    std::int64_t memory = 0;

    std::string message;
};

struct subtask_result {
    std::string name;

    /**
     * @brief 子任务的满分
     */
    std::int64_t full_score = 0;
    std::int64_t score = 0;

    /**
     * @brief 计分方式，sum 或 min
     */
    std::string method = "sum";

    status result = status::WAITING;
    std::vector<testcase_result> testcases;

    /**
     * @brief 根据数据点的结果计算子任务的结果和分数
     * min: 所有数据点通过才能得到子任务的满分
     * sum: 子任务的分数为数据点分数之和
     * 子任务的结果为数据点中严重程度最高的结果，没有任何数据点被评测时保持不变。
     */
    void aggregate();
};

/**
 * @brief 一个任务的评测报告
 * 每个被接受的任务都恰好产生一个评测报告，流水线出错时也会产生一个 SYSTEM_ERROR 的报告。
 */
struct submission_report {
    status result = status::WAITING;
    std::int64_t score = 0;

    /**
     * @brief 所有数据点运行时间的最大值（毫秒）
     */
    std::int64_t time = 0;

    /**
     * @brief 所有数据点内存峰值的最大值（字节）
     */
    std::int64_t memory = 0;

    /**
     * @brief 发送给用户的信息，编译错误时为编译器输出
     */
    std::string message;

    std::vector<subtask_result> subtasks;

    // 以下字段只有在线 IDE 运行时使用
    std::string stdout_text, stderr_text;
    int exit_code = 0;

    /**
     * @brief 按照题目信息构造初始评测报告，所有数据点都处于等待状态
     */
    static submission_report from_problem(const problem_info &problem);

    subtask_result *find_subtask(const std::string &name);

    /**
     * @brief 计算子任务和整个提交的评测结果、分数、时间和内存
     * 整个提交的评测结果为所有子任务中严重程度最高的结果，分数为子任务分数之和。
     * 没有任何数据点被评测时结果为 ACCEPTED。
     */
    void aggregate();
};

}  // namespace hjudge
