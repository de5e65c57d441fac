#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/io_utils.hpp"
#include "config.hpp"
#include "judge/comparator.hpp"
#include "judge/report.hpp"
#include "judge/task.hpp"
#include "sandbox/sandbox.hpp"
#include "server/platform.hpp"

namespace hjudge {

enum class pipeline_state {
    PENDING,
    COMPILING,
    RUNNING,
    CHECKING,
    AGGREGATING,
    DONE,
    ERRORED
};

const char *get_display_message(pipeline_state state);

/**
 * @brief 一个任务的评测流程
 * PENDING -> COMPILING -> RUNNING(i) -> CHECKING(i) -> AGGREGATING -> DONE
 * 任何一步抛出异常都会进入 ERRORED，此时仍然返回一个 SYSTEM_ERROR 的评测报告。
 *
 * 评测流水线由一个 worker 线程独占，每个任务创建一次。
 */
struct judge_pipeline {
    /**
     * @param t 要评测的任务
     * @param config 评测机配置
     * @param platform 评测网站
     * @param runner 沙箱管理器
     * @param cpuset 沙箱绑定的 CPU 核心，为空表示不绑定
     */
    judge_pipeline(const task &t, const judger_config &config, server::platform &platform, sandbox::sandbox_runner &runner, const std::string &cpuset = "");

    /**
     * @brief 执行评测，不会抛出异常
     * @return 评测报告
     */
    submission_report run() noexcept;

    pipeline_state state() const;

    /**
     * @brief 经过的所有状态，RUNNING 和 CHECKING 每个数据点记录一次
     */
    const std::vector<pipeline_state> &history() const;

    const judge_mode &mode() const;

    static constexpr std::int64_t COMPILE_MEMORY_LIMIT = 2LL << 30;
    static constexpr std::int64_t CHECKER_MEMORY_LIMIT = 1LL << 30;
    static constexpr std::int64_t IDE_OUTPUT_LIMIT = 64LL << 20;

private:
    friend struct mode_dispatcher;

    void transition(pipeline_state next);
    void progress(const std::string &message);

    /**
     * @brief 解析评测模式，获取题目信息和语言配置，构造初始评测报告
     */
    void prepare();

    /**
     * @brief 编译用户程序
     * @return 是否编译成功，编译失败时评测报告已经被设置为 COMPILE_ERROR
     */
    bool compile(sandbox::sandbox &box, const std::string &extra, std::int64_t time_limit, std::int64_t result_length_limit,
                 std::int64_t memory_limit = COMPILE_MEMORY_LIMIT);

    /**
     * @brief 在独立的沙箱中编译 Special Judge
     */
    special_judge_comparator prepare_checker(sandbox::sandbox &checker_box, const std::string &checker_language);

    /**
     * @brief 按照依赖关系依次评测所有子任务
     * @param judge_testcase 评测一个数据点，结果写入 testcase_result
     */
    void judge_subtasks(const std::function<void(const subtask_info &, const testcase_info &, testcase_result &)> &judge_testcase);

    void judge_program(comparator &cmp, sandbox::sandbox &box);
    void run_testcase(sandbox::sandbox &box, comparator &cmp, const subtask_info &subtask, const testcase_info &testcase, testcase_result &result);
    void judge_answers(comparator &cmp);
    void run_ide(sandbox::sandbox &box);

    sandbox::execution_limits program_limits(double time_limit, std::int64_t memory_limit) const;

    task t;
    const judger_config &config;
    server::platform &platform;
    sandbox::sandbox_runner &runner;
    std::string cpuset;

    judge_mode current_mode;
    problem_info problem;
    std::filesystem::path problem_dir;
    language_config lang;
    nlohmann::json dependency;
    submission_report report;
    std::vector<pipeline_state> states;

    /**
     * @brief 评测期间对评测数据加读锁，防止被同步评测数据的其他 worker 修改
     */
    scoped_file_lock data_lock;
};

}  // namespace hjudge
