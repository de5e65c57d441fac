#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace hjudge {

/**
 * @brief 消息队列中的任务类型
 */
enum class task_kind {
    /**
     * @brief 评测网站题目的提交，对应 judgers.local.run
     */
    LOCAL_JUDGE,

    /**
     * @brief 在线 IDE 运行，对应 judgers.ide_run.run
     */
    IDE_RUN
};

/**
 * @brief 评测提交时的额外配置，对应旧协议中的 extra_config
 */
struct judge_options {
    /**
     * @brief 编译时间限制（毫秒）
     */
    std::int64_t compile_time_limit = 5000;

    /**
     * @brief 编译信息最多保留多少个字符
     */
    std::int64_t compile_result_length_limit = 500;

    /**
     * @brief Special Judge 的运行时间限制（毫秒）
     */
    std::int64_t spj_execute_time_limit = 3000;

    std::string extra_compile_parameter;

    /**
     * @brief 评测前是否从评测网站同步评测数据
     */
    bool auto_sync_files = false;

    /**
     * @brief 用户程序输出文件的大小限制（字节）
     */
    std::int64_t output_file_size_limit = 64 << 20;

    bool submit_answer = false;

    /**
     * @brief 提交答案题的答案压缩包（已经过 base64 解码）
     */
    std::string answer_data;

    /**
     * @brief 时间限制的缩放系数，用于补偿不同评测机的性能差异
     */
    double time_scale = 1.0;
};

/**
 * @brief 在线 IDE 运行的配置，对应旧协议中的 extra_config
 */
struct ide_options {
    std::int64_t compile_time_limit = 5000;
    std::int64_t compile_result_length_limit = 500;

    /**
     * @brief 运行时间限制（毫秒）
     */
    std::int64_t time_limit = 1000;

    /**
     * @brief 内存限制（MB）
     */
    std::int64_t memory_limit = 256;

    /**
     * @brief 运行结果最多保留多少个字符
     */
    std::int64_t result_length_limit = 1000;

    /**
     * @brief 编译参数
     */
    std::string parameter;
};

/**
 * @brief 从消息队列收到的评测任务
 * 解码后不再修改，由处理它的评测流水线独占。
 */
struct task {
    /**
     * @brief 消息队列中的任务 id（Celery 的 task id）
     */
    std::string id;

    task_kind kind = task_kind::LOCAL_JUDGE;

    std::int64_t submission_id = 0;
    std::int64_t problem_id = 0;

    /**
     * @brief 在线 IDE 运行的 id
     */
    std::string run_id;

    /**
     * @brief 语言 id，用于获取语言配置
     */
    std::string language;

    /**
     * @brief 用户代码
     */
    std::string code;

    /**
     * @brief 在线 IDE 运行时的标准输入
     */
    std::string input;

    judge_options options;
    ide_options ide;
};

struct testcase_info {
    /**
     * @brief 输入文件名，相对于题目的评测数据文件夹
     */
    std::string input;

    /**
     * @brief 标准输出文件名；对于提交答案题，也是选手答案的文件名
     */
    std::string output;

    std::int64_t full_score = 0;
};

struct subtask_info {
    std::string name;
    std::int64_t score = 0;

    /**
     * @brief 子任务的计分方式
     * sum: 子任务的分数为各个数据点的分数之和
     * min: 所有数据点通过才能得到子任务的分数，遇到未通过的数据点后跳过剩余数据点
     */
    std::string method = "sum";

    /**
     * @brief 时间限制（毫秒）
     */
    std::int64_t time_limit = 1000;

    /**
     * @brief 内存限制（MB）
     */
    std::int64_t memory_limit = 256;

    std::vector<testcase_info> testcases;
};

/**
 * @brief 题目信息，从评测网站获取
 */
struct problem_info {
    std::int64_t id = 0;

    /**
     * @brief Special Judge 的文件名，形如 spj_<语言 id>.<扩展名>，为空表示不使用 Special Judge
     */
    std::string spj_filename;

    bool using_file_io = false;
    std::string input_file_name;
    std::string output_file_name;

    /**
     * @brief 需要复制到用户程序旁边的额外文件
     */
    std::vector<std::string> provides;

    std::vector<subtask_info> subtasks;
};

void from_json(const nlohmann::json &j, testcase_info &testcase);
void from_json(const nlohmann::json &j, subtask_info &subtask);
void from_json(const nlohmann::json &j, problem_info &problem);

/**
 * @brief 语言配置，从评测网站获取
 * 命令模板中可以使用占位符：
 * {filename} 不含扩展名的文件名
 * {source} 源代码文件名
 * {output} 编译产物文件名
 * {extra} 额外的编译参数
 * {program} 要运行的程序
 * {redirect} 运行时的输入输出重定向
 */
struct language_config {
    std::string id;
    std::string source_file;
    std::string output_file;
    std::string compile;
    std::string run;

    std::string source_name(const std::string &filename) const;
    std::string output_name(const std::string &filename) const;
    std::string compile_command(const std::string &filename, const std::string &extra) const;
    std::string run_command(const std::string &program, const std::string &redirect) const;
};

void from_json(const nlohmann::json &j, language_config &lang);

/**
 * @brief 用户程序的默认文件名（不含扩展名）
 */
constexpr const char *DEFAULT_PROGRAM_FILENAME = "user-app";

/**
 * @brief 普通题目，逐字符比较（忽略行末空格和文末空行）
 */
struct traditional_mode {
};

/**
 * @brief 使用 Special Judge 判断用户输出
 */
struct special_judge_mode {
    std::string checker_file;
    std::string checker_language;
};

/**
 * @brief 提交答案题，用户提交的是答案文件的压缩包，由 Special Judge 判断
 */
struct submit_answer_mode {
    std::string checker_file;
    std::string checker_language;
};

/**
 * @brief 在线 IDE，运行一次并返回程序输出，不判断对错
 */
struct interactive_ide_mode {
    std::string input;
};

using judge_mode = std::variant<traditional_mode, special_judge_mode, submit_answer_mode, interactive_ide_mode>;

const char *mode_name(const judge_mode &mode);

}  // namespace hjudge
