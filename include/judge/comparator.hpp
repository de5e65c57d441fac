#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include "judge/task.hpp"
#include "sandbox/sandbox.hpp"

namespace hjudge {

struct compare_result {
    /**
     * @brief 用户输出是否完全正确
     */
    bool accepted = false;

    std::int64_t score = 0;
    std::string message;
};

/**
 * @brief 判断用户输出是否正确
 */
struct comparator {
    virtual ~comparator();

    /**
     * @param user_out 用户程序的输出
     * @param answer 标准输出
     * @param input 数据点的输入
     * @param full_score 数据点的满分
     * @throw checker_error 如果比较器本身出错
     */
    virtual compare_result compare(const std::string &user_out, const std::string &answer, const std::string &input, std::int64_t full_score) = 0;
};

/**
 * @brief 逐行比较，忽略行末空白字符和文末空行
 */
struct simple_line_comparator : public comparator {
    compare_result compare(const std::string &user_out, const std::string &answer, const std::string &input, std::int64_t full_score) override;
};

/**
 * @brief 使用 Special Judge 程序判断用户输出
 * Special Judge 可以为任何所支持的语言编写，文件名为 spj_<语言 id>.<扩展名>。
 * 评测时 Special Judge 的工作目录下有以下文件：
 * input: 数据点的输入
 * user_out: 用户程序的输出
 * answer: 数据点的标准输出
 * Special Judge 应当在限制的时间内输出以下文件：
 * score: 该数据点的得分（0~100，自动折合为数据点的分数）
 * message: 发送给用户的信息
 * Special Judge 的运行时间不计入数据点的运行时间。
 */
struct special_judge_comparator : public comparator {
    /**
     * @param runner 沙箱管理器
     * @param box Special Judge 独占的沙箱
     * @param lang Special Judge 的语言配置
     * @param limits Special Judge 运行时的资源限制
     */
    special_judge_comparator(sandbox::sandbox_runner &runner, sandbox::sandbox &box, const language_config &lang, const sandbox::execution_limits &limits);

    /**
     * @brief 在沙箱中编译 Special Judge，时间限制 10 秒，内存限制 1GB
     * @param source Special Judge 源代码在宿主机上的路径
     * @throw checker_error 如果编译失败
     */
    void compile(const std::filesystem::path &source);

    compare_result compare(const std::string &user_out, const std::string &answer, const std::string &input, std::int64_t full_score) override;

    static constexpr const char *PROGRAM_FILENAME = "specialjudge";

private:
    sandbox::sandbox_runner &runner;
    sandbox::sandbox &box;
    language_config lang;
    sandbox::execution_limits limits;
};

/**
 * @brief 从 Special Judge 的文件名 spj_<语言 id>.<扩展名> 中提取语言 id
 * @throw internal_error 如果文件名不符合格式
 */
std::string special_judge_language(const std::string &spj_filename);

}  // namespace hjudge
