#pragma once

namespace hjudge {

/**
 * @brief 表示数据点、子任务或整个提交的评测结果
 */
enum class status {
    /**
     * @brief 数据点还在等待评测
     */
    WAITING = 0,

    /**
     * @brief 数据点正在评测
     */
    JUDGING = 1,

    /**
     * @brief 数据点由于子任务的评测方式或者依赖关系没有被评测
     */
    SKIPPED = 2,

    /**
     * @brief 用户程序本测试点评测通过
     * 行末空白字符和文末空行不影响比较结果。
     */
    ACCEPTED = 3,

    /**
     * @brief 答案错误，或者 Special Judge 没有给满分
     */
    WRONG_ANSWER = 4,

    /**
     * @brief 用户程序运行时间超出限制
     * 优先比较 CPU 时间，时钟时间作为兜底，防止程序通过 sleep 占用评测机。
     */
    TIME_LIMIT_EXCEEDED = 5,

    /**
     * @brief 用户程序运行内存超限
     * 通过 cgroup 的内存峰值以及 OOM killer 的触发次数判断，
     * 与程序的退出码无关。
     */
    MEMORY_LIMIT_EXCEEDED = 6,

    /**
     * @brief 用户程序出现运行时错误，即返回值非 0 或者被信号终止
     */
    RUNTIME_ERROR = 7,

    /**
     * @brief 用户程序输出内容过多
     */
    OUTPUT_LIMIT_EXCEEDED = 8,

    /**
     * @brief 用户程序编译错误
     */
    COMPILE_ERROR = 9,

    /**
     * @brief 内部错误，评测系统出错
     * 比如容器无法创建、Special Judge 崩溃、评测数据缺失等。
     */
    SYSTEM_ERROR = 10
};

const char *get_display_message(status);

/**
 * @brief 评测结果的严重程度，用于计算整个提交的评测结果
 * 评测结果为所有数据点中严重程度最高的结果。
 */
int severity(status);

/**
 * @brief 是否是最终结果（不是 WAITING、JUDGING、SKIPPED）
 */
bool is_final(status);

}  // namespace hjudge
