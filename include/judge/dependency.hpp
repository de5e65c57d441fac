#pragma once

#include <functional>
#include <map>
#include <optional>
#include <queue>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace hjudge {

/**
 * @brief 子任务之间的依赖关系
 * 依赖关系定义在评测数据文件夹的 subtask_dependency.json 中，格式为
 * { "子任务 A": ["子任务 B", "子任务 C"] }，表示 A 依赖 B 和 C，即 B 和 C 都通过后才评测 A。
 * 子任务按照拓扑序评测，同时可以评测的子任务中编号小的优先。
 * 依赖的子任务没有全部通过的子任务（包括处于环中的子任务）会被跳过。
 */
struct dependency_graph {
    static constexpr const char *DEFINITION_FILENAME = "subtask_dependency.json";

    /**
     * @param names 子任务名，按照题目信息中的顺序
     * @param definition 依赖关系，null 表示没有依赖关系
     * @throw internal_error 如果依赖关系中出现不存在的子任务或者格式错误
     */
    dependency_graph(const std::vector<std::string> &names, const nlohmann::json &definition);

    /**
     * @brief 下一个可以评测的子任务，没有则返回空
     */
    std::optional<std::string> next() const;

    /**
     * @brief 报告 next() 返回的子任务的评测结果
     * @param ok 子任务是否通过
     */
    void report(bool ok);

    /**
     * @brief 被跳过的子任务及原因
     * 在所有子任务都评测完之后调用。
     */
    std::map<std::string, std::string> skipped() const;

private:
    std::vector<std::string> names;
    std::map<std::string, std::size_t> index;

    /**
     * @brief graph[u] 为 u 依赖的子任务，rev_graph[v] 为依赖 v 的子任务
     */
    std::vector<std::vector<std::size_t>> graph, rev_graph;

    /**
     * @brief 每个子任务还有多少依赖没有通过
     */
    std::vector<int> pending;

    std::vector<bool> passed;
    std::priority_queue<std::size_t, std::vector<std::size_t>, std::greater<std::size_t>> ready;
};

}  // namespace hjudge
