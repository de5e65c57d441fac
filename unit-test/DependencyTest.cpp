#include <set>
#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "judge/dependency.hpp"

using namespace std;
using namespace hjudge;
using namespace nlohmann;

static vector<string> judge_all(dependency_graph &graph, const set<string> &failing) {
    vector<string> order;
    while (auto name = graph.next()) {
        order.push_back(*name);
        graph.report(!failing.count(*name));
    }
    return order;
}

TEST(DependencyTest, NoDependencyKeepsOriginalOrder) {
    dependency_graph graph({"a", "b", "c"}, nullptr);
    EXPECT_EQ(judge_all(graph, {}), vector<string>({"a", "b", "c"}));
    EXPECT_TRUE(graph.skipped().empty());
}

TEST(DependencyTest, DependenciesAreJudgedFirst) {
    dependency_graph graph({"a", "b", "c"}, json::parse(R"({"a": ["c"], "b": ["a"]})"));
    EXPECT_EQ(judge_all(graph, {}), vector<string>({"c", "a", "b"}));
}

TEST(DependencyTest, SmallerIndexFirstAmongReadySubtasks) {
    dependency_graph graph({"s1", "s2", "s3", "s4"}, json::parse(R"({"s2": ["s4"], "s1": ["s4"]})"));
    EXPECT_EQ(judge_all(graph, {}), vector<string>({"s3", "s4", "s1", "s2"}));
}

TEST(DependencyTest, FailingDependencySkipsDependents) {
    dependency_graph graph({"a", "b", "c"}, json::parse(R"({"b": ["a"], "c": ["a", "b"]})"));
    EXPECT_EQ(judge_all(graph, {"a"}), vector<string>({"a"}));
    auto skipped = graph.skipped();
    ASSERT_EQ(skipped.size(), 2u);
    EXPECT_EQ(skipped["b"], "Skipped for failing `a`");
    EXPECT_EQ(skipped["c"], "Skipped for failing `a, b`");
}

TEST(DependencyTest, CycleIsSkipped) {
    dependency_graph graph({"a", "b", "c"}, json::parse(R"({"a": ["b"], "b": ["a"]})"));
    EXPECT_EQ(judge_all(graph, {}), vector<string>({"c"}));
    EXPECT_EQ(graph.skipped().size(), 2u);
}

TEST(DependencyTest, RejectsUnknownSubtask) {
    EXPECT_THROW(dependency_graph({"a"}, json::parse(R"({"a": ["x"]})")), internal_error);
    EXPECT_THROW(dependency_graph({"a"}, json::parse(R"({"x": []})")), internal_error);
    EXPECT_THROW(dependency_graph({"a"}, json::parse(R"({"a": "a"})")), internal_error);
    EXPECT_THROW(dependency_graph({"a"}, json::parse(R"([1, 2])")), internal_error);
}
