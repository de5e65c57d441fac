#include "judge/dependency.hpp"
#include <boost/algorithm/string/join.hpp>
#include "common/exceptions.hpp"

namespace hjudge {
using namespace std;
using namespace nlohmann;

dependency_graph::dependency_graph(const vector<string> &names, const json &definition)
    : names(names), graph(names.size()), rev_graph(names.size()), pending(names.size()), passed(names.size()) {
    for (size_t i = 0; i < names.size(); ++i) index[names[i]] = i;

    if (!definition.is_null()) {
        if (!definition.is_object())
            BOOST_THROW_EXCEPTION(internal_error() << "Malformed subtask dependency definition: " << definition.dump());
        for (auto &item : definition.items()) {
            const string &from = item.key();
            const json &edges = item.value();
            if (!index.count(from))
                BOOST_THROW_EXCEPTION(internal_error() << "Invalid subtask name `" << from << "` in dependency definition");
            if (!edges.is_array())
                BOOST_THROW_EXCEPTION(internal_error() << "Dependencies of subtask `" << from << "` must be an array");
            size_t u = index.at(from);
            for (auto &edge : edges) {
                if (!edge.is_string() || !index.count(edge.get<string>()))
                    BOOST_THROW_EXCEPTION(internal_error() << "Invalid subtask name " << edge.dump() << " in dependency definition");
                size_t v = index.at(edge.get<string>());
                graph[u].push_back(v);
                rev_graph[v].push_back(u);
                ++pending[u];
            }
        }
    }

    for (size_t i = 0; i < names.size(); ++i)
        if (pending[i] == 0) ready.push(i);
}

optional<string> dependency_graph::next() const {
    if (ready.empty()) return nullopt;
    return names[ready.top()];
}

void dependency_graph::report(bool ok) {
    if (ready.empty()) return;
    size_t u = ready.top();
    ready.pop();
    if (!ok) return;

    passed[u] = true;
    for (size_t from : rev_graph[u])
        if (--pending[from] == 0) ready.push(from);
}

map<string, string> dependency_graph::skipped() const {
    map<string, string> result;
    for (size_t i = 0; i < names.size(); ++i) {
        if (pending[i] == 0) continue;
        vector<string> failing;
        for (size_t v : graph[i])
            if (!passed[v]) failing.push_back(names[v]);
        result[names[i]] = "Skipped for failing `" + boost::algorithm::join(failing, ", ") + "`";
    }
    return result;
}

}  // namespace hjudge
