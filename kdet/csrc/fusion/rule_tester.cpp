// SPDX-FileCopyrightText: © 2024 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0
#include "fusion/rule_tester.hpp"

#include <algorithm>
#include <iterator>
#include <limits>
#include <optional>
#include <unordered_map>

#include <boost/graph/adjacency_list.hpp>
#include <boost/graph/exception.hpp>
#include <boost/graph/topological_sort.hpp>

#include "utils/assert.hpp"
#include "utils/logger.hpp"

namespace kdet::fusion
{
using json = nlohmann::json;

namespace
{
using DependencyGraph = boost::adjacency_list<boost::vecS, boost::vecS, boost::directedS, std::string>;

// A latency is either a plain number or a profiler record {"avg": ...}
std::optional<double> latency_value(const json &latency)
{
    if (latency.is_number())
        return latency.get<double>();
    if (latency.is_object() and latency.contains("avg") and latency.at("avg").is_number())
        return latency.at("avg").get<double>();
    return std::nullopt;
}
}  // namespace

void FusionRuleTester::add_rule(const std::string &name, std::map<std::string, bool> deps)
{
    KDET_ASSERT(deps.count(name) == 0, "Rule cannot depend on itself", name);
    rules_[name] = std::move(deps);
}

std::vector<std::string> FusionRuleTester::evaluation_order() const
{
    DependencyGraph dag;
    std::unordered_map<std::string, DependencyGraph::vertex_descriptor> vertex_of;
    auto vertex = [&](const std::string &name)
    {
        auto it = vertex_of.find(name);
        if (it != vertex_of.end())
            return it->second;
        auto v = boost::add_vertex(name, dag);
        vertex_of.emplace(name, v);
        return v;
    };

    for (const auto &[name, deps] : rules_)
    {
        auto rule = vertex(name);
        for (const auto &dep : deps) boost::add_edge(vertex(dep.first), rule, dag);
    }

    std::vector<DependencyGraph::vertex_descriptor> reversed;
    try
    {
        boost::topological_sort(dag, std::back_inserter(reversed));
    }
    catch (const boost::not_a_dag &)
    {
        KDET_THROW("Fusion rule dependencies form a cycle");
    }

    std::vector<std::string> order;
    for (auto it = reversed.rbegin(); it != reversed.rend(); ++it) order.push_back(dag[*it]);
    return order;
}

bool FusionRuleTester::test_latency(const std::string &name, const json &latency, json &detail) const
{
    if (not latency.is_object() or not latency.contains("block"))
    {
        log_warning(LogRuleTester, "{}: no block latency", name);
        return false;
    }

    std::optional<double> block = latency_value(latency.at("block"));
    double parts = 0.0;
    double fastest = std::numeric_limits<double>::max();
    int num_parts = 0;
    for (const auto &[key, value] : latency.items())
    {
        detail[key] = value;
        if (key == "block")
            continue;
        std::optional<double> part = latency_value(value);
        if (not part)
        {
            log_warning(LogRuleTester, "{}: unreadable latency for {}", name, key);
            return false;
        }
        parts += *part;
        fastest = std::min(fastest, *part);
        ++num_parts;
    }

    if (not block or num_parts == 0)
    {
        log_warning(LogRuleTester, "{}: incomplete latency record", name);
        return false;
    }

    bool obey = *block < parts - eps_ * fastest;
    log_debug(LogRuleTester, "{}: block {} vs parts {} (fastest {}): {}", name, *block, parts, fastest, obey);
    return obey;
}

json FusionRuleTester::analyze(const json &profile_results) const
{
    KDET_ASSERT(profile_results.is_object(), "Profile results must map rule names to latencies");

    json result = json::object();
    for (const std::string &name : evaluation_order())
    {
        if (not profile_results.contains(name))
        {
            log_debug(LogRuleTester, "{}: no profile results, skipped", name);
            continue;
        }

        bool obey = true;
        auto rule = rules_.find(name);
        if (rule != rules_.end())
        {
            for (const auto &[dep, expected] : rule->second)
            {
                if (not result.contains(dep) or result[dep]["obey"].get<bool>() != expected)
                {
                    log_debug(LogRuleTester, "{}: dependency {} did not reach {}", name, dep, expected);
                    obey = false;
                }
            }
        }

        json entry = json::object();
        if (obey)
        {
            json latency = json::object();
            obey = test_latency(name, profile_results.at(name), latency);
            if (detail_)
                entry["latency"] = latency;
        }
        entry["obey"] = obey;
        result[name] = entry;
    }

    log_info(LogRuleTester, "Analyzed {} of {} rules", result.size(), rules_.size());
    return result;
}

}  // namespace kdet::fusion
