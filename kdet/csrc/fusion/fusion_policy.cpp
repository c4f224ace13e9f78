// SPDX-FileCopyrightText: © 2024 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0
#include "fusion/fusion_policy.hpp"

#include <algorithm>
#include <fstream>

#include "utils/assert.hpp"
#include "utils/logger.hpp"

namespace kdet::fusion
{

namespace
{
const std::string kBasicFusionPrefix = "BF_";

// {"obey": ...} of a rule entry; null means the rule has no verdict
const json &obey_of(const std::string &rule_name, const json &rule)
{
    if (not rule.is_object() or not rule.contains("obey"))
        KDET_THROW("Rule entry must be an object with an 'obey' field", rule_name);
    return rule.at("obey");
}

bool obey_as_bool(const std::string &rule_name, const json &obey)
{
    if (not obey.is_boolean())
        KDET_THROW("Rule verdict must be a boolean", rule_name, obey.dump());
    return obey.get<bool>();
}

// BF_<a>_<b> is (a, b), BF_<a> is (a, a). Op names holding '_' must be given as "ops": [a, b].
std::pair<std::string, std::string> basic_fusion_ops(const std::string &rule_name, const json &rule)
{
    if (rule.contains("ops"))
    {
        const json &ops = rule.at("ops");
        if (not ops.is_array() or ops.size() != 2 or not ops[0].is_string() or not ops[1].is_string())
            KDET_THROW("Rule 'ops' must be a pair of op names", rule_name);
        return {ops[0].get<std::string>(), ops[1].get<std::string>()};
    }

    std::string ops = rule_name.substr(kBasicFusionPrefix.size());
    std::size_t separator = ops.find('_');
    if (ops.empty() or separator == 0 or separator == ops.size() - 1)
        KDET_THROW("Malformed basic fusion rule name", rule_name);
    if (separator == std::string::npos)
        return {ops, ops};
    if (ops.find('_', separator + 1) != std::string::npos)
        KDET_THROW("Ambiguous basic fusion rule name, give its ops explicitly", rule_name);
    return {ops.substr(0, separator), ops.substr(separator + 1)};
}

MultipleOutboundMode multiple_outbound_mode(const json &obey)
{
    if (obey.is_boolean())
        return obey.get<bool>() ? MultipleOutboundMode::FuseFirst : MultipleOutboundMode::NoFuse;
    if (obey.is_number_integer())
    {
        auto value = obey.get<std::int64_t>();
        if (value >= 0 and value <= 2)
            return static_cast<MultipleOutboundMode>(value);
    }
    KDET_THROW("MON verdict must be a boolean or 0, 1 or 2", obey.dump());
}

std::vector<std::string> accepted_types(const std::string &unit_name, const json &types)
{
    if (types.is_string())
        return {types.get<std::string>()};
    if (types.is_array() and not types.empty() and
        std::all_of(types.begin(), types.end(), [](const json &t) { return t.is_string(); }))
        return types.get<std::vector<std::string>>();
    KDET_THROW("Fusion unit vertex types must be a string or a non-empty list of strings", unit_name);
}

FusionUnit parse_fusion_unit(const std::string &name, const json &unit_json)
{
    if (not unit_json.is_object() or not unit_json.contains("nodes") or not unit_json.at("nodes").is_array())
        KDET_THROW("Fusion unit must be an object with a 'nodes' list", name);

    FusionUnit unit;
    unit.name = name;
    for (const json &vertex : unit_json.at("nodes"))
    {
        if (not vertex.is_object() or not vertex.contains("alias") or not vertex.at("alias").is_string() or
            not vertex.contains("types"))
            KDET_THROW("Fusion unit vertex needs an 'alias' and 'types'", name);
        unit.vertices.push_back(
            FusionUnitVertex{vertex.at("alias").get<std::string>(), accepted_types(name, vertex.at("types"))});
    }
    if (unit.vertices.empty())
        KDET_THROW("Fusion unit has no vertices", name);

    if (unit_json.contains("edges"))
    {
        for (const json &edge : unit_json.at("edges"))
        {
            if (not edge.is_array() or edge.size() != 2 or not edge[0].is_string() or not edge[1].is_string())
                KDET_THROW("Fusion unit edge must be a pair of aliases", name);
            unit.edges.emplace_back(edge[0].get<std::string>(), edge[1].get<std::string>());
        }
    }

    for (const auto &[producer, consumer] : unit.edges)
    {
        for (const std::string &alias : {producer, consumer})
        {
            auto known = std::any_of(
                unit.vertices.begin(),
                unit.vertices.end(),
                [&alias](const FusionUnitVertex &vertex) { return vertex.alias == alias; });
            if (not known)
                KDET_THROW("Fusion unit edge references unknown alias", name, alias);
        }
    }
    return unit;
}
}  // namespace

void FusibilityTable::set_fusible(const std::string &producer, const std::string &consumer, bool fusible)
{
    if (fusible)
        pairs_.insert({producer, consumer});
    else
        pairs_.erase({producer, consumer});
}

FusionPolicy::FusionPolicy(
    FusibilityTable table,
    RuleFlags flags,
    std::vector<FusionUnit> fusion_units,
    std::unordered_map<std::string, std::string> op_aliases) :
    table_(std::move(table)),
    flags_(flags),
    fusion_units_(std::move(fusion_units)),
    op_aliases_(std::move(op_aliases))
{
    std::sort(
        fusion_units_.begin(),
        fusion_units_.end(),
        [](const FusionUnit &a, const FusionUnit &b) { return a.name < b.name; });
}

FusionPolicy FusionPolicy::from_json(const json &rules)
{
    if (not rules.is_object())
        KDET_THROW("Rule document must be an object");

    FusibilityTable table;
    RuleFlags flags;
    std::vector<FusionUnit> fusion_units;
    std::unordered_map<std::string, std::string> op_aliases;

    for (const auto &[key, value] : rules.items())
    {
        if (key == "op_aliases")
        {
            if (not value.is_object())
                KDET_THROW("op_aliases must map op types to rule op names");
            for (const auto &[op_type, alias] : value.items())
            {
                if (not alias.is_string())
                    KDET_THROW("op alias must be a string", op_type);
                op_aliases[op_type] = alias.get<std::string>();
            }
        }
        else if (key == "fusion_units")
        {
            if (not value.is_object())
                KDET_THROW("fusion_units must map unit names to templates");
            for (const auto &[name, unit_json] : value.items()) fusion_units.push_back(parse_fusion_unit(name, unit_json));
        }
        else if (key == "MON")
        {
            const json &obey = obey_of(key, value);
            if (not obey.is_null())
                flags.multiple_outbound = multiple_outbound_mode(obey);
        }
        else if (key == "RT")
        {
            const json &obey = obey_of(key, value);
            if (not obey.is_null())
                flags.require_ready = obey_as_bool(key, obey);
        }
        else if (key.rfind(kBasicFusionPrefix, 0) == 0)
        {
            const json &obey = obey_of(key, value);
            if (obey.is_null())
                continue;
            auto [producer, consumer] = basic_fusion_ops(key, value);
            table.set_fusible(producer, consumer, obey_as_bool(key, obey));
        }
        else
        {
            log_warning(LogFusionPolicy, "Ignoring unknown rule {}", key);
        }
    }

    log_info(
        LogFusionPolicy,
        "Loaded fusion policy: {} fusible pairs, {} fusion units, MON={}, RT={}",
        table.size(),
        fusion_units.size(),
        static_cast<int>(flags.multiple_outbound),
        flags.require_ready);
    return FusionPolicy(std::move(table), flags, std::move(fusion_units), std::move(op_aliases));
}

FusionPolicy FusionPolicy::from_file(const std::string &filename)
{
    std::ifstream ifile{filename};
    if (not ifile.is_open())
        KDET_THROW("Unable to open rule file", filename);

    json rules;
    try
    {
        ifile >> rules;
    }
    catch (const json::parse_error &e)
    {
        KDET_THROW("Unable to parse rule file", filename, e.what());
    }
    return from_json(rules);
}

std::string FusionPolicy::canonical_type(const std::string &op_type) const
{
    auto it = op_aliases_.find(op_type);
    return it == op_aliases_.end() ? op_type : it->second;
}

std::ostream &operator<<(std::ostream &os, MultipleOutboundMode mode)
{
    switch (mode)
    {
        case MultipleOutboundMode::NoFuse: return os << "NoFuse";
        case MultipleOutboundMode::FuseFirst: return os << "FuseFirst";
        case MultipleOutboundMode::FuseAll: return os << "FuseAll";
    }
    return os << "Unknown";
}

}  // namespace kdet::fusion
