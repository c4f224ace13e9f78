// SPDX-FileCopyrightText: © 2024 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "pattern_matcher/pattern_matcher.hpp"
#include "utils/hash_combine.hpp"

namespace kdet::fusion
{
using json = nlohmann::json;
using pattern_matcher::FusionUnit;
using pattern_matcher::FusionUnitVertex;

// What a node with more than one consumer may do
enum class MultipleOutboundMode
{
    // never fused forward
    NoFuse = 0,
    // fused into its first fusible consumer, other consumers are kept
    FuseFirst = 1,
    // fused into every fusible consumer
    FuseAll = 2,
};

struct RuleFlags
{
    MultipleOutboundMode multiple_outbound = MultipleOutboundMode::NoFuse;
    // a consumer may only be absorbed once it has been visited as a fusion source
    bool require_ready = false;
};

// Order-sensitive (producer, consumer) set. Unlisted pairs are not fusible.
class FusibilityTable
{
   public:
    void set_fusible(const std::string &producer, const std::string &consumer, bool fusible = true);
    bool is_fusible(const std::string &producer, const std::string &consumer) const
    {
        return pairs_.count({producer, consumer}) > 0;
    }
    std::size_t size() const { return pairs_.size(); }

   private:
    std::unordered_set<std::pair<std::string, std::string>, StringPairHash> pairs_;
};

// Read-only rule set for kernel splitting. Safe to share between splitters.
class FusionPolicy
{
   public:
    FusionPolicy() = default;
    FusionPolicy(
        FusibilityTable table,
        RuleFlags flags,
        std::vector<FusionUnit> fusion_units = {},
        std::unordered_map<std::string, std::string> op_aliases = {});

    // Rule document:
    //   {"BF_<a>_<b>": {"obey": bool}, "BF_<a>": {"obey": bool}, "MON": {"obey": bool|int},
    //    "RT": {"obey": bool}, "op_aliases": {type: op}, "fusion_units": {name: {"nodes", "edges"}}}
    // Throws on a malformed document.
    static FusionPolicy from_json(const json &rules);
    static FusionPolicy from_file(const std::string &filename);

    const RuleFlags &flags() const { return flags_; }
    const FusibilityTable &table() const { return table_; }
    // Sorted by name
    const std::vector<FusionUnit> &fusion_units() const { return fusion_units_; }

    // Rule op name of a graph op type, the type itself when it has no alias
    std::string canonical_type(const std::string &op_type) const;
    bool is_fusible(const std::string &producer_type, const std::string &consumer_type) const
    {
        return table_.is_fusible(canonical_type(producer_type), canonical_type(consumer_type));
    }

   private:
    FusibilityTable table_;
    RuleFlags flags_;
    std::vector<FusionUnit> fusion_units_;
    std::unordered_map<std::string, std::string> op_aliases_;
};

std::ostream &operator<<(std::ostream &os, MultipleOutboundMode mode);

}  // namespace kdet::fusion
