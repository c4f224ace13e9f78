// SPDX-FileCopyrightText: © 2024 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace kdet::fusion
{

// Derives rule verdicts from measured latencies of rule test cases. The result of analyze() is a rule
// document FusionPolicy::from_json accepts.
//
// Profile results map a rule name to the latencies of its test case, e.g.
//   {"BF_conv_relu": {"block": 1.2, "conv": 1.0, "relu": {"avg": 0.5}}}
// A rule obeys when its block runs faster than its parts back to back, by a margin of eps times the
// fastest part, and every dependency ended with its expected verdict.
class FusionRuleTester
{
   public:
    explicit FusionRuleTester(bool detail = false, double eps = 0.5) : detail_(detail), eps_(eps) {}

    // `deps` maps a rule that must be decided first to the verdict it has to reach
    void add_rule(const std::string &name, std::map<std::string, bool> deps = {});

    // Rules without profile results are left out. Throws on a dependency cycle.
    nlohmann::json analyze(const nlohmann::json &profile_results) const;

    // Rule names in dependency order
    std::vector<std::string> evaluation_order() const;

   private:
    bool test_latency(const std::string &name, const nlohmann::json &latency, nlohmann::json &detail) const;

    bool detail_;
    double eps_;
    std::map<std::string, std::map<std::string, bool>> rules_;
};

}  // namespace kdet::fusion
