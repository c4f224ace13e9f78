// SPDX-FileCopyrightText: © 2024 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <algorithm>
#include <string>
#include <vector>

namespace kdet::shape_inference
{

enum class DiagnosticKind
{
    // No shape rule for the op type
    Unsupported,
    // A rule's structural precondition failed (missing predecessor, ambiguous weight, bad attribute)
    MalformedTopology,
    // Element counts disagree; a best-effort shape was still produced
    ShapeMismatch,
};

inline const char *to_string(DiagnosticKind kind)
{
    switch (kind)
    {
        case DiagnosticKind::Unsupported: return "Unsupported";
        case DiagnosticKind::MalformedTopology: return "MalformedTopology";
        case DiagnosticKind::ShapeMismatch: return "ShapeMismatch";
    }
    return "Unknown";
}

struct Diagnostic
{
    std::string node_name;
    DiagnosticKind kind;
    std::string message;
};

// Recoverable per-node problems collected over one inference run
class InferenceReport
{
   public:
    void add(std::string node_name, DiagnosticKind kind, std::string message)
    {
        diagnostics_.push_back(Diagnostic{std::move(node_name), kind, std::move(message)});
    }

    const std::vector<Diagnostic> &diagnostics() const { return diagnostics_; }

    std::size_t count(DiagnosticKind kind) const
    {
        return std::count_if(
            diagnostics_.begin(), diagnostics_.end(), [kind](const Diagnostic &d) { return d.kind == kind; });
    }

    bool has_diagnostic(const std::string &node_name, DiagnosticKind kind) const
    {
        return std::any_of(
            diagnostics_.begin(),
            diagnostics_.end(),
            [&](const Diagnostic &d) { return d.node_name == node_name and d.kind == kind; });
    }

    // Nodes still without an output shape after both passes. Consumers should treat them as untrusted.
    const std::vector<std::string> &unresolved_nodes() const { return unresolved_nodes_; }
    void set_unresolved_nodes(std::vector<std::string> names) { unresolved_nodes_ = std::move(names); }

    bool clean() const { return diagnostics_.empty() and unresolved_nodes_.empty(); }

   private:
    std::vector<Diagnostic> diagnostics_;
    std::vector<std::string> unresolved_nodes_;
};

}  // namespace kdet::shape_inference
