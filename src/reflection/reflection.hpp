#pragma once

#include <json/json.h>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "../engine/execution_engine.hpp"
#include "../rules/patch.hpp"
#include "../rules/rule_set.hpp"

namespace Evo {

// Everything known about one FAILED or SKIPPED node of a report.
struct FailureContext {
    std::string task_id;
    std::string version;
    std::string node_id;
    Action action;
    NodeStatus status = NodeStatus::FAILED;

    // The node whose failure signature applies: the node itself when it
    // FAILED, otherwise its nearest failed ancestor.
    std::string origin_node_id;
    std::string origin_action;
    FailureInfo failure;

    std::vector<std::string> blamed_rules;
    std::vector<BuildTraceEntry> evidence;
    WorldState final_state;
};

// Walks predecessors breadth-first from `node_id` and stops at the first nodes
// carrying trace entries. Returns their rule ids in discovery order.
std::vector<std::string> blame_rules(const ExecutionReport& report, const std::string& node_id);

// One context per FAILED/SKIPPED node, in node order.
std::vector<FailureContext> failure_contexts(const ExecutionReport& report);

// Wire form of a context, for advisors that talk to an external service.
Json::Value failure_context_to_json(const FailureContext& context);

// Drops proposals whose edit signature was already seen. Keeps first occurrences
// in order; a kept proposal whose id is taken gets a numeric suffix.
std::vector<PatchProposal> deduplicate(const std::vector<PatchProposal>& proposals);

// Rule-based reflection. Pure: identical inputs give identical proposals.
class ReflectionV1 {
public:
    std::vector<PatchProposal> reflect(const ExecutionReport& report, const RuleSet& rules) const;
    std::vector<PatchProposal> reflect_all(const std::vector<ExecutionReport>& reports, const RuleSet& rules) const;

private:
    bool propose_for_rule(const Rule& rule, const FailureContext& context, PatchProposal& out) const;
    bool propose_new_rule(const FailureContext& context, const RuleSet& rules, PatchProposal& out) const;
};

// External source of patch candidates, one JSON object per candidate.
class Advisor {
public:
    virtual ~Advisor() = default;
    virtual std::vector<Json::Value> propose(const FailureContext& context) = 0;
};

// Advisor-assisted reflection. Every candidate is schema-checked and must stay
// inside the edit whitelist and reference existing rules; anything else is
// logged and discarded.
class ReflectionV2 {
public:
    ReflectionV2(std::shared_ptr<Advisor> advisor, std::chrono::milliseconds timeout);

    std::vector<PatchProposal> reflect(const ExecutionReport& report, const RuleSet& rules) const;

    // Runs the advisor for one context. A timeout or advisor error yields no proposals.
    std::vector<PatchProposal> consult(const FailureContext& context, const RuleSet& rules) const;

    // Throws InvalidProposal.
    static PatchProposal validate(const Json::Value& candidate, const RuleSet& rules);
    static bool is_whitelisted(EditKind kind);

    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    std::shared_ptr<Advisor> advisor_;
    std::chrono::milliseconds timeout_;
};

// Runs V1 and, when an advisor is installed, V2 over the non-successful
// reports of a cycle. Without an advisor it degrades to V1 only.
class Reflector {
public:
    Reflector() = default;

    void set_advisor(std::shared_ptr<Advisor> advisor, std::chrono::milliseconds timeout);
    void clear_advisor() { v2_.reset(); }
    bool has_advisor() const { return v2_ != nullptr; }

    std::vector<PatchProposal> reflect(const std::vector<ExecutionReport>& reports, const RuleSet& rules) const;

private:
    ReflectionV1 v1_;
    std::unique_ptr<ReflectionV2> v2_;
};

} // namespace Evo
