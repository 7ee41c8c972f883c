#include "reflection.hpp"
#include "../core/errors.hpp"
#include "../utils/logger.hpp"
#include "../world/model_serializer.hpp"
#include <algorithm>
#include <deque>
#include <future>
#include <set>
#include <thread>

namespace Evo {

namespace {

const char* kV1Provenance = "reflection_v1";
const char* kV2Provenance = "reflection_v2";

// Breadth-first over predecessors, starting at (and including) `node_id`.
template <typename Visit>
void walk_back(const ActionDAG& dag, const std::string& node_id, Visit visit) {
    std::deque<std::string> queue = {node_id};
    std::set<std::string> seen = {node_id};
    while (!queue.empty()) {
        std::string current = queue.front();
        queue.pop_front();
        if (!visit(current)) continue;
        for (const auto& pred : dag.node(current).predecessors) {
            if (seen.insert(pred).second) queue.push_back(pred);
        }
    }
}

bool contains(const std::vector<Condition>& conditions, const Condition& condition) {
    return std::find(conditions.begin(), conditions.end(), condition) != conditions.end();
}

std::string proposal_id(const std::string& rule_id, EditKind kind, const std::string& subject) {
    return "refl-" + rule_id + "-" + to_string(kind) + "-" + subject;
}

} // namespace

std::vector<std::string> blame_rules(const ExecutionReport& report, const std::string& node_id) {
    std::vector<std::string> blamed;
    walk_back(report.dag, node_id, [&](const std::string& current) {
        std::vector<std::string> rules = report.trace.rules_for(current);
        if (rules.empty()) return true;
        for (const auto& r : rules) {
            if (std::find(blamed.begin(), blamed.end(), r) == blamed.end()) blamed.push_back(r);
        }
        return false;
    });
    return blamed;
}

std::vector<FailureContext> failure_contexts(const ExecutionReport& report) {
    std::vector<FailureContext> contexts;
    for (const auto& node : report.dag.nodes()) {
        if (node.status != NodeStatus::FAILED && node.status != NodeStatus::SKIPPED) continue;

        FailureContext context;
        context.task_id = report.task_id;
        context.version = report.version;
        context.node_id = node.id;
        context.action = node.action;
        context.status = node.status;
        context.final_state = report.final_state;

        walk_back(report.dag, node.id, [&](const std::string& current) {
            if (!context.origin_node_id.empty()) return false;
            auto it = report.failures.find(current);
            if (it == report.failures.end()) return true;
            context.origin_node_id = current;
            context.origin_action = report.dag.node(current).action.name;
            context.failure = it->second;
            return false;
        });
        if (context.origin_node_id.empty()) {
            context.origin_node_id = node.id;
            context.origin_action = node.action.name;
            context.failure.reason = "no failure recorded upstream";
        }

        context.blamed_rules = blame_rules(report, node.id);
        for (const auto& entry : report.trace.entries) {
            if (std::find(context.blamed_rules.begin(), context.blamed_rules.end(), entry.rule_id) !=
                context.blamed_rules.end()) {
                context.evidence.push_back(entry);
            }
        }
        contexts.push_back(std::move(context));
    }
    return contexts;
}

Json::Value failure_context_to_json(const FailureContext& context) {
    Json::Value out(Json::objectValue);
    out["task_id"] = context.task_id;
    out["version"] = context.version;
    out["node_id"] = context.node_id;
    out["action"] = context.action.name;
    out["status"] = to_string(context.status);
    out["origin_node_id"] = context.origin_node_id;
    out["origin_action"] = context.origin_action;

    Json::Value failure(Json::objectValue);
    failure["kind"] = to_string(context.failure.kind);
    failure["reason"] = context.failure.reason;
    failure["state_key"] = context.failure.state_key;
    failure["expected_value"] = context.failure.expected_value;
    failure["required_action"] = context.failure.required_action;
    out["failure"] = failure;

    Json::Value blamed(Json::arrayValue);
    for (const auto& r : context.blamed_rules) blamed.append(r);
    out["blamed_rules"] = blamed;

    Json::Value evidence(Json::arrayValue);
    for (const auto& e : context.evidence) {
        Json::Value entry(Json::objectValue);
        entry["node_id"] = e.node_id;
        entry["rule_id"] = e.rule_id;
        entry["relation"] = to_string(e.relation);
        entry["rationale"] = e.rationale;
        evidence.append(entry);
    }
    out["evidence"] = evidence;

    Json::Value state(Json::objectValue);
    for (const auto& kv : context.final_state) state[kv.first] = kv.second;
    out["state"] = state;
    return out;
}

std::vector<PatchProposal> deduplicate(const std::vector<PatchProposal>& proposals) {
    std::vector<PatchProposal> out;
    std::set<std::string> seen;
    std::set<std::string> ids;
    for (const auto& p : proposals) {
        if (!seen.insert(p.signature()).second) continue;
        PatchProposal kept = p;
        for (int n = 2; !ids.insert(kept.id).second; ++n) {
            kept.id = p.id + "-" + std::to_string(n);
        }
        out.push_back(std::move(kept));
    }
    return out;
}

// ---------------------------------------------------------------------------
// ReflectionV1

bool ReflectionV1::propose_for_rule(const Rule& rule, const FailureContext& context, PatchProposal& out) const {
    const FailureInfo& failure = context.failure;
    const std::string why = "node " + context.node_id + " (" + context.action.name + ") " +
                            to_string(context.status) + " after " + context.origin_node_id + ": " +
                            failure.reason;

    // 1. Missing precondition: require the missing state.
    if (failure.kind == FailureKind::MISSING_PRECONDITION && !failure.state_key.empty()) {
        Condition condition = failure.expected_value.empty()
            ? Condition{failure.state_key, ConditionOp::EXISTS, ""}
            : Condition{failure.state_key, ConditionOp::EQUALS, failure.expected_value};
        const auto& target = rule.kind == RuleKind::PRECONDITION ? rule.requirements : rule.scope;
        if (!contains(target, condition)) {
            out.id = proposal_id(rule.id, EditKind::ADD_CONDITION, condition.key);
            out.edits = {PatchEdit::add_condition(rule.id, condition)};
            out.rationale = "Rule " + rule.id + " should require " + condition.to_string() + "; " + why;
            return true;
        }
    }

    // 2. Ordering violation: order the failing action after the one it needed.
    if (failure.kind == FailureKind::ORDERING_VIOLATION && !failure.required_action.empty()) {
        const OrderConstraint& order = rule.order;
        bool compatible = order.empty() || order.action == context.origin_action;
        bool present = !order.empty() &&
                       std::find(order.predecessors.begin(), order.predecessors.end(),
                                 failure.required_action) != order.predecessors.end();
        if (compatible && !present) {
            out.id = proposal_id(rule.id, EditKind::ADD_ORDER_CONSTRAINT, failure.required_action);
            out.edits = {PatchEdit::add_order_constraint(
                rule.id, OrderConstraint{context.origin_action, {failure.required_action}})};
            out.rationale = "Rule " + rule.id + " should run " + context.origin_action + " after " +
                            failure.required_action + "; " + why;
            return true;
        }
    }

    // 3. Otherwise restrict where the rule applies.
    Condition scope = failure.state_key.empty()
        ? Condition{"context." + context.origin_action, ConditionOp::EXISTS, ""}
        : Condition{failure.state_key, ConditionOp::EXISTS, ""};
    if (!contains(rule.scope, scope)) {
        out.id = proposal_id(rule.id, EditKind::NARROW_SCOPE, scope.key);
        out.edits = {PatchEdit::narrow_scope(rule.id, scope)};
        out.rationale = "Rule " + rule.id + " only applies when " + scope.to_string() + "; " + why;
        return true;
    }
    return false;
}

bool ReflectionV1::propose_new_rule(const FailureContext& context, const RuleSet& rules, PatchProposal& out) const {
    const FailureInfo& failure = context.failure;
    Rule rule;
    if (failure.kind == FailureKind::MISSING_PRECONDITION && !failure.state_key.empty()) {
        Condition condition = failure.expected_value.empty()
            ? Condition{failure.state_key, ConditionOp::EXISTS, ""}
            : Condition{failure.state_key, ConditionOp::EQUALS, failure.expected_value};
        rule = Rule::precondition("pre-" + context.origin_action + "-" + failure.state_key,
                                  context.origin_action, {condition},
                                  context.origin_action + " requires " + condition.to_string());
    } else if (failure.kind == FailureKind::ORDERING_VIOLATION && !failure.required_action.empty()) {
        rule = Rule::order_rule("order-" + context.origin_action + "-" + failure.required_action,
                                context.origin_action, {failure.required_action},
                                context.origin_action + " runs after " + failure.required_action);
    } else {
        return false;
    }
    if (rules.contains(rule.id)) {
        return false;
    }
    out.id = "refl-new-" + rule.id;
    out.edits = {PatchEdit::add_rule(rule)};
    out.rationale = "No rule covers " + context.origin_action + " (" + failure.reason + "); adding " + rule.id;
    return true;
}

std::vector<PatchProposal> ReflectionV1::reflect(const ExecutionReport& report, const RuleSet& rules) const {
    std::vector<PatchProposal> proposals;
    if (report.status == ReportStatus::SUCCESS) {
        return proposals;
    }

    for (const auto& context : failure_contexts(report)) {
        bool blamed_known = false;
        for (const auto& rule_id : context.blamed_rules) {
            const Rule* rule = rules.find(rule_id);
            if (!rule) continue;
            blamed_known = true;
            PatchProposal proposal;
            proposal.provenance = kV1Provenance;
            if (propose_for_rule(*rule, context, proposal)) {
                proposals.push_back(proposal);
            }
        }
        if (!blamed_known) {
            PatchProposal proposal;
            proposal.provenance = kV1Provenance;
            if (propose_new_rule(context, rules, proposal)) {
                proposals.push_back(proposal);
            }
        }
    }
    return deduplicate(proposals);
}

std::vector<PatchProposal> ReflectionV1::reflect_all(const std::vector<ExecutionReport>& reports,
                                                     const RuleSet& rules) const {
    std::vector<PatchProposal> all;
    for (const auto& report : reports) {
        auto proposals = reflect(report, rules);
        all.insert(all.end(), proposals.begin(), proposals.end());
    }
    return deduplicate(all);
}

// ---------------------------------------------------------------------------
// ReflectionV2

ReflectionV2::ReflectionV2(std::shared_ptr<Advisor> advisor, std::chrono::milliseconds timeout)
    : advisor_(std::move(advisor)), timeout_(timeout) {
    if (!advisor_) {
        throw std::invalid_argument("ReflectionV2 requires an advisor");
    }
}

bool ReflectionV2::is_whitelisted(EditKind kind) {
    switch (kind) {
        case EditKind::ADD_CONDITION:
        case EditKind::ADD_ORDER_CONSTRAINT:
        case EditKind::NARROW_SCOPE:
        case EditKind::DEPRECATE_RULE:
            return true;
        case EditKind::ADD_RULE:
            return false;
    }
    return false;
}

PatchProposal ReflectionV2::validate(const Json::Value& candidate, const RuleSet& rules) {
    PatchProposal proposal = ModelSerializer::proposal_from_json(candidate);
    for (const auto& edit : proposal.edits) {
        if (!is_whitelisted(edit.kind)) {
            throw InvalidProposal(std::string("Edit kind ") + to_string(edit.kind) + " is not allowed from the advisor");
        }
        if (!rules.contains(edit.rule_id)) {
            throw InvalidProposal("Advisor edit references unknown rule " + edit.rule_id);
        }
    }
    // The edits must also apply cleanly to the current rules.
    apply_edits(rules, proposal.edits);
    return proposal;
}

std::vector<PatchProposal> ReflectionV2::consult(const FailureContext& context, const RuleSet& rules) const {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    Logger::getInstance().debug("Consulting advisor: " + Json::writeString(writer, failure_context_to_json(context)));

    // The worker is detached so an unresponsive advisor cannot hold up the cycle.
    std::shared_ptr<Advisor> advisor = advisor_;
    auto task = std::make_shared<std::packaged_task<std::vector<Json::Value>()>>(
        [advisor, context]() { return advisor->propose(context); });
    std::future<std::vector<Json::Value>> future = task->get_future();
    std::thread([task]() { (*task)(); }).detach();

    if (future.wait_for(timeout_) != std::future_status::ready) {
        Logger::getInstance().warning("Advisor timed out after " + std::to_string(timeout_.count()) +
                                      "ms for node " + context.node_id + "; no proposals");
        return {};
    }

    std::vector<Json::Value> candidates;
    try {
        candidates = future.get();
    } catch (const std::exception& e) {
        Logger::getInstance().warning(std::string("Advisor failed: ") + e.what() + "; no proposals");
        return {};
    }

    std::vector<PatchProposal> accepted;
    for (size_t i = 0; i < candidates.size(); ++i) {
        try {
            PatchProposal proposal = validate(candidates[i], rules);
            proposal.provenance = kV2Provenance;
            if (proposal.id.empty()) {
                proposal.id = "adv-" + context.task_id + "-" + context.node_id + "-" + std::to_string(i);
            }
            accepted.push_back(proposal);
        } catch (const InvalidProposal& e) {
            Logger::getInstance().warning("Discarding advisor candidate " + std::to_string(i) + " for node " +
                                          context.node_id + ": " + e.what());
        } catch (const DuplicateRuleId& e) {
            Logger::getInstance().warning("Discarding advisor candidate " + std::to_string(i) + ": " + e.what());
        }
    }
    return accepted;
}

std::vector<PatchProposal> ReflectionV2::reflect(const ExecutionReport& report, const RuleSet& rules) const {
    std::vector<PatchProposal> proposals;
    if (report.status == ReportStatus::SUCCESS) {
        return proposals;
    }
    for (const auto& context : failure_contexts(report)) {
        // Skipped nodes share their origin's failure; ask once per failure.
        if (context.status != NodeStatus::FAILED) continue;
        auto found = consult(context, rules);
        proposals.insert(proposals.end(), found.begin(), found.end());
    }
    return deduplicate(proposals);
}

// ---------------------------------------------------------------------------
// Reflector

void Reflector::set_advisor(std::shared_ptr<Advisor> advisor, std::chrono::milliseconds timeout) {
    v2_ = std::make_unique<ReflectionV2>(std::move(advisor), timeout);
}

std::vector<PatchProposal> Reflector::reflect(const std::vector<ExecutionReport>& reports,
                                              const RuleSet& rules) const {
    std::vector<PatchProposal> proposals = v1_.reflect_all(reports, rules);
    if (v2_) {
        for (const auto& report : reports) {
            auto advised = v2_->reflect(report, rules);
            proposals.insert(proposals.end(), advised.begin(), advised.end());
        }
    }
    proposals = deduplicate(proposals);
    Logger::getInstance().info("Reflection produced " + std::to_string(proposals.size()) + " proposal(s) from " +
                               std::to_string(reports.size()) + " report(s)");
    return proposals;
}

} // namespace Evo
