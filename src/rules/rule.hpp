#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace Evo {

// Key/value view of the environment that rules are evaluated against.
using WorldState = std::map<std::string, std::string>;

enum class ConditionOp {
    EQUALS,
    NOT_EQUALS,
    EXISTS,
    ABSENT
};

struct Condition {
    std::string key;
    ConditionOp op = ConditionOp::EXISTS;
    std::string value;

    bool evaluate(const WorldState& state) const;

    // True when no single state can satisfy both conditions.
    bool contradicts(const Condition& other) const;

    // True when a state write of key=value makes this condition hold.
    bool satisfied_by(const std::string& written_key, const std::string& written_value) const;

    std::string to_string() const;

    bool operator==(const Condition& other) const {
        return key == other.key && op == other.op && value == other.value;
    }
    bool operator!=(const Condition& other) const { return !(*this == other); }
};

struct OrderConstraint {
    std::string action;                     // empty when the rule carries no order constraint
    std::vector<std::string> predecessors;  // actions that must complete before `action`

    bool empty() const { return action.empty(); }
    bool operator==(const OrderConstraint& other) const {
        return action == other.action && predecessors == other.predecessors;
    }
};

enum class RuleKind {
    PRECONDITION,  // target_action needs `requirements` to hold before it runs
    ORDER,         // order.action must run after order.predecessors
    EFFECT         // target_action establishes `produces`
};

enum class RuleStatus {
    ACTIVE,
    COOLDOWN,
    DEPRECATED
};

struct RuleMetadata {
    int success_count = 0;
    int failure_count = 0;
    double confidence = 0.5;
    RuleStatus status = RuleStatus::ACTIVE;
    std::chrono::system_clock::time_point last_updated = std::chrono::system_clock::now();
    int below_threshold_cycles = 0;

    // Lifecycle only moves forward. Throws std::logic_error otherwise.
    void advance_status(RuleStatus next);
};

struct Rule {
    std::string id;
    RuleKind kind = RuleKind::PRECONDITION;
    std::string description;

    std::vector<Condition> scope;            // applicability predicate
    std::string target_action;               // PRECONDITION, EFFECT
    std::vector<Condition> requirements;     // PRECONDITION
    std::map<std::string, std::string> produces;  // EFFECT
    OrderConstraint order;                   // ORDER; optional on the other kinds

    RuleMetadata metadata;

    bool is_applicable(const WorldState& state) const;
    bool is_live() const { return metadata.status != RuleStatus::DEPRECATED; }

    // Total conditions the rule imposes (scope plus requirements).
    size_t condition_count() const { return scope.size() + requirements.size(); }

    static Rule precondition(const std::string& id, const std::string& action,
                             const std::vector<Condition>& requirements,
                             const std::string& description = "");
    static Rule order_rule(const std::string& id, const std::string& action,
                           const std::vector<std::string>& predecessors,
                           const std::string& description = "");
    static Rule effect(const std::string& id, const std::string& action,
                       const std::map<std::string, std::string>& produces,
                       const std::string& description = "");
};

const char* to_string(ConditionOp op);
const char* to_string(RuleKind kind);
const char* to_string(RuleStatus status);

bool parse_condition_op(const std::string& text, ConditionOp& out);
bool parse_rule_kind(const std::string& text, RuleKind& out);
bool parse_rule_status(const std::string& text, RuleStatus& out);

} // namespace Evo
