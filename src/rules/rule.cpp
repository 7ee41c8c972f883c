#include "rule.hpp"
#include <algorithm>
#include <stdexcept>

namespace Evo {

bool Condition::evaluate(const WorldState& state) const {
    auto it = state.find(key);
    switch (op) {
        case ConditionOp::EQUALS:
            return it != state.end() && it->second == value;
        case ConditionOp::NOT_EQUALS:
            return it == state.end() || it->second != value;
        case ConditionOp::EXISTS:
            return it != state.end();
        case ConditionOp::ABSENT:
            return it == state.end();
    }
    return false;
}

bool Condition::contradicts(const Condition& other) const {
    if (key != other.key) return false;

    auto clash = [](const Condition& a, const Condition& b) {
        switch (a.op) {
            case ConditionOp::EQUALS:
                if (b.op == ConditionOp::EQUALS) return a.value != b.value;
                if (b.op == ConditionOp::NOT_EQUALS) return a.value == b.value;
                return b.op == ConditionOp::ABSENT;
            case ConditionOp::EXISTS:
                return b.op == ConditionOp::ABSENT;
            case ConditionOp::NOT_EQUALS:
            case ConditionOp::ABSENT:
                return false;
        }
        return false;
    };
    return clash(*this, other) || clash(other, *this);
}

bool Condition::satisfied_by(const std::string& written_key, const std::string& written_value) const {
    if (written_key != key) return false;
    switch (op) {
        case ConditionOp::EQUALS: return written_value == value;
        case ConditionOp::NOT_EQUALS: return written_value != value;
        case ConditionOp::EXISTS: return true;
        case ConditionOp::ABSENT: return false;
    }
    return false;
}

std::string Condition::to_string() const {
    switch (op) {
        case ConditionOp::EQUALS: return key + "==" + value;
        case ConditionOp::NOT_EQUALS: return key + "!=" + value;
        case ConditionOp::EXISTS: return key + " exists";
        case ConditionOp::ABSENT: return key + " absent";
    }
    return key;
}

void RuleMetadata::advance_status(RuleStatus next) {
    if (static_cast<int>(next) < static_cast<int>(status)) {
        throw std::logic_error(std::string("Rule lifecycle cannot move from ") +
                               Evo::to_string(status) + " to " + Evo::to_string(next));
    }
    status = next;
    last_updated = std::chrono::system_clock::now();
}

bool Rule::is_applicable(const WorldState& state) const {
    return std::all_of(scope.begin(), scope.end(),
                       [&state](const Condition& c) { return c.evaluate(state); });
}

Rule Rule::precondition(const std::string& id, const std::string& action,
                        const std::vector<Condition>& requirements,
                        const std::string& description) {
    Rule rule;
    rule.id = id;
    rule.kind = RuleKind::PRECONDITION;
    rule.target_action = action;
    rule.requirements = requirements;
    rule.description = description;
    return rule;
}

Rule Rule::order_rule(const std::string& id, const std::string& action,
                      const std::vector<std::string>& predecessors,
                      const std::string& description) {
    Rule rule;
    rule.id = id;
    rule.kind = RuleKind::ORDER;
    rule.order.action = action;
    rule.order.predecessors = predecessors;
    rule.description = description;
    return rule;
}

Rule Rule::effect(const std::string& id, const std::string& action,
                  const std::map<std::string, std::string>& produces,
                  const std::string& description) {
    Rule rule;
    rule.id = id;
    rule.kind = RuleKind::EFFECT;
    rule.target_action = action;
    rule.produces = produces;
    rule.description = description;
    return rule;
}

const char* to_string(ConditionOp op) {
    switch (op) {
        case ConditionOp::EQUALS: return "EQUALS";
        case ConditionOp::NOT_EQUALS: return "NOT_EQUALS";
        case ConditionOp::EXISTS: return "EXISTS";
        case ConditionOp::ABSENT: return "ABSENT";
    }
    return "EXISTS";
}

const char* to_string(RuleKind kind) {
    switch (kind) {
        case RuleKind::PRECONDITION: return "PRECONDITION";
        case RuleKind::ORDER: return "ORDER";
        case RuleKind::EFFECT: return "EFFECT";
    }
    return "PRECONDITION";
}

const char* to_string(RuleStatus status) {
    switch (status) {
        case RuleStatus::ACTIVE: return "ACTIVE";
        case RuleStatus::COOLDOWN: return "COOLDOWN";
        case RuleStatus::DEPRECATED: return "DEPRECATED";
    }
    return "ACTIVE";
}

bool parse_condition_op(const std::string& text, ConditionOp& out) {
    static const ConditionOp all[] = {ConditionOp::EQUALS, ConditionOp::NOT_EQUALS,
                                      ConditionOp::EXISTS, ConditionOp::ABSENT};
    for (ConditionOp op : all) {
        if (text == to_string(op)) { out = op; return true; }
    }
    return false;
}

bool parse_rule_kind(const std::string& text, RuleKind& out) {
    static const RuleKind all[] = {RuleKind::PRECONDITION, RuleKind::ORDER, RuleKind::EFFECT};
    for (RuleKind kind : all) {
        if (text == to_string(kind)) { out = kind; return true; }
    }
    return false;
}

bool parse_rule_status(const std::string& text, RuleStatus& out) {
    static const RuleStatus all[] = {RuleStatus::ACTIVE, RuleStatus::COOLDOWN, RuleStatus::DEPRECATED};
    for (RuleStatus status : all) {
        if (text == to_string(status)) { out = status; return true; }
    }
    return false;
}

} // namespace Evo
