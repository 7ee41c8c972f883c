#include "patch.hpp"
#include "../core/errors.hpp"
#include <algorithm>
#include <sstream>

namespace Evo {

std::string PatchEdit::describe() const {
    std::ostringstream out;
    out << to_string(kind) << "(" << rule_id;
    switch (kind) {
        case EditKind::ADD_CONDITION:
        case EditKind::NARROW_SCOPE:
            out << ", " << condition.key << " " << Evo::to_string(condition.op) << " " << condition.value;
            break;
        case EditKind::ADD_ORDER_CONSTRAINT:
            out << ", " << order.action << " after [";
            for (size_t i = 0; i < order.predecessors.size(); ++i) {
                out << (i ? "," : "") << order.predecessors[i];
            }
            out << "]";
            break;
        case EditKind::ADD_RULE:
            out << ", " << Evo::to_string(new_rule.kind) << " " << new_rule.target_action << new_rule.order.action;
            for (const auto& c : new_rule.requirements) out << " req:" << c.to_string();
            for (const auto& c : new_rule.scope) out << " scope:" << c.to_string();
            for (const auto& p : new_rule.order.predecessors) out << " after:" << p;
            for (const auto& kv : new_rule.produces) out << " sets:" << kv.first << "=" << kv.second;
            break;
        case EditKind::DEPRECATE_RULE:
            break;
    }
    out << ")";
    return out.str();
}

PatchEdit PatchEdit::add_condition(const std::string& rule_id, const Condition& condition) {
    PatchEdit edit;
    edit.kind = EditKind::ADD_CONDITION;
    edit.rule_id = rule_id;
    edit.condition = condition;
    return edit;
}

PatchEdit PatchEdit::add_order_constraint(const std::string& rule_id, const OrderConstraint& order) {
    PatchEdit edit;
    edit.kind = EditKind::ADD_ORDER_CONSTRAINT;
    edit.rule_id = rule_id;
    edit.order = order;
    return edit;
}

PatchEdit PatchEdit::narrow_scope(const std::string& rule_id, const Condition& condition) {
    PatchEdit edit;
    edit.kind = EditKind::NARROW_SCOPE;
    edit.rule_id = rule_id;
    edit.condition = condition;
    return edit;
}

PatchEdit PatchEdit::deprecate_rule(const std::string& rule_id) {
    PatchEdit edit;
    edit.kind = EditKind::DEPRECATE_RULE;
    edit.rule_id = rule_id;
    return edit;
}

PatchEdit PatchEdit::add_rule(const Rule& rule) {
    PatchEdit edit;
    edit.kind = EditKind::ADD_RULE;
    edit.rule_id = rule.id;
    edit.new_rule = rule;
    return edit;
}

std::string PatchProposal::signature() const {
    std::string sig;
    for (const auto& edit : edits) {
        sig += edit.describe();
        sig += ";";
    }
    return sig;
}

namespace {

Rule& require_rule(RuleSet& rules, const PatchEdit& edit) {
    Rule* rule = rules.find_mutable(edit.rule_id);
    if (!rule) {
        throw InvalidProposal(std::string(to_string(edit.kind)) + " references unknown rule " + edit.rule_id);
    }
    return *rule;
}

void require_condition(const PatchEdit& edit) {
    if (edit.condition.key.empty()) {
        throw InvalidProposal(std::string(to_string(edit.kind)) + " on " + edit.rule_id + " has no condition key");
    }
}

void append_unique(std::vector<Condition>& conditions, const Condition& condition) {
    if (std::find(conditions.begin(), conditions.end(), condition) == conditions.end()) {
        conditions.push_back(condition);
    }
}

} // namespace

RuleSet apply_edits(const RuleSet& base, const std::vector<PatchEdit>& edits) {
    RuleSet result = base;
    for (const auto& edit : edits) {
        switch (edit.kind) {
            case EditKind::ADD_CONDITION: {
                require_condition(edit);
                Rule& rule = require_rule(result, edit);
                if (rule.kind == RuleKind::PRECONDITION) {
                    append_unique(rule.requirements, edit.condition);
                } else {
                    append_unique(rule.scope, edit.condition);
                }
                rule.metadata.last_updated = std::chrono::system_clock::now();
                break;
            }
            case EditKind::NARROW_SCOPE: {
                require_condition(edit);
                Rule& rule = require_rule(result, edit);
                append_unique(rule.scope, edit.condition);
                rule.metadata.last_updated = std::chrono::system_clock::now();
                break;
            }
            case EditKind::ADD_ORDER_CONSTRAINT: {
                if (edit.order.action.empty() || edit.order.predecessors.empty()) {
                    throw InvalidProposal("ADD_ORDER_CONSTRAINT on " + edit.rule_id + " is missing action or predecessors");
                }
                Rule& rule = require_rule(result, edit);
                if (rule.order.empty()) {
                    rule.order.action = edit.order.action;
                } else if (rule.order.action != edit.order.action) {
                    throw InvalidProposal("Rule " + rule.id + " already orders " + rule.order.action +
                                          ", cannot constrain " + edit.order.action);
                }
                for (const auto& pred : edit.order.predecessors) {
                    auto& preds = rule.order.predecessors;
                    if (std::find(preds.begin(), preds.end(), pred) == preds.end()) {
                        preds.push_back(pred);
                    }
                }
                rule.metadata.last_updated = std::chrono::system_clock::now();
                break;
            }
            case EditKind::DEPRECATE_RULE: {
                Rule& rule = require_rule(result, edit);
                rule.metadata.advance_status(RuleStatus::DEPRECATED);
                break;
            }
            case EditKind::ADD_RULE: {
                if (edit.new_rule.id.empty()) {
                    throw InvalidProposal("ADD_RULE carries a rule without an id");
                }
                result.add_rule(edit.new_rule);
                break;
            }
        }
    }
    return result;
}

const char* to_string(EditKind kind) {
    switch (kind) {
        case EditKind::ADD_CONDITION: return "ADD_CONDITION";
        case EditKind::ADD_ORDER_CONSTRAINT: return "ADD_ORDER_CONSTRAINT";
        case EditKind::NARROW_SCOPE: return "NARROW_SCOPE";
        case EditKind::DEPRECATE_RULE: return "DEPRECATE_RULE";
        case EditKind::ADD_RULE: return "ADD_RULE";
    }
    return "NARROW_SCOPE";
}

bool parse_edit_kind(const std::string& text, EditKind& out) {
    static const EditKind all[] = {EditKind::ADD_CONDITION, EditKind::ADD_ORDER_CONSTRAINT,
                                   EditKind::NARROW_SCOPE, EditKind::DEPRECATE_RULE, EditKind::ADD_RULE};
    for (EditKind kind : all) {
        if (text == to_string(kind)) { out = kind; return true; }
    }
    return false;
}

} // namespace Evo
