#pragma once

#include <string>
#include <vector>
#include "rule.hpp"
#include "rule_set.hpp"

namespace Evo {

enum class EditKind {
    ADD_CONDITION,
    ADD_ORDER_CONSTRAINT,
    NARROW_SCOPE,
    DEPRECATE_RULE,
    ADD_RULE
};

// One primitive change to a rule set. Which payload field is read depends on `kind`:
//   ADD_CONDITION, NARROW_SCOPE -> condition
//   ADD_ORDER_CONSTRAINT        -> order
//   ADD_RULE                    -> new_rule (rule_id mirrors new_rule.id)
//   DEPRECATE_RULE              -> nothing
struct PatchEdit {
    EditKind kind = EditKind::NARROW_SCOPE;
    std::string rule_id;
    Condition condition;
    OrderConstraint order;
    Rule new_rule;

    std::string describe() const;

    static PatchEdit add_condition(const std::string& rule_id, const Condition& condition);
    static PatchEdit add_order_constraint(const std::string& rule_id, const OrderConstraint& order);
    static PatchEdit narrow_scope(const std::string& rule_id, const Condition& condition);
    static PatchEdit deprecate_rule(const std::string& rule_id);
    static PatchEdit add_rule(const Rule& rule);
};

struct PatchProposal {
    std::string id;
    std::vector<PatchEdit> edits;
    std::string provenance;   // "reflection_v1", "reflection_v2", ...
    std::string rationale;

    // Canonical text of the edit list; equal signatures mean equal effect.
    std::string signature() const;
};

// Returns `base` with `edits` applied in order. `base` is never touched.
// Throws InvalidProposal for malformed edits or unknown rule ids and
// DuplicateRuleId when ADD_RULE collides with an existing rule.
RuleSet apply_edits(const RuleSet& base, const std::vector<PatchEdit>& edits);

const char* to_string(EditKind kind);
bool parse_edit_kind(const std::string& text, EditKind& out);

} // namespace Evo
