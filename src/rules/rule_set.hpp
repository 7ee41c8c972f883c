#pragma once

#include <map>
#include <string>
#include <vector>
#include "rule.hpp"

namespace Evo {

// Ordered collection of rules. A value type: copies are independent.
class RuleSet {
public:
    RuleSet() = default;
    explicit RuleSet(const std::vector<Rule>& rules);

    // Throws DuplicateRuleId if a rule with the same id is present.
    void add_rule(const Rule& rule);

    const Rule* find(const std::string& rule_id) const;
    Rule* find_mutable(const std::string& rule_id);
    bool contains(const std::string& rule_id) const { return find(rule_id) != nullptr; }

    // ACTIVE rules whose scope holds over `state`, by descending confidence then id.
    std::vector<const Rule*> applicable_rules(const WorldState& state) const;

    // Throws CyclicOrderConstraint when the order constraints of live rules form a cycle.
    void validate() const;

    const std::vector<Rule>& rules() const { return rules_; }
    size_t size() const { return rules_.size(); }
    bool empty() const { return rules_.empty(); }

    size_t live_rule_count() const;
    size_t active_condition_count() const;
    size_t active_order_edge_count() const;
    std::map<RuleStatus, size_t> count_by_status() const;

private:
    std::vector<Rule> rules_;
};

} // namespace Evo
