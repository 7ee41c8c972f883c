#include "rule_set.hpp"
#include "../core/errors.hpp"
#include <algorithm>
#include <functional>
#include <set>

namespace Evo {

RuleSet::RuleSet(const std::vector<Rule>& rules) {
    for (const auto& rule : rules) {
        add_rule(rule);
    }
}

void RuleSet::add_rule(const Rule& rule) {
    if (contains(rule.id)) {
        throw DuplicateRuleId(rule.id);
    }
    rules_.push_back(rule);
}

const Rule* RuleSet::find(const std::string& rule_id) const {
    auto it = std::find_if(rules_.begin(), rules_.end(),
                           [&rule_id](const Rule& r) { return r.id == rule_id; });
    return it == rules_.end() ? nullptr : &*it;
}

Rule* RuleSet::find_mutable(const std::string& rule_id) {
    auto it = std::find_if(rules_.begin(), rules_.end(),
                           [&rule_id](const Rule& r) { return r.id == rule_id; });
    return it == rules_.end() ? nullptr : &*it;
}

std::vector<const Rule*> RuleSet::applicable_rules(const WorldState& state) const {
    std::vector<const Rule*> applicable;
    for (const auto& rule : rules_) {
        if (rule.metadata.status == RuleStatus::ACTIVE && rule.is_applicable(state)) {
            applicable.push_back(&rule);
        }
    }
    std::sort(applicable.begin(), applicable.end(), [](const Rule* a, const Rule* b) {
        if (a->metadata.confidence != b->metadata.confidence) {
            return a->metadata.confidence > b->metadata.confidence;
        }
        return a->id < b->id;
    });
    return applicable;
}

void RuleSet::validate() const {
    // action -> actions that must precede it
    std::map<std::string, std::set<std::string>> must_follow;
    std::map<std::string, std::string> edge_owner;
    for (const auto& rule : rules_) {
        if (!rule.is_live() || rule.order.empty()) continue;
        for (const auto& pred : rule.order.predecessors) {
            if (pred == rule.order.action) {
                throw CyclicOrderConstraint("Rule " + rule.id + " orders " + pred + " after itself");
            }
            must_follow[rule.order.action].insert(pred);
            edge_owner[rule.order.action + "<-" + pred] = rule.id;
        }
    }

    enum class Mark { NONE, VISITING, DONE };
    std::map<std::string, Mark> marks;
    std::vector<std::string> path;

    std::function<void(const std::string&)> visit = [&](const std::string& action) {
        Mark& mark = marks[action];
        if (mark == Mark::DONE) return;
        if (mark == Mark::VISITING) {
            std::string cycle;
            auto start = std::find(path.begin(), path.end(), action);
            for (auto it = start; it != path.end(); ++it) cycle += *it + " -> ";
            cycle += action;
            throw CyclicOrderConstraint("Order constraints form a cycle: " + cycle);
        }
        mark = Mark::VISITING;
        path.push_back(action);
        auto it = must_follow.find(action);
        if (it != must_follow.end()) {
            for (const auto& pred : it->second) visit(pred);
        }
        path.pop_back();
        marks[action] = Mark::DONE;
    };

    for (const auto& entry : must_follow) {
        visit(entry.first);
    }
}

size_t RuleSet::live_rule_count() const {
    return static_cast<size_t>(std::count_if(rules_.begin(), rules_.end(),
                                             [](const Rule& r) { return r.is_live(); }));
}

size_t RuleSet::active_condition_count() const {
    size_t total = 0;
    for (const auto& rule : rules_) {
        if (rule.metadata.status == RuleStatus::ACTIVE) total += rule.condition_count();
    }
    return total;
}

size_t RuleSet::active_order_edge_count() const {
    size_t total = 0;
    for (const auto& rule : rules_) {
        if (rule.metadata.status == RuleStatus::ACTIVE) total += rule.order.predecessors.size();
    }
    return total;
}

std::map<RuleStatus, size_t> RuleSet::count_by_status() const {
    std::map<RuleStatus, size_t> counts = {
        {RuleStatus::ACTIVE, 0}, {RuleStatus::COOLDOWN, 0}, {RuleStatus::DEPRECATED, 0}};
    for (const auto& rule : rules_) {
        counts[rule.metadata.status]++;
    }
    return counts;
}

} // namespace Evo
