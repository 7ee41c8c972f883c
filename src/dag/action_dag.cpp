#include "action_dag.hpp"
#include <algorithm>
#include <set>
#include <stdexcept>

namespace Evo {

const char* to_string(NodeStatus status) {
    switch (status) {
        case NodeStatus::PENDING: return "PENDING";
        case NodeStatus::RUNNING: return "RUNNING";
        case NodeStatus::SUCCEEDED: return "SUCCEEDED";
        case NodeStatus::FAILED: return "FAILED";
        case NodeStatus::SKIPPED: return "SKIPPED";
    }
    return "PENDING";
}

const char* to_string(TraceRelation relation) {
    switch (relation) {
        case TraceRelation::PRODUCED: return "PRODUCED";
        case TraceRelation::CONSTRAINED: return "CONSTRAINED";
    }
    return "PRODUCED";
}

std::string ActionDAG::add_node(const Action& action, const std::vector<std::string>& predecessors) {
    for (const auto& pred : predecessors) {
        if (!has_node(pred)) {
            throw std::invalid_argument("Unknown predecessor node: " + pred);
        }
    }
    ActionNode node;
    node.id = "n" + std::to_string(nodes_.size());
    node.action = action;
    for (const auto& pred : predecessors) {
        if (std::find(node.predecessors.begin(), node.predecessors.end(), pred) == node.predecessors.end()) {
            node.predecessors.push_back(pred);
        }
    }
    index_[node.id] = nodes_.size();
    nodes_.push_back(node);
    return nodes_.back().id;
}

bool ActionDAG::add_edge(const std::string& from, const std::string& to) {
    if (!has_node(from) || !has_node(to)) {
        throw std::invalid_argument("Edge references unknown node: " + from + " -> " + to);
    }
    if (from == to || has_path(to, from)) {
        return false;
    }
    auto& preds = node(to).predecessors;
    if (std::find(preds.begin(), preds.end(), from) == preds.end()) {
        preds.push_back(from);
    }
    return true;
}

bool ActionDAG::has_edge(const std::string& from, const std::string& to) const {
    const auto& preds = node(to).predecessors;
    return std::find(preds.begin(), preds.end(), from) != preds.end();
}

bool ActionDAG::has_path(const std::string& from, const std::string& to) const {
    // Walk predecessor links backward from `to`.
    std::vector<std::string> stack = {to};
    std::set<std::string> seen;
    while (!stack.empty()) {
        std::string current = stack.back();
        stack.pop_back();
        if (current == from) return true;
        if (!seen.insert(current).second) continue;
        for (const auto& pred : node(current).predecessors) stack.push_back(pred);
    }
    return false;
}

const ActionNode& ActionDAG::node(const std::string& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        throw std::invalid_argument("Unknown node: " + id);
    }
    return nodes_[it->second];
}

ActionNode& ActionDAG::node(const std::string& id) {
    auto it = index_.find(id);
    if (it == index_.end()) {
        throw std::invalid_argument("Unknown node: " + id);
    }
    return nodes_[it->second];
}

std::vector<std::string> ActionDAG::successors(const std::string& id) const {
    std::vector<std::string> out;
    for (const auto& n : nodes_) {
        if (std::find(n.predecessors.begin(), n.predecessors.end(), id) != n.predecessors.end()) {
            out.push_back(n.id);
        }
    }
    return out;
}

std::vector<std::string> ActionDAG::nodes_for_action(const std::string& action_name) const {
    std::vector<std::string> out;
    for (const auto& n : nodes_) {
        if (n.action.name == action_name) out.push_back(n.id);
    }
    return out;
}

std::vector<std::string> ActionDAG::topological_order() const {
    // Kahn's algorithm, ties broken by insertion order.
    std::vector<size_t> remaining(nodes_.size());
    for (size_t i = 0; i < nodes_.size(); ++i) remaining[i] = nodes_[i].predecessors.size();

    std::vector<std::string> order;
    std::vector<bool> emitted(nodes_.size(), false);
    while (order.size() < nodes_.size()) {
        bool progressed = false;
        for (size_t i = 0; i < nodes_.size(); ++i) {
            if (emitted[i] || remaining[i] != 0) continue;
            emitted[i] = true;
            progressed = true;
            order.push_back(nodes_[i].id);
            for (const auto& succ : successors(nodes_[i].id)) {
                remaining[index_.at(succ)]--;
            }
        }
        if (!progressed) {
            throw std::logic_error("ActionDAG contains a cycle");
        }
    }
    return order;
}

void ActionDAG::validate() const {
    for (const auto& n : nodes_) {
        for (const auto& pred : n.predecessors) {
            if (!has_node(pred)) {
                throw std::logic_error("Node " + n.id + " has unresolved predecessor " + pred);
            }
        }
    }
    topological_order();
}

std::vector<std::string> BuildTrace::rules_for(const std::string& node_id) const {
    std::vector<std::string> rules;
    for (const auto& entry : entries) {
        if (entry.node_id == node_id &&
            std::find(rules.begin(), rules.end(), entry.rule_id) == rules.end()) {
            rules.push_back(entry.rule_id);
        }
    }
    return rules;
}

} // namespace Evo
