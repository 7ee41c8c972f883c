#pragma once

#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace Evo {

struct Action {
    std::string name;
    std::map<std::string, std::string> params;

    bool operator==(const Action& other) const {
        return name == other.name && params == other.params;
    }
};

enum class NodeStatus {
    PENDING,
    RUNNING,
    SUCCEEDED,
    FAILED,
    SKIPPED
};

const char* to_string(NodeStatus status);

struct ActionNode {
    std::string id;
    Action action;
    std::vector<std::string> predecessors;
    NodeStatus status = NodeStatus::PENDING;
};

// Nodes are kept in insertion order; edges never close a cycle.
class ActionDAG {
public:
    // Returns the new node id ("n<index>"). Throws std::invalid_argument on unknown predecessors.
    std::string add_node(const Action& action, const std::vector<std::string>& predecessors = {});

    // Adds from -> to. Returns false (and leaves the graph untouched) if the edge would
    // close a cycle. Throws std::invalid_argument for unknown ids.
    bool add_edge(const std::string& from, const std::string& to);

    bool has_node(const std::string& id) const { return index_.count(id) > 0; }
    bool has_edge(const std::string& from, const std::string& to) const;
    // True if `to` is reachable from `from` along edges.
    bool has_path(const std::string& from, const std::string& to) const;

    const ActionNode& node(const std::string& id) const;
    ActionNode& node(const std::string& id);
    const std::vector<ActionNode>& nodes() const { return nodes_; }

    std::vector<std::string> successors(const std::string& id) const;
    std::vector<std::string> nodes_for_action(const std::string& action_name) const;
    std::vector<std::string> topological_order() const;

    size_t size() const { return nodes_.size(); }
    bool empty() const { return nodes_.empty(); }

    // Checks acyclicity and that every predecessor resolves. Throws std::logic_error.
    void validate() const;

private:
    std::vector<ActionNode> nodes_;
    std::unordered_map<std::string, size_t> index_;
};

enum class TraceRelation {
    PRODUCED,     // the rule caused the node to exist
    CONSTRAINED   // the rule added an edge into the node
};

struct BuildTraceEntry {
    std::string node_id;
    std::string rule_id;
    TraceRelation relation = TraceRelation::PRODUCED;
    std::string rationale;
};

// Links DAG nodes to the rules that produced or constrained them.
// Nodes no rule touched have no entry.
struct BuildTrace {
    std::vector<BuildTraceEntry> entries;

    void record(const std::string& node_id, const std::string& rule_id,
                TraceRelation relation, const std::string& rationale) {
        entries.push_back({node_id, rule_id, relation, rationale});
    }
    std::vector<std::string> rules_for(const std::string& node_id) const;
    bool empty() const { return entries.empty(); }
    size_t size() const { return entries.size(); }
};

const char* to_string(TraceRelation relation);

} // namespace Evo
