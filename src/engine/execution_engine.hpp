#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "capability.hpp"
#include "../core/errors.hpp"
#include "../dag/dag_builder.hpp"

namespace Evo {

enum class ReportStatus {
    SUCCESS,   // every node SUCCEEDED
    PARTIAL,   // at least one node SUCCEEDED, at least one did not
    FAILURE    // no node SUCCEEDED
};

const char* to_string(ReportStatus status);

struct ExecutionEvent {
    std::chrono::system_clock::time_point timestamp;
    std::string node_id;
    std::string action;
    NodeStatus status = NodeStatus::PENDING;
    std::string detail;
};

// Failure signature of a FAILED node, copied out of the ActionFailure.
struct FailureInfo {
    FailureKind kind = FailureKind::OTHER;
    std::string reason;
    std::string state_key;
    std::string expected_value;
    std::string required_action;
};

struct ExecutionReport {
    std::string task_id;
    std::string version;            // world model version the DAG was built from
    ReportStatus status = ReportStatus::FAILURE;
    ActionDAG dag;                  // final node statuses
    BuildTrace trace;
    std::vector<ExecutionEvent> events;
    std::map<std::string, FailureInfo> failures;   // by node id
    WorldState final_state;
    double duration_ms = 0.0;       // sum of observation costs

    size_t count(NodeStatus status) const;
};

struct EngineConfig {
    bool parallel = true;
    size_t max_workers = 4;
    std::chrono::milliseconds node_timeout{0};   // 0 disables the timeout
};

// Runs an ActionDAG against a Capability.
//
// Nodes run once all their predecessors SUCCEEDED. Ready nodes form a wave that
// runs concurrently (up to max_workers); the wave's results are collected in
// node order before any dependent is scheduled, so events, state and metrics
// are identical between parallel and sequential runs. A failure is contained
// to its branch: dependents become SKIPPED, independent nodes keep running.
// A node still running at its deadline is reported TIMEOUT right away; its
// token is cancelled and the capability call finishes in the background.
class Engine {
public:
    Engine(std::shared_ptr<Capability> capability, EngineConfig config = EngineConfig());

    ExecutionReport execute(const std::string& task_id, const BuildResult& build,
                            const WorldState& initial_state, const std::string& version) const;

    const EngineConfig& config() const { return config_; }

private:
    struct NodeOutcome {
        bool succeeded = false;
        Observation observation;
        FailureInfo failure;
    };

    static NodeOutcome run_node(Capability& capability, const Action& action, const ExecutionContext& context);
    std::vector<NodeOutcome> run_wave(const ActionDAG& dag, const std::vector<std::string>& wave,
                                      const WorldState& state,
                                      const std::set<std::string>& completed) const;

    std::shared_ptr<Capability> capability_;
    EngineConfig config_;
};

} // namespace Evo
