#pragma once

#include <memory>
#include <string>
#include <vector>
#include "../dag/dag_builder.hpp"
#include "../engine/execution_engine.hpp"
#include "../rules/patch.hpp"
#include "../world/world_model.hpp"

namespace Evo {

struct TaskSpec {
    std::string task_id;
    Goal goal;
    WorldState initial_state;
};

// Weights of the specialization score:
//   condition_weight * (conditions across ACTIVE rules)
//   + order_weight * (order edges across ACTIVE rules)
// The score grows monotonically with the active condition count.
struct SpecializationConfig {
    double condition_weight = 1.0;
    double order_weight = 0.0;
};

struct SimulationMetrics {
    double success_rate = 0.0;
    double mean_execution_time_ms = 0.0;   // logical, from observation costs
    size_t rule_count = 0;                 // non-deprecated rules
    double specialization_score = 0.0;
    double stability = 1.0;                // mean confidence of ACTIVE rules
    size_t tasks_run = 0;

    bool operator==(const SimulationMetrics& other) const {
        return success_rate == other.success_rate &&
               mean_execution_time_ms == other.mean_execution_time_ms &&
               rule_count == other.rule_count &&
               specialization_score == other.specialization_score &&
               stability == other.stability && tasks_run == other.tasks_run;
    }
};

struct SimulationResult {
    PatchProposal proposal;
    bool valid = true;           // false when the edits could not be applied to the baseline
    std::string error;
    SimulationMetrics baseline;
    SimulationMetrics patched;
    WorldModelDiff diff;         // patched - baseline
};

// A/B harness. Forks the baseline rules with a proposal's edits (never
// committing anything) and runs the same task set against both.
class Simulator {
public:
    Simulator(const DagBuilder& builder, const Engine& engine,
              SpecializationConfig specialization = SpecializationConfig());

    // A task whose DAG cannot be built counts as failed.
    SimulationMetrics measure(const RuleSet& rules, const std::vector<TaskSpec>& tasks,
                              const std::string& label) const;

    SimulationResult simulate(const WorldModelSnapshot& baseline, const PatchProposal& proposal,
                              const std::vector<TaskSpec>& tasks) const;

    // Proposals are simulated concurrently; returns once every simulation finished,
    // results in proposal order.
    std::vector<SimulationResult> simulate_batch(const WorldModelSnapshot& baseline,
                                                 const std::vector<PatchProposal>& proposals,
                                                 const std::vector<TaskSpec>& tasks) const;

    double specialization_score(const RuleSet& rules) const;
    static double stability(const RuleSet& rules);
    static WorldModelDiff diff(const SimulationMetrics& baseline, const SimulationMetrics& patched);

    const SpecializationConfig& specialization() const { return specialization_; }

private:
    const DagBuilder& builder_;
    const Engine& engine_;
    SpecializationConfig specialization_;
};

} // namespace Evo
