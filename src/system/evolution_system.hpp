#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "system_config.hpp"
#include "../dag/dag_builder.hpp"
#include "../engine/execution_engine.hpp"
#include "../evolution/evolution_controller.hpp"
#include "../evolution/patch_applier.hpp"
#include "../evolution/rule_stats_updater.hpp"
#include "../reflection/reflection.hpp"
#include "../simulation/simulator.hpp"
#include "../world/world_model.hpp"

namespace Evo {

// Outcome of one evolve_step.
struct CycleReport {
    size_t cycle = 0;
    std::string start_version;
    std::string end_version;
    std::vector<ExecutionReport> reports;
    std::vector<PatchProposal> proposals;
    std::vector<SimulationResult> simulations;
    Decision decision;
    std::vector<std::string> applied;          // proposal ids, in commit order
    std::vector<Rejection> apply_failures;     // approved but refused at commit time
    std::string stats_summary;
    bool maintenance_committed = false;

    size_t successes() const;
};

struct SystemState {
    std::string current_version;
    size_t version_count = 0;
    size_t cycles_completed = 0;
    std::map<RuleStatus, size_t> rules_by_status;
    BudgetStatus budget;
    RuleHealthReport health;
    bool advisor_installed = false;
};

// Wires the whole loop together:
// build -> execute -> reflect -> simulate -> select -> apply -> update stats.
// Cycles run strictly one after another.
class EvolutionSystem {
public:
    EvolutionSystem(std::shared_ptr<Capability> capability, const RuleSet& seed_rules = RuleSet(),
                    EvolutionSystemConfig config = EvolutionSystemConfig());

    // Builds and executes one task against the current version.
    // Throws UnsatisfiableGoal and RuleConflict.
    ExecutionReport run_task(const TaskSpec& task);

    CycleReport evolve_step(const std::vector<TaskSpec>& tasks);

    SystemState system_state() const;

    // Throws UnknownVersion.
    void rollback_to(const std::string& version);

    void export_model(const std::string& path) const;
    // Replaces the version store with the one saved at `path`.
    void load_model(const std::string& path);

    void set_advisor(std::shared_ptr<Advisor> advisor);
    void register_decomposer(std::shared_ptr<const GoalDecomposer> decomposer);

    const VersionStore& store() const { return *store_; }
    const EvolutionController& controller() const { return controller_; }
    const EvolutionSystemConfig& config() const { return config_; }

private:
    ExecutionReport execute_for_cycle(const TaskSpec& task, const WorldModelSnapshot& snapshot) const;

    EvolutionSystemConfig config_;
    std::unique_ptr<VersionStore> store_;
    DagBuilder builder_;
    Engine engine_;
    Reflector reflector_;
    Simulator simulator_;
    EvolutionController controller_;
    std::unique_ptr<PatchApplier> applier_;
    RuleStatsUpdater stats_;
    size_t cycles_ = 0;
};

} // namespace Evo
