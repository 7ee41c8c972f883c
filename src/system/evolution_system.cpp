#include "evolution_system.hpp"
#include "../core/errors.hpp"
#include "../utils/logger.hpp"
#include "../world/model_serializer.hpp"
#include <algorithm>

namespace Evo {

size_t CycleReport::successes() const {
    return static_cast<size_t>(std::count_if(reports.begin(), reports.end(), [](const ExecutionReport& r) {
        return r.status == ReportStatus::SUCCESS;
    }));
}

EvolutionSystem::EvolutionSystem(std::shared_ptr<Capability> capability, const RuleSet& seed_rules,
                                 EvolutionSystemConfig config)
    : config_(config),
      store_(std::make_unique<VersionStore>(seed_rules)),
      engine_(std::move(capability), config.engine),
      simulator_(builder_, engine_, config.specialization),
      controller_(config.budget, config.require_improvement),
      applier_(std::make_unique<PatchApplier>(*store_, &controller_)),
      stats_(config.stats) {
    Logger::getInstance().info("Evolution system initialised at v0 with " +
                               std::to_string(seed_rules.size()) + " seed rule(s)");
}

ExecutionReport EvolutionSystem::run_task(const TaskSpec& task) {
    SnapshotPtr snapshot = store_->current();
    BuildResult build = builder_.build(task.goal, snapshot->rules, task.initial_state);
    return engine_.execute(task.task_id, build, task.initial_state, snapshot->version);
}

ExecutionReport EvolutionSystem::execute_for_cycle(const TaskSpec& task, const WorldModelSnapshot& snapshot) const {
    try {
        BuildResult build = builder_.build(task.goal, snapshot.rules, task.initial_state);
        return engine_.execute(task.task_id, build, task.initial_state, snapshot.version);
    } catch (const EvoError& e) {
        Logger::getInstance().warning("Task " + task.task_id + " could not be built on " + snapshot.version +
                                      ": " + e.what());
        ExecutionReport report;
        report.task_id = task.task_id;
        report.version = snapshot.version;
        report.status = ReportStatus::FAILURE;
        report.final_state = task.initial_state;
        return report;
    }
}

CycleReport EvolutionSystem::evolve_step(const std::vector<TaskSpec>& tasks) {
    CycleReport cycle;
    cycle.cycle = cycles_ + 1;
    SnapshotPtr base = store_->current();
    cycle.start_version = base->version;

    for (const auto& task : tasks) {
        cycle.reports.push_back(execute_for_cycle(task, *base));
    }

    std::vector<ExecutionReport> unsuccessful;
    for (const auto& report : cycle.reports) {
        if (report.status != ReportStatus::SUCCESS) unsuccessful.push_back(report);
    }

    if (!unsuccessful.empty()) {
        cycle.proposals = reflector_.reflect(unsuccessful, base->rules);
    }
    if (!cycle.proposals.empty()) {
        cycle.simulations = simulator_.simulate_batch(*base, cycle.proposals, tasks);
        cycle.decision = controller_.select(cycle.simulations);
    }

    for (const auto& result : cycle.decision.accepted) {
        const std::string& id = result.proposal.id;
        try {
            applier_->apply(result.proposal, result.diff);
            cycle.applied.push_back(id);
        } catch (const BudgetExceeded& e) {
            cycle.apply_failures.push_back({id, RejectionReason::BUDGET_EXCEEDED, e.what()});
            Logger::getInstance().info("Not applying " + id + ": " + e.what());
        } catch (const InvalidProposal& e) {
            cycle.apply_failures.push_back({id, RejectionReason::INVALID, e.what()});
            Logger::getInstance().warning("Not applying " + id + ": " + e.what());
        } catch (const CyclicOrderConstraint& e) {
            cycle.apply_failures.push_back({id, RejectionReason::INVALID, e.what()});
            Logger::getInstance().warning("Not applying " + id + ": " + e.what());
        } catch (const DuplicateRuleId& e) {
            cycle.apply_failures.push_back({id, RejectionReason::INVALID, e.what()});
            Logger::getInstance().warning("Not applying " + id + ": " + e.what());
        }
    }

    StatsUpdate update = stats_.update(store_->current()->rules, RuleUsage::collect(cycle.reports));
    cycle.stats_summary = update.summary();
    if (update.changed) {
        applier_->commit_maintenance(update.rules, "cycle " + std::to_string(cycle.cycle) + ": " + update.summary());
        cycle.maintenance_committed = true;
    }

    controller_.advance_cycle();
    cycles_++;
    cycle.end_version = store_->current_version();

    Logger::getInstance().info("Cycle " + std::to_string(cycle.cycle) + ": " +
                               std::to_string(cycle.successes()) + "/" + std::to_string(tasks.size()) +
                               " tasks succeeded, " + std::to_string(cycle.proposals.size()) + " proposal(s), " +
                               std::to_string(cycle.applied.size()) + " applied, " + cycle.start_version +
                               " -> " + cycle.end_version);
    return cycle;
}

SystemState EvolutionSystem::system_state() const {
    SystemState state;
    SnapshotPtr current = store_->current();
    state.current_version = current->version;
    state.version_count = store_->size();
    state.cycles_completed = cycles_;
    state.rules_by_status = current->rules.count_by_status();
    state.budget = controller_.budget_status();
    state.health = stats_.health_report(current->rules);
    state.advisor_installed = reflector_.has_advisor();
    return state;
}

void EvolutionSystem::rollback_to(const std::string& version) {
    applier_->rollback(version);
}

void EvolutionSystem::export_model(const std::string& path) const {
    ModelSerializer::write_file(*store_, path);
}

void EvolutionSystem::load_model(const std::string& path) {
    std::unique_ptr<VersionStore> loaded = ModelSerializer::read_file(path);
    // The applier refers to the store, so both are replaced together.
    auto applier = std::make_unique<PatchApplier>(*loaded, &controller_);
    store_ = std::move(loaded);
    applier_ = std::move(applier);
    Logger::getInstance().info("Loaded model from " + path + " (current " + store_->current_version() + ")");
}

void EvolutionSystem::set_advisor(std::shared_ptr<Advisor> advisor) {
    if (advisor) {
        reflector_.set_advisor(std::move(advisor), config_.advisor_timeout);
    } else {
        reflector_.clear_advisor();
    }
}

void EvolutionSystem::register_decomposer(std::shared_ptr<const GoalDecomposer> decomposer) {
    builder_.register_decomposer(std::move(decomposer));
}

} // namespace Evo
