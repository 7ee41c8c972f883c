#include "simulator.hpp"
#include "../core/errors.hpp"
#include "../utils/logger.hpp"
#include <future>

namespace Evo {

Simulator::Simulator(const DagBuilder& builder, const Engine& engine, SpecializationConfig specialization)
    : builder_(builder), engine_(engine), specialization_(specialization) {}

double Simulator::specialization_score(const RuleSet& rules) const {
    return specialization_.condition_weight * static_cast<double>(rules.active_condition_count()) +
           specialization_.order_weight * static_cast<double>(rules.active_order_edge_count());
}

double Simulator::stability(const RuleSet& rules) {
    double total = 0.0;
    size_t active = 0;
    for (const auto& rule : rules.rules()) {
        if (rule.metadata.status != RuleStatus::ACTIVE) continue;
        total += rule.metadata.confidence;
        active++;
    }
    return active == 0 ? 1.0 : total / static_cast<double>(active);
}

WorldModelDiff Simulator::diff(const SimulationMetrics& baseline, const SimulationMetrics& patched) {
    WorldModelDiff d;
    d.rule_count_delta = static_cast<int>(patched.rule_count) - static_cast<int>(baseline.rule_count);
    d.success_rate_delta = patched.success_rate - baseline.success_rate;
    d.specialization_delta = patched.specialization_score - baseline.specialization_score;
    d.stability_delta = patched.stability - baseline.stability;
    d.execution_time_delta_ms = patched.mean_execution_time_ms - baseline.mean_execution_time_ms;
    return d;
}

SimulationMetrics Simulator::measure(const RuleSet& rules, const std::vector<TaskSpec>& tasks,
                                     const std::string& label) const {
    SimulationMetrics metrics;
    metrics.rule_count = rules.live_rule_count();
    metrics.specialization_score = specialization_score(rules);
    metrics.stability = stability(rules);
    metrics.tasks_run = tasks.size();
    if (tasks.empty()) {
        return metrics;
    }

    size_t succeeded = 0;
    double total_time = 0.0;
    for (const auto& task : tasks) {
        try {
            BuildResult build = builder_.build(task.goal, rules, task.initial_state);
            ExecutionReport report = engine_.execute(task.task_id, build, task.initial_state, label);
            if (report.status == ReportStatus::SUCCESS) succeeded++;
            total_time += report.duration_ms;
        } catch (const EvoError& e) {
            Logger::getInstance().debug("Simulation " + label + ": task " + task.task_id +
                                        " not buildable: " + e.what());
        }
    }
    metrics.success_rate = static_cast<double>(succeeded) / static_cast<double>(tasks.size());
    metrics.mean_execution_time_ms = total_time / static_cast<double>(tasks.size());
    return metrics;
}

SimulationResult Simulator::simulate(const WorldModelSnapshot& baseline, const PatchProposal& proposal,
                                     const std::vector<TaskSpec>& tasks) const {
    SimulationResult result;
    result.proposal = proposal;
    result.baseline = measure(baseline.rules, tasks, baseline.version);

    RuleSet forked;
    try {
        forked = apply_edits(baseline.rules, proposal.edits);
        forked.validate();
    } catch (const EvoError& e) {
        result.valid = false;
        result.error = e.what();
        Logger::getInstance().info("Proposal " + proposal.id + " cannot fork " + baseline.version + ": " + e.what());
        return result;
    }

    result.patched = measure(forked, tasks, baseline.version + "+" + proposal.id);
    result.diff = diff(result.baseline, result.patched);
    return result;
}

std::vector<SimulationResult> Simulator::simulate_batch(const WorldModelSnapshot& baseline,
                                                        const std::vector<PatchProposal>& proposals,
                                                        const std::vector<TaskSpec>& tasks) const {
    std::vector<std::future<SimulationResult>> futures;
    futures.reserve(proposals.size());
    for (const auto& proposal : proposals) {
        futures.push_back(std::async(std::launch::async, [this, &baseline, &proposal, &tasks]() {
            return simulate(baseline, proposal, tasks);
        }));
    }

    std::vector<SimulationResult> results;
    results.reserve(futures.size());
    for (auto& f : futures) {
        results.push_back(f.get());
    }
    Logger::getInstance().info("Simulated " + std::to_string(results.size()) + " proposal(s) against " +
                               baseline.version + " on " + std::to_string(tasks.size()) + " task(s)");
    return results;
}

} // namespace Evo
