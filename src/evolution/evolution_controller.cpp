#include "evolution_controller.hpp"
#include "../core/errors.hpp"
#include "../utils/logger.hpp"
#include <algorithm>

namespace Evo {

namespace {

const double kEpsilon = 1e-9;

size_t growth_of(const WorldModelDiff& diff) {
    return diff.rule_count_delta > 0 ? static_cast<size_t>(diff.rule_count_delta) : 0;
}

} // namespace

const char* to_string(RejectionReason reason) {
    switch (reason) {
        case RejectionReason::INVALID: return "INVALID";
        case RejectionReason::NO_IMPROVEMENT: return "NO_IMPROVEMENT";
        case RejectionReason::BUDGET_EXCEEDED: return "BUDGET_EXCEEDED";
        case RejectionReason::DOMINATED: return "DOMINATED";
    }
    return "INVALID";
}

EvolutionController::EvolutionController(PatchBudget budget, bool require_improvement)
    : budget_(budget), require_improvement_(require_improvement) {
    if (budget_.window_length == 0) {
        throw std::invalid_argument("Budget window length must be at least one cycle");
    }
}

bool EvolutionController::dominates(const WorldModelDiff& a, const WorldModelDiff& b) {
    bool no_worse = a.success_rate_delta >= b.success_rate_delta - kEpsilon &&
                    a.rule_count_delta <= b.rule_count_delta &&
                    a.specialization_delta <= b.specialization_delta + kEpsilon;
    bool better = a.success_rate_delta > b.success_rate_delta + kEpsilon ||
                  a.rule_count_delta < b.rule_count_delta ||
                  a.specialization_delta < b.specialization_delta - kEpsilon;
    return no_worse && better;
}

bool EvolutionController::improves(const WorldModelDiff& diff) const {
    if (diff.success_rate_delta > kEpsilon) return true;
    return diff.success_rate_delta > -kEpsilon && diff.rule_count_delta < 0;
}

void EvolutionController::check_budget(const WorldModelDiff& diff) const {
    if (patches_in_window_ + 1 > budget_.max_patches_per_window) {
        throw BudgetExceeded("Patch budget exhausted: " + std::to_string(patches_in_window_) + "/" +
                             std::to_string(budget_.max_patches_per_window) + " patches used this window");
    }
    if (rule_growth_in_window_ + growth_of(diff) > budget_.max_rule_count_increase) {
        throw BudgetExceeded("Rule growth budget exceeded: " + std::to_string(rule_growth_in_window_) + " + " +
                             std::to_string(growth_of(diff)) + " > " +
                             std::to_string(budget_.max_rule_count_increase));
    }
}

Decision EvolutionController::select(const std::vector<SimulationResult>& results) {
    Decision decision;
    approved_.clear();

    std::vector<const SimulationResult*> survivors;
    for (const auto& result : results) {
        const std::string& id = result.proposal.id;
        if (!result.valid) {
            decision.rejected.push_back({id, RejectionReason::INVALID, result.error});
            continue;
        }
        if (require_improvement_ && !improves(result.diff)) {
            decision.rejected.push_back({id, RejectionReason::NO_IMPROVEMENT,
                                         "success delta " + std::to_string(result.diff.success_rate_delta)});
            continue;
        }
        try {
            check_budget(result.diff);
        } catch (const BudgetExceeded& e) {
            decision.rejected.push_back({id, RejectionReason::BUDGET_EXCEEDED, e.what()});
            Logger::getInstance().info("Rejected " + id + ": " + e.what());
            continue;
        }
        survivors.push_back(&result);
    }

    std::vector<const SimulationResult*> frontier;
    for (const auto* candidate : survivors) {
        const SimulationResult* dominator = nullptr;
        for (const auto* other : survivors) {
            if (other != candidate && dominates(other->diff, candidate->diff)) {
                dominator = other;
                break;
            }
        }
        if (dominator) {
            decision.rejected.push_back({candidate->proposal.id, RejectionReason::DOMINATED,
                                         "dominated by " + dominator->proposal.id});
        } else {
            frontier.push_back(candidate);
        }
    }

    std::stable_sort(frontier.begin(), frontier.end(),
                     [](const SimulationResult* a, const SimulationResult* b) {
                         if (a->diff.success_rate_delta != b->diff.success_rate_delta) {
                             return a->diff.success_rate_delta > b->diff.success_rate_delta;
                         }
                         if (a->diff.rule_count_delta != b->diff.rule_count_delta) {
                             return a->diff.rule_count_delta < b->diff.rule_count_delta;
                         }
                         return a->proposal.id < b->proposal.id;
                     });

    for (const auto* result : frontier) {
        decision.accepted.push_back(*result);
        approved_.insert({result->proposal.id, result->proposal.signature()});
    }

    Logger::getInstance().info("Controller selected " + std::to_string(decision.accepted.size()) + " of " +
                               std::to_string(results.size()) + " proposal(s)");
    return decision;
}

bool EvolutionController::is_approved(const PatchProposal& proposal) const {
    return approved_.count({proposal.id, proposal.signature()}) > 0;
}

void EvolutionController::record_acceptance(const PatchProposal& proposal, const WorldModelDiff& diff) {
    patches_in_window_++;
    rule_growth_in_window_ += growth_of(diff);
    approved_.erase({proposal.id, proposal.signature()});
}

void EvolutionController::advance_cycle() {
    approved_.clear();
    cycle_in_window_++;
    if (cycle_in_window_ >= budget_.window_length) {
        roll_window();
    }
}

void EvolutionController::roll_window() {
    window_index_++;
    cycle_in_window_ = 0;
    patches_in_window_ = 0;
    rule_growth_in_window_ = 0;
    Logger::getInstance().debug("Budget window " + std::to_string(window_index_) + " opened");
}

BudgetStatus EvolutionController::budget_status() const {
    BudgetStatus status;
    status.window_index = window_index_;
    status.cycle_in_window = cycle_in_window_;
    status.window_length = budget_.window_length;
    status.patches_used = patches_in_window_;
    status.patches_available = budget_.max_patches_per_window > patches_in_window_
        ? budget_.max_patches_per_window - patches_in_window_ : 0;
    status.rule_growth_used = rule_growth_in_window_;
    status.rule_growth_available = budget_.max_rule_count_increase > rule_growth_in_window_
        ? budget_.max_rule_count_increase - rule_growth_in_window_ : 0;
    return status;
}

} // namespace Evo
