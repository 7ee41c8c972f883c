#pragma once

#include <set>
#include <string>
#include <utility>
#include <vector>
#include "../simulation/simulator.hpp"

namespace Evo {

// Rolling budget. The window is measured in evolution cycles.
struct PatchBudget {
    size_t window_length = 5;
    size_t max_patches_per_window = 3;
    size_t max_rule_count_increase = 5;
};

struct BudgetStatus {
    size_t window_index = 0;
    size_t cycle_in_window = 0;
    size_t window_length = 0;
    size_t patches_used = 0;
    size_t patches_available = 0;
    size_t rule_growth_used = 0;
    size_t rule_growth_available = 0;
};

enum class RejectionReason {
    INVALID,          // edits could not be applied to the baseline
    NO_IMPROVEMENT,
    BUDGET_EXCEEDED,
    DOMINATED
};

const char* to_string(RejectionReason reason);

struct Rejection {
    std::string proposal_id;
    RejectionReason reason = RejectionReason::INVALID;
    std::string detail;
};

struct Decision {
    std::vector<SimulationResult> accepted;   // Pareto frontier, in application order
    std::vector<Rejection> rejected;
};

// Filters and ranks simulated proposals.
//
// Budget state is owned by the instance, so several controllers can coexist.
// select() remembers the proposals it approved, by id and edit signature;
// PatchApplier checks them again before committing so that stale decisions
// are refused.
class EvolutionController {
public:
    explicit EvolutionController(PatchBudget budget = PatchBudget(), bool require_improvement = true);

    Decision select(const std::vector<SimulationResult>& results);

    // Throws BudgetExceeded if accepting a patch with this diff would exceed the window's budget.
    void check_budget(const WorldModelDiff& diff) const;

    bool is_approved(const PatchProposal& proposal) const;
    void record_acceptance(const PatchProposal& proposal, const WorldModelDiff& diff);

    // Ends a cycle; rolls the window over after window_length cycles.
    void advance_cycle();
    void roll_window();

    BudgetStatus budget_status() const;
    const PatchBudget& budget() const { return budget_; }

    // a dominates b on (max success delta, min rule-count delta, min specialization delta).
    static bool dominates(const WorldModelDiff& a, const WorldModelDiff& b);

private:
    bool improves(const WorldModelDiff& diff) const;

    PatchBudget budget_;
    bool require_improvement_;
    size_t window_index_ = 0;
    size_t cycle_in_window_ = 0;
    size_t patches_in_window_ = 0;
    size_t rule_growth_in_window_ = 0;
    std::set<std::pair<std::string, std::string>> approved_;
};

} // namespace Evo
