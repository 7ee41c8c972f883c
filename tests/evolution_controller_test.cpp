#include <gtest/gtest.h>
#include "../src/core/errors.hpp"
#include "../src/evolution/evolution_controller.hpp"

using namespace Evo;

namespace {

SimulationResult result(const std::string& id, double success, int rules, double specialization = 0.0) {
    SimulationResult r;
    r.proposal.id = id;
    r.diff.success_rate_delta = success;
    r.diff.rule_count_delta = rules;
    r.diff.specialization_delta = specialization;
    return r;
}

std::vector<std::string> ids(const std::vector<SimulationResult>& results) {
    std::vector<std::string> out;
    for (const auto& r : results) out.push_back(r.proposal.id);
    return out;
}

} // namespace

TEST(EvolutionControllerTest, ZeroPatchBudgetRejectsEverything) {
    PatchBudget budget;
    budget.max_patches_per_window = 0;
    EvolutionController controller(budget);

    Decision decision = controller.select({result("great", 1.0, 0), result("good", 0.5, 1)});

    EXPECT_TRUE(decision.accepted.empty());
    ASSERT_EQ(decision.rejected.size(), 2u);
    for (const auto& rejection : decision.rejected) {
        EXPECT_EQ(rejection.reason, RejectionReason::BUDGET_EXCEEDED);
    }
    EXPECT_THROW(controller.check_budget(WorldModelDiff()), BudgetExceeded);
}

TEST(EvolutionControllerTest, DominatedProposalsAreDropped) {
    EvolutionController controller;
    Decision decision = controller.select({
        result("best", 0.5, 0, 1.0),
        result("worse", 0.5, 1, 1.0),        // dominated by best
        result("tradeoff", 0.8, 2, 3.0),     // better success, more rules
    });

    EXPECT_EQ(ids(decision.accepted), (std::vector<std::string>{"tradeoff", "best"}));
    ASSERT_EQ(decision.rejected.size(), 1u);
    EXPECT_EQ(decision.rejected[0].proposal_id, "worse");
    EXPECT_EQ(decision.rejected[0].reason, RejectionReason::DOMINATED);

    // No accepted proposal is dominated by another one from the batch.
    for (const auto& a : decision.accepted) {
        for (const auto& b : decision.accepted) {
            EXPECT_FALSE(EvolutionController::dominates(b.diff, a.diff));
        }
    }
}

TEST(EvolutionControllerTest, FrontierTiesBrokenByRuleCountDelta) {
    EvolutionController controller;
    Decision decision = controller.select({
        result("more-rules", 0.5, 1, 0.0),
        result("fewer-rules", 0.5, 0, 2.0),
    });
    EXPECT_EQ(ids(decision.accepted), (std::vector<std::string>{"fewer-rules", "more-rules"}));
}

TEST(EvolutionControllerTest, NonImprovingAndInvalidProposalsAreRejected) {
    EvolutionController controller;
    SimulationResult invalid = result("invalid", 1.0, 0);
    invalid.valid = false;
    invalid.error = "unknown rule";

    Decision decision = controller.select({result("flat", 0.0, 1), result("shrink", 0.0, -1), invalid});

    EXPECT_EQ(ids(decision.accepted), (std::vector<std::string>{"shrink"}));
    ASSERT_EQ(decision.rejected.size(), 2u);
    EXPECT_EQ(decision.rejected[0].reason, RejectionReason::NO_IMPROVEMENT);
    EXPECT_EQ(decision.rejected[1].reason, RejectionReason::INVALID);
}

TEST(EvolutionControllerTest, ImprovementRequirementCanBeDisabled) {
    EvolutionController controller(PatchBudget(), false);
    Decision decision = controller.select({result("flat", 0.0, 1)});
    EXPECT_EQ(decision.accepted.size(), 1u);
}

TEST(EvolutionControllerTest, RuleGrowthCeiling) {
    PatchBudget budget;
    budget.max_rule_count_increase = 2;
    EvolutionController controller(budget);

    Decision decision = controller.select({result("big", 1.0, 3), result("small", 0.5, 1)});
    EXPECT_EQ(ids(decision.accepted), (std::vector<std::string>{"small"}));
    EXPECT_EQ(decision.rejected[0].reason, RejectionReason::BUDGET_EXCEEDED);
}

TEST(EvolutionControllerTest, BudgetCountersRollOverWithWindow) {
    PatchBudget budget;
    budget.window_length = 2;
    budget.max_patches_per_window = 1;
    EvolutionController controller(budget);

    SimulationResult p1 = result("p1", 0.5, 1);
    controller.select({p1});
    EXPECT_TRUE(controller.is_approved(p1.proposal));
    controller.record_acceptance(p1.proposal, p1.diff);
    EXPECT_FALSE(controller.is_approved(p1.proposal));
    EXPECT_THROW(controller.check_budget(WorldModelDiff()), BudgetExceeded);

    BudgetStatus status = controller.budget_status();
    EXPECT_EQ(status.patches_used, 1u);
    EXPECT_EQ(status.patches_available, 0u);
    EXPECT_EQ(status.rule_growth_used, 1u);

    controller.advance_cycle();
    EXPECT_THROW(controller.check_budget(WorldModelDiff()), BudgetExceeded);
    controller.advance_cycle();
    EXPECT_NO_THROW(controller.check_budget(WorldModelDiff()));
    EXPECT_EQ(controller.budget_status().window_index, 1u);
}

TEST(EvolutionControllerTest, InstancesKeepIndependentBudgets) {
    PatchBudget budget;
    budget.max_patches_per_window = 1;
    EvolutionController first(budget);
    EvolutionController second(budget);

    first.record_acceptance(result("p", 0.0, 0).proposal, WorldModelDiff());
    EXPECT_THROW(first.check_budget(WorldModelDiff()), BudgetExceeded);
    EXPECT_NO_THROW(second.check_budget(WorldModelDiff()));
}

TEST(EvolutionControllerTest, DominanceNeedsStrictImprovement) {
    WorldModelDiff a;
    a.success_rate_delta = 0.5;
    WorldModelDiff b = a;
    EXPECT_FALSE(EvolutionController::dominates(a, b));
    b.rule_count_delta = 1;
    EXPECT_TRUE(EvolutionController::dominates(a, b));
    EXPECT_FALSE(EvolutionController::dominates(b, a));
}

TEST(EvolutionControllerTest, ApprovalCoversIdAndEdits) {
    SimulationResult approved = result("p1", 0.5, 0);
    approved.proposal.edits = {PatchEdit::deprecate_rule("r1")};
    EvolutionController controller;
    controller.select({approved});

    PatchProposal impostor = approved.proposal;
    impostor.edits = {PatchEdit::deprecate_rule("r2")};
    EXPECT_TRUE(controller.is_approved(approved.proposal));
    EXPECT_FALSE(controller.is_approved(impostor));

    controller.advance_cycle();
    EXPECT_FALSE(controller.is_approved(approved.proposal));
}
