#include <gtest/gtest.h>
#include "../src/core/errors.hpp"
#include "../src/evolution/evolution_controller.hpp"
#include "../src/evolution/patch_applier.hpp"
#include "../src/reflection/reflection.hpp"
#include "../src/world/model_serializer.hpp"

using namespace Evo;

class PatchApplierTest : public ::testing::Test {
protected:
    void SetUp() override {
        RuleSet seed;
        seed.add_rule(Rule::effect("login-effect", "auth.login", {{"loggedIn", "true"}}));
        seed.add_rule(Rule::order_rule("fill-after-open", "browser.fill", {"browser.open"}));
        store_ = std::make_unique<VersionStore>(seed);
        applier_ = std::make_unique<PatchApplier>(*store_);
    }

    static PatchProposal proposal(const std::string& id, const std::vector<PatchEdit>& edits) {
        PatchProposal p;
        p.id = id;
        p.provenance = "test";
        p.edits = edits;
        return p;
    }

    static std::string rules_json(const RuleSet& rules) {
        WorldModelSnapshot snapshot;
        snapshot.version = "x";
        snapshot.rules = rules;
        return ModelSerializer::snapshot_to_json(snapshot)["rules"].toStyledString();
    }

    std::unique_ptr<VersionStore> store_;
    std::unique_ptr<PatchApplier> applier_;
};

TEST_F(PatchApplierTest, ApplyCommitsEditsExactlyOnce) {
    PatchProposal p = proposal("p1", {PatchEdit::add_rule(Rule::precondition(
        "click-login", "browser.click", {{"loggedIn", ConditionOp::EQUALS, "true"}}))});
    RuleSet expected = apply_edits(store_->current()->rules, p.edits);

    SnapshotPtr snapshot = applier_->apply(p, WorldModelDiff());

    EXPECT_EQ(snapshot->version, "v1");
    EXPECT_EQ(snapshot->parent_version, "v0");
    EXPECT_EQ(store_->current_version(), "v1");
    EXPECT_EQ(rules_json(snapshot->rules), rules_json(expected));

    ASSERT_EQ(store_->audit_log().size(), 1u);
    const AuditRecord& record = store_->audit_log()[0];
    EXPECT_EQ(record.kind, AuditKind::PATCH);
    EXPECT_EQ(record.proposal.id, "p1");
    EXPECT_EQ(record.version, "v1");
    EXPECT_EQ(record.parent_version, "v0");
}

TEST_F(PatchApplierTest, FailedApplyLeavesStoreUnchanged) {
    std::string before = rules_json(store_->current()->rules);

    EXPECT_THROW(applier_->apply(proposal("bad", {PatchEdit::deprecate_rule("ghost")}), WorldModelDiff()),
                 InvalidProposal);
    // Creates open -> fill -> open.
    EXPECT_THROW(applier_->apply(proposal("cycle", {PatchEdit::add_rule(
                     Rule::order_rule("open-after-fill", "browser.open", {"browser.fill"}))}),
                                 WorldModelDiff()),
                 CyclicOrderConstraint);

    EXPECT_EQ(store_->current_version(), "v0");
    EXPECT_EQ(store_->size(), 1u);
    EXPECT_TRUE(store_->audit_log().empty());
    EXPECT_EQ(rules_json(store_->current()->rules), before);
}

TEST_F(PatchApplierTest, VersionIdsAreMonotonicAndLineageReachesRoot) {
    applier_->apply(proposal("p1", {PatchEdit::narrow_scope("login-effect", {"a", ConditionOp::EXISTS, ""})}),
                    WorldModelDiff());
    applier_->apply(proposal("p2", {PatchEdit::narrow_scope("login-effect", {"b", ConditionOp::EXISTS, ""})}),
                    WorldModelDiff());
    applier_->commit_maintenance(store_->current()->rules, "stats");

    EXPECT_EQ(store_->versions(), (std::vector<std::string>{"v0", "v1", "v2", "v3"}));
    EXPECT_EQ(store_->lineage("v3"), (std::vector<std::string>{"v3", "v2", "v1", "v0"}));
    EXPECT_EQ(store_->patch_lineage("v3"), (std::vector<std::string>{"p1", "p2"}));
    EXPECT_EQ(store_->audit_log().back().kind, AuditKind::MAINTENANCE);
}

TEST_F(PatchApplierTest, RollbackToUnknownVersionFails) {
    applier_->apply(proposal("p1", {PatchEdit::deprecate_rule("fill-after-open")}), WorldModelDiff());

    EXPECT_THROW(applier_->rollback("v42"), UnknownVersion);
    EXPECT_EQ(store_->current_version(), "v1");
    EXPECT_EQ(store_->audit_log().size(), 1u);
}

TEST_F(PatchApplierTest, RollbackKeepsHistoryAndBranches) {
    applier_->apply(proposal("p1", {PatchEdit::deprecate_rule("fill-after-open")}), WorldModelDiff());
    applier_->rollback("v0");

    EXPECT_EQ(store_->current_version(), "v0");
    EXPECT_TRUE(store_->contains("v1"));
    EXPECT_EQ(store_->audit_log().back().kind, AuditKind::ROLLBACK);

    // A new patch branches from the rolled-back version.
    SnapshotPtr branch = applier_->apply(
        proposal("p2", {PatchEdit::narrow_scope("login-effect", {"site", ConditionOp::EXISTS, ""})}),
        WorldModelDiff());
    EXPECT_EQ(branch->version, "v2");
    EXPECT_EQ(branch->parent_version, "v0");
    EXPECT_EQ(store_->children("v0"), (std::vector<std::string>{"v1", "v2"}));
    EXPECT_EQ(store_->patch_lineage("v2"), (std::vector<std::string>{"p2"}));
}

TEST_F(PatchApplierTest, ControllerApprovalAndBudgetAreRechecked) {
    PatchBudget budget;
    budget.max_patches_per_window = 1;
    EvolutionController controller(budget);
    PatchApplier guarded(*store_, &controller);

    PatchProposal p1 = proposal("p1", {PatchEdit::narrow_scope("login-effect", {"a", ConditionOp::EXISTS, ""})});
    PatchProposal p2 = proposal("p2", {PatchEdit::narrow_scope("login-effect", {"b", ConditionOp::EXISTS, ""})});

    // Never selected: stale.
    EXPECT_THROW(guarded.apply(p1, WorldModelDiff()), InvalidProposal);

    SimulationResult r1;
    r1.proposal = p1;
    r1.diff.success_rate_delta = 0.5;
    SimulationResult r2 = r1;
    r2.proposal = p2;
    Decision decision = controller.select({r1, r2});
    ASSERT_EQ(decision.accepted.size(), 2u);

    guarded.apply(decision.accepted[0].proposal, decision.accepted[0].diff);
    EXPECT_THROW(guarded.apply(decision.accepted[1].proposal, decision.accepted[1].diff), BudgetExceeded);
    EXPECT_EQ(store_->size(), 2u);
    EXPECT_EQ(controller.budget_status().patches_used, 1u);
}

TEST_F(PatchApplierTest, FrontierProposalsFromOneCycleAllCommit) {
    // Two failures under the same order rule: fill misses the login, extract misses the page.
    ExecutionReport report;
    report.task_id = "task";
    report.version = "v0";
    report.status = ReportStatus::FAILURE;
    std::string open = report.dag.add_node(Action{"browser.open", {}});
    std::string fill = report.dag.add_node(Action{"browser.fill", {}}, {open});
    std::string extract = report.dag.add_node(Action{"browser.extract", {}}, {open});
    report.dag.node(open).status = NodeStatus::SUCCEEDED;
    report.dag.node(fill).status = NodeStatus::FAILED;
    report.dag.node(extract).status = NodeStatus::FAILED;
    report.trace.record(fill, "fill-after-open", TraceRelation::CONSTRAINED, "test");
    report.trace.record(extract, "fill-after-open", TraceRelation::CONSTRAINED, "test");
    FailureInfo login;
    login.kind = FailureKind::MISSING_PRECONDITION;
    login.state_key = "loggedIn";
    login.expected_value = "true";
    FailureInfo page = login;
    page.state_key = "page.loaded";
    report.failures[fill] = login;
    report.failures[extract] = page;

    std::vector<PatchProposal> proposals = ReflectionV1().reflect(report, store_->current()->rules);
    ASSERT_EQ(proposals.size(), 2u);
    EXPECT_NE(proposals[0].id, proposals[1].id);

    EvolutionController controller;
    PatchApplier guarded(*store_, &controller);
    std::vector<SimulationResult> results;
    for (const auto& p : proposals) {
        SimulationResult r;
        r.proposal = p;
        r.diff.success_rate_delta = 0.5;
        results.push_back(r);
    }
    Decision decision = controller.select(results);
    ASSERT_EQ(decision.accepted.size(), 2u);

    for (const auto& accepted : decision.accepted) {
        EXPECT_NO_THROW(guarded.apply(accepted.proposal, accepted.diff)) << accepted.proposal.id;
    }
    EXPECT_EQ(store_->current_version(), "v2");
    EXPECT_EQ(store_->patch_lineage("v2").size(), 2u);
    EXPECT_EQ(store_->current()->rules.find("fill-after-open")->scope.size(), 2u);
}

TEST_F(PatchApplierTest, SnapshotsAreNeverMutated) {
    SnapshotPtr root = store_->current();
    std::string before = rules_json(root->rules);
    applier_->apply(proposal("p1", {PatchEdit::deprecate_rule("login-effect")}), WorldModelDiff());
    EXPECT_EQ(rules_json(store_->get("v0")->rules), before);
    EXPECT_EQ(root.get(), store_->get("v0").get());
}
