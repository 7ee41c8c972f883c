#include <gtest/gtest.h>
#include "../src/core/errors.hpp"
#include "../src/dag/dag_builder.hpp"
#include "../src/engine/execution_engine.hpp"
#include "../src/tools/scripted_capability.hpp"

using namespace Evo;

namespace {

Condition equals(const std::string& key, const std::string& value) {
    return Condition{key, ConditionOp::EQUALS, value};
}

class SingleStepDecomposer : public GoalDecomposer {
public:
    std::string name() const override { return "single"; }
    bool matches(const Goal& goal) const override { return goal.description.find("ping") != std::string::npos; }
    std::vector<SeedStep> decompose(const Goal&) const override {
        return {SeedStep{Action{"net.ping", {}}, {}}};
    }
};

} // namespace

class DagBuilderTest : public ::testing::Test {
protected:
    DagBuilder builder_;
    Goal search_{"search for cheap flights"};
};

TEST_F(DagBuilderTest, BrowseGoalWithoutRulesBuildsSingleNodeAndRuns) {
    BuildResult build = builder_.build(Goal{"browse to example.com"}, RuleSet(), {});

    ASSERT_EQ(build.dag.size(), 1u);
    EXPECT_EQ(build.decomposer, "browse");
    EXPECT_EQ(build.dag.nodes()[0].id, "n0");
    EXPECT_EQ(build.dag.nodes()[0].action.name, "browser.open");
    EXPECT_EQ(build.dag.nodes()[0].action.params.at("url"), "example.com");
    EXPECT_TRUE(build.trace.empty());

    Engine engine(std::make_shared<ScriptedCapability>());
    ExecutionReport report = engine.execute("browse", build, {}, "v0");
    EXPECT_EQ(report.status, ReportStatus::SUCCESS);
}

TEST_F(DagBuilderTest, DecomposersMatchGoalKinds) {
    EXPECT_EQ(builder_.select_decomposer(search_).name(), "search");
    EXPECT_EQ(builder_.select_decomposer(Goal{"extract prices from shop.example"}).name(), "extract");
    EXPECT_EQ(builder_.select_decomposer(Goal{"water the plants"}).name(), "generic");

    BuildResult extract = builder_.build(Goal{"extract prices from shop.example"}, RuleSet(), {});
    ASSERT_EQ(extract.dag.size(), 3u);
    EXPECT_EQ(extract.dag.nodes()[0].action.params.at("url"), "shop.example");
    EXPECT_TRUE(extract.dag.has_edge("n0", "n1"));
    EXPECT_TRUE(extract.dag.has_edge("n1", "n2"));
}

TEST_F(DagBuilderTest, CustomDecomposerTakesPriority) {
    builder_.register_decomposer(std::make_shared<SingleStepDecomposer>());
    BuildResult build = builder_.build(Goal{"browse and ping"}, RuleSet(), {});
    EXPECT_EQ(build.decomposer, "single");
    ASSERT_EQ(build.dag.size(), 1u);
    EXPECT_EQ(build.dag.nodes()[0].action.name, "net.ping");
}

TEST_F(DagBuilderTest, MissingPreconditionInjectsProducer) {
    RuleSet rules;
    rules.add_rule(Rule::precondition("click-login", "browser.click", {equals("loggedIn", "true")}));
    rules.add_rule(Rule::effect("login-effect", "auth.login", {{"loggedIn", "true"}}));

    BuildResult build = builder_.build(search_, rules, {});

    ASSERT_EQ(build.dag.size(), 4u);
    const ActionNode& injected = build.dag.node("n3");
    EXPECT_EQ(injected.action.name, "auth.login");
    EXPECT_TRUE(build.dag.has_edge("n3", "n2"));

    EXPECT_EQ(build.trace.rules_for("n3"), (std::vector<std::string>{"click-login", "login-effect"}));
    EXPECT_EQ(build.trace.rules_for("n2"), (std::vector<std::string>{"click-login"}));
    EXPECT_TRUE(build.trace.rules_for("n0").empty());
}

TEST_F(DagBuilderTest, SatisfiedPreconditionInjectsNothing) {
    RuleSet rules;
    rules.add_rule(Rule::precondition("click-login", "browser.click", {equals("loggedIn", "true")}));

    BuildResult build = builder_.build(search_, rules, {{"loggedIn", "true"}});
    EXPECT_EQ(build.dag.size(), 3u);
    EXPECT_TRUE(build.trace.empty());
}

TEST_F(DagBuilderTest, MissingPreconditionWithoutProducerIsUnsatisfiable) {
    RuleSet rules;
    rules.add_rule(Rule::precondition("click-login", "browser.click", {equals("loggedIn", "true")}));

    EXPECT_THROW(builder_.build(search_, rules, {}), UnsatisfiableGoal);
}

TEST_F(DagBuilderTest, ProducerIsSharedBetweenConsumers) {
    RuleSet rules;
    rules.add_rule(Rule::precondition("fill-login", "browser.fill", {equals("loggedIn", "true")}));
    rules.add_rule(Rule::precondition("click-login", "browser.click", {equals("loggedIn", "true")}));
    rules.add_rule(Rule::effect("login-effect", "auth.login", {{"loggedIn", "true"}}));

    BuildResult build = builder_.build(search_, rules, {});
    EXPECT_EQ(build.dag.nodes_for_action("auth.login").size(), 1u);
    EXPECT_TRUE(build.dag.has_edge("n3", "n1"));
    EXPECT_TRUE(build.dag.has_edge("n3", "n2"));
}

TEST_F(DagBuilderTest, ContradictoryRequirementsRaiseRuleConflict) {
    RuleSet rules;
    rules.add_rule(Rule::precondition("fill-logged-in", "browser.fill", {equals("loggedIn", "true")}));
    rules.add_rule(Rule::precondition("click-logged-out", "browser.click", {equals("loggedIn", "false")}));

    try {
        builder_.build(search_, rules, {{"loggedIn", "true"}});
        FAIL() << "expected RuleConflict";
    } catch (const RuleConflict& e) {
        EXPECT_EQ(e.first_rule(), "fill-logged-in");
        EXPECT_EQ(e.second_rule(), "click-logged-out");
    }
}

TEST_F(DagBuilderTest, OrderRuleAddsConstrainedEdge) {
    RuleSet rules;
    rules.add_rule(Rule::order_rule("click-after-fill", "browser.click", {"browser.fill"}));

    BuildResult build = builder_.build(search_, rules, {});
    EXPECT_TRUE(build.dag.has_edge("n1", "n2"));
    ASSERT_EQ(build.trace.size(), 1u);
    EXPECT_EQ(build.trace.entries[0].node_id, "n2");
    EXPECT_EQ(build.trace.entries[0].relation, TraceRelation::CONSTRAINED);
}

TEST_F(DagBuilderTest, OrderRuleAgainstPlannedSequenceConflicts) {
    RuleSet rules;
    rules.add_rule(Rule::order_rule("open-after-fill", "browser.open", {"browser.fill"}));

    EXPECT_THROW(builder_.build(search_, rules, {}), RuleConflict);
}

TEST_F(DagBuilderTest, CircularProducerChainIsUnsatisfiable) {
    RuleSet rules;
    rules.add_rule(Rule::precondition("click-login", "browser.click", {equals("loggedIn", "true")}));
    rules.add_rule(Rule::effect("login-effect", "auth.login", {{"loggedIn", "true"}}));
    rules.add_rule(Rule::precondition("login-token", "auth.login", {equals("token", "1")}));
    rules.add_rule(Rule::effect("click-token", "browser.click", {{"token", "1"}}));

    EXPECT_THROW(builder_.build(search_, rules, {}), UnsatisfiableGoal);
}

TEST_F(DagBuilderTest, IdenticalInputsBuildIdenticalGraphs) {
    RuleSet rules;
    rules.add_rule(Rule::precondition("click-login", "browser.click", {equals("loggedIn", "true")}));
    rules.add_rule(Rule::effect("login-effect", "auth.login", {{"loggedIn", "true"}}));
    rules.add_rule(Rule::order_rule("click-after-fill", "browser.click", {"browser.fill"}));

    BuildResult first = builder_.build(search_, rules, {});
    BuildResult second = builder_.build(search_, rules, {});

    ASSERT_EQ(first.dag.size(), second.dag.size());
    for (size_t i = 0; i < first.dag.size(); ++i) {
        EXPECT_EQ(first.dag.nodes()[i].id, second.dag.nodes()[i].id);
        EXPECT_EQ(first.dag.nodes()[i].action, second.dag.nodes()[i].action);
        EXPECT_EQ(first.dag.nodes()[i].predecessors, second.dag.nodes()[i].predecessors);
    }
    ASSERT_EQ(first.trace.size(), second.trace.size());
    for (size_t i = 0; i < first.trace.size(); ++i) {
        EXPECT_EQ(first.trace.entries[i].rule_id, second.trace.entries[i].rule_id);
        EXPECT_EQ(first.trace.entries[i].node_id, second.trace.entries[i].node_id);
    }
}

TEST(ActionDagTest, RefusesCycleClosingEdges) {
    ActionDAG dag;
    std::string a = dag.add_node(Action{"a", {}});
    std::string b = dag.add_node(Action{"b", {}}, {a});
    std::string c = dag.add_node(Action{"c", {}}, {b});

    EXPECT_FALSE(dag.add_edge(c, a));
    EXPECT_FALSE(dag.add_edge(a, a));
    EXPECT_TRUE(dag.has_path(a, c));
    EXPECT_EQ(dag.topological_order(), (std::vector<std::string>{a, b, c}));
    EXPECT_THROW(dag.add_node(Action{"d", {}}, {"n99"}), std::invalid_argument);
}
