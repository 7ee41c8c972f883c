#include <gtest/gtest.h>
#include "../src/core/errors.hpp"
#include "../src/rules/patch.hpp"

using namespace Evo;

class PatchTest : public ::testing::Test {
protected:
    void SetUp() override {
        base_.add_rule(Rule::precondition("click-login", "browser.click",
                                          {{"loggedIn", ConditionOp::EQUALS, "true"}}));
        base_.add_rule(Rule::effect("login-effect", "auth.login", {{"loggedIn", "true"}}));
        base_.add_rule(Rule::order_rule("click-after-fill", "browser.click", {"browser.fill"}));
    }

    RuleSet base_;
};

TEST_F(PatchTest, AddConditionTargetsRequirementsOfPreconditionRules) {
    Condition form{"form.filled", ConditionOp::EQUALS, "true"};
    RuleSet patched = apply_edits(base_, {PatchEdit::add_condition("click-login", form)});

    const Rule* rule = patched.find("click-login");
    ASSERT_NE(rule, nullptr);
    EXPECT_EQ(rule->requirements.size(), 2u);
    EXPECT_TRUE(rule->scope.empty());
    // The base is untouched.
    EXPECT_EQ(base_.find("click-login")->requirements.size(), 1u);
}

TEST_F(PatchTest, AddConditionOnOtherKindsNarrowsScope) {
    Condition site{"site", ConditionOp::EQUALS, "shop"};
    RuleSet patched = apply_edits(base_, {PatchEdit::add_condition("login-effect", site)});
    ASSERT_EQ(patched.find("login-effect")->scope.size(), 1u);
    EXPECT_EQ(patched.find("login-effect")->scope[0], site);
}

TEST_F(PatchTest, AddOrderConstraintExtendsExistingOrder) {
    RuleSet patched = apply_edits(base_, {PatchEdit::add_order_constraint(
        "click-after-fill", OrderConstraint{"browser.click", {"browser.open"}})});
    const auto& preds = patched.find("click-after-fill")->order.predecessors;
    ASSERT_EQ(preds.size(), 2u);
    EXPECT_EQ(preds[1], "browser.open");

    EXPECT_THROW(apply_edits(base_, {PatchEdit::add_order_constraint(
                     "click-after-fill", OrderConstraint{"browser.fill", {"browser.open"}})}),
                 InvalidProposal);
}

TEST_F(PatchTest, DeprecateRuleGoesStraightToDeprecated) {
    RuleSet patched = apply_edits(base_, {PatchEdit::deprecate_rule("click-after-fill")});
    EXPECT_EQ(patched.find("click-after-fill")->metadata.status, RuleStatus::DEPRECATED);
    EXPECT_EQ(patched.live_rule_count(), 2u);
}

TEST_F(PatchTest, UnknownRuleAndDuplicateAddAreRejected) {
    EXPECT_THROW(apply_edits(base_, {PatchEdit::deprecate_rule("missing")}), InvalidProposal);
    EXPECT_THROW(apply_edits(base_, {PatchEdit::add_rule(Rule::effect("login-effect", "auth.login",
                                                                      {{"session", "1"}}))}),
                 DuplicateRuleId);
}

TEST_F(PatchTest, SignatureIgnoresIdsAndRationale) {
    PatchProposal a;
    a.id = "a";
    a.rationale = "first";
    a.edits = {PatchEdit::narrow_scope("click-login", {"site", ConditionOp::EXISTS, ""})};

    PatchProposal b = a;
    b.id = "b";
    b.rationale = "second";
    EXPECT_EQ(a.signature(), b.signature());

    b.edits = {PatchEdit::narrow_scope("click-login", {"site", ConditionOp::ABSENT, ""})};
    EXPECT_NE(a.signature(), b.signature());
}
