#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "../src/core/errors.hpp"
#include "../src/evolution/patch_applier.hpp"
#include "../src/world/model_serializer.hpp"

using namespace Evo;
namespace fs = std::filesystem;

class WorldModelTest : public ::testing::Test {
protected:
    void SetUp() override {
        RuleSet seed;
        seed.add_rule(Rule::effect("login-effect", "auth.login", {{"loggedIn", "true"}}, "login sets flag"));
        seed.add_rule(Rule::precondition("click-login", "browser.click",
                                         {{"loggedIn", ConditionOp::EQUALS, "true"}}));
        store_ = std::make_unique<VersionStore>(seed);

        dir_ = fs::temp_directory_path() / ("evo_world_model_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    static PatchProposal proposal(const std::string& id, const PatchEdit& edit) {
        PatchProposal p;
        p.id = id;
        p.provenance = "reflection_v1";
        p.rationale = "test";
        p.edits = {edit};
        return p;
    }

    std::unique_ptr<VersionStore> store_;
    fs::path dir_;
};

TEST_F(WorldModelTest, FreshStoreHoldsRoot) {
    EXPECT_EQ(store_->current_version(), "v0");
    EXPECT_TRUE(store_->current()->is_root());
    EXPECT_EQ(store_->lineage("v0"), (std::vector<std::string>{"v0"}));
    EXPECT_TRUE(store_->children("v0").empty());
    EXPECT_THROW(store_->get("v9"), UnknownVersion);
    EXPECT_THROW(store_->children("v9"), UnknownVersion);
}

TEST_F(WorldModelTest, SeedWithCyclicOrderIsRejected) {
    RuleSet cyclic;
    cyclic.add_rule(Rule::order_rule("a", "x", {"y"}));
    cyclic.add_rule(Rule::order_rule("b", "y", {"x"}));
    EXPECT_THROW(VersionStore{cyclic}, CyclicOrderConstraint);
}

TEST_F(WorldModelTest, ExportedModelReloadsWithSameHistory) {
    PatchApplier applier(*store_);
    WorldModelDiff diff;
    diff.success_rate_delta = 0.5;
    diff.rule_count_delta = 1;
    applier.apply(proposal("p1", PatchEdit::add_rule(Rule::order_rule("click-after-fill", "browser.click",
                                                                       {"browser.fill"}))),
                  diff);
    applier.apply(proposal("p2", PatchEdit::add_condition("click-login", {"form.filled", ConditionOp::EXISTS, ""})),
                  WorldModelDiff());
    applier.rollback("v1");

    std::string path = (dir_ / "model.json").string();
    ModelSerializer::write_file(*store_, path);
    std::unique_ptr<VersionStore> loaded = ModelSerializer::read_file(path);

    EXPECT_EQ(loaded->versions(), store_->versions());
    EXPECT_EQ(loaded->current_version(), "v1");
    EXPECT_EQ(loaded->lineage("v2"), store_->lineage("v2"));
    EXPECT_EQ(loaded->patch_lineage("v2"), (std::vector<std::string>{"p1", "p2"}));
    ASSERT_EQ(loaded->audit_log().size(), 3u);
    EXPECT_EQ(loaded->audit_log()[2].kind, AuditKind::ROLLBACK);
    EXPECT_DOUBLE_EQ(loaded->audit_log()[0].diff.success_rate_delta, 0.5);

    for (const auto& version : store_->versions()) {
        EXPECT_EQ(ModelSerializer::snapshot_to_json(*loaded->get(version)),
                  ModelSerializer::snapshot_to_json(*store_->get(version)));
    }
}

TEST_F(WorldModelTest, RestoreRejectsUnknownParent) {
    WorldModelSnapshot root;
    root.version = "v0";
    WorldModelSnapshot orphan;
    orphan.version = "v1";
    orphan.parent_version = "v7";

    EXPECT_THROW(VersionStore::restore({root, orphan}, {}, "v0"), std::runtime_error);
    EXPECT_THROW(VersionStore::restore({orphan}, {}, "v1"), std::runtime_error);
    EXPECT_THROW(VersionStore::restore({root}, {}, "v3"), UnknownVersion);
}

TEST_F(WorldModelTest, RestoredGapsKeepIdsMonotonic) {
    WorldModelSnapshot root;
    root.version = "v0";
    WorldModelSnapshot later;
    later.version = "v5";
    later.parent_version = "v0";
    std::unique_ptr<VersionStore> restored = VersionStore::restore({root, later}, {}, "v5");

    PatchApplier applier(*restored);
    SnapshotPtr next = applier.apply(proposal("p1", PatchEdit::add_rule(Rule::order_rule("o", "b", {"a"}))),
                                     WorldModelDiff());
    EXPECT_EQ(next->version, "v6");
    EXPECT_EQ(next->parent_version, "v5");
    EXPECT_EQ(applier.commit_maintenance(next->rules, "decay")->version, "v7");
}

TEST_F(WorldModelTest, MalformedFileIsReported) {
    std::string path = (dir_ / "broken.json").string();
    {
        std::ofstream out(path);
        out << "{ \"format\": ";
    }
    EXPECT_THROW(ModelSerializer::read_file(path), std::runtime_error);
    EXPECT_THROW(ModelSerializer::read_file((dir_ / "missing.json").string()), std::runtime_error);
}

TEST_F(WorldModelTest, RuleJsonValidatesFields) {
    Json::Value rule = ModelSerializer::rule_to_json(*store_->current()->rules.find("login-effect"));
    Rule parsed = ModelSerializer::rule_from_json(rule);
    EXPECT_EQ(parsed.id, "login-effect");
    EXPECT_EQ(parsed.kind, RuleKind::EFFECT);
    EXPECT_EQ(parsed.produces.at("loggedIn"), "true");

    rule["metadata"]["confidence"] = 1.5;
    EXPECT_THROW(ModelSerializer::rule_from_json(rule), std::runtime_error);
}
