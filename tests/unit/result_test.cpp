#include "../../src/check/engine.hpp"

#include "../../src/facts/memory_provider.hpp"
#include "../../src/requirement/builder.hpp"

#include <gtest/gtest.h>

using namespace prereq;
using namespace prereq::req;

class ResultTest : public ::testing::Test {
   protected:
    void SetUp() override {
        hero_.set_trait("strength", 2);
        hero_.set_trait("dexterity", 5);
    }

    facts::MemoryFactProvider hero_{"hero"};
};

// ============================================================
// 失敗理由
// ============================================================
TEST_F(ResultTest, FailureReasonsCollectFailingLeaves) {
    auto result = check::evaluate(
        all_of({trait("strength", 3), trait("dexterity", 3), trait("wits", 1)}), hero_);

    auto reasons = result.failure_reasons();
    ASSERT_EQ(reasons.size(), 2u);
    EXPECT_EQ(reasons[0], "Strength requirement not met (2 < 3)");
    EXPECT_EQ(reasons[1], "Wits trait not found");
}

TEST_F(ResultTest, PassedAnyOfContributesNoReasons) {
    auto result = check::evaluate(
        all_of({any_of({trait("strength", 3), trait("dexterity", 3)}), trait("wits", 1)}), hero_);

    auto reasons = result.failure_reasons();
    ASSERT_EQ(reasons.size(), 1u);
    EXPECT_EQ(reasons[0], "Wits trait not found");
}

TEST_F(ResultTest, FailedEmptyAnyOfIsItsOwnReason) {
    auto result = check::evaluate(any_of({}), hero_);
    auto reasons = result.failure_reasons();
    ASSERT_EQ(reasons.size(), 1u);
    EXPECT_EQ(reasons[0], "No requirements satisfied (0/0)");
}

TEST_F(ResultTest, PassedResultHasNoReasons) {
    auto result = check::evaluate(trait("dexterity", 5), hero_);
    EXPECT_TRUE(static_cast<bool>(result));
    EXPECT_TRUE(result.failure_reasons().empty());
}

// ============================================================
// 出力形式
// ============================================================
TEST_F(ResultTest, ToJson) {
    auto result = check::evaluate(all_of({trait("strength", 3)}), hero_);
    auto json = result.to_json();

    const auto* object = json.getAsObject();
    ASSERT_NE(object, nullptr);
    EXPECT_EQ(object->getBoolean("passed"), false);
    EXPECT_EQ(object->getString("type"), llvm::StringRef("all"));
    EXPECT_FALSE(object->get("observed"));

    const auto* children = object->getArray("children");
    ASSERT_NE(children, nullptr);
    ASSERT_EQ(children->size(), 1u);

    const auto* child = (*children)[0].getAsObject();
    ASSERT_NE(child, nullptr);
    EXPECT_EQ(child->getString("type"), llvm::StringRef("trait"));
    EXPECT_EQ(child->getInteger("observed"), int64_t{2});
    EXPECT_EQ(child->getString("message"), llvm::StringRef("Strength requirement not met (2 < 3)"));
    EXPECT_FALSE(child->get("children"));
}

TEST_F(ResultTest, ToTextIndentsChildren) {
    auto result = check::evaluate(any_of({trait("strength", 3), trait("dexterity", 3)}), hero_);
    EXPECT_EQ(result.to_text(),
              "[PASS] At least one requirement satisfied (1/2)\n"
              "  [FAIL] Strength requirement not met (2 < 3)\n"
              "  [PASS] Dexterity requirement met (minimum 3): 5\n");
}
