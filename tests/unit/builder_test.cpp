#include "../../src/requirement/builder.hpp"

#include <gtest/gtest.h>
#include <functional>

using namespace prereq;
using namespace prereq::req;

// ============================================================
// テストヘルパー
// ============================================================
class BuilderTest : public ::testing::Test {
   protected:
    static InvalidRequirement::Kind error_kind(const std::function<void()>& fn) {
        try {
            fn();
        } catch (const InvalidRequirement& e) {
            return e.kind();
        }
        ADD_FAILURE() << "InvalidRequirement が送出されなかった";
        return InvalidRequirement::Kind::MALFORMED_JSON;
    }
};

// ============================================================
// 特性要件
// ============================================================
TEST_F(BuilderTest, TraitWithMinimum) {
    auto r = trait("strength", 3);
    ASSERT_EQ(r.type(), RequirementType::Trait);

    const auto* node = r.get_if<TraitRequirement>();
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->name, "strength");
    EXPECT_EQ(node->minimum, 3);
    EXPECT_FALSE(node->maximum.has_value());
    EXPECT_FALSE(node->exact.has_value());
}

TEST_F(BuilderTest, TraitWithRangeAndExact) {
    auto r = trait("arete", 2, 5, 4);
    const auto* node = r.get_if<TraitRequirement>();
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->minimum, 2);
    EXPECT_EQ(node->maximum, 5);
    EXPECT_EQ(node->exact, 4);
}

TEST_F(BuilderTest, TraitRequiresABound) {
    EXPECT_EQ(error_kind([] { trait("strength", std::nullopt); }),
              InvalidRequirement::Kind::MISSING_BOUND);
}

TEST_F(BuilderTest, TraitRejectsEmptyName) {
    EXPECT_EQ(error_kind([] { trait("", 1); }), InvalidRequirement::Kind::EMPTY_FIELD);
    EXPECT_EQ(error_kind([] { trait("   ", 1); }), InvalidRequirement::Kind::EMPTY_FIELD);
}

TEST_F(BuilderTest, TraitRejectsInvertedRange) {
    EXPECT_EQ(error_kind([] { trait("strength", 5, 3); }), InvalidRequirement::Kind::INVALID_BOUND);
}

TEST_F(BuilderTest, TraitRejectsNegativeBound) {
    EXPECT_EQ(error_kind([] { trait("strength", -1); }), InvalidRequirement::Kind::INVALID_BOUND);
}

// ============================================================
// 所持品要件
// ============================================================
TEST_F(BuilderTest, HasItemByName) {
    auto r = has_item("weapons", std::nullopt, std::string("Magic Sword"));
    const auto* node = r.get_if<PossessionRequirement>();
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->field, "weapons");
    EXPECT_EQ(node->filter.name, std::string("Magic Sword"));
    EXPECT_FALSE(node->filter.id.has_value());
}

TEST_F(BuilderTest, HasItemWithAttributes) {
    auto r = has_item("foci", std::nullopt, std::nullopt, {{"material", std::string("crystal")}});
    const auto* node = r.get_if<PossessionRequirement>();
    ASSERT_NE(node, nullptr);
    ASSERT_EQ(node->filter.attributes.size(), 1u);
    EXPECT_TRUE(attribute_equals(node->filter.attributes.at("material"),
                                 AttributeValue(std::string("crystal"))));
}

TEST_F(BuilderTest, HasItemRequiresCriteria) {
    EXPECT_EQ(error_kind([] { has_item("weapons", std::nullopt); }),
              InvalidRequirement::Kind::MISSING_FIELD);
}

TEST_F(BuilderTest, HasItemRejectsEmptyField) {
    EXPECT_EQ(error_kind([] { has_item("", 7); }), InvalidRequirement::Kind::EMPTY_FIELD);
}

TEST_F(BuilderTest, HasItemRejectsReservedAttribute) {
    EXPECT_TRUE(is_reserved_attribute("field"));
    EXPECT_TRUE(is_reserved_attribute("id"));
    EXPECT_TRUE(is_reserved_attribute("name"));
    EXPECT_FALSE(is_reserved_attribute("material"));

    EXPECT_EQ(error_kind([] {
                  has_item("weapons", std::nullopt, std::nullopt,
                           {{"field", std::string("x")}});
              }),
              InvalidRequirement::Kind::UNKNOWN_KEY);
}

TEST_F(BuilderTest, HasItemRejectsNonPositiveId) {
    EXPECT_EQ(error_kind([] { has_item("weapons", 0); }), InvalidRequirement::Kind::INVALID_BOUND);
}

// ============================================================
// タグ数要件
// ============================================================
TEST_F(BuilderTest, TagCount) {
    auto r = tag_count("spheres", "elemental", 2);
    const auto* node = r.get_if<TagCountRequirement>();
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->field, "spheres");
    EXPECT_EQ(node->tag, "elemental");
    EXPECT_EQ(node->minimum, 2);
}

TEST_F(BuilderTest, TagCountRequiresABound) {
    EXPECT_EQ(error_kind([] { tag_count("spheres", "elemental", std::nullopt); }),
              InvalidRequirement::Kind::MISSING_BOUND);
}

TEST_F(BuilderTest, TagCountRejectsEmptyTag) {
    EXPECT_EQ(error_kind([] { tag_count("spheres", "", 1); }),
              InvalidRequirement::Kind::EMPTY_FIELD);
}

// ============================================================
// 論理要件
// ============================================================
TEST_F(BuilderTest, CompositesKeepChildOrder) {
    auto r = all_of({trait("a", 1), any_of({trait("b", 2), trait("c", 3)})});
    const auto* all = r.get_if<AllOfRequirement>();
    ASSERT_NE(all, nullptr);
    ASSERT_EQ(all->children.size(), 2u);
    EXPECT_EQ(all->children[0].type(), RequirementType::Trait);
    EXPECT_EQ(all->children[1].type(), RequirementType::AnyOf);

    const auto* any = all->children[1].get_if<AnyOfRequirement>();
    ASSERT_NE(any, nullptr);
    EXPECT_EQ(any->children[1].get_if<TraitRequirement>()->name, "c");
}

TEST_F(BuilderTest, EmptyCompositesAreAllowed) {
    EXPECT_EQ(all_of({}).type(), RequirementType::AllOf);
    EXPECT_EQ(any_of({}).type(), RequirementType::AnyOf);
}

TEST_F(BuilderTest, DepthIsTracked) {
    EXPECT_EQ(trait("a", 1).depth(), 1u);
    EXPECT_EQ(all_of({}).depth(), 1u);
    EXPECT_EQ(all_of({trait("a", 1), any_of({trait("b", 1)})}).depth(), 3u);
}

TEST_F(BuilderTest, NestingLimit) {
    Requirement r = trait("a", 1);
    for (size_t i = 1; i < kMaxNesting; ++i) {
        r = all_of({r});
    }
    EXPECT_EQ(r.depth(), kMaxNesting);

    EXPECT_EQ(error_kind([&] { any_of({r}); }), InvalidRequirement::Kind::TOO_DEEP);
}

TEST_F(BuilderTest, StructuralEquality) {
    EXPECT_EQ(all_of({trait("a", 1), tag_count("x", "y", 1, 2)}),
              all_of({trait("a", 1), tag_count("x", "y", 1, 2)}));
    EXPECT_NE(trait("a", 1), trait("a", 2));
    EXPECT_NE(all_of({trait("a", 1)}), any_of({trait("a", 1)}));
}

// ============================================================
// 外部コンテンツへの紐付け
// ============================================================
TEST_F(BuilderTest, AttachToContent) {
    auto attached = attach("Requires combat training", any_of({trait("strength", 4)}),
                           ContentRef{"merit", 42});
    EXPECT_EQ(attached.description, "Requires combat training");
    ASSERT_TRUE(attached.content.has_value());
    EXPECT_EQ(attached.content->type, "merit");
    EXPECT_EQ(attached.content->id, 42);
    EXPECT_EQ(attached.requirement.type(), RequirementType::AnyOf);
}

TEST_F(BuilderTest, AttachRejectsBlankDescription) {
    EXPECT_EQ(error_kind([] { attach("  ", trait("strength", 1)); }),
              InvalidRequirement::Kind::EMPTY_FIELD);
    EXPECT_EQ(error_kind([] { attach("x", trait("strength", 1), ContentRef{"merit", 0}); }),
              InvalidRequirement::Kind::INVALID_BOUND);
}
