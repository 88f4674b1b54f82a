#include "../../src/check/batch.hpp"

#include "../../src/audit/sink.hpp"
#include "../../src/facts/memory_provider.hpp"
#include "../../src/requirement/builder.hpp"

#include <gtest/gtest.h>
#include <algorithm>

using namespace prereq;
using namespace prereq::req;

namespace {

// 特性の問い合わせで必ず失敗するプロバイダ
class OfflineProvider : public facts::FactProvider {
   public:
    std::optional<int64_t> get_trait(const std::string&) const override {
        throw FactProviderError(FactProviderError::Kind::QUERY_FAILED, identity(), "timeout");
    }
    bool has_match(const std::string&, const PossessionFilter&) const override { return false; }
    int64_t count_tagged(const std::string&, const std::string&) const override { return 0; }
    std::string identity() const override { return "offline"; }
};

}  // namespace

// ============================================================
// テストヘルパー
// ============================================================
class BatchTest : public ::testing::TestWithParam<unsigned> {
   protected:
    void SetUp() override {
        warrior_.set_trait("strength", 5);
        warrior_.set_trait("dexterity", 3);
        facts::FactObject sword;
        sword.id = 1;
        sword.name = "Longsword";
        sword.tags = {"blade"};
        warrior_.add_object("weapons", sword);

        mage_.set_trait("strength", 1);
        mage_.set_trait("arete", 4);

        requirements_ = {
            {"strong", trait("strength", 4)},
            {"armed", has_item("weapons", std::nullopt, std::string("Longsword"))},
            {"blades", tag_count("weapons", "blade", 2)},
            {"either", any_of({trait("arete", 3), trait("dexterity", 3)})},
            {"nothing", all_of({})},
        };
    }

    facts::MemoryFactProvider warrior_{"warrior"};
    facts::MemoryFactProvider mage_{"mage"};
    std::map<std::string, Requirement> requirements_;
    check::Checker checker_;
};

// ============================================================
// 1キャラクター × 複数要件
// ============================================================
TEST_P(BatchTest, EvaluateManyMatchesIndividualEvaluation) {
    check::BatchChecker batch(checker_, GetParam());
    EXPECT_EQ(batch.threads(), GetParam());
    auto out = batch.evaluate_many(requirements_, warrior_);

    EXPECT_TRUE(out.ok());
    ASSERT_EQ(out.results.size(), requirements_.size());
    for (const auto& [key, requirement] : requirements_) {
        ASSERT_EQ(out.results.count(key), 1u) << key;
        EXPECT_EQ(out.results.at(key), checker_.evaluate(requirement, warrior_)) << key;
    }
    EXPECT_TRUE(out.results.at("strong").passed);
    EXPECT_FALSE(out.results.at("blades").passed);
}

TEST_P(BatchTest, EvaluateManyEmpty) {
    check::BatchChecker batch(checker_, GetParam());
    auto out = batch.evaluate_many({}, warrior_);
    EXPECT_TRUE(out.results.empty());
    EXPECT_TRUE(out.ok());
}

TEST_P(BatchTest, ProviderErrorsStayPerEntry) {
    check::BatchChecker batch(checker_, GetParam());
    OfflineProvider offline;
    auto out = batch.evaluate_many(requirements_, offline);

    // 特性を問い合わせるエントリだけが失敗する
    EXPECT_FALSE(out.ok());
    EXPECT_EQ(out.errors.count("strong"), 1u);
    EXPECT_EQ(out.errors.count("either"), 1u);
    EXPECT_NE(out.errors.at("strong").find("timeout"), std::string::npos);
    EXPECT_EQ(out.results.count("armed"), 1u);
    EXPECT_EQ(out.results.count("blades"), 1u);
    EXPECT_TRUE(out.results.at("nothing").passed);
    EXPECT_EQ(out.results.size() + out.errors.size(), requirements_.size());
}

// ============================================================
// 1要件 × 複数キャラクター
// ============================================================
TEST_P(BatchTest, EvaluateAcrossKeepsOrder) {
    check::BatchChecker batch(checker_, GetParam());
    OfflineProvider offline;
    auto out = batch.evaluate_across(trait("strength", 4), {&mage_, &warrior_, &offline, nullptr});

    ASSERT_EQ(out.results.size(), 4u);
    ASSERT_TRUE(out.results[0].has_value());
    EXPECT_FALSE(out.results[0]->passed);
    ASSERT_TRUE(out.results[1].has_value());
    EXPECT_TRUE(out.results[1]->passed);

    EXPECT_FALSE(out.results[2].has_value());
    EXPECT_FALSE(out.results[3].has_value());
    ASSERT_EQ(out.errors.size(), 2u);
    EXPECT_NE(out.errors.at(2).find("offline"), std::string::npos);
    EXPECT_NE(out.errors.at(3).find("no fact provider"), std::string::npos);
}

// ============================================================
// ドキュメントからの評価
// ============================================================
TEST_P(BatchTest, EvaluateDocumentsIsolatesInvalidEntries) {
    check::BatchChecker batch(checker_, GetParam());
    auto documents = serde::parse_document_map(R"({
        "strong": {"trait": {"name": "strength", "min": 4}},
        "broken": {"trait": {"name": "strength"}},
        "unknown": {"spell": {}}
    })");

    auto out = batch.evaluate_documents(documents, warrior_);
    ASSERT_EQ(out.results.size(), 1u);
    EXPECT_TRUE(out.results.at("strong").passed);
    ASSERT_EQ(out.errors.size(), 2u);
    EXPECT_NE(out.errors.at("broken").find("Missing bound"), std::string::npos);
    EXPECT_NE(out.errors.at("unknown").find("Unknown requirement type"), std::string::npos);
}

// ============================================================
// 監査（複数スレッドからの書き込み）
// ============================================================
TEST_P(BatchTest, AuditsEveryEntry) {
    std::string buffer;
    llvm::raw_string_ostream os(buffer);
    audit::JsonLinesAuditSink sink(os);
    check::Checker audited(&sink);

    check::BatchChecker batch(audited, GetParam());
    batch.evaluate_many(requirements_, warrior_);
    os.flush();

    EXPECT_EQ(sink.count(), requirements_.size());
    EXPECT_EQ(static_cast<size_t>(std::count(buffer.begin(), buffer.end(), '\n')),
              requirements_.size());
}

INSTANTIATE_TEST_SUITE_P(Threads, BatchTest, ::testing::Values(1u, 4u));
