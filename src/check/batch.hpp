#pragma once

// ============================================================
// バッチチェック
// ============================================================
// 1キャラクター×複数要件、または1要件×複数キャラクターを評価する。
// 各エントリは独立して評価され、1つのエントリのエラーは他に影響しない。
// 出力の順序・キーは実行順に関係なく入力と一致する。

#include "../serde/requirement_json.hpp"
#include "engine.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace prereq::check {

// キー付きバッチの結果
struct KeyedBatchResult {
    std::map<std::string, CheckResult> results;
    std::map<std::string, std::string> errors;  // キー -> エラーメッセージ

    bool ok() const { return errors.empty(); }
};

// 複数キャラクターに対する結果（入力と同じ順序）
struct IndexedBatchResult {
    std::vector<std::optional<CheckResult>> results;  // エラーのエントリは nullopt
    std::map<size_t, std::string> errors;             // 添字 -> エラーメッセージ

    bool ok() const { return errors.empty(); }
};

class BatchChecker {
   public:
    /// threads が 1 以下なら呼び出しスレッドで順に評価する
    explicit BatchChecker(const Checker& checker, unsigned threads = 1)
        : checker_(checker), threads_(threads) {}

    /// 1キャラクターに対して複数の要件を評価
    KeyedBatchResult evaluate_many(const std::map<std::string, req::Requirement>& requirements,
                                   const facts::FactProvider& facts) const;

    /// 1つの要件を複数キャラクターに対して評価
    IndexedBatchResult evaluate_across(const req::Requirement& requirement,
                                       const std::vector<const facts::FactProvider*>& providers) const;

    /// 要件ドキュメントをデシリアライズしつつ評価（構造エラーもエントリ単位で収集）
    KeyedBatchResult evaluate_documents(const std::map<std::string, llvm::json::Value>& documents,
                                        const facts::FactProvider& facts,
                                        const serde::ParseOptions& options = {}) const;

    unsigned threads() const { return threads_; }

   private:
    const Checker& checker_;
    unsigned threads_;

    // count 個のタスクを実行する。task は例外を投げないこと
    void run(size_t count, const std::function<void(size_t)>& task) const;
};

}  // namespace prereq::check
