#pragma once

// ============================================================
// 要件チェックエンジン
// ============================================================
// 要件木を深さ優先・左から右に評価し、同じ形の結果木を返す。
// all/any は短絡評価しない（全ての子の状態を結果に残す）。
// 状態を持たないため、同じ Checker を複数スレッドから同時に使える。

#include "../facts/provider.hpp"
#include "../requirement/nodes.hpp"
#include "result.hpp"

namespace prereq::audit {
class AuditSink;
}

namespace prereq::check {

class Checker {
   public:
    explicit Checker(audit::AuditSink* audit = nullptr) : audit_(audit) {}

    /// 要件を評価する
    /// 事実の欠如は passed=false、データソース障害は FactProviderError として伝播
    CheckResult evaluate(const req::Requirement& requirement,
                         const facts::FactProvider& facts) const;

    /// 監査先を設定（nullptrで無効化）。所有権は持たない
    void set_audit_sink(audit::AuditSink* audit) { audit_ = audit; }
    audit::AuditSink* audit_sink() const { return audit_; }

   private:
    audit::AuditSink* audit_;

    CheckResult check_node(const req::Requirement& requirement,
                           const facts::FactProvider& facts) const;
    CheckResult check_trait(const req::TraitRequirement& node,
                            const facts::FactProvider& facts) const;
    CheckResult check_possession(const req::PossessionRequirement& node,
                                 const facts::FactProvider& facts) const;
    CheckResult check_tag_count(const req::TagCountRequirement& node,
                                const facts::FactProvider& facts) const;
    CheckResult check_all_of(const req::AllOfRequirement& node,
                             const facts::FactProvider& facts) const;
    CheckResult check_any_of(const req::AnyOfRequirement& node,
                             const facts::FactProvider& facts) const;
};

/// 監査なしで評価する
CheckResult evaluate(const req::Requirement& requirement, const facts::FactProvider& facts);

}  // namespace prereq::check
