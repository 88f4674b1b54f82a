#pragma once

#include "../requirement/nodes.hpp"

#include <llvm/Support/JSON.h>

#include <optional>
#include <string>
#include <vector>

namespace prereq::check {

// 評価結果。要件木と同じ形の木になる（葉は子を持たない）
struct CheckResult {
    bool passed = false;
    std::string message;
    req::RequirementType type = req::RequirementType::Trait;
    std::optional<int64_t> observed;  // 観測した特性値・タグ数
    std::vector<CheckResult> children;

    explicit operator bool() const { return passed; }

    /// 不成立の葉のメッセージを深さ優先で収集
    /// 成立したノードの配下は辿らない（成立した any の失敗枝は理由にならない）
    std::vector<std::string> failure_reasons() const;

    /// {"passed", "message", "type", "observed"?, "children"?}
    llvm::json::Value to_json() const;

    /// インデント付きのテキスト表示
    std::string to_text() const;

    bool operator==(const CheckResult& other) const;
    bool operator!=(const CheckResult& other) const { return !(*this == other); }
};

}  // namespace prereq::check
