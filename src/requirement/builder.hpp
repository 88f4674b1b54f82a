#pragma once

// ============================================================
// 要件ビルダー - 検証済みの要件ノードを構築
// ============================================================
// 例:
//   auto combat = any_of({trait("strength", 4), trait("dexterity", 4)});
//   auto adept = all_of({trait("arete", 3),
//                        has_item("foci", std::nullopt, "Crystal Orb"),
//                        tag_count("spheres", "elemental", 2)});
//
// 不正な引数には InvalidRequirement を送出する。

#include "../common/errors.hpp"
#include "nodes.hpp"

#include <optional>
#include <string>
#include <vector>

namespace prereq::req {

/// 特性要件。minimum/maximum/exact の少なくとも1つが必要
Requirement trait(const std::string& name, std::optional<int64_t> minimum,
                  std::optional<int64_t> maximum = std::nullopt,
                  std::optional<int64_t> exact = std::nullopt);

/// 所持品要件（検索条件を直接指定）
Requirement possession(const std::string& field, PossessionFilter filter);

/// 所持品要件。id/name/attributes の少なくとも1つが必要
Requirement has_item(const std::string& field, std::optional<int64_t> id,
                     std::optional<std::string> name = std::nullopt,
                     AttributeMap attributes = {});

/// タグ数要件。minimum/maximum の少なくとも1つが必要
Requirement tag_count(const std::string& field, const std::string& tag,
                      std::optional<int64_t> minimum,
                      std::optional<int64_t> maximum = std::nullopt);

/// 構築できる木の最大深さ（葉を1とする）。超えると InvalidRequirement(TOO_DEEP)
inline constexpr size_t kMaxNesting = 1024;

/// 論理積。空なら常に満たされる
Requirement all_of(std::vector<Requirement> children);

/// 論理和。空なら常に満たされない
Requirement any_of(std::vector<Requirement> children);

/// 説明付きで外部コンテンツに紐付ける
AttachedRequirement attach(const std::string& description, Requirement requirement,
                           std::optional<ContentRef> content = std::nullopt);

/// 所持品の属性キーとして使えない予約語か
bool is_reserved_attribute(const std::string& key);

}  // namespace prereq::req
