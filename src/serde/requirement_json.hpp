#pragma once

// ============================================================
// 要件のJSON直列化
// ============================================================
// {"trait": {"name": "strength", "min": 3}}
// {"has": {"field": "weapons", "name": "Magic Sword"}}
// {"all": [ ... ]}
// {"any": [ ... ]}
// {"count_tag": {"model": "spheres", "tag": "elemental", "minimum": 2}}

#include "../common/errors.hpp"
#include "../requirement/nodes.hpp"

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/JSON.h>

#include <map>
#include <string>

namespace prereq::serde {

// デシリアライズ設定
struct ParseOptions {
    size_t max_depth = 64;  // 要件ノードの最大ネスト深度
};

/// 括弧 ([ と {) のネストが limit を超えるか。文字列リテラル内は数えない
/// llvm::json::parse は再帰の深さを制限しないため、解析前に確認する
bool exceeds_nesting(llvm::StringRef text, size_t limit);

/// JSONテキストから要件を構築（不正なら InvalidRequirement）
req::Requirement parse_requirement(llvm::StringRef text, const ParseOptions& options = {});

/// JSON値から要件を構築
req::Requirement from_json(const llvm::json::Value& value, const ParseOptions& options = {});

/// 要件をJSON値に変換
llvm::json::Value to_json(const req::Requirement& requirement);

/// 要件をJSONテキストに変換
std::string to_string(const req::Requirement& requirement, bool pretty = false);

/// JSON値をテキストに変換
std::string render(const llvm::json::Value& value, bool pretty = false);

/// {"key": <requirement>, ...} 形式のドキュメントをキーごとに分割
std::map<std::string, llvm::json::Value> parse_document_map(llvm::StringRef text,
                                                            const ParseOptions& options = {});

}  // namespace prereq::serde
