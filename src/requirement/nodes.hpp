#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace prereq::req {

// ============================================================
// 前方宣言
// ============================================================
struct TraitRequirement;
struct PossessionRequirement;
struct TagCountRequirement;
struct AllOfRequirement;
struct AnyOfRequirement;

class Builder;

// 所持品の属性値（スカラーのみ）
using AttributeValue = std::variant<bool, int64_t, double, std::string>;
using AttributeMap = std::map<std::string, AttributeValue>;

// 要件の種類（Requirement::Kind の添字順と一致させること）
enum class RequirementType {
    Trait,
    Possession,
    TagCount,
    AllOf,
    AnyOf,
};

/// 直列化キー ("trait", "has", "count_tag", "all", "any")
const char* type_key(RequirementType type);

/// 属性値の比較（整数と浮動小数点は値で比較）
bool attribute_equals(const AttributeValue& lhs, const AttributeValue& rhs);

/// 属性値を文字列化
std::string attribute_to_string(const AttributeValue& value);

// ============================================================
// 要件ノード
// ============================================================
// 不変の木。ノードは共有され、構築後に変更されない。
// 構築は Builder 経由のみ（builder.hpp の関数を使う）。
class Requirement {
   public:
    using Kind = std::variant<std::shared_ptr<const TraitRequirement>,
                              std::shared_ptr<const PossessionRequirement>,
                              std::shared_ptr<const TagCountRequirement>,
                              std::shared_ptr<const AllOfRequirement>,
                              std::shared_ptr<const AnyOfRequirement>>;

    const Kind& kind() const { return kind_; }

    RequirementType type() const { return static_cast<RequirementType>(kind_.index()); }

    /// 木の深さ（葉は1）
    size_t depth() const { return depth_; }

    /// 指定ノード型なら取得、違えばnullptr
    template <typename T>
    const T* get_if() const {
        auto* node = std::get_if<std::shared_ptr<const T>>(&kind_);
        return node ? node->get() : nullptr;
    }

    /// 構造的な等価比較
    bool operator==(const Requirement& other) const;
    bool operator!=(const Requirement& other) const { return !(*this == other); }

   private:
    template <typename T>
    Requirement(std::shared_ptr<const T> node, size_t depth)
        : kind_(std::move(node)), depth_(depth) {}

    Kind kind_;
    size_t depth_;

    friend class Builder;
};

// 特性値の比較
struct TraitRequirement {
    std::string name;
    std::optional<int64_t> minimum;
    std::optional<int64_t> maximum;
    std::optional<int64_t> exact;
};

// 所持品の検索条件
struct PossessionFilter {
    std::optional<int64_t> id;
    std::optional<std::string> name;
    AttributeMap attributes;

    bool empty() const { return !id && !name && attributes.empty(); }

    /// "id=7, name=Magic Sword, level=2" 形式
    std::string describe() const;

    bool operator==(const PossessionFilter& other) const;
};

// コレクション内の一致オブジェクトの存在
struct PossessionRequirement {
    std::string field;
    PossessionFilter filter;
};

// タグ付きオブジェクトの個数
struct TagCountRequirement {
    std::string field;
    std::string tag;
    std::optional<int64_t> minimum;
    std::optional<int64_t> maximum;
};

// 論理積（子の順序は結果木でのみ意味を持つ）
struct AllOfRequirement {
    std::vector<Requirement> children;
};

// 論理和
struct AnyOfRequirement {
    std::vector<Requirement> children;
};

// ============================================================
// コンテンツへの紐付け
// ============================================================

// 外部オブジェクトへの不透明な参照（エンジンは解決しない）
struct ContentRef {
    std::string type;
    int64_t id = 0;

    bool operator==(const ContentRef& other) const {
        return type == other.type && id == other.id;
    }
};

// 説明付きで外部オブジェクトに紐付けられた要件
struct AttachedRequirement {
    std::string description;
    Requirement requirement;
    std::optional<ContentRef> content;
};

}  // namespace prereq::req
