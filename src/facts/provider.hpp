#pragma once

#include "../requirement/nodes.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace prereq::facts {

// キャラクター1体分の事実を照会するインターフェース
// 実装は読み取り専用であること。データソース障害は FactProviderError で報告する。
class FactProvider {
   public:
    virtual ~FactProvider() = default;

    /// 特性値。未知の特性なら nullopt
    virtual std::optional<int64_t> get_trait(const std::string& name) const = 0;

    /// コレクション内に条件に一致するオブジェクトが1つ以上あるか
    virtual bool has_match(const std::string& collection,
                           const req::PossessionFilter& filter) const = 0;

    /// コレクション内で指定タグを持つオブジェクトの数
    virtual int64_t count_tagged(const std::string& collection, const std::string& tag) const = 0;

    /// 監査用の識別子
    virtual std::string identity() const { return "anonymous"; }
};

}  // namespace prereq::facts
