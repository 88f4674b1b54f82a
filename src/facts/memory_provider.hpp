#pragma once

#include "provider.hpp"

#include <llvm/ADT/StringRef.h>

#include <set>
#include <unordered_map>
#include <vector>

namespace prereq::facts {

// コレクション内のオブジェクト
struct FactObject {
    std::optional<int64_t> id;
    std::string name;
    std::set<std::string> tags;
    req::AttributeMap attributes;

    /// 検索条件にすべて一致するか
    bool matches(const req::PossessionFilter& filter) const;
};

// メモリ上の事実を返すプロバイダ
class MemoryFactProvider : public FactProvider {
   public:
    explicit MemoryFactProvider(std::string identity = "memory") : identity_(std::move(identity)) {}

    /// キャラクタードキュメント(JSON)から構築
    /// {"id": "...", "traits": {...}, "collections": {"weapons": [{...}]}}
    static MemoryFactProvider from_json(llvm::StringRef text);

    void set_trait(const std::string& name, int64_t value) { traits_[name] = value; }

    void add_object(const std::string& collection, FactObject object) {
        collections_[collection].push_back(std::move(object));
    }

    std::optional<int64_t> get_trait(const std::string& name) const override;
    bool has_match(const std::string& collection,
                   const req::PossessionFilter& filter) const override;
    int64_t count_tagged(const std::string& collection, const std::string& tag) const override;
    std::string identity() const override { return identity_; }

   private:
    std::string identity_;
    std::unordered_map<std::string, int64_t> traits_;
    std::unordered_map<std::string, std::vector<FactObject>> collections_;
};

}  // namespace prereq::facts
