#include "memory_provider.hpp"

#include "../common/debug/serde.hpp"
#include "../common/errors.hpp"
#include "../serde/requirement_json.hpp"

#include <fmt/format.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/JSON.h>

#include <algorithm>

namespace prereq::facts {

using Kind = FactProviderError::Kind;

bool FactObject::matches(const req::PossessionFilter& filter) const {
    if (filter.id && id != filter.id) {
        return false;
    }
    if (filter.name && name != *filter.name) {
        return false;
    }
    for (const auto& [key, expected] : filter.attributes) {
        auto it = attributes.find(key);
        if (it == attributes.end() || !req::attribute_equals(it->second, expected)) {
            return false;
        }
    }
    return true;
}

std::optional<int64_t> MemoryFactProvider::get_trait(const std::string& name) const {
    auto it = traits_.find(name);
    if (it == traits_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MemoryFactProvider::has_match(const std::string& collection,
                                   const req::PossessionFilter& filter) const {
    auto it = collections_.find(collection);
    if (it == collections_.end()) {
        return false;
    }
    return std::any_of(it->second.begin(), it->second.end(),
                       [&](const FactObject& object) { return object.matches(filter); });
}

int64_t MemoryFactProvider::count_tagged(const std::string& collection,
                                         const std::string& tag) const {
    auto it = collections_.find(collection);
    if (it == collections_.end()) {
        return 0;
    }
    return std::count_if(it->second.begin(), it->second.end(),
                         [&](const FactObject& object) { return object.tags.count(tag) > 0; });
}

// ========== キャラクタードキュメント読み込み ==========

namespace {

// ルート > collections > 配列 > オブジェクト > attributes/tags
constexpr size_t kMaxDocumentNesting = 8;

[[noreturn]] void malformed(const std::string& identity, const std::string& message) {
    debug::serde::log(debug::serde::Id::CharacterError, message, debug::Level::Warn);
    throw FactProviderError(Kind::MALFORMED_DOCUMENT, identity, message);
}

FactObject read_object(const llvm::json::Value& value, const std::string& identity,
                       const std::string& where) {
    const auto* object = value.getAsObject();
    if (!object) {
        malformed(identity, fmt::format("{} must be an object", where));
    }

    FactObject fact;
    if (const auto* id = object->get("id")) {
        auto number = id->getAsInteger();
        if (!number) {
            malformed(identity, fmt::format("{}.id must be an integer", where));
        }
        fact.id = *number;
    }
    if (const auto* name = object->get("name")) {
        auto text = name->getAsString();
        if (!text) {
            malformed(identity, fmt::format("{}.name must be a string", where));
        }
        fact.name = text->str();
    }
    if (const auto* tags = object->getArray("tags")) {
        for (const auto& tag : *tags) {
            auto text = tag.getAsString();
            if (!text) {
                malformed(identity, fmt::format("{}.tags must contain strings", where));
            }
            fact.tags.insert(text->str());
        }
    }
    if (const auto* attributes = object->getObject("attributes")) {
        for (const auto& entry : *attributes) {
            std::string key = entry.first.str();
            const auto& attr = entry.second;
            if (auto b = attr.getAsBoolean()) {
                fact.attributes.emplace(key, *b);
            } else if (auto i = attr.getAsInteger()) {
                fact.attributes.emplace(key, *i);
            } else if (auto d = attr.getAsNumber()) {
                fact.attributes.emplace(key, *d);
            } else if (auto s = attr.getAsString()) {
                fact.attributes.emplace(key, s->str());
            } else {
                malformed(identity,
                          fmt::format("{}.attributes.{} must be a scalar", where, key));
            }
        }
    }
    return fact;
}

}  // namespace

MemoryFactProvider MemoryFactProvider::from_json(llvm::StringRef text) {
    debug::serde::log(debug::serde::Id::CharacterLoad);

    if (serde::exceeds_nesting(text, kMaxDocumentNesting)) {
        malformed("document",
                  fmt::format("character document nests deeper than {}", kMaxDocumentNesting));
    }

    auto parsed = llvm::json::parse(text);
    if (!parsed) {
        malformed("document", llvm::toString(parsed.takeError()));
    }
    const auto* root = parsed->getAsObject();
    if (!root) {
        malformed("document", "character document must be an object");
    }

    std::string identity = "character";
    if (auto id = root->getString("id")) {
        identity = id->str();
    } else if (auto number = root->getInteger("id")) {
        identity = std::to_string(*number);
    }

    MemoryFactProvider provider(identity);

    if (const auto* traits = root->getObject("traits")) {
        for (const auto& entry : *traits) {
            auto value = entry.second.getAsInteger();
            if (!value) {
                malformed(identity,
                          fmt::format("trait '{}' must be an integer", entry.first.str()));
            }
            provider.set_trait(entry.first.str(), *value);
        }
    } else if (root->get("traits")) {
        malformed(identity, "traits must be an object");
    }

    if (const auto* collections = root->getObject("collections")) {
        for (const auto& entry : *collections) {
            std::string collection = entry.first.str();
            const auto* items = entry.second.getAsArray();
            if (!items) {
                malformed(identity, fmt::format("collection '{}' must be an array", collection));
            }
            // 空のコレクションも登録しておく
            provider.collections_[collection];
            for (size_t i = 0; i < items->size(); ++i) {
                provider.add_object(collection,
                                    read_object((*items)[i], identity,
                                                fmt::format("{}[{}]", collection, i)));
            }
        }
    } else if (root->get("collections")) {
        malformed(identity, "collections must be an object");
    }

    debug::serde::log(debug::serde::Id::CharacterLoad, identity, debug::Level::Trace);
    return provider;
}

}  // namespace prereq::facts
