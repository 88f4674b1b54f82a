#pragma once

#include "../debug.hpp"

#include <string>

namespace prereq::debug::serde {

/// 直列化メッセージID
enum class Id {
    ParseStart,
    ParseEnd,
    ParseNode,
    ParseError,
    SerializeStart,
    SerializeEnd,
    CharacterLoad,
    CharacterError,
};

/// メッセージテーブル [en, ja]
inline const char* messages[][2] = {
    {"Parsing requirement document", "要件ドキュメントを解析"},
    {"Parsed requirement document", "要件ドキュメントの解析を完了"},
    {"Parsing node", "ノードを解析中"},
    {"Requirement document rejected", "要件ドキュメントを拒否"},
    {"Serializing requirement", "要件を直列化"},
    {"Serialized requirement", "要件の直列化を完了"},
    {"Loading character document", "キャラクタードキュメントを読み込み"},
    {"Character document rejected", "キャラクタードキュメントを拒否"},
};

inline const char* get(Id id) {
    return messages[static_cast<int>(id)][::prereq::debug::g_lang];
}

inline void log(Id id, ::prereq::debug::Level level = ::prereq::debug::Level::Debug) {
    if (!::prereq::debug::enabled(level))
        return;
    ::prereq::debug::log(::prereq::debug::Stage::Serde, level, get(id));
}

inline void log(Id id, const std::string& detail,
                ::prereq::debug::Level level = ::prereq::debug::Level::Debug) {
    if (!::prereq::debug::enabled(level))
        return;
    ::prereq::debug::log(::prereq::debug::Stage::Serde, level, std::string(get(id)) + ": " + detail);
}

}  // namespace prereq::debug::serde
