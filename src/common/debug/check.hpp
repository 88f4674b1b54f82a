#pragma once

#include "../debug.hpp"

#include <string>

namespace prereq::debug::check {

/// 評価メッセージID
enum class Id {
    Start,
    End,
    // ノード評価
    TraitNode,
    PossessionNode,
    TagCountNode,
    AllOfNode,
    AnyOfNode,
    // ファクト照会
    TraitMissing,
    ProviderError,
    // 監査
    AuditEmit,
};

/// メッセージテーブル [en, ja]
inline const char* messages[][2] = {
    {"Starting requirement check", "要件チェックを開始"},
    {"Completed requirement check", "要件チェックを完了"},

    {"Checking trait", "特性を検査"},
    {"Checking possession", "所持品を検査"},
    {"Checking tag count", "タグ数を検査"},
    {"Checking all-of group", "全条件グループを検査"},
    {"Checking any-of group", "いずれか条件グループを検査"},

    {"Trait not found", "特性が見つかりません"},
    {"Fact provider failed", "ファクトプロバイダが失敗"},

    {"Emitting audit record", "監査レコードを出力"},
};

inline const char* get(Id id) {
    return messages[static_cast<int>(id)][::prereq::debug::g_lang];
}

inline void log(Id id, ::prereq::debug::Level level = ::prereq::debug::Level::Debug) {
    if (!::prereq::debug::enabled(level))
        return;
    ::prereq::debug::log(::prereq::debug::Stage::Check, level, get(id));
}

inline void log(Id id, const std::string& detail,
                ::prereq::debug::Level level = ::prereq::debug::Level::Debug) {
    if (!::prereq::debug::enabled(level))
        return;
    ::prereq::debug::log(::prereq::debug::Stage::Check, level, std::string(get(id)) + ": " + detail);
}

/// ノード結果の詳細（Traceレベル）
inline void dump_result(const std::string& node, bool passed, const std::string& message) {
    if (!::prereq::debug::enabled(::prereq::debug::Level::Trace))
        return;
    ::prereq::debug::log(::prereq::debug::Stage::Check, ::prereq::debug::Level::Trace,
                         node + (passed ? " [pass] " : " [fail] ") + message);
}

}  // namespace prereq::debug::check
