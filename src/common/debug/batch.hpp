#pragma once

#include "../debug.hpp"

#include <string>

namespace prereq::debug::batch {

enum class Id { Start, End, Inline, Pool, EntryStart, EntryError };

inline const char* messages[][2] = {
    {"Starting batch check", "バッチチェックを開始"},
    {"Completed batch check", "バッチチェックを完了"},
    {"Evaluating inline", "呼び出しスレッドで評価"},
    {"Evaluating on worker pool", "ワーカープールで評価"},
    {"Evaluating entry", "エントリを評価"},
    {"Entry failed", "エントリが失敗"},
};

inline const char* get(Id id) {
    return messages[static_cast<int>(id)][::prereq::debug::g_lang];
}

inline void log(Id id, ::prereq::debug::Level level = ::prereq::debug::Level::Debug) {
    if (!::prereq::debug::enabled(level))
        return;
    ::prereq::debug::log(::prereq::debug::Stage::Batch, level, get(id));
}

inline void log(Id id, const std::string& detail,
                ::prereq::debug::Level level = ::prereq::debug::Level::Debug) {
    if (!::prereq::debug::enabled(level))
        return;
    ::prereq::debug::log(::prereq::debug::Stage::Batch, level, std::string(get(id)) + ": " + detail);
}

}  // namespace prereq::debug::batch
