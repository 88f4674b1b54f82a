// ============================================================
// 設定システム
// ============================================================
// .prereq.yml から実行設定を読み込む

#pragma once

#include "../common/debug.hpp"
#include "../serde/requirement_json.hpp"

#include <string>

namespace prereq {
namespace config {

// 実行設定
struct Settings {
    bool debug = false;
    debug::Level level = debug::Level::Info;
    int lang = 0;           // 0=English, 1=Japanese
    unsigned threads = 1;   // バッチ評価のワーカー数
    size_t max_depth = 64;  // 要件の最大ネスト深度

    serde::ParseOptions parse_options() const {
        serde::ParseOptions options;
        options.max_depth = max_depth;
        return options;
    }
};

// 設定ローダー
class ConfigLoader {
   public:
    // .prereq.yml を読み込み（存在しなければfalse、読めなければ ConfigError）
    bool load(const std::string& filepath);

    // .prereq.yml を探す（カレントディレクトリから親に向かって）
    bool find_and_load(const std::string& start_path = ".");

    // 設定が読み込まれているか
    bool is_loaded() const { return loaded_; }

    // 設定ファイルのパスを取得
    const std::string& config_path() const { return config_path_; }

    const Settings& settings() const { return settings_; }
    Settings& settings() { return settings_; }

    // ログ設定をグローバルなデバッグ設定に反映
    void apply_debug_settings() const;

   private:
    // 簡易YAMLパーサー（セクション + key: value形式のみ）
    bool parse_yaml(const std::string& content);

    // セクション内のキーを適用
    void apply(const std::string& section, const std::string& key, const std::string& value);

    // 行をトリム
    static std::string trim(const std::string& str);

    Settings settings_;
    std::string config_path_;
    bool loaded_ = false;
};

}  // namespace config
}  // namespace prereq
