// ============================================================
// 設定システム - 実装
// ============================================================

#include "config.hpp"

#include "../common/errors.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace prereq {
namespace config {

namespace {

bool parse_bool(const std::string& value, bool fallback) {
    if (value == "true" || value == "yes" || value == "on")
        return true;
    if (value == "false" || value == "no" || value == "off")
        return false;
    return fallback;
}

template <typename T>
T parse_positive(const std::string& value, T fallback) {
    try {
        size_t used = 0;
        long long parsed = std::stoll(value, &used);
        if (used == value.size() && parsed > 0) {
            return static_cast<T>(parsed);
        }
    } catch (const std::logic_error&) {
        // 数値でなければ既定値
    }
    return fallback;
}

}  // namespace

bool ConfigLoader::load(const std::string& filepath) {
    if (!fs::exists(filepath)) {
        return false;
    }

    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw ConfigError(filepath, "cannot open configuration file");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    if (parse_yaml(buffer.str())) {
        config_path_ = filepath;
        loaded_ = true;
        debug::log(debug::Stage::Config, debug::Level::Debug, "loaded " + filepath);
        return true;
    }
    return false;
}

bool ConfigLoader::find_and_load(const std::string& start_path) {
    fs::path current = fs::absolute(start_path);

    // 最大10レベルまで親ディレクトリを探索
    for (int i = 0; i < 10; ++i) {
        fs::path config_file = current / ".prereq.yml";
        if (fs::exists(config_file)) {
            return load(config_file.string());
        }

        fs::path parent = current.parent_path();
        if (parent == current) {
            break;  // ルートに到達
        }
        current = parent;
    }

    return false;
}

void ConfigLoader::apply_debug_settings() const {
    debug::set_debug_mode(settings_.debug);
    debug::set_level(settings_.level);
    debug::set_lang(settings_.lang);
}

bool ConfigLoader::parse_yaml(const std::string& content) {
    // 簡易YAMLパーサー
    // サポート形式:
    // log:
    //   debug: true
    //   level: trace
    // batch:
    //   threads: 4

    std::istringstream stream(content);
    std::string line;
    std::string section;

    while (std::getline(stream, line)) {
        // コメント行をスキップ
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }

        // インデントレベルを計算
        size_t indent = 0;
        for (char c : line) {
            if (c == ' ')
                indent++;
            else if (c == '\t')
                indent += 2;  // タブは2スペースとして扱う
            else
                break;
        }

        size_t colon_pos = trimmed.find(':');
        if (colon_pos == std::string::npos) {
            continue;
        }
        std::string key = trim(trimmed.substr(0, colon_pos));
        std::string value = trim(trimmed.substr(colon_pos + 1));

        // 行末コメントを除去
        size_t hash_pos = value.find(" #");
        if (hash_pos != std::string::npos) {
            value = trim(value.substr(0, hash_pos));
        }

        if (indent == 0) {
            section = value.empty() ? key : "";
        } else if (!section.empty() && !value.empty()) {
            apply(section, key, value);
        }
    }

    return true;  // 空の設定も有効
}

void ConfigLoader::apply(const std::string& section, const std::string& key,
                         const std::string& value) {
    if (section == "log") {
        if (key == "debug") {
            settings_.debug = parse_bool(value, settings_.debug);
        } else if (key == "level") {
            settings_.level = debug::parse_level(value);
        } else if (key == "lang") {
            settings_.lang = (value == "ja") ? 1 : 0;
        }
    } else if (section == "batch") {
        if (key == "threads") {
            settings_.threads = parse_positive<unsigned>(value, settings_.threads);
        }
    } else if (section == "serializer") {
        if (key == "max_depth") {
            settings_.max_depth = parse_positive<size_t>(value, settings_.max_depth);
        }
    }
}

std::string ConfigLoader::trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos)
        return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

}  // namespace config
}  // namespace prereq
