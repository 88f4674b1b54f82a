#pragma once

#include <stdexcept>
#include <string>

namespace prereq {

// 要件の構造エラー（構築時・デシリアライズ時に送出）
class InvalidRequirement : public std::runtime_error {
   public:
    enum class Kind {
        MISSING_BOUND,
        INVALID_BOUND,
        EMPTY_FIELD,
        MISSING_FIELD,
        WRONG_TYPE,
        UNKNOWN_VARIANT,
        UNKNOWN_KEY,
        NOT_A_SEQUENCE,
        MALFORMED_JSON,
        TOO_DEEP,
    };

    InvalidRequirement(Kind kind, const std::string& message, const std::string& path = "")
        : std::runtime_error(format_error(kind, message, path)),
          kind_(kind),
          path_(path),
          detail_(message) {}

    Kind kind() const { return kind_; }

    // 問題のあるノードのパス（例: "all[1].trait"）。ルートなら空
    const std::string& path() const { return path_; }

    // パスを含まない説明文
    const std::string& detail() const { return detail_; }

   private:
    Kind kind_;
    std::string path_;
    std::string detail_;

    static std::string format_error(Kind kind, const std::string& message,
                                    const std::string& path);
};

// ファクトプロバイダのデータソース障害（評価時に呼び出し元へ伝播）
class FactProviderError : public std::runtime_error {
   public:
    enum class Kind {
        UNAVAILABLE,
        QUERY_FAILED,
        MALFORMED_DOCUMENT,
    };

    FactProviderError(Kind kind, const std::string& provider, const std::string& message)
        : std::runtime_error(format_error(kind, provider, message)),
          kind_(kind),
          provider_(provider) {}

    Kind kind() const { return kind_; }
    const std::string& provider() const { return provider_; }

   private:
    Kind kind_;
    std::string provider_;

    static std::string format_error(Kind kind, const std::string& provider,
                                    const std::string& message);
};

// 設定ファイルの読み込みエラー
class ConfigError : public std::runtime_error {
   public:
    ConfigError(const std::string& path, const std::string& message)
        : std::runtime_error("[CONFIG] " + path + ": " + message), path_(path) {}

    const std::string& path() const { return path_; }

   private:
    std::string path_;
};

// エラー種別の文字列表現
const char* kind_name(InvalidRequirement::Kind kind);
const char* kind_name(FactProviderError::Kind kind);

}  // namespace prereq
