#include "audit/sink.hpp"
#include "check/batch.hpp"
#include "check/engine.hpp"
#include "common/debug.hpp"
#include "common/errors.hpp"
#include "config/config.hpp"
#include "facts/memory_provider.hpp"
#include "serde/requirement_json.hpp"

#include <llvm/Support/FileSystem.h>
#include <llvm/Support/raw_ostream.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#ifndef PREREQ_VERSION
#define PREREQ_VERSION "0.1.0"
#endif

namespace prereq {

// 終了コード
constexpr int kExitPassed = 0;
constexpr int kExitError = 1;
constexpr int kExitNotPassed = 2;

// コマンドラインオプション
enum class Command { None, Validate, Check, Batch, Help };

struct Options {
    Command command = Command::None;
    std::vector<std::string> inputs;
    bool json = false;
    std::string audit_file;
    std::string config_file;
    std::optional<unsigned> threads;
    bool debug = false;
    std::optional<std::string> debug_level;
    bool lang_ja = false;
};

// ヘルプメッセージを表示
void print_help(const char* program_name) {
    std::cout << "prereq 要件チェッカー v" << PREREQ_VERSION << "\n\n";
    std::cout << "使用方法:\n";
    std::cout << "  " << program_name << " <コマンド> [オプション] <ファイル>...\n\n";
    std::cout << "コマンド:\n";
    std::cout << "  validate <requirement.json>               要件ドキュメントを検証\n";
    std::cout << "  check <requirement.json> <character.json> 要件をキャラクターに対して評価\n";
    std::cout << "  batch <requirements.json> <character.json>...\n";
    std::cout << "                                            複数の要件・キャラクターを評価\n";
    std::cout << "  help                                      このヘルプを表示\n\n";
    std::cout << "オプション:\n";
    std::cout << "  --json                結果をJSONで出力\n";
    std::cout << "  --audit=<file>        監査レコードをJSON Linesで追記\n";
    std::cout << "  --threads=<n>         バッチ評価のワーカー数\n";
    std::cout << "  --config=<file>       設定ファイルを指定（既定: .prereq.yml を探索）\n";
    std::cout << "  --debug, -d           デバッグ出力を有効化\n";
    std::cout << "  -d=<level>            デバッグレベル（trace/debug/info/warn/error）\n";
    std::cout << "  --lang=ja             日本語デバッグメッセージ\n";
    std::cout << "  --version             バージョン情報を表示\n\n";
    std::cout << "終了コード:\n";
    std::cout << "  0 すべて成立 / 1 エラー / 2 不成立あり\n\n";
    std::cout << "例:\n";
    std::cout << "  " << program_name << " check reqs/adept.json chars/mage.json\n";
    std::cout << "  " << program_name << " batch --threads=4 reqs/spells.json chars/*.json\n";
}

// コマンドラインオプションをパース
Options parse_options(int argc, char* argv[]) {
    Options opts;

    if (argc < 2) {
        return opts;  // コマンドなし
    }

    std::string cmd = argv[1];
    if (cmd == "validate") {
        opts.command = Command::Validate;
    } else if (cmd == "check") {
        opts.command = Command::Check;
    } else if (cmd == "batch") {
        opts.command = Command::Batch;
    } else if (cmd == "help" || cmd == "--help" || cmd == "-h") {
        opts.command = Command::Help;
        return opts;
    } else if (cmd == "--version") {
        std::cout << "prereq v" << PREREQ_VERSION << "\n";
        std::exit(kExitPassed);
    } else {
        std::cerr << "不明なコマンド: " << cmd << "\n";
        std::cerr << "'prereq help' でヘルプを表示\n";
        std::exit(kExitError);
    }

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--json") {
            opts.json = true;
        } else if (arg.substr(0, 8) == "--audit=") {
            opts.audit_file = arg.substr(8);
        } else if (arg.substr(0, 9) == "--config=") {
            opts.config_file = arg.substr(9);
        } else if (arg.substr(0, 10) == "--threads=") {
            try {
                int n = std::stoi(arg.substr(10));
                if (n < 1) {
                    throw std::out_of_range("threads");
                }
                opts.threads = static_cast<unsigned>(n);
            } catch (const std::logic_error&) {
                std::cerr << "--threads には1以上の整数を指定してください\n";
                std::exit(kExitError);
            }
        } else if (arg == "--debug" || arg == "-d") {
            opts.debug = true;
        } else if (arg.substr(0, 3) == "-d=") {
            opts.debug = true;
            opts.debug_level = arg.substr(3);
        } else if (arg == "--lang=ja") {
            opts.lang_ja = true;
        } else if (!arg.empty() && arg[0] != '-') {
            opts.inputs.push_back(arg);
        } else {
            std::cerr << "不明なオプション: " << arg << "\n";
            std::cerr << "'prereq help' でヘルプを表示\n";
            std::exit(kExitError);
        }
    }

    return opts;
}

// ファイルを読み込む
std::string read_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "エラー: ファイルを開けません: " << filename << "\n";
        std::exit(kExitError);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

// 設定ファイルとコマンドラインから実行設定を決定
config::Settings resolve_settings(const Options& opts) {
    config::ConfigLoader loader;
    if (!opts.config_file.empty()) {
        if (!loader.load(opts.config_file)) {
            std::cerr << "エラー: 設定ファイルが見つかりません: " << opts.config_file << "\n";
            std::exit(kExitError);
        }
    } else {
        loader.find_and_load(".");
    }

    // コマンドラインが設定ファイルより優先
    auto& settings = loader.settings();
    if (opts.debug)
        settings.debug = true;
    if (opts.debug_level)
        settings.level = debug::parse_level(*opts.debug_level);
    if (opts.lang_ja)
        settings.lang = 1;
    if (opts.threads)
        settings.threads = *opts.threads;

    loader.apply_debug_settings();
    if (loader.is_loaded()) {
        debug::log(debug::Stage::Cli, debug::Level::Info, "config: " + loader.config_path());
    }
    return settings;
}

void print_result(const std::string& label, const check::CheckResult& result) {
    if (!label.empty()) {
        std::cout << "== " << label << "\n";
    }
    std::cout << result.to_text();
    auto reasons = result.failure_reasons();
    if (!reasons.empty()) {
        std::cout << "理由:\n";
        for (const auto& reason : reasons) {
            std::cout << "  - " << reason << "\n";
        }
    }
}

int run_validate(const Options& opts, const config::Settings& settings) {
    if (opts.inputs.size() != 1) {
        std::cerr << "エラー: validate には要件ファイルを1つ指定してください\n";
        return kExitError;
    }

    auto requirement =
        serde::parse_requirement(read_file(opts.inputs[0]), settings.parse_options());
    std::cout << serde::to_string(requirement, !opts.json) << "\n";
    return kExitPassed;
}

int run_check(const Options& opts, const config::Settings& settings, check::Checker& checker) {
    if (opts.inputs.size() != 2) {
        std::cerr << "エラー: check には要件ファイルとキャラクターファイルを指定してください\n";
        return kExitError;
    }

    auto requirement =
        serde::parse_requirement(read_file(opts.inputs[0]), settings.parse_options());
    auto facts = facts::MemoryFactProvider::from_json(read_file(opts.inputs[1]));

    auto result = checker.evaluate(requirement, facts);
    if (opts.json) {
        std::cout << serde::render(result.to_json(), true) << "\n";
    } else {
        print_result("", result);
    }
    return result.passed ? kExitPassed : kExitNotPassed;
}

int run_batch(const Options& opts, const config::Settings& settings, check::Checker& checker) {
    if (opts.inputs.size() < 2) {
        std::cerr << "エラー: batch には要件ファイルと1つ以上のキャラクターファイルを指定してください\n";
        return kExitError;
    }

    auto documents =
        serde::parse_document_map(read_file(opts.inputs[0]), settings.parse_options());

    std::vector<facts::MemoryFactProvider> characters;
    characters.reserve(opts.inputs.size() - 1);
    for (size_t i = 1; i < opts.inputs.size(); ++i) {
        characters.push_back(facts::MemoryFactProvider::from_json(read_file(opts.inputs[i])));
    }

    check::BatchChecker batch(checker, settings.threads);
    bool all_passed = true;
    bool any_error = false;
    llvm::json::Object json_out;

    if (characters.size() == 1) {
        // 1キャラクター × 複数要件
        auto out = batch.evaluate_documents(documents, characters[0], settings.parse_options());
        llvm::json::Object results;
        for (const auto& [key, result] : out.results) {
            all_passed = all_passed && result.passed;
            if (opts.json) {
                results[key] = result.to_json();
            } else {
                print_result(key, result);
            }
        }
        llvm::json::Object errors;
        for (const auto& [key, message] : out.errors) {
            any_error = true;
            if (opts.json) {
                errors[key] = message;
            } else {
                std::cout << "== " << key << "\nエラー: " << message << "\n";
            }
        }
        json_out["results"] = std::move(results);
        json_out["errors"] = std::move(errors);
    } else {
        // 各要件 × 複数キャラクター
        std::vector<const facts::FactProvider*> providers;
        for (const auto& character : characters) {
            providers.push_back(&character);
        }

        llvm::json::Object results;
        llvm::json::Object errors;
        for (const auto& [key, document] : documents) {
            std::optional<req::Requirement> requirement;
            try {
                requirement = serde::from_json(document, settings.parse_options());
            } catch (const InvalidRequirement& e) {
                any_error = true;
                if (opts.json) {
                    errors[key] = e.what();
                } else {
                    std::cout << "== " << key << "\nエラー: " << e.what() << "\n";
                }
                continue;
            }

            auto out = batch.evaluate_across(*requirement, providers);
            llvm::json::Object per_character;
            llvm::json::Object per_character_errors;
            for (size_t i = 0; i < out.results.size(); ++i) {
                const std::string who = characters[i].identity();
                if (out.results[i]) {
                    all_passed = all_passed && out.results[i]->passed;
                    if (opts.json) {
                        per_character[who] = out.results[i]->to_json();
                    } else {
                        print_result(key + " / " + who, *out.results[i]);
                    }
                } else {
                    any_error = true;
                    const auto& message = out.errors.at(i);
                    if (opts.json) {
                        per_character_errors[who] = message;
                    } else {
                        std::cout << "== " << key << " / " << who << "\nエラー: " << message
                                  << "\n";
                    }
                }
            }
            results[key] = std::move(per_character);
            if (!per_character_errors.empty()) {
                errors[key] = std::move(per_character_errors);
            }
        }
        json_out["results"] = std::move(results);
        json_out["errors"] = std::move(errors);
    }

    if (opts.json) {
        std::cout << serde::render(llvm::json::Value(std::move(json_out)), true) << "\n";
    }

    if (any_error)
        return kExitError;
    return all_passed ? kExitPassed : kExitNotPassed;
}

}  // namespace prereq

int main(int argc, char* argv[]) {
    using namespace prereq;

    Options opts = parse_options(argc, argv);

    if (opts.command == Command::Help) {
        print_help(argv[0]);
        return kExitPassed;
    }

    if (opts.command == Command::None) {
        std::cerr << "エラー: コマンドが指定されていません\n";
        std::cerr << "'prereq help' でヘルプを表示\n";
        return kExitError;
    }

    try {
        config::Settings settings = resolve_settings(opts);

        // 監査出力（任意）
        std::unique_ptr<llvm::raw_fd_ostream> audit_stream;
        std::unique_ptr<audit::JsonLinesAuditSink> audit_sink;
        if (!opts.audit_file.empty()) {
            std::error_code ec;
            audit_stream = std::make_unique<llvm::raw_fd_ostream>(opts.audit_file, ec,
                                                                  llvm::sys::fs::OF_Append);
            if (ec) {
                std::cerr << "エラー: 監査ファイルを開けません: " << opts.audit_file << ": "
                          << ec.message() << "\n";
                return kExitError;
            }
            audit_sink = std::make_unique<audit::JsonLinesAuditSink>(*audit_stream);
        }

        check::Checker checker(audit_sink.get());

        switch (opts.command) {
            case Command::Validate:
                return run_validate(opts, settings);
            case Command::Check:
                return run_check(opts, settings, checker);
            case Command::Batch:
                return run_batch(opts, settings, checker);
            default:
                break;
        }
    } catch (const InvalidRequirement& e) {
        std::cerr << "要件エラー: " << e.what() << "\n";
        return kExitError;
    } catch (const FactProviderError& e) {
        std::cerr << "キャラクターエラー: " << e.what() << "\n";
        return kExitError;
    } catch (const ConfigError& e) {
        std::cerr << "設定エラー: " << e.what() << "\n";
        return kExitError;
    }

    return kExitError;
}
