#include "batch.hpp"

#include "../common/debug/batch.hpp"
#include "../common/errors.hpp"

#include <fmt/format.h>
#include <llvm/Support/ThreadPool.h>
#include <llvm/Support/Threading.h>

#include <algorithm>

namespace prereq::check {

namespace {

// エントリ1件分の評価結果
struct Slot {
    std::optional<CheckResult> result;
    std::optional<std::string> error;
};

// 評価を実行し、エラーをスロットに記録する
template <typename Fn>
void fill_slot(Slot& slot, const std::string& label, Fn&& fn) {
    debug::batch::log(debug::batch::Id::EntryStart, label, debug::Level::Trace);
    try {
        slot.result = fn();
    } catch (const InvalidRequirement& e) {
        slot.error = e.what();
    } catch (const FactProviderError& e) {
        slot.error = e.what();
    } catch (const std::exception& e) {
        slot.error = fmt::format("unexpected error: {}", e.what());
    }
    if (slot.error) {
        debug::batch::log(debug::batch::Id::EntryError, label + ": " + *slot.error,
                          debug::Level::Warn);
    }
}

template <typename Map>
std::vector<typename Map::const_iterator> entries_of(const Map& map) {
    std::vector<typename Map::const_iterator> entries;
    entries.reserve(map.size());
    for (auto it = map.begin(); it != map.end(); ++it) {
        entries.push_back(it);
    }
    return entries;
}

KeyedBatchResult collect(const std::vector<std::string>& keys, std::vector<Slot>& slots) {
    KeyedBatchResult out;
    for (size_t i = 0; i < keys.size(); ++i) {
        if (slots[i].result) {
            out.results.emplace(keys[i], std::move(*slots[i].result));
        } else if (slots[i].error) {
            out.errors.emplace(keys[i], std::move(*slots[i].error));
        }
    }
    return out;
}

}  // namespace

void BatchChecker::run(size_t count, const std::function<void(size_t)>& task) const {
    if (threads_ <= 1 || count <= 1) {
        debug::batch::log(debug::batch::Id::Inline, std::to_string(count));
        for (size_t i = 0; i < count; ++i) {
            task(i);
        }
        return;
    }

    unsigned workers = std::min<unsigned>(threads_, static_cast<unsigned>(count));
    debug::batch::log(debug::batch::Id::Pool, fmt::format("{} tasks on {} workers", count, workers));

    llvm::ThreadPool pool(llvm::hardware_concurrency(workers));
    for (size_t i = 0; i < count; ++i) {
        pool.async([&task, i] { task(i); });
    }
    pool.wait();
}

KeyedBatchResult BatchChecker::evaluate_many(
    const std::map<std::string, req::Requirement>& requirements,
    const facts::FactProvider& facts) const {
    debug::batch::log(debug::batch::Id::Start, std::to_string(requirements.size()));

    auto entries = entries_of(requirements);
    std::vector<std::string> keys;
    keys.reserve(entries.size());
    for (const auto& it : entries) {
        keys.push_back(it->first);
    }

    // 各タスクは自分のスロットにのみ書き込む
    std::vector<Slot> slots(entries.size());
    run(entries.size(), [&](size_t i) {
        fill_slot(slots[i], keys[i], [&] { return checker_.evaluate(entries[i]->second, facts); });
    });

    auto out = collect(keys, slots);
    debug::batch::log(debug::batch::Id::End,
                      fmt::format("{} results, {} errors", out.results.size(), out.errors.size()));
    return out;
}

IndexedBatchResult BatchChecker::evaluate_across(
    const req::Requirement& requirement,
    const std::vector<const facts::FactProvider*>& providers) const {
    debug::batch::log(debug::batch::Id::Start, std::to_string(providers.size()));

    std::vector<Slot> slots(providers.size());
    run(providers.size(), [&](size_t i) {
        fill_slot(slots[i], fmt::format("#{}", i), [&]() -> CheckResult {
            if (!providers[i]) {
                throw FactProviderError(FactProviderError::Kind::UNAVAILABLE,
                                        fmt::format("#{}", i), "no fact provider given");
            }
            return checker_.evaluate(requirement, *providers[i]);
        });
    });

    IndexedBatchResult out;
    out.results.resize(slots.size());
    for (size_t i = 0; i < slots.size(); ++i) {
        if (slots[i].result) {
            out.results[i] = std::move(slots[i].result);
        } else if (slots[i].error) {
            out.errors.emplace(i, std::move(*slots[i].error));
        }
    }

    debug::batch::log(debug::batch::Id::End,
                      fmt::format("{} providers, {} errors", out.results.size(), out.errors.size()));
    return out;
}

KeyedBatchResult BatchChecker::evaluate_documents(
    const std::map<std::string, llvm::json::Value>& documents, const facts::FactProvider& facts,
    const serde::ParseOptions& options) const {
    debug::batch::log(debug::batch::Id::Start, std::to_string(documents.size()));

    auto entries = entries_of(documents);
    std::vector<std::string> keys;
    keys.reserve(entries.size());
    for (const auto& it : entries) {
        keys.push_back(it->first);
    }

    std::vector<Slot> slots(entries.size());
    run(entries.size(), [&](size_t i) {
        fill_slot(slots[i], keys[i], [&] {
            auto requirement = serde::from_json(entries[i]->second, options);
            return checker_.evaluate(requirement, facts);
        });
    });

    auto out = collect(keys, slots);
    debug::batch::log(debug::batch::Id::End,
                      fmt::format("{} results, {} errors", out.results.size(), out.errors.size()));
    return out;
}

}  // namespace prereq::check
