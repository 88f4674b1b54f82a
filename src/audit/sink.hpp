#pragma once

#include "../check/result.hpp"
#include "../requirement/nodes.hpp"

#include <llvm/Support/JSON.h>
#include <llvm/Support/raw_ostream.h>

#include <chrono>
#include <mutex>
#include <string>

namespace prereq::audit {

// 評価1回分の監査レコード
struct AuditRecord {
    req::Requirement requirement;
    std::string provider;
    check::CheckResult result;
    std::chrono::system_clock::time_point timestamp;

    /// {"requirement", "provider", "result", "timestamp"}
    llvm::json::Value to_json() const;
};

// 監査レコードの受け取り先
// バッチ評価では複数スレッドから呼ばれるため、実装はスレッドセーフであること
class AuditSink {
   public:
    virtual ~AuditSink() = default;
    virtual void record(const AuditRecord& record) = 0;
};

// 1行1レコードのJSONで書き出す
class JsonLinesAuditSink : public AuditSink {
   public:
    explicit JsonLinesAuditSink(llvm::raw_ostream& out) : out_(out) {}

    void record(const AuditRecord& record) override;

    /// 書き出したレコード数
    size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_;
    }

   private:
    llvm::raw_ostream& out_;
    mutable std::mutex mutex_;
    size_t count_ = 0;
};

/// UTC の ISO 8601 形式 ("2026-10-19T12:34:56Z")
std::string format_timestamp(std::chrono::system_clock::time_point time);

}  // namespace prereq::audit
