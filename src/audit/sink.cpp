#include "sink.hpp"

#include "../common/debug.hpp"
#include "../serde/requirement_json.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

namespace prereq::audit {

llvm::json::Value AuditRecord::to_json() const {
    llvm::json::Object object;
    object["requirement"] = serde::to_json(requirement);
    object["provider"] = provider;
    object["result"] = result.to_json();
    object["timestamp"] = format_timestamp(timestamp);
    return llvm::json::Value(std::move(object));
}

void JsonLinesAuditSink::record(const AuditRecord& record) {
    // 直列化はロックの外で行う
    std::string line = serde::render(record.to_json());

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << '\n';
    out_.flush();
    ++count_;

    debug::log(debug::Stage::Audit, debug::Level::Trace,
               fmt::format("record #{} for {}", count_, record.provider));
}

std::string format_timestamp(std::chrono::system_clock::time_point time) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(seconds));
}

}  // namespace prereq::audit
