#include "result.hpp"

#include <fmt/format.h>

namespace prereq::check {

namespace {

void collect_failures(const CheckResult& node, std::vector<std::string>& out) {
    if (node.passed) {
        return;
    }
    if (node.children.empty()) {
        out.push_back(node.message);
        return;
    }
    for (const auto& child : node.children) {
        collect_failures(child, out);
    }
}

void write_text(const CheckResult& node, size_t indent, std::string& out) {
    out.append(indent * 2, ' ');
    out += fmt::format("[{}] {}\n", node.passed ? "PASS" : "FAIL", node.message);
    for (const auto& child : node.children) {
        write_text(child, indent + 1, out);
    }
}

}  // namespace

std::vector<std::string> CheckResult::failure_reasons() const {
    std::vector<std::string> reasons;
    collect_failures(*this, reasons);
    return reasons;
}

llvm::json::Value CheckResult::to_json() const {
    llvm::json::Object object;
    object["passed"] = passed;
    object["message"] = message;
    object["type"] = req::type_key(type);
    if (observed) {
        object["observed"] = *observed;
    }
    if (!children.empty()) {
        llvm::json::Array array;
        for (const auto& child : children) {
            array.push_back(child.to_json());
        }
        object["children"] = std::move(array);
    }
    return llvm::json::Value(std::move(object));
}

std::string CheckResult::to_text() const {
    std::string out;
    write_text(*this, 0, out);
    return out;
}

bool CheckResult::operator==(const CheckResult& other) const {
    return passed == other.passed && message == other.message && type == other.type &&
           observed == other.observed && children == other.children;
}

}  // namespace prereq::check
