#include "engine.hpp"

#include "../audit/sink.hpp"
#include "../common/debug/check.hpp"
#include "../common/errors.hpp"

#include <fmt/format.h>

#include <chrono>
#include <type_traits>

namespace prereq::check {

namespace {

template <typename T>
inline constexpr bool always_false_v = false;

// メッセージ用に先頭を大文字化 ("strength" -> "Strength")
std::string display_name(const std::string& name) {
    std::string out = name;
    if (!out.empty() && out[0] >= 'a' && out[0] <= 'z') {
        out[0] = static_cast<char>(out[0] - 'a' + 'A');
    }
    return out;
}

// "minimum 3 and maximum 5"
std::string describe_bounds(const std::optional<int64_t>& minimum,
                            const std::optional<int64_t>& maximum,
                            const std::optional<int64_t>& exact = std::nullopt) {
    std::vector<std::string> parts;
    if (minimum)
        parts.push_back(fmt::format("minimum {}", *minimum));
    if (maximum)
        parts.push_back(fmt::format("maximum {}", *maximum));
    if (exact)
        parts.push_back(fmt::format("exactly {}", *exact));
    return fmt::format("{}", fmt::join(parts, " and "));
}

CheckResult leaf(req::RequirementType type, bool passed, std::string message,
                 std::optional<int64_t> observed = std::nullopt) {
    CheckResult result;
    result.passed = passed;
    result.message = std::move(message);
    result.type = type;
    result.observed = observed;
    return result;
}

size_t count_passed(const std::vector<CheckResult>& results) {
    size_t n = 0;
    for (const auto& r : results) {
        if (r.passed)
            ++n;
    }
    return n;
}

}  // namespace

CheckResult Checker::evaluate(const req::Requirement& requirement,
                              const facts::FactProvider& facts) const {
    debug::check::log(debug::check::Id::Start, facts.identity());

    CheckResult result;
    try {
        result = check_node(requirement, facts);
    } catch (const FactProviderError& e) {
        debug::check::log(debug::check::Id::ProviderError, e.what(), debug::Level::Error);
        throw;
    }

    if (audit_) {
        debug::check::log(debug::check::Id::AuditEmit, facts.identity(), debug::Level::Trace);
        audit_->record(audit::AuditRecord{requirement, facts.identity(), result,
                                          std::chrono::system_clock::now()});
    }

    debug::check::log(debug::check::Id::End, result.passed ? "passed" : "not passed");
    return result;
}

CheckResult Checker::check_node(const req::Requirement& requirement,
                                const facts::FactProvider& facts) const {
    return std::visit(
        [&](const auto& node) -> CheckResult {
            using T = std::remove_const_t<typename std::decay_t<decltype(node)>::element_type>;
            if constexpr (std::is_same_v<T, req::TraitRequirement>) {
                return check_trait(*node, facts);
            } else if constexpr (std::is_same_v<T, req::PossessionRequirement>) {
                return check_possession(*node, facts);
            } else if constexpr (std::is_same_v<T, req::TagCountRequirement>) {
                return check_tag_count(*node, facts);
            } else if constexpr (std::is_same_v<T, req::AllOfRequirement>) {
                return check_all_of(*node, facts);
            } else if constexpr (std::is_same_v<T, req::AnyOfRequirement>) {
                return check_any_of(*node, facts);
            } else {
                static_assert(always_false_v<T>, "unhandled requirement kind");
            }
        },
        requirement.kind());
}

// 特性: 指定された境界すべてを満たす必要がある（境界は両端を含む）
CheckResult Checker::check_trait(const req::TraitRequirement& node,
                                 const facts::FactProvider& facts) const {
    debug::check::log(debug::check::Id::TraitNode, node.name, debug::Level::Trace);

    const auto type = req::RequirementType::Trait;
    std::string label = display_name(node.name);

    auto value = facts.get_trait(node.name);
    if (!value) {
        debug::check::log(debug::check::Id::TraitMissing, node.name);
        return leaf(type, false, fmt::format("{} trait not found", label));
    }

    int64_t actual = *value;
    CheckResult result;
    if (node.minimum && actual < *node.minimum) {
        result = leaf(type, false,
                      fmt::format("{} requirement not met ({} < {})", label, actual, *node.minimum),
                      actual);
    } else if (node.maximum && actual > *node.maximum) {
        result = leaf(type, false,
                      fmt::format("{} exceeds maximum ({} > {})", label, actual, *node.maximum),
                      actual);
    } else if (node.exact && actual != *node.exact) {
        result = leaf(type, false,
                      fmt::format("{} must be exactly {} (got {})", label, *node.exact, actual),
                      actual);
    } else {
        result = leaf(type, true,
                      fmt::format("{} requirement met ({}): {}", label,
                                  describe_bounds(node.minimum, node.maximum, node.exact), actual),
                      actual);
    }

    debug::check::dump_result("trait " + node.name, result.passed, result.message);
    return result;
}

CheckResult Checker::check_possession(const req::PossessionRequirement& node,
                                      const facts::FactProvider& facts) const {
    debug::check::log(debug::check::Id::PossessionNode, node.field, debug::Level::Trace);

    bool found = facts.has_match(node.field, node.filter);
    std::string criteria = node.filter.describe();

    auto result = leaf(req::RequirementType::Possession, found,
                       found ? fmt::format("Has required object in {} ({})", node.field, criteria)
                             : fmt::format("Missing required object in {} ({})", node.field,
                                           criteria));

    debug::check::dump_result("has " + node.field, result.passed, result.message);
    return result;
}

CheckResult Checker::check_tag_count(const req::TagCountRequirement& node,
                                     const facts::FactProvider& facts) const {
    debug::check::log(debug::check::Id::TagCountNode, node.field + "/" + node.tag,
                      debug::Level::Trace);

    const auto type = req::RequirementType::TagCount;
    int64_t count = facts.count_tagged(node.field, node.tag);

    CheckResult result;
    if (node.minimum && count < *node.minimum) {
        result = leaf(type, false,
                      fmt::format("Insufficient {} tagged '{}' ({} < {})", node.field, node.tag,
                                  count, *node.minimum),
                      count);
    } else if (node.maximum && count > *node.maximum) {
        result = leaf(type, false,
                      fmt::format("Too many {} tagged '{}' ({} > {})", node.field, node.tag, count,
                                  *node.maximum),
                      count);
    } else {
        result = leaf(type, true,
                      fmt::format("Sufficient {} tagged '{}' ({}): {}", node.field, node.tag,
                                  describe_bounds(node.minimum, node.maximum), count),
                      count);
    }

    debug::check::dump_result("count_tag " + node.field, result.passed, result.message);
    return result;
}

// 論理積: 先行する子が失敗しても残りを評価する。空なら成立
CheckResult Checker::check_all_of(const req::AllOfRequirement& node,
                                  const facts::FactProvider& facts) const {
    debug::check::log(debug::check::Id::AllOfNode, std::to_string(node.children.size()),
                      debug::Level::Trace);

    CheckResult result;
    result.type = req::RequirementType::AllOf;
    result.children.reserve(node.children.size());
    for (const auto& child : node.children) {
        result.children.push_back(check_node(child, facts));
    }

    size_t total = result.children.size();
    size_t satisfied = count_passed(result.children);
    result.passed = satisfied == total;
    result.message = result.passed
                         ? fmt::format("All requirements satisfied ({}/{})", satisfied, total)
                         : fmt::format("Not all requirements satisfied ({}/{})", satisfied, total);
    return result;
}

// 論理和: 全ての子を評価する。空なら不成立
CheckResult Checker::check_any_of(const req::AnyOfRequirement& node,
                                  const facts::FactProvider& facts) const {
    debug::check::log(debug::check::Id::AnyOfNode, std::to_string(node.children.size()),
                      debug::Level::Trace);

    CheckResult result;
    result.type = req::RequirementType::AnyOf;
    result.children.reserve(node.children.size());
    for (const auto& child : node.children) {
        result.children.push_back(check_node(child, facts));
    }

    size_t total = result.children.size();
    size_t satisfied = count_passed(result.children);
    result.passed = satisfied > 0;
    result.message =
        result.passed ? fmt::format("At least one requirement satisfied ({}/{})", satisfied, total)
                      : fmt::format("No requirements satisfied (0/{})", total);
    return result;
}

CheckResult evaluate(const req::Requirement& requirement, const facts::FactProvider& facts) {
    return Checker().evaluate(requirement, facts);
}

}  // namespace prereq::check
