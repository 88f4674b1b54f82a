#include "nodes.hpp"

#include <fmt/format.h>
#include <type_traits>

namespace prereq::req {

const char* type_key(RequirementType type) {
    switch (type) {
        case RequirementType::Trait:
            return "trait";
        case RequirementType::Possession:
            return "has";
        case RequirementType::TagCount:
            return "count_tag";
        case RequirementType::AllOf:
            return "all";
        case RequirementType::AnyOf:
            return "any";
    }
    return "unknown";
}

bool attribute_equals(const AttributeValue& lhs, const AttributeValue& rhs) {
    // 数値同士は型をまたいで比較
    auto as_number = [](const AttributeValue& v) -> std::optional<double> {
        if (auto* i = std::get_if<int64_t>(&v))
            return static_cast<double>(*i);
        if (auto* d = std::get_if<double>(&v))
            return *d;
        return std::nullopt;
    };
    auto l = as_number(lhs);
    auto r = as_number(rhs);
    if (l && r) {
        return *l == *r;
    }
    return lhs == rhs;
}

std::string attribute_to_string(const AttributeValue& value) {
    return std::visit(
        [](auto&& arg) -> std::string {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, bool>) {
                return arg ? "true" : "false";
            } else if constexpr (std::is_same_v<T, std::string>) {
                return arg;
            } else {
                return fmt::format("{}", arg);
            }
        },
        value);
}

std::string PossessionFilter::describe() const {
    std::vector<std::string> parts;
    if (id) {
        parts.push_back(fmt::format("id={}", *id));
    }
    if (name) {
        parts.push_back(fmt::format("name={}", *name));
    }
    for (const auto& [key, value] : attributes) {
        parts.push_back(fmt::format("{}={}", key, attribute_to_string(value)));
    }
    return fmt::format("{}", fmt::join(parts, ", "));
}

bool PossessionFilter::operator==(const PossessionFilter& other) const {
    if (id != other.id || name != other.name) {
        return false;
    }
    if (attributes.size() != other.attributes.size()) {
        return false;
    }
    for (const auto& [key, value] : attributes) {
        auto it = other.attributes.find(key);
        if (it == other.attributes.end() || !attribute_equals(value, it->second)) {
            return false;
        }
    }
    return true;
}

namespace {

bool same_children(const std::vector<Requirement>& lhs, const std::vector<Requirement>& rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (size_t i = 0; i < lhs.size(); ++i) {
        if (lhs[i] != rhs[i]) {
            return false;
        }
    }
    return true;
}

}  // namespace

bool Requirement::operator==(const Requirement& other) const {
    if (kind_.index() != other.kind_.index()) {
        return false;
    }

    if (auto* trait = get_if<TraitRequirement>()) {
        auto* rhs = other.get_if<TraitRequirement>();
        return trait == rhs || (trait->name == rhs->name && trait->minimum == rhs->minimum &&
                                trait->maximum == rhs->maximum && trait->exact == rhs->exact);
    }
    if (auto* has = get_if<PossessionRequirement>()) {
        auto* rhs = other.get_if<PossessionRequirement>();
        return has == rhs || (has->field == rhs->field && has->filter == rhs->filter);
    }
    if (auto* count = get_if<TagCountRequirement>()) {
        auto* rhs = other.get_if<TagCountRequirement>();
        return count == rhs || (count->field == rhs->field && count->tag == rhs->tag &&
                                count->minimum == rhs->minimum && count->maximum == rhs->maximum);
    }
    if (auto* all = get_if<AllOfRequirement>()) {
        auto* rhs = other.get_if<AllOfRequirement>();
        return all == rhs || same_children(all->children, rhs->children);
    }
    auto* any = get_if<AnyOfRequirement>();
    auto* rhs = other.get_if<AnyOfRequirement>();
    return any == rhs || same_children(any->children, rhs->children);
}

}  // namespace prereq::req
