#include "builder.hpp"

#include "../common/debug.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace prereq::req {

using Kind = InvalidRequirement::Kind;

// ノードを共有ポインタで包む唯一の入口
class Builder {
   public:
    template <typename T>
    static Requirement make(T node, size_t depth = 1) {
        return Requirement(std::make_shared<const T>(std::move(node)), depth);
    }
};

namespace {

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos)
        return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::string require_text(const std::string& value, const char* what) {
    std::string trimmed = trim(value);
    if (trimmed.empty()) {
        throw InvalidRequirement(Kind::EMPTY_FIELD, fmt::format("{} cannot be empty", what));
    }
    return trimmed;
}

void require_non_negative(const std::optional<int64_t>& bound, const char* what) {
    if (bound && *bound < 0) {
        throw InvalidRequirement(Kind::INVALID_BOUND,
                                 fmt::format("{} must be non-negative, got {}", what, *bound));
    }
}

void require_ordered(const std::optional<int64_t>& minimum, const std::optional<int64_t>& maximum) {
    if (minimum && maximum && *minimum > *maximum) {
        throw InvalidRequirement(
            Kind::INVALID_BOUND,
            fmt::format("maximum ({}) cannot be less than minimum ({})", *maximum, *minimum));
    }
}

// 論理要件の深さ（上限を超えたら拒否）
size_t group_depth(const std::vector<Requirement>& children) {
    size_t deepest = 0;
    for (const auto& child : children) {
        deepest = std::max(deepest, child.depth());
    }
    if (deepest + 1 > kMaxNesting) {
        throw InvalidRequirement(Kind::TOO_DEEP,
                                 fmt::format("nesting exceeds {} levels", kMaxNesting));
    }
    return deepest + 1;
}

}  // namespace

bool is_reserved_attribute(const std::string& key) {
    return key == "field" || key == "id" || key == "name";
}

Requirement trait(const std::string& name, std::optional<int64_t> minimum,
                  std::optional<int64_t> maximum, std::optional<int64_t> exact) {
    TraitRequirement node;
    node.name = require_text(name, "trait name");

    if (!minimum && !maximum && !exact) {
        throw InvalidRequirement(
            Kind::MISSING_BOUND,
            fmt::format("trait '{}' needs at least one of min, max or exact", node.name));
    }
    require_non_negative(minimum, "min");
    require_non_negative(maximum, "max");
    require_non_negative(exact, "exact");
    require_ordered(minimum, maximum);

    node.minimum = minimum;
    node.maximum = maximum;
    node.exact = exact;

    debug::log(debug::Stage::Build, debug::Level::Trace, "trait " + node.name);
    return Builder::make(std::move(node));
}

Requirement possession(const std::string& field, PossessionFilter filter) {
    PossessionRequirement node;
    node.field = require_text(field, "collection field");

    if (filter.empty()) {
        throw InvalidRequirement(
            Kind::MISSING_FIELD,
            fmt::format("possession in '{}' needs an id, a name or an attribute", node.field));
    }
    if (filter.id && *filter.id <= 0) {
        throw InvalidRequirement(Kind::INVALID_BOUND,
                                 fmt::format("id must be positive, got {}", *filter.id));
    }
    for (const auto& [key, value] : filter.attributes) {
        if (trim(key).empty()) {
            throw InvalidRequirement(Kind::EMPTY_FIELD, "attribute name cannot be empty");
        }
        if (is_reserved_attribute(key)) {
            throw InvalidRequirement(Kind::UNKNOWN_KEY,
                                     fmt::format("'{}' cannot be used as an attribute", key));
        }
    }

    node.filter = std::move(filter);

    debug::log(debug::Stage::Build, debug::Level::Trace, "has " + node.field);
    return Builder::make(std::move(node));
}

Requirement has_item(const std::string& field, std::optional<int64_t> id,
                     std::optional<std::string> name, AttributeMap attributes) {
    PossessionFilter filter;
    filter.id = id;
    filter.name = std::move(name);
    filter.attributes = std::move(attributes);
    return possession(field, std::move(filter));
}

Requirement tag_count(const std::string& field, const std::string& tag,
                      std::optional<int64_t> minimum, std::optional<int64_t> maximum) {
    TagCountRequirement node;
    node.field = require_text(field, "collection field");
    node.tag = require_text(tag, "tag");

    if (!minimum && !maximum) {
        throw InvalidRequirement(Kind::MISSING_BOUND,
                                 fmt::format("count of '{}' tagged '{}' needs a minimum or maximum",
                                             node.field, node.tag));
    }
    require_non_negative(minimum, "minimum");
    require_non_negative(maximum, "maximum");
    require_ordered(minimum, maximum);

    node.minimum = minimum;
    node.maximum = maximum;

    debug::log(debug::Stage::Build, debug::Level::Trace, "count_tag " + node.field + "/" + node.tag);
    return Builder::make(std::move(node));
}

Requirement all_of(std::vector<Requirement> children) {
    size_t depth = group_depth(children);
    return Builder::make(AllOfRequirement{std::move(children)}, depth);
}

Requirement any_of(std::vector<Requirement> children) {
    size_t depth = group_depth(children);
    return Builder::make(AnyOfRequirement{std::move(children)}, depth);
}

AttachedRequirement attach(const std::string& description, Requirement requirement,
                           std::optional<ContentRef> content) {
    std::string text = trim(description);
    if (text.empty()) {
        throw InvalidRequirement(Kind::EMPTY_FIELD,
                                 "description cannot be empty or whitespace-only");
    }
    if (content) {
        if (trim(content->type).empty()) {
            throw InvalidRequirement(Kind::EMPTY_FIELD, "content type cannot be empty");
        }
        if (content->id <= 0) {
            throw InvalidRequirement(Kind::INVALID_BOUND,
                                     fmt::format("content id must be positive, got {}", content->id));
        }
    }
    return AttachedRequirement{std::move(text), std::move(requirement), std::move(content)};
}

}  // namespace prereq::req
