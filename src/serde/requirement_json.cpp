#include "requirement_json.hpp"

#include "../common/debug/serde.hpp"
#include "../requirement/builder.hpp"

#include <fmt/format.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/FormatVariadic.h>
#include <llvm/Support/raw_ostream.h>

#include <algorithm>

namespace prereq::serde {

using Kind = InvalidRequirement::Kind;

namespace {

std::string join_path(const std::string& path, const std::string& key) {
    return path.empty() ? key : path + "." + key;
}

// 要件JSONの読み取り器
class RequirementReader {
   public:
    explicit RequirementReader(const ParseOptions& options) : options_(options) {}

    req::Requirement read(const llvm::json::Value& value, const std::string& path, size_t depth) {
        if (depth > options_.max_depth) {
            throw InvalidRequirement(
                Kind::TOO_DEEP, fmt::format("nesting exceeds {} levels", options_.max_depth), path);
        }

        const auto* object = value.getAsObject();
        if (!object) {
            throw InvalidRequirement(Kind::WRONG_TYPE, "requirement must be a JSON object", path);
        }
        if (object->empty()) {
            throw InvalidRequirement(Kind::MISSING_FIELD, "requirement cannot be empty", path);
        }
        if (object->size() != 1) {
            throw InvalidRequirement(
                Kind::UNKNOWN_KEY,
                fmt::format("requirement must contain exactly one type, got {}", object->size()),
                path);
        }

        const auto& entry = *object->begin();
        std::string key = entry.first.str();
        std::string here = join_path(path, key);

        debug::serde::log(debug::serde::Id::ParseNode, here, debug::Level::Trace);

        if (key == "trait")
            return read_trait(entry.second, here);
        if (key == "has")
            return read_has(entry.second, here);
        if (key == "count_tag")
            return read_count_tag(entry.second, here);
        if (key == "all")
            return req::all_of(read_children(entry.second, here, depth));
        if (key == "any")
            return req::any_of(read_children(entry.second, here, depth));

        throw InvalidRequirement(Kind::UNKNOWN_VARIANT,
                                 fmt::format("unknown requirement type '{}'", key), path);
    }

   private:
    const ParseOptions& options_;

    // ビルダーの例外にパスを付け直す
    template <typename Fn>
    static req::Requirement build_at(const std::string& path, Fn&& fn) {
        try {
            return fn();
        } catch (const InvalidRequirement& e) {
            throw InvalidRequirement(e.kind(), e.detail(), path);
        }
    }

    static const llvm::json::Object& expect_object(const llvm::json::Value& value,
                                                   const char* type, const std::string& path) {
        const auto* object = value.getAsObject();
        if (!object) {
            throw InvalidRequirement(Kind::WRONG_TYPE,
                                     fmt::format("{} requirement must be an object", type), path);
        }
        return *object;
    }

    static void reject_unknown_keys(const llvm::json::Object& object,
                                    std::initializer_list<llvm::StringRef> allowed,
                                    const char* type, const std::string& path) {
        for (const auto& entry : object) {
            bool known = false;
            for (auto name : allowed) {
                if (llvm::StringRef(entry.first) == name) {
                    known = true;
                    break;
                }
            }
            if (!known) {
                throw InvalidRequirement(
                    Kind::UNKNOWN_KEY,
                    fmt::format("{} requirement has unknown key '{}'", type, entry.first.str()),
                    path);
            }
        }
    }

    static std::string required_string(const llvm::json::Object& object, llvm::StringRef key,
                                       const char* type, const std::string& path) {
        const auto* value = object.get(key);
        if (!value) {
            throw InvalidRequirement(
                Kind::MISSING_FIELD,
                fmt::format("{} requirement missing required '{}' field", type, key.str()), path);
        }
        auto text = value->getAsString();
        if (!text) {
            throw InvalidRequirement(
                Kind::WRONG_TYPE,
                fmt::format("{} requirement '{}' must be a string", type, key.str()), path);
        }
        return text->str();
    }

    static std::optional<int64_t> optional_integer(const llvm::json::Object& object,
                                                   llvm::StringRef key, const char* type,
                                                   const std::string& path) {
        const auto* value = object.get(key);
        if (!value) {
            return std::nullopt;
        }
        auto number = value->getAsInteger();
        if (!number) {
            throw InvalidRequirement(
                Kind::WRONG_TYPE,
                fmt::format("{} requirement '{}' must be an integer", type, key.str()), path);
        }
        return *number;
    }

    req::Requirement read_trait(const llvm::json::Value& value, const std::string& path) {
        const auto& object = expect_object(value, "trait", path);
        reject_unknown_keys(object, {"name", "min", "max", "exact"}, "trait", path);

        std::string name = required_string(object, "name", "trait", path);
        auto minimum = optional_integer(object, "min", "trait", path);
        auto maximum = optional_integer(object, "max", "trait", path);
        auto exact = optional_integer(object, "exact", "trait", path);

        return build_at(path, [&] { return req::trait(name, minimum, maximum, exact); });
    }

    req::Requirement read_has(const llvm::json::Value& value, const std::string& path) {
        const auto& object = expect_object(value, "has", path);

        std::string field = required_string(object, "field", "has", path);

        req::PossessionFilter filter;
        filter.id = optional_integer(object, "id", "has", path);
        if (object.get("name")) {
            filter.name = required_string(object, "name", "has", path);
        }

        // field/id/name 以外は属性として扱う
        for (const auto& entry : object) {
            std::string key = entry.first.str();
            if (req::is_reserved_attribute(key)) {
                continue;
            }
            filter.attributes.emplace(key, read_attribute(entry.second, key, path));
        }

        return build_at(path, [&] { return req::possession(field, std::move(filter)); });
    }

    static req::AttributeValue read_attribute(const llvm::json::Value& value,
                                              const std::string& key, const std::string& path) {
        switch (value.kind()) {
            case llvm::json::Value::Boolean:
                return *value.getAsBoolean();
            case llvm::json::Value::Number:
                if (auto integer = value.getAsInteger()) {
                    return *integer;
                }
                return *value.getAsNumber();
            case llvm::json::Value::String:
                return value.getAsString()->str();
            default:
                break;
        }
        throw InvalidRequirement(
            Kind::WRONG_TYPE, fmt::format("has requirement attribute '{}' must be a scalar", key),
            path);
    }

    req::Requirement read_count_tag(const llvm::json::Value& value, const std::string& path) {
        const auto& object = expect_object(value, "count_tag", path);
        reject_unknown_keys(object, {"model", "tag", "minimum", "maximum"}, "count_tag", path);

        std::string model = required_string(object, "model", "count_tag", path);
        std::string tag = required_string(object, "tag", "count_tag", path);
        auto minimum = optional_integer(object, "minimum", "count_tag", path);
        auto maximum = optional_integer(object, "maximum", "count_tag", path);

        return build_at(path, [&] { return req::tag_count(model, tag, minimum, maximum); });
    }

    std::vector<req::Requirement> read_children(const llvm::json::Value& value,
                                                const std::string& path, size_t depth) {
        const auto* array = value.getAsArray();
        if (!array) {
            throw InvalidRequirement(Kind::NOT_A_SEQUENCE, "logical requirement must be an array",
                                     path);
        }

        std::vector<req::Requirement> children;
        children.reserve(array->size());
        for (size_t i = 0; i < array->size(); ++i) {
            children.push_back(read((*array)[i], fmt::format("{}[{}]", path, i), depth + 1));
        }
        return children;
    }
};

llvm::json::Value attribute_to_json(const req::AttributeValue& value) {
    return std::visit([](auto&& arg) -> llvm::json::Value { return llvm::json::Value(arg); },
                      value);
}

llvm::json::Value node_to_json(const req::Requirement& requirement) {
    llvm::json::Object body;

    if (auto* trait = requirement.get_if<req::TraitRequirement>()) {
        body["name"] = trait->name;
        if (trait->minimum)
            body["min"] = *trait->minimum;
        if (trait->maximum)
            body["max"] = *trait->maximum;
        if (trait->exact)
            body["exact"] = *trait->exact;
    } else if (auto* has = requirement.get_if<req::PossessionRequirement>()) {
        body["field"] = has->field;
        if (has->filter.id)
            body["id"] = *has->filter.id;
        if (has->filter.name)
            body["name"] = *has->filter.name;
        for (const auto& [key, value] : has->filter.attributes) {
            body[key] = attribute_to_json(value);
        }
    } else if (auto* count = requirement.get_if<req::TagCountRequirement>()) {
        body["model"] = count->field;
        body["tag"] = count->tag;
        if (count->minimum)
            body["minimum"] = *count->minimum;
        if (count->maximum)
            body["maximum"] = *count->maximum;
    } else {
        const auto& children = requirement.type() == req::RequirementType::AllOf
                                   ? requirement.get_if<req::AllOfRequirement>()->children
                                   : requirement.get_if<req::AnyOfRequirement>()->children;
        llvm::json::Array array;
        for (const auto& child : children) {
            array.push_back(node_to_json(child));
        }
        return llvm::json::Object{{req::type_key(requirement.type()), std::move(array)}};
    }

    return llvm::json::Object{{req::type_key(requirement.type()), std::move(body)}};
}

// 要件1段は {"all": [ ... ]} の2括弧。葉は {"trait": {...}} の2括弧
size_t bracket_limit(const ParseOptions& options) {
    return std::min(options.max_depth, req::kMaxNesting) * 2;
}

void reject_deep_text(llvm::StringRef text, size_t limit, const std::string& where) {
    if (exceeds_nesting(text, limit)) {
        std::string message = fmt::format("JSON nesting exceeds {} brackets", limit);
        debug::serde::log(debug::serde::Id::ParseError, message, debug::Level::Warn);
        throw InvalidRequirement(Kind::TOO_DEEP, message, where);
    }
}

}  // namespace

bool exceeds_nesting(llvm::StringRef text, size_t limit) {
    size_t depth = 0;
    bool in_string = false;
    bool escaped = false;
    for (char c : text) {
        if (in_string) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }
        switch (c) {
            case '"':
                in_string = true;
                break;
            case '[':
            case '{':
                if (++depth > limit) {
                    return true;
                }
                break;
            case ']':
            case '}':
                if (depth > 0) {
                    --depth;
                }
                break;
            default:
                break;
        }
    }
    return false;
}

req::Requirement parse_requirement(llvm::StringRef text, const ParseOptions& options) {
    debug::serde::log(debug::serde::Id::ParseStart);

    reject_deep_text(text, bracket_limit(options), "");

    auto parsed = llvm::json::parse(text);
    if (!parsed) {
        std::string message = llvm::toString(parsed.takeError());
        debug::serde::log(debug::serde::Id::ParseError, message, debug::Level::Warn);
        throw InvalidRequirement(Kind::MALFORMED_JSON, message);
    }
    return from_json(*parsed, options);
}

req::Requirement from_json(const llvm::json::Value& value, const ParseOptions& options) {
    RequirementReader reader(options);
    try {
        auto requirement = reader.read(value, "", 1);
        debug::serde::log(debug::serde::Id::ParseEnd);
        return requirement;
    } catch (const InvalidRequirement& e) {
        debug::serde::log(debug::serde::Id::ParseError, e.what(), debug::Level::Warn);
        throw;
    }
}

llvm::json::Value to_json(const req::Requirement& requirement) {
    debug::serde::log(debug::serde::Id::SerializeStart, debug::Level::Trace);
    auto value = node_to_json(requirement);
    debug::serde::log(debug::serde::Id::SerializeEnd, debug::Level::Trace);
    return value;
}

std::string to_string(const req::Requirement& requirement, bool pretty) {
    return render(to_json(requirement), pretty);
}

std::string render(const llvm::json::Value& value, bool pretty) {
    std::string out;
    llvm::raw_string_ostream os(out);
    if (pretty) {
        os << llvm::formatv("{0:2}", value);
    } else {
        os << value;
    }
    os.flush();
    return out;
}

std::map<std::string, llvm::json::Value> parse_document_map(llvm::StringRef text,
                                                            const ParseOptions& options) {
    // キーごとのオブジェクトで1段深くなる
    reject_deep_text(text, bracket_limit(options) + 1, "document");

    auto parsed = llvm::json::parse(text);
    if (!parsed) {
        throw InvalidRequirement(Kind::MALFORMED_JSON, llvm::toString(parsed.takeError()));
    }
    auto* object = parsed->getAsObject();
    if (!object) {
        throw InvalidRequirement(Kind::WRONG_TYPE,
                                 "requirement map must be an object of key to requirement");
    }

    std::map<std::string, llvm::json::Value> documents;
    for (auto& entry : *object) {
        documents.emplace(entry.first.str(), std::move(entry.second));
    }
    return documents;
}

}  // namespace prereq::serde
