#include "hybridkb/filter_json.hpp"

#include <utility>
#include <vector>

#include <json/json.h>
#include <spdlog/spdlog.h>

#include "hybridkb/filter_eval.hpp"
#include "json_util.hpp"

namespace hybridkb::filter_json {

namespace {

constexpr const char* kComponent = "filter.json";

enum class composite { none, all, any };

auto composite_key(std::string_view key) -> composite {
    if (key == "$and" || key == "AND" || key == "and") return composite::all;
    if (key == "$or" || key == "OR" || key == "or") return composite::any;
    return composite::none;
}

auto malformed(std::string message) -> std::unexpected<core::error> {
    return core::make_error(core::error_code::malformed_predicate, std::move(message), kComponent);
}

auto decode_scalar(const Json::Value& v, std::string_view where_) -> std::expected<scalar, core::error> {
    if (v.isBool()) return scalar{v.asBool()};
    if (v.isString()) return scalar{v.asString()};
    return malformed(std::string(where_) + ": operand must be a string or boolean");
}

auto decode_operand(const Json::Value& v, comparison op, std::string_view where_)
    -> std::expected<operand, core::error> {
    if (op == comparison::in || op == comparison::nin) {
        if (!v.isArray()) return malformed(std::string(where_) + ": operand must be an array");
        std::vector<scalar> items;
        items.reserve(v.size());
        for (const auto& item : v) {
            auto s = decode_scalar(item, where_);
            if (!s) return std::unexpected(s.error());
            items.push_back(std::move(*s));
        }
        return operand{std::move(items)};
    }
    auto s = decode_scalar(v, where_);
    if (!s) return std::unexpected(s.error());
    return operand{std::move(*s)};
}

auto fold(std::vector<filter_expr> parts) -> filter_expr {
    if (parts.size() == 1) return std::move(parts.front());
    return all_of(std::move(parts));
}

auto decode_field(const std::string& name, const Json::Value& constraint)
    -> std::expected<filter_expr, core::error> {
    auto f = parse_field(name);
    if (!f) return malformed("unknown field '" + name + "'");

    if (!constraint.isObject()) {
        if (constraint.isArray()) {
            return malformed("field '" + name + "': bare arrays are not a constraint, use $in");
        }
        auto s = decode_scalar(constraint, name);
        if (!s) return std::unexpected(s.error());
        return filter_expr{condition{*f, comparison::eq, operand{std::move(*s)}}};
    }

    if (constraint.empty()) return malformed("field '" + name + "': empty constraint");

    std::vector<filter_expr> parts;
    for (const auto& op_name : constraint.getMemberNames()) {
        auto op = parse_comparison(op_name);
        if (!op) return malformed("field '" + name + "': unknown operator '" + op_name + "'");
        auto rhs = decode_operand(constraint[op_name], *op, name + " " + op_name);
        if (!rhs) return std::unexpected(rhs.error());
        parts.push_back(filter_expr{condition{*f, *op, std::move(*rhs)}});
    }
    return fold(std::move(parts));
}

auto decode_node(const Json::Value& v) -> std::expected<filter_expr, core::error> {
    if (!v.isObject()) return malformed("predicate node must be an object");

    const auto keys = v.getMemberNames();
    for (const auto& key : keys) {
        const auto kind = composite_key(key);
        if (kind == composite::none) continue;
        if (keys.size() != 1) return malformed("'" + key + "' cannot be combined with other keys");
        const auto& list = v[key];
        if (!list.isArray()) return malformed("'" + key + "' expects an array");

        std::vector<filter_expr> children;
        children.reserve(list.size());
        for (const auto& child : list) {
            auto node = decode_node(child);
            if (!node) return node;
            children.push_back(std::move(*node));
        }
        return kind == composite::all ? all_of(std::move(children)) : any_of(std::move(children));
    }

    std::vector<filter_expr> parts;
    parts.reserve(keys.size());
    for (const auto& key : keys) {
        auto node = decode_field(key, v[key]);
        if (!node) return node;
        parts.push_back(std::move(*node));
    }
    // {} nested inside a composite places no constraint.
    if (parts.empty()) return all_of({});
    return fold(std::move(parts));
}

auto encode_scalar(const scalar& s) -> Json::Value {
    if (std::holds_alternative<bool>(s)) return Json::Value(std::get<bool>(s));
    return Json::Value(std::get<std::string>(s));
}

} // namespace

auto parse_predicate(const Json::Value& value)
    -> std::expected<std::optional<filter_expr>, core::error> {
    if (value.isNull()) return std::optional<filter_expr>{};
    if (value.isObject() && value.empty()) return std::optional<filter_expr>{};

    auto node = decode_node(value);
    if (!node) return std::unexpected(node.error());
    if (auto ok = filter_eval::validate(*node); !ok) return std::unexpected(ok.error());
    return std::optional<filter_expr>{std::move(*node)};
}

auto parse_predicate(std::string_view text)
    -> std::expected<std::optional<filter_expr>, core::error> {
    auto root = detail::parse_json_text(text, core::error_code::malformed_predicate, kComponent);
    if (!root) return std::unexpected(root.error());
    return parse_predicate(*root);
}

auto to_json(const filter_expr& expr) -> Json::Value {
    if (std::holds_alternative<condition>(expr.node)) {
        const auto& c = std::get<condition>(expr.node);
        Json::Value rhs;
        if (std::holds_alternative<scalar>(c.value)) {
            rhs = encode_scalar(std::get<scalar>(c.value));
        } else {
            rhs = Json::Value(Json::arrayValue);
            for (const auto& s : std::get<std::vector<scalar>>(c.value)) rhs.append(encode_scalar(s));
        }
        Json::Value constraint(Json::objectValue);
        constraint[std::string(to_string(c.op))] = rhs;
        Json::Value out(Json::objectValue);
        out[std::string(to_string(c.target))] = constraint;
        return out;
    }

    const bool is_and = std::holds_alternative<filter_expr::and_t>(expr.node);
    const auto& children = is_and ? std::get<filter_expr::and_t>(expr.node).children
                                  : std::get<filter_expr::or_t>(expr.node).children;
    Json::Value list(Json::arrayValue);
    for (const auto& child : children) list.append(to_json(child));
    Json::Value out(Json::objectValue);
    out[is_and ? "$and" : "$or"] = list;
    return out;
}

auto to_string(const filter_expr& expr) -> std::string {
    return detail::to_compact_string(to_json(expr));
}

auto from_extracted_filters(const Json::Value& flat) -> std::optional<filter_expr> {
    if (!flat.isObject() || flat.empty()) return std::nullopt;

    std::vector<filter_expr> conditions;
    for (const char* key : {"region", "product_version", "category"}) {
        if (!flat.isMember(key)) continue;
        if (!flat[key].isString()) {
            spdlog::debug("extracted filter '{}' is not a string; skipped", key);
            continue;
        }
        conditions.push_back(where(*parse_field(key), comparison::eq, flat[key].asString()));
    }
    if (flat.isMember("deprecated")) {
        if (flat["deprecated"].isBool()) {
            conditions.push_back(where(field::deprecated, comparison::eq, flat["deprecated"].asBool()));
        } else {
            spdlog::debug("extracted filter 'deprecated' is not a boolean; skipped");
        }
    }
    // Error codes steer ranking through the query text; a code no article carries
    // would otherwise empty the filtered candidate set.
    if (flat.isMember("error_codes")) {
        spdlog::debug("extracted error code {} is not applied as a filter",
                      detail::to_compact_string(flat["error_codes"]));
    }
    for (const auto& key : flat.getMemberNames()) {
        if (!parse_field(key)) spdlog::debug("extracted filter '{}' is not a metadata field; ignored", key);
    }

    if (conditions.empty()) return std::nullopt;
    return fold(std::move(conditions));
}

} // namespace hybridkb::filter_json
