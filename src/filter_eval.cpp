#include "hybridkb/filter_eval.hpp"

#include <string>

namespace hybridkb::filter_eval {

namespace {

constexpr const char* kComponent = "filter.eval";

// Three-way compare of two scalars of the same type; nullopt on type mismatch.
auto compare(const scalar& lhs, const scalar& rhs) -> std::optional<int> {
  if (lhs.index() != rhs.index()) return std::nullopt;
  if (std::holds_alternative<bool>(lhs)) {
    const bool a = std::get<bool>(lhs);
    const bool b = std::get<bool>(rhs);
    return static_cast<int>(a) - static_cast<int>(b);
  }
  const int c = std::get<std::string>(lhs).compare(std::get<std::string>(rhs));
  return (c < 0) ? -1 : (c > 0 ? 1 : 0);
}

auto equals(const std::optional<scalar>& value, const operand& rhs) -> bool {
  if (!value || !std::holds_alternative<scalar>(rhs)) return false;
  auto c = compare(*value, std::get<scalar>(rhs));
  return c && *c == 0;
}

auto member_of(const std::optional<scalar>& value, const operand& rhs) -> bool {
  if (!value || !std::holds_alternative<std::vector<scalar>>(rhs)) return false;
  for (const auto& candidate : std::get<std::vector<scalar>>(rhs)) {
    auto c = compare(*value, candidate);
    if (c && *c == 0) return true;
  }
  return false;
}

template <typename Pred>
auto ordered(const std::optional<scalar>& value, const operand& rhs, Pred pred) -> bool {
  if (!value || !std::holds_alternative<scalar>(rhs)) return false;
  auto c = compare(*value, std::get<scalar>(rhs));
  return c && pred(*c);
}

auto contains(const std::optional<scalar>& value, const operand& rhs) -> bool {
  if (!value || !std::holds_alternative<scalar>(rhs)) return false;
  const auto& needle = std::get<scalar>(rhs);
  if (!std::holds_alternative<std::string>(*value) || !std::holds_alternative<std::string>(needle)) {
    return false;
  }
  return std::get<std::string>(*value).find(std::get<std::string>(needle)) != std::string::npos;
}

auto matches_condition(const condition& c, const metadata_record& record) -> bool {
  const auto& value = record.get(c.target);
  switch (c.op) {
    case comparison::eq: return equals(value, c.value);
    case comparison::ne: return !equals(value, c.value);
    case comparison::gt: return ordered(value, c.value, [](int r) { return r > 0; });
    case comparison::gte: return ordered(value, c.value, [](int r) { return r >= 0; });
    case comparison::lt: return ordered(value, c.value, [](int r) { return r < 0; });
    case comparison::lte: return ordered(value, c.value, [](int r) { return r <= 0; });
    case comparison::in: return member_of(value, c.value);
    case comparison::nin: return !member_of(value, c.value);
    case comparison::contains: return contains(value, c.value);
  }
  return false;
}

auto matches_node(const filter_expr& e, const metadata_record& record) -> bool {
  if (std::holds_alternative<condition>(e.node)) {
    return matches_condition(std::get<condition>(e.node), record);
  } else if (std::holds_alternative<filter_expr::and_t>(e.node)) {
    const auto& a = std::get<filter_expr::and_t>(e.node);
    for (const auto& c : a.children) if (!matches_node(c, record)) return false;
    return true; // and([]) == true
  } else if (std::holds_alternative<filter_expr::or_t>(e.node)) {
    const auto& o = std::get<filter_expr::or_t>(e.node);
    for (const auto& c : o.children) if (matches_node(c, record)) return true;
    return false; // or([]) == false
  }
  return false;
}

auto malformed(const condition& c, std::string_view what) -> std::unexpected<core::error> {
  std::string msg;
  msg.append(to_string(c.target)).append(" ").append(to_string(c.op)).append(": ").append(what);
  return core::make_error(core::error_code::malformed_predicate, std::move(msg), kComponent);
}

auto scalar_fits(field f, const scalar& s) -> bool {
  return is_boolean_field(f) ? std::holds_alternative<bool>(s)
                             : std::holds_alternative<std::string>(s);
}

auto validate_condition(const condition& c) -> std::expected<void, core::error> {
  const bool wants_list = c.op == comparison::in || c.op == comparison::nin;
  if (wants_list) {
    if (!std::holds_alternative<std::vector<scalar>>(c.value)) {
      return malformed(c, "operand must be a list");
    }
    for (const auto& s : std::get<std::vector<scalar>>(c.value)) {
      if (!scalar_fits(c.target, s)) return malformed(c, "list element has the wrong type");
    }
    return {};
  }
  if (!std::holds_alternative<scalar>(c.value)) {
    return malformed(c, "operand must be a single value");
  }
  if (!scalar_fits(c.target, std::get<scalar>(c.value))) {
    return malformed(c, is_boolean_field(c.target) ? "operand must be a boolean"
                                                   : "operand must be a string");
  }
  if (c.op == comparison::contains && is_boolean_field(c.target)) {
    return malformed(c, "substring test on a boolean field");
  }
  return {};
}

} // namespace

auto metadata_record::from(const document_metadata& meta) -> metadata_record {
  metadata_record r;
  auto set = [&r](field f, const std::optional<std::string>& v) {
    if (v) r.values[static_cast<std::size_t>(f)] = scalar{*v};
  };
  set(field::region, meta.region);
  set(field::product_version, meta.product_version);
  set(field::category, meta.category);
  if (meta.deprecated) r.values[static_cast<std::size_t>(field::deprecated)] = scalar{*meta.deprecated};
  set(field::effective_date, meta.effective_date);
  // Always present: an article without codes exposes "".
  r.values[static_cast<std::size_t>(field::error_codes)] = scalar{join_error_codes(meta.error_codes)};
  return r;
}

auto validate(const filter_expr& expr) -> std::expected<void, core::error> {
  if (std::holds_alternative<condition>(expr.node)) {
    return validate_condition(std::get<condition>(expr.node));
  }
  const auto& children = std::holds_alternative<filter_expr::and_t>(expr.node)
                             ? std::get<filter_expr::and_t>(expr.node).children
                             : std::get<filter_expr::or_t>(expr.node).children;
  for (const auto& child : children) {
    if (auto ok = validate(child); !ok) return ok;
  }
  return {};
}

auto matches(const filter_expr& expr, const metadata_record& record) -> bool {
  return matches_node(expr, record);
}

} // namespace hybridkb::filter_eval
