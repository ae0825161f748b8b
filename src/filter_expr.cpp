#include "hybridkb/filter_expr.hpp"

#include <utility>

namespace hybridkb {

auto to_string(field f) noexcept -> std::string_view {
  switch (f) {
    case field::region: return "region";
    case field::product_version: return "product_version";
    case field::category: return "category";
    case field::deprecated: return "deprecated";
    case field::effective_date: return "effective_date";
    case field::error_codes: return "error_codes";
  }
  return "unknown";
}

auto to_string(comparison op) noexcept -> std::string_view {
  switch (op) {
    case comparison::eq: return "$eq";
    case comparison::ne: return "$ne";
    case comparison::gt: return "$gt";
    case comparison::gte: return "$gte";
    case comparison::lt: return "$lt";
    case comparison::lte: return "$lte";
    case comparison::in: return "$in";
    case comparison::nin: return "$nin";
    case comparison::contains: return "$contains";
  }
  return "$unknown";
}

auto parse_field(std::string_view name) noexcept -> std::optional<field> {
  if (name == "region") return field::region;
  if (name == "product_version") return field::product_version;
  if (name == "category") return field::category;
  if (name == "deprecated") return field::deprecated;
  if (name == "effective_date") return field::effective_date;
  if (name == "error_codes" || name == "error_codes_str") return field::error_codes;
  return std::nullopt;
}

auto parse_comparison(std::string_view name) noexcept -> std::optional<comparison> {
  if (!name.empty() && name.front() == '$') name.remove_prefix(1);
  if (name == "eq") return comparison::eq;
  if (name == "ne") return comparison::ne;
  if (name == "gt") return comparison::gt;
  if (name == "gte") return comparison::gte;
  if (name == "lt") return comparison::lt;
  if (name == "lte") return comparison::lte;
  if (name == "in") return comparison::in;
  if (name == "nin") return comparison::nin;
  if (name == "contains") return comparison::contains;
  return std::nullopt;
}

auto where(field f, comparison op, std::string value) -> filter_expr {
  return filter_expr{condition{f, op, scalar{std::move(value)}}};
}

auto where(field f, comparison op, const char* value) -> filter_expr {
  return where(f, op, std::string(value));
}

auto where(field f, comparison op, bool value) -> filter_expr {
  return filter_expr{condition{f, op, scalar{value}}};
}

auto where(field f, comparison op, std::vector<scalar> values) -> filter_expr {
  return filter_expr{condition{f, op, operand{std::move(values)}}};
}

auto all_of(std::vector<filter_expr> children) -> filter_expr {
  return filter_expr{filter_expr::and_t{std::move(children)}};
}

auto any_of(std::vector<filter_expr> children) -> filter_expr {
  return filter_expr{filter_expr::or_t{std::move(children)}};
}

} // namespace hybridkb
