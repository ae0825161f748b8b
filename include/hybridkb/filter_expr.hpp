#pragma once

/** \file filter_expr.hpp
 *  \brief Filter predicate AST for document metadata.
 *
 * The tree is a tagged variant (condition | AND | OR). Fields and operators are closed
 * enumerations, so an unrecognised name can only appear at the wire boundary
 * (filter_json.hpp), where it is rejected as malformed_predicate.
 *
 * Ownership: this AST is value-semantic and self-contained.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace hybridkb {

/** \brief Metadata fields a predicate can reference. */
enum class field : std::uint8_t {
  region,
  product_version,
  category,
  deprecated,
  effective_date,
  error_codes,   /**< compared as the comma-joined string */
};

inline constexpr std::size_t field_count = 6;

/** \brief Comparison operators. */
enum class comparison : std::uint8_t {
  eq,
  ne,
  gt,
  gte,
  lt,
  lte,
  in,        /**< value is one of the operand list */
  nin,       /**< value is none of the operand list */
  contains,  /**< substring test on string fields */
};

/** \brief Comparable value: deprecated is boolean, every other field is a string. */
using scalar = std::variant<bool, std::string>;

/** \brief Right-hand side: a scalar, or a list for in/nin. */
using operand = std::variant<scalar, std::vector<scalar>>;

/** \brief Leaf predicate: field <op> value. */
struct condition {
  field target{field::region};
  comparison op{comparison::eq};
  operand value;
};

/** \brief Recursive filter expression. */
struct filter_expr {
  struct and_t { std::vector<filter_expr> children; };
  struct or_t  { std::vector<filter_expr> children; };

  std::variant<condition, and_t, or_t> node; /**< root node */
};

/** \brief Wire name of a field ("region", "error_codes", ...). */
auto to_string(field f) noexcept -> std::string_view;

/** \brief Canonical wire name of an operator ("$eq", "$in", ...). */
auto to_string(comparison op) noexcept -> std::string_view;

/** \brief Field by wire name; "error_codes_str" is accepted for error_codes. */
auto parse_field(std::string_view name) noexcept -> std::optional<field>;

/** \brief Operator by name, with or without the '$' prefix. */
auto parse_comparison(std::string_view name) noexcept -> std::optional<comparison>;

/** \brief True if the field holds a boolean, false if it holds a string. */
constexpr auto is_boolean_field(field f) noexcept -> bool { return f == field::deprecated; }

// Builders. The const char* overload exists so string literals do not bind to bool.
auto where(field f, comparison op, std::string value) -> filter_expr;
auto where(field f, comparison op, const char* value) -> filter_expr;
auto where(field f, comparison op, bool value) -> filter_expr;
auto where(field f, comparison op, std::vector<scalar> values) -> filter_expr;
auto all_of(std::vector<filter_expr> children) -> filter_expr;
auto any_of(std::vector<filter_expr> children) -> filter_expr;

} // namespace hybridkb
