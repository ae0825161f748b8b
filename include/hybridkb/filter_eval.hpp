#pragma once

/** \file filter_eval.hpp
 *  \brief In-memory evaluation of filter_expr against a flattened metadata record.
 *
 * Absence: a field with no value fails every comparator except $ne and $nin, which
 * hold against an absent value.
 * error_codes is exposed as the comma-joined string, so $eq compares the whole list
 * and $contains tests for a single code.
 */

#include <array>
#include <expected>
#include <optional>

#include "hybridkb/document.hpp"
#include "hybridkb/error.hpp"
#include "hybridkb/filter_expr.hpp"

namespace hybridkb::filter_eval {

/** \brief Flattened, uniformly comparable view of a document's metadata. */
struct metadata_record {
  std::array<std::optional<scalar>, field_count> values;

  auto get(field f) const noexcept -> const std::optional<scalar>& {
    return values[static_cast<std::size_t>(f)];
  }

  static auto from(const document_metadata& meta) -> metadata_record;
};

/** \brief Check operand shapes and types for every condition in the tree.
 *
 * \return malformed_predicate naming the first offending condition.
 *
 * Rules: deprecated takes booleans, all other fields take strings; $in/$nin take a
 * list; other operators take a scalar; $contains applies to string fields only.
 */
auto validate(const filter_expr& expr) -> std::expected<void, core::error>;

/** \brief Evaluate whether a record satisfies the expression.
 *
 * and([]) == true, or([]) == false. Expects a validated expression; a mistyped
 * operand never matches a positive comparator.
 */
auto matches(const filter_expr& expr, const metadata_record& record) -> bool;

} // namespace hybridkb::filter_eval
