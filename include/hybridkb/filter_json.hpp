#pragma once

/** \file filter_json.hpp
 *  \brief JSON wire format of filter predicates.
 *
 * Accepted shapes:
 * - {"field": value}                      equality shorthand
 * - {"field": {"$op": value, ...}}        several operators are an implicit AND
 * - {"f1": ..., "f2": ...}                several fields are an implicit AND
 * - {"$and": [..]} / {"$or": [..]}        also "AND"/"and", "OR"/"or"
 * Operators may be written with or without '$'. An empty object or null means no filter.
 *
 * Anything else (unknown field or operator, mistyped operand, composite mixed with
 * field keys) is rejected with error_code::malformed_predicate.
 */

#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include <json/value.h>

#include "hybridkb/error.hpp"
#include "hybridkb/filter_expr.hpp"

namespace hybridkb::filter_json {

/** \brief Decode a predicate; nullopt means "no filter". */
auto parse_predicate(const Json::Value& value)
    -> std::expected<std::optional<filter_expr>, core::error>;

/** \brief Decode a predicate from JSON text. */
auto parse_predicate(std::string_view text)
    -> std::expected<std::optional<filter_expr>, core::error>;

/** \brief Canonical '$'-prefixed encoding, suitable for forwarding to a vector service. */
auto to_json(const filter_expr& expr) -> Json::Value;

/** \brief Compact single-line JSON, used in log lines. */
auto to_string(const filter_expr& expr) -> std::string;

/** \brief Convert the flat output of the natural-language filter extractor.
 *
 * Recognised keys: region, product_version, category (string equality) and deprecated
 * (boolean equality). An extracted error_codes value is not turned into a condition;
 * the code reaches ranking through the query text. Other keys and mistyped values are
 * skipped.
 *
 * \return nullopt when nothing usable was extracted.
 */
auto from_extracted_filters(const Json::Value& flat) -> std::optional<filter_expr>;

} // namespace hybridkb::filter_json
