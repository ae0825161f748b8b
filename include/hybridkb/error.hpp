#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling; values never change once published.
 * - Human-readable message and originating component for diagnostics.
 * - Degraded fallbacks (filters dropped to recover results) are not errors and never
 *   surface here; see search::SearchReport.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace hybridkb::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  io_failed = 1001,
  config_invalid = 2001,
  data_integrity = 3001,
  precondition_failed = 4001,
  malformed_predicate = 4002,   /**< unknown filter field/operator or mistyped operand */
  not_found = 6001,
  unavailable = 7001,           /**< vector search port failed after the retry */
  deadline_exceeded = 8002,     /**< vector search port timed out */
  internal = 9001,
  invalid_argument = 9002,
  index_unavailable = 9003,     /**< no corpus index installed */
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "search.hybrid" */
};

/** \brief Stable lowercase name of a code, suitable for logs and metrics labels. */
constexpr auto to_string(error_code ec) noexcept -> std::string_view {
  switch (ec) {
    case error_code::ok: return "ok";
    case error_code::io_failed: return "io_failed";
    case error_code::config_invalid: return "config_invalid";
    case error_code::data_integrity: return "data_integrity";
    case error_code::precondition_failed: return "precondition_failed";
    case error_code::malformed_predicate: return "malformed_predicate";
    case error_code::not_found: return "not_found";
    case error_code::unavailable: return "unavailable";
    case error_code::deadline_exceeded: return "deadline_exceeded";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
    case error_code::index_unavailable: return "index_unavailable";
  }
  return "unknown";
}

/** \brief Shorthand for building the unexpected branch of a std::expected. */
inline auto make_error(error_code code, std::string message, std::string component)
    -> std::unexpected<error> {
  return std::unexpected(error{code, std::move(message), std::move(component)});
}

} // namespace hybridkb::core
