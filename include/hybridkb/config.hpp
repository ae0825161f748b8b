#pragma once

/** \file config.hpp
 *  \brief Retrieval configuration: defaults, environment overrides, validation.
 *
 * Environment variables (all optional; unset or empty leaves the base value):
 * - HYBRIDKB_TOP_K               default result count (integer >= 1)
 * - HYBRIDKB_RRF_K               reciprocal rank fusion constant (finite, >= 0)
 * - HYBRIDKB_DENSE_TIMEOUT_MS    vector port deadline in ms, 0 disables
 * - HYBRIDKB_PARALLEL_BRANCHES   run dense and sparse branches concurrently (bool)
 * - HYBRIDKB_LOG_LEVEL           spdlog level name (trace, debug, info, warn, error, critical, off)
 * - HYBRIDKB_CORPUS_PATH         JSON corpus file
 */

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>

#include "hybridkb/error.hpp"

namespace hybridkb {

struct retrieval_config {
  std::uint32_t default_top_k{5};
  double rrf_k{60.0};
  std::chrono::milliseconds dense_timeout{10000};
  bool parallel_branches{false};
  std::string log_level{"info"};
  std::string corpus_path{"data/kb_articles.json"};
};

/** \brief Check value ranges; returns config_invalid naming the first bad field. */
auto validate(const retrieval_config& cfg) -> std::expected<void, core::error>;

/** \brief Overlay HYBRIDKB_* environment variables onto \p base, then validate.
 *
 * Unparsable values are reported, never ignored.
 */
auto load_config_from_env(retrieval_config base = {})
    -> std::expected<retrieval_config, core::error>;

/** \brief Apply cfg.log_level to the spdlog default logger. */
auto apply_log_level(const retrieval_config& cfg) -> std::expected<void, core::error>;

} // namespace hybridkb
