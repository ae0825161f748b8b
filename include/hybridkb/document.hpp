#pragma once

/** \file document.hpp
 *  \brief Knowledge-base documents and the display-ready result record.
 *
 * Ownership: value-semantic. Documents are immutable once handed to a CorpusIndex.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hybridkb {

/** \brief Structured metadata of one article. Unset optionals are absent fields. */
struct document_metadata {
  std::optional<std::string> region;           /**< EU | US | APAC */
  std::optional<std::string> product_version;  /**< v1.0 | v2.0 | v3.0 */
  std::optional<std::string> category;         /**< authentication | billing | deployment | networking */
  std::optional<bool> deprecated;
  std::optional<std::string> effective_date;   /**< ISO-8601 YYYY-MM-DD */
  std::vector<std::string> error_codes;        /**< ordered E-#### codes */
};

/** \brief One corpus record. */
struct document {
  std::string doc_id; /**< unique, stable */
  std::string title;
  std::string body;
  document_metadata metadata;
};

/** \brief Fields shown to the caller for a hit. Absent metadata renders as ""/false. */
struct display_fields {
  std::string title;
  std::string body;
  std::string region;
  std::string product_version;
  std::string category;
  bool deprecated{false};

  static auto from(const document& doc) -> display_fields;
};

/** \brief Final hit handed back by the orchestrator. */
struct result_record {
  std::string doc_id;
  display_fields fields;
  double score{0.0};    /**< fused RRF score */
  std::uint32_t rank{0};
};

/** \brief Error codes joined with ',' in stored order (the flattened filter view). */
auto join_error_codes(const std::vector<std::string>& codes) -> std::string;

} // namespace hybridkb
