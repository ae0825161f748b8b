#pragma once

/** \file corpus_loader.hpp
 *  \brief Load knowledge-base articles from their JSON file.
 *
 * Input: a JSON array of objects
 *   {doc_id, title, body, region, product_version, category, deprecated,
 *    effective_date, error_codes: [..]}
 * Order is preserved. Unknown keys are ignored. Missing or null metadata keys leave
 * the field absent; a missing error_codes is an empty list.
 *
 * Validation failures are reported as data_integrity naming the record; unreadable
 * files as io_failed.
 */

#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "hybridkb/document.hpp"
#include "hybridkb/error.hpp"

namespace hybridkb {

auto parse_documents(std::string_view json_text) -> std::expected<std::vector<document>, core::error>;

auto load_documents(const std::string& path) -> std::expected<std::vector<document>, core::error>;

/** \brief Check one document against the corpus vocabulary (regions, versions, ...). */
auto validate_document(const document& doc) -> std::expected<void, core::error>;

} // namespace hybridkb
