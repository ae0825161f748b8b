#include "hybridkb/document.hpp"

namespace hybridkb {

auto display_fields::from(const document& doc) -> display_fields {
  display_fields f;
  f.title = doc.title;
  f.body = doc.body;
  f.region = doc.metadata.region.value_or("");
  f.product_version = doc.metadata.product_version.value_or("");
  f.category = doc.metadata.category.value_or("");
  f.deprecated = doc.metadata.deprecated.value_or(false);
  return f;
}

auto join_error_codes(const std::vector<std::string>& codes) -> std::string {
  std::string out;
  for (std::size_t i = 0; i < codes.size(); ++i) {
    if (i > 0) out.push_back(',');
    out += codes[i];
  }
  return out;
}

} // namespace hybridkb
