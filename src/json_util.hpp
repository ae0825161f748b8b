#pragma once

// Internal helpers shared by the JSON-reading modules (corpus, predicates, eval sets).

#include <expected>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>

#include <json/json.h>

#include "hybridkb/error.hpp"

namespace hybridkb::detail {

// Strict parse: trailing garbage and duplicate keys are rejected.
inline auto parse_json_text(std::string_view text, core::error_code on_error, const char* component)
    -> std::expected<Json::Value, core::error> {
    Json::CharReaderBuilder builder;
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    builder["allowSpecialFloats"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errs;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs)) {
        return core::make_error(on_error, "invalid JSON: " + errs, component);
    }
    return root;
}

inline auto read_text_file(const std::string& path, const char* component)
    -> std::expected<std::string, core::error> {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return core::make_error(core::error_code::io_failed, "cannot open " + path, component);
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    if (in.bad()) {
        return core::make_error(core::error_code::io_failed, "read failed for " + path, component);
    }
    return buf.str();
}

inline auto to_compact_string(const Json::Value& v) -> std::string {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, v);
}

} // namespace hybridkb::detail
