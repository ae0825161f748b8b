#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <cstdlib>

namespace hybridkb::core {

// Cross-platform safe getenv wrapper.
// - Windows: uses _dupenv_s and frees the allocated buffer
// - POSIX/others: uses std::getenv (read-only)
// Returns std::nullopt if the variable is not set. If set but empty, returns an
// engaged optional with an empty string.
inline std::optional<std::string> safe_getenv(const char* name) noexcept {
    if (name == nullptr || *name == '\0') return std::nullopt;
#if defined(_WIN32)
    char* buf = nullptr;
    size_t len = 0;
    const errno_t err = _dupenv_s(&buf, &len, name);
    if (err != 0 || buf == nullptr) {
        if (buf) std::free(buf);
        return std::nullopt;
    }
    std::string value(buf);
    std::free(buf);
    return value;
#else
    const char* v = std::getenv(name);
    if (!v) return std::nullopt;
    return std::string(v);
#endif
}

// Set and non-empty, otherwise nullopt. Empty variables count as "not configured".
inline std::optional<std::string> getenv_nonempty(const char* key) noexcept {
    auto v = safe_getenv(key);
    if (v && !v->empty()) return v;
    return std::nullopt;
}

// Case-insensitive boolean flag: 1/0, true/false, yes/no, on/off.
// Anything else is nullopt so callers can report the bad value.
inline std::optional<bool> parse_bool_ci(std::string_view s) noexcept {
    auto eq_ci = [](std::string_view a, std::string_view b) {
        if (a.size() != b.size()) return false;
        for (std::size_t i = 0; i < a.size(); ++i) {
            char c = a[i];
            if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
            if (c != b[i]) return false;
        }
        return true;
    };
    if (eq_ci(s, "1") || eq_ci(s, "true") || eq_ci(s, "yes") || eq_ci(s, "on")) return true;
    if (eq_ci(s, "0") || eq_ci(s, "false") || eq_ci(s, "no") || eq_ci(s, "off")) return false;
    return std::nullopt;
}

} // namespace hybridkb::core
