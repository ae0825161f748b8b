#include "hybridkb/config.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <optional>
#include <string_view>

#include <spdlog/spdlog.h>

#include "hybridkb/core/platform_utils.hpp"

namespace hybridkb {

namespace {

constexpr const char* kComponent = "config";

struct level_name {
    std::string_view name;
    spdlog::level::level_enum level;
};

constexpr std::array<level_name, 9> kLevels{{
    {"trace", spdlog::level::trace},
    {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},
    {"warning", spdlog::level::warn},
    {"err", spdlog::level::err},
    {"error", spdlog::level::err},
    {"critical", spdlog::level::critical},
    {"off", spdlog::level::off},
}};

auto find_level(std::string_view name) -> std::optional<spdlog::level::level_enum> {
    for (const auto& l : kLevels) {
        if (l.name == name) return l.level;
    }
    return std::nullopt;
}

template <typename T>
auto parse_number(std::string_view s) -> std::optional<T> {
    T value{};
    const char* first = s.data();
    const char* last = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) return std::nullopt;
    return value;
}

auto bad_env(const char* key, const std::string& value) -> std::unexpected<core::error> {
    return core::make_error(core::error_code::config_invalid,
                            std::string(key) + " has unparsable value '" + value + "'",
                            kComponent);
}

} // namespace

auto validate(const retrieval_config& cfg) -> std::expected<void, core::error> {
    if (cfg.default_top_k == 0) {
        return core::make_error(core::error_code::config_invalid,
                                "default_top_k must be at least 1", kComponent);
    }
    if (!std::isfinite(cfg.rrf_k) || cfg.rrf_k < 0.0) {
        return core::make_error(core::error_code::config_invalid,
                                "rrf_k must be finite and non-negative", kComponent);
    }
    if (cfg.dense_timeout.count() < 0) {
        return core::make_error(core::error_code::config_invalid,
                                "dense_timeout must not be negative", kComponent);
    }
    if (!find_level(cfg.log_level)) {
        return core::make_error(core::error_code::config_invalid,
                                "unknown log level '" + cfg.log_level + "'", kComponent);
    }
    return {};
}

auto load_config_from_env(retrieval_config base)
    -> std::expected<retrieval_config, core::error> {
    using core::getenv_nonempty;

    if (auto v = getenv_nonempty("HYBRIDKB_TOP_K")) {
        auto n = parse_number<std::uint32_t>(*v);
        if (!n) return bad_env("HYBRIDKB_TOP_K", *v);
        base.default_top_k = *n;
    }
    if (auto v = getenv_nonempty("HYBRIDKB_RRF_K")) {
        auto k = parse_number<double>(*v);
        if (!k) return bad_env("HYBRIDKB_RRF_K", *v);
        base.rrf_k = *k;
    }
    if (auto v = getenv_nonempty("HYBRIDKB_DENSE_TIMEOUT_MS")) {
        auto ms = parse_number<std::int64_t>(*v);
        if (!ms) return bad_env("HYBRIDKB_DENSE_TIMEOUT_MS", *v);
        base.dense_timeout = std::chrono::milliseconds(*ms);
    }
    if (auto v = getenv_nonempty("HYBRIDKB_PARALLEL_BRANCHES")) {
        auto flag = core::parse_bool_ci(*v);
        if (!flag) return bad_env("HYBRIDKB_PARALLEL_BRANCHES", *v);
        base.parallel_branches = *flag;
    }
    if (auto v = getenv_nonempty("HYBRIDKB_LOG_LEVEL")) {
        base.log_level = *v;
    }
    if (auto v = getenv_nonempty("HYBRIDKB_CORPUS_PATH")) {
        base.corpus_path = *v;
    }

    if (auto ok = validate(base); !ok) {
        return std::unexpected(ok.error());
    }
    return base;
}

auto apply_log_level(const retrieval_config& cfg) -> std::expected<void, core::error> {
    auto level = find_level(cfg.log_level);
    if (!level) {
        return core::make_error(core::error_code::config_invalid,
                                "unknown log level '" + cfg.log_level + "'", kComponent);
    }
    spdlog::set_level(*level);
    return {};
}

} // namespace hybridkb
