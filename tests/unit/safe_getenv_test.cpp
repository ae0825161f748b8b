#include <catch2/catch_test_macros.hpp>
#include <optional>
#include <string>
#include "hybridkb/core/platform_utils.hpp"

#include <cstdlib>

using hybridkb::core::getenv_nonempty;
using hybridkb::core::parse_bool_ci;
using hybridkb::core::safe_getenv;

static void set_env_var(const char* name, const char* value) {
#if defined(_WIN32)
    _putenv_s(name, value ? value : "");
#else
    if (value) setenv(name, value, 1); else unsetenv(name);
#endif
}

static void unset_env_var(const char* name) {
#if defined(_WIN32)
    _putenv_s(name, "");
#else
    unsetenv(name);
#endif
}

TEST_CASE("safe_getenv returns nullopt when unset", "[platform][env]") {
    const char* key = "HYBRIDKB_TEST_SAFE_GETENV_UNSET";
    unset_env_var(key);
    auto v = safe_getenv(key);
    REQUIRE_FALSE(v.has_value());
}

TEST_CASE("safe_getenv returns value when set", "[platform][env]") {
    const char* key = "HYBRIDKB_TEST_SAFE_GETENV_VALUE";
    set_env_var(key, "hello_world");
    auto v = safe_getenv(key);
    REQUIRE(v.has_value());
    REQUIRE(*v == std::string("hello_world"));
    unset_env_var(key);
}

TEST_CASE("getenv_nonempty treats empty as unset", "[platform][env]") {
    const char* key = "HYBRIDKB_TEST_GETENV_EMPTY";
    set_env_var(key, "");
    REQUIRE_FALSE(getenv_nonempty(key).has_value());
    set_env_var(key, "x");
    REQUIRE(getenv_nonempty(key) == std::optional<std::string>("x"));
    unset_env_var(key);
}

TEST_CASE("safe_getenv rejects null and empty names", "[platform][env]") {
    REQUIRE_FALSE(safe_getenv(nullptr).has_value());
    REQUIRE_FALSE(safe_getenv("").has_value());
}

TEST_CASE("parse_bool_ci accepts common spellings", "[platform][env]") {
    REQUIRE(parse_bool_ci("1") == std::optional<bool>(true));
    REQUIRE(parse_bool_ci("TRUE") == std::optional<bool>(true));
    REQUIRE(parse_bool_ci("Yes") == std::optional<bool>(true));
    REQUIRE(parse_bool_ci("on") == std::optional<bool>(true));
    REQUIRE(parse_bool_ci("0") == std::optional<bool>(false));
    REQUIRE(parse_bool_ci("False") == std::optional<bool>(false));
    REQUIRE(parse_bool_ci("no") == std::optional<bool>(false));
    REQUIRE(parse_bool_ci("OFF") == std::optional<bool>(false));
    REQUIRE_FALSE(parse_bool_ci("maybe").has_value());
    REQUIRE_FALSE(parse_bool_ci("").has_value());
}
