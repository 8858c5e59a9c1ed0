#include <catch2/catch_test_macros.hpp>
#include "core/utils.hpp"

using namespace sqlguard;

TEST_CASE("Utils: try_parse_int requires the whole string", "[utils]") {
    CHECK(utils::try_parse_int<uint64_t>("100") == 100u);
    CHECK_FALSE(utils::try_parse_int<uint64_t>("100x").has_value());
    CHECK_FALSE(utils::try_parse_int<uint64_t>("-1").has_value());
    CHECK_FALSE(utils::try_parse_int<uint64_t>("").has_value());
    CHECK(utils::try_parse_int<uint64_t>("18446744073709551616") == std::nullopt);
}

TEST_CASE("Utils: split_list trims and drops empty pieces", "[utils]") {
    CHECK(utils::split_list(" a, b,,c ,") == std::vector<std::string>{"a", "b", "c"});
    CHECK(utils::split_list("").empty());
    CHECK(utils::split_list("x|y", '|') == std::vector<std::string>{"x", "y"});
}

TEST_CASE("Utils: case helpers", "[utils]") {
    CHECK(utils::to_upper("Select") == "SELECT");
    CHECK(utils::to_lower("Public.Users") == "public.users");
    CHECK(utils::iequals("WaRn", "warn"));
    CHECK_FALSE(utils::iequals("warn", "warning"));
    CHECK(utils::trim("  \tx y\n") == "x y");
}

TEST_CASE("Utils: log level names", "[utils][log]") {
    CHECK(utils::log::parse_level("DEBUG") == utils::log::Level::DEBUG);
    CHECK(utils::log::parse_level("info") == utils::log::Level::INFO);
    CHECK(utils::log::parse_level("warning") == utils::log::Level::WARN);
    CHECK(utils::log::parse_level("error") == utils::log::Level::ERROR);
    CHECK_FALSE(utils::log::parse_level("trace").has_value());

    const auto saved = utils::log::get_level();
    utils::log::set_level(utils::log::Level::ERROR);
    CHECK(utils::log::get_level() == utils::log::Level::ERROR);
    utils::log::set_level(saved);
}

TEST_CASE("Utils: request ids are unique UUID-shaped strings", "[utils]") {
    const auto a = utils::generate_uuid();
    const auto b = utils::generate_uuid();
    CHECK(a.size() == 36);
    CHECK(a[8] == '-');
    CHECK(a != b);
}
