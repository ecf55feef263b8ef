#include <catch2/catch_all.hpp>
#include <cf/value.h>

using namespace cf;
using Catch::Approx;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("Value keeps object keys in insertion order", "[value]") {
    Value v = Value::object();
    v["zeta"] = 1;
    v["alpha"] = 2;
    v["mid"] = 3;
    auto keys = v.keys();
    REQUIRE(keys.size() == 3);
    REQUIRE(keys[0] == "zeta");
    REQUIRE(keys[1] == "alpha");
    REQUIRE(keys[2] == "mid");

    v["zeta"] = 10;
    REQUIRE(v.keys()[0] == "zeta");
    REQUIRE(v.at("zeta").asInt() == 10);
}

TEST_CASE("Value copies are deep", "[value]") {
    Value original{{"tags", Value::array({"a", "b"})}, {"nested", Value{{"x", 1}}}};
    Value copy = original;
    copy["tags"].push_back("c");
    copy["nested"]["x"] = 2;

    REQUIRE(original.at("tags").size() == 2);
    REQUIRE(original.at("nested").at("x").asInt() == 1);
    REQUIRE(copy.at("tags").size() == 3);
    REQUIRE(copy.at("nested").at("x").asInt() == 2);
}

TEST_CASE("Object equality ignores key order", "[value]") {
    Value a{{"x", 1}, {"y", "two"}};
    Value b{{"y", "two"}, {"x", 1}};
    REQUIRE(a == b);
    b["x"] = 2;
    REQUIRE(a != b);
    REQUIRE(Value(1) != Value(1.0));
}

TEST_CASE("Value accessors throw on the wrong kind", "[value]") {
    Value s("text");
    REQUIRE(s.isString());
    REQUIRE_THROWS_AS(s.asInt(), std::runtime_error);
    REQUIRE_THROWS_AS(s.asBool(), std::runtime_error);

    Value i(int64_t(7));
    REQUIRE(i.asDouble() == Approx(7.0));
    REQUIRE_THROWS_AS(i.asString(), std::runtime_error);
}

TEST_CASE("Missing object key lists the available keys", "[value]") {
    Value v{{"host", "localhost"}, {"port", 8080}};
    REQUIRE_THROWS_AS(v.at("hots"), std::out_of_range);
    REQUIRE_THROWS_WITH(v.at("hots"), ContainsSubstring("\"host\"") && ContainsSubstring("\"port\""));
}

TEST_CASE("Array access is bounds checked", "[value]") {
    Value arr = Value::array({1, 2, 3});
    REQUIRE(arr.size() == 3);
    REQUIRE(arr[1].asInt() == 2);
    REQUIRE_THROWS_AS(arr.at(3), std::out_of_range);
    REQUIRE_THROWS_AS(arr.at(-1), std::out_of_range);
}

TEST_CASE("Value dump renders compact JSON", "[value]") {
    Value v{{"name", "Ada"}, {"age", 36}, {"tags", Value::array({"x"})}, {"none", Value()}};
    REQUIRE(v.dump() == R"({"name":"Ada","age":36,"tags":["x"],"none":null})");
    REQUIRE(Value("quote\"d").dump() == R"("quote\"d")");
    REQUIRE(Value(true).to_string() == "true");
    REQUIRE(Value("plain").to_string() == "plain");
}

TEST_CASE("Value pretty dump indents nested containers", "[value]") {
    Value v{{"a", Value::array({1, 2})}};
    std::string expected = "{\n  \"a\": [\n    1,\n    2\n  ]\n}";
    REQUIRE(v.dump(2) == expected);
}

TEST_CASE("ISO dates are parsed with calendar checks", "[value][temporal]") {
    auto d = parse_iso_date("2024-02-29");
    REQUIRE(d.has_value());
    REQUIRE(d->year == 2024);
    REQUIRE(d->month == 2);
    REQUIRE(d->day == 29);
    REQUIRE(d->to_string() == "2024-02-29");

    REQUIRE_FALSE(parse_iso_date("2023-02-29").has_value());
    REQUIRE_FALSE(parse_iso_date("2024-13-01").has_value());
    REQUIRE_FALSE(parse_iso_date("2024-1-01").has_value());
    REQUIRE_FALSE(parse_iso_date("2024-01-01x").has_value());
}

TEST_CASE("ISO times keep fractions and offsets", "[value][temporal]") {
    auto t = parse_iso_time("08:30");
    REQUIRE(t.has_value());
    REQUIRE(t->to_string() == "08:30:00");

    auto precise = parse_iso_time("23:59:59.250000+02:00");
    REQUIRE(precise.has_value());
    REQUIRE(precise->microsecond == 250000);
    REQUIRE(precise->has_offset);
    REQUIRE(precise->offset_minutes == 120);
    REQUIRE(precise->to_string() == "23:59:59.250000+02:00");

    auto utc = parse_iso_time("12:00:00Z");
    REQUIRE(utc.has_value());
    REQUIRE(utc->to_string() == "12:00:00Z");

    REQUIRE_FALSE(parse_iso_time("24:00").has_value());
    REQUIRE_FALSE(parse_iso_time("12:60").has_value());
}

TEST_CASE("ISO datetimes accept T or space separators", "[value][temporal]") {
    auto a = parse_iso_datetime("2024-05-01T10:00:00Z");
    auto b = parse_iso_datetime("2024-05-01 12:00:00+02:00");
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    REQUIRE(a->epoch_microseconds() == b->epoch_microseconds());
    REQUIRE(a->to_string() == "2024-05-01T10:00:00Z");
    REQUIRE_FALSE(parse_iso_datetime("2024-05-01").has_value());
}

TEST_CASE("Temporal values dump as ISO strings", "[value][temporal]") {
    Value d(*parse_iso_date("2020-01-02"));
    REQUIRE(d.isDate());
    REQUIRE(d.dump() == "\"2020-01-02\"");
    REQUIRE(d.typeString() == "date");
}
