#include <catch2/catch_all.hpp>
#include <cf/constraints.h>
#include <cf/validate.h>

#include <limits>

using namespace cf;

namespace {
std::vector<CompiledConstraint> compiled(const Constraints& c) {
    std::vector<CompiledConstraint> out;
    for (auto const& item : c.items()) out.push_back(compile_constraint(item));
    return out;
}
}  // namespace

TEST_CASE("Numeric bounds", "[constraints]") {
    auto rules = compiled(Constraints().ge(0).lt(10));
    REQUIRE(check_constraints(Value(0), rules, FieldPath("n")).empty());
    REQUIRE(check_constraints(Value(9.5), rules, FieldPath("n")).empty());

    auto low = check_constraints(Value(-1), rules, FieldPath("n"));
    REQUIRE(low.size() == 1);
    REQUIRE(low[0].kind == ErrorKind::CONSTRAINT_VIOLATION);
    REQUIRE(low[0].code == "greater_than_equal");
    REQUIRE(low[0].message == "ensure this value is greater than or equal to 0");

    auto high = check_constraints(Value(10), rules, FieldPath("n"));
    REQUIRE(high.size() == 1);
    REQUIRE(high[0].code == "less_than");
    REQUIRE(high[0].message == "ensure this value is less than 10");
}

TEST_CASE("Every violated constraint is reported in declaration order", "[constraints]") {
    auto rules = compiled(Constraints().gt(100).multiple_of(7).le(50));
    auto errors = check_constraints(Value(60), rules, FieldPath("n"));
    REQUIRE(errors.size() == 3);
    REQUIRE(errors[0].code == "greater_than");
    REQUIRE(errors[1].code == "multiple_of");
    REQUIRE(errors[2].code == "less_than_equal");
}

TEST_CASE("multiple_of on doubles tolerates representation error", "[constraints]") {
    auto rules = compiled(Constraints().multiple_of(0.1));
    REQUIRE(check_constraints(Value(0.3), rules, FieldPath("x")).empty());
    REQUIRE(check_constraints(Value(1.2), rules, FieldPath("x")).empty());
    REQUIRE(check_constraints(Value(0.35), rules, FieldPath("x")).size() == 1);

    auto ints = compiled(Constraints().multiple_of(5));
    REQUIRE(check_constraints(Value(25), ints, FieldPath("x")).empty());
    REQUIRE(check_constraints(Value(-10), ints, FieldPath("x")).empty());
    REQUIRE(check_constraints(Value(26), ints, FieldPath("x")).size() == 1);
}

TEST_CASE("Length counts code points, elements and entries", "[constraints]") {
    auto rules = compiled(Constraints().min_length(2).max_length(3));
    REQUIRE(check_constraints(Value("h\xC3\xA9"), rules, FieldPath("s")).empty());
    REQUIRE(utf8_length("h\xC3\xA9llo") == 5);

    auto short_text = check_constraints(Value("x"), rules, FieldPath("s"));
    REQUIRE(short_text.size() == 1);
    REQUIRE(short_text[0].code == "too_short");
    REQUIRE(short_text[0].message == "ensure this value has at least 2 characters");

    auto long_list = check_constraints(Value::array({1, 2, 3, 4}), rules, FieldPath("s"));
    REQUIRE(long_list.size() == 1);
    REQUIRE(long_list[0].code == "too_long");
    REQUIRE(long_list[0].message == "ensure this value has at most 3 items");

    REQUIRE(check_constraints(Value{{"a", 1}, {"b", 2}}, rules, FieldPath("s")).empty());
}

TEST_CASE("Pattern is a whole-string match", "[constraints]") {
    auto rules = compiled(Constraints().pattern("[a-z]+"));
    REQUIRE(check_constraints(Value("abc"), rules, FieldPath("p")).empty());
    auto errors = check_constraints(Value("abc1"), rules, FieldPath("p"));
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].code == "pattern_mismatch");
    REQUIRE(errors[0].message == "string does not match pattern '[a-z]+'");
}

TEST_CASE("Temporal bounds compare chronologically", "[constraints][temporal]") {
    auto rules = compiled(Constraints().ge(Value(*parse_iso_date("2020-01-01"))));
    REQUIRE(check_constraints(Value(*parse_iso_date("2021-06-01")), rules, FieldPath("d")).empty());
    auto errors = check_constraints(Value(*parse_iso_date("2019-12-31")), rules, FieldPath("d"));
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].message == "ensure this value is greater than or equal to 2020-01-01");
}

TEST_CASE("Constraint applicability depends on the declared type", "[constraints]") {
    Constraint pattern;
    pattern.kind = Constraint::Pattern;
    pattern.pattern = "x";
    REQUIRE(constraint_applies(pattern, Type::string()));
    REQUIRE(constraint_applies(pattern, Type::optional(Type::string())));
    REQUIRE_FALSE(constraint_applies(pattern, Type::integer()));

    Constraint ge;
    ge.kind = Constraint::GreaterEqual;
    ge.bound = Value(1);
    REQUIRE(constraint_applies(ge, Type::number()));
    REQUIRE_FALSE(constraint_applies(ge, Type::string()));
    REQUIRE_FALSE(constraint_applies(ge, Type::date()));
    REQUIRE(constraint_applies(ge, Type::union_of({Type::integer(), Type::string()})));
}

TEST_CASE("Bad constraints are compile errors", "[constraints][compile]") {
    SECTION("pattern on an integer field") {
        auto s = make_schema(Schema("Bad").field(FieldSpec("n", Type::integer()).constraints(Constraints().pattern("\\d+"))));
        REQUIRE_THROWS_AS(compile(s), CompileError);
        REQUIRE_THROWS_WITH(compile(s), Catch::Matchers::ContainsSubstring("cannot apply to field 'n'"));
    }
    SECTION("invalid regular expression") {
        auto s = make_schema(Schema("Bad").field(FieldSpec("s", Type::string()).constraints(Constraints().pattern("(unclosed"))));
        REQUIRE_THROWS_WITH(compile(s), Catch::Matchers::ContainsSubstring("invalid pattern '(unclosed'"));
    }
    SECTION("zero divisor") {
        auto s = make_schema(Schema("Bad").field(FieldSpec("n", Type::integer()).constraints(Constraints().multiple_of(0))));
        REQUIRE_THROWS_AS(compile(s), CompileError);
    }
}

TEST_CASE("Constraints run after coercion and are skipped for null", "[constraints][validate]") {
    auto s = make_schema(Schema("Item")
                             .field(FieldSpec("qty", Type::integer()).constraints(Constraints().ge(1)))
                             .field(FieldSpec("note", Type::optional(Type::string())).constraints(Constraints().min_length(3))));
    auto ok = validate(s, Value{{"qty", "4"}, {"note", Value()}});
    REQUIRE(ok.is_valid());
    REQUIRE(ok.record().getInt("qty") == 4);

    auto bad = validate(s, Value{{"qty", "0"}, {"note", "hi"}});
    REQUIRE(bad.error_count() == 2);
    REQUIRE(bad.errors()[0].code == "greater_than_equal");
    REQUIRE(bad.errors()[0].input->asInt() == 0);
    REQUIRE(bad.errors()[1].code == "too_short");
}

TEST_CASE("multiple_of by one or minus one accepts every integer", "[constraints]") {
    const int64_t lowest = std::numeric_limits<int64_t>::min();
    for (int divisor : {1, -1}) {
        auto rules = compiled(Constraints().multiple_of(divisor));
        REQUIRE(check_constraints(Value(lowest), rules, FieldPath("n")).empty());
        REQUIRE(check_constraints(Value(int64_t(7)), rules, FieldPath("n")).empty());
    }

    auto s = make_schema(Schema("Counter").field(
        FieldSpec("n", Type::integer()).constraints(Constraints().multiple_of(Value(-1)))));
    auto result = validate(s, Value{{"n", "-9223372036854775808"}});
    REQUIRE(result.is_valid());
    REQUIRE(result.record().getInt("n") == lowest);
}

TEST_CASE("Integers are compared exactly against double bounds", "[constraints]") {
    const int64_t above = 9007199254740993;  // 2^53 + 1, not representable as a double
    auto le = compiled(Constraints().le(9007199254740992.0));
    auto errors = check_constraints(Value(above), le, FieldPath("n"));
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].code == "less_than_equal");
    REQUIRE(check_constraints(Value(above - 1), le, FieldPath("n")).empty());

    auto gt = compiled(Constraints().gt(2.5));
    REQUIRE(check_constraints(Value(3), gt, FieldPath("n")).empty());
    REQUIRE(check_constraints(Value(2), gt, FieldPath("n")).size() == 1);

    auto huge = compiled(Constraints().lt(1e19).gt(-1e19));
    REQUIRE(check_constraints(Value(std::numeric_limits<int64_t>::max()), huge, FieldPath("n")).empty());
    REQUIRE(check_constraints(Value(std::numeric_limits<int64_t>::min()), huge, FieldPath("n")).empty());
}

TEST_CASE("Overlong strings are not matched against a pattern", "[constraints][pattern]") {
    auto rules = compiled(Constraints().pattern("[a-z]+"));
    REQUIRE(check_constraints(Value(std::string(2048, 'a')), rules, FieldPath("s")).empty());

    auto errors = check_constraints(Value(std::string(100000, 'a')), rules, FieldPath("s"));
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].kind == ErrorKind::CONSTRAINT_VIOLATION);
    REQUIRE(errors[0].code == "pattern_input_too_long");

    auto alternation = compiled(Constraints().pattern("(a|b)*"));
    REQUIRE(check_constraints(Value(std::string(200000, 'b')), alternation, FieldPath("s")).size() == 1);
}
