#include <catch2/catch_all.hpp>
#include <cf/validate.h>

using namespace cf;

namespace {
std::shared_ptr<const Schema> signup_schema() {
    static auto schema = make_schema(
        Schema("Signup")
            .field(FieldSpec("password", Type::string()))
            .field(FieldSpec("confirm", Type::string()))
            .modelValidator(model_before("legacy_keys",
                                         [](const Value& data) {
                                             if (!data.has("pwd")) return Verdict::accept();
                                             Value reshaped = data;
                                             reshaped["password"] = data.at("pwd");
                                             reshaped.erase("pwd");
                                             return Verdict::replace(reshaped);
                                         }))
            .modelValidator(model_after("passwords_match", [](const Value& record) {
                if (record.at("password") != record.at("confirm")) return Verdict::reject("passwords do not match");
                return Verdict::accept();
            })));
    return schema;
}
}  // namespace

TEST_CASE("After-model validators see the complete record", "[model-validators]") {
    REQUIRE(validate(signup_schema(), Value{{"password", "s3cret"}, {"confirm", "s3cret"}}).is_valid());

    auto result = validate(signup_schema(), Value{{"password", "s3cret"}, {"confirm", "other"}});
    REQUIRE(result.error_count() == 1);
    REQUIRE(result.errors()[0].kind == ErrorKind::MODEL_REJECTION);
    REQUIRE(result.errors()[0].code == "passwords_match");
    REQUIRE(result.errors()[0].location() == "__root__");
    REQUIRE(result.errors()[0].message == "passwords do not match");
}

TEST_CASE("After-model validators are skipped when a field failed", "[model-validators]") {
    auto result = validate(signup_schema(), Value{{"password", 5}, {"confirm", "x"}});
    REQUIRE(result.error_count() == 1);
    REQUIRE(result.errors()[0].location() == "password");
}

TEST_CASE("Before-model validators may reshape the raw mapping", "[model-validators]") {
    auto result = validate(signup_schema(), Value{{"pwd", "abc"}, {"confirm", "abc"}});
    REQUIRE(result.is_valid());
    REQUIRE(result.record().getString("password") == "abc");
}

TEST_CASE("A before-model rejection stops validation", "[model-validators]") {
    int field_checks = 0;
    auto s = make_schema(Schema("Gate")
                             .field(FieldSpec("n", Type::integer()).check(after("count", [&field_checks](const Value&, const Siblings&) {
                                 ++field_checks;
                                 return Verdict::accept();
                             })))
                             .modelValidator(model_before("not_empty", [](const Value& data) {
                                 return data.empty() ? Verdict::reject("empty payload") : Verdict::accept();
                             })));
    auto result = validate(s, Value::object());
    REQUIRE(result.error_count() == 1);
    REQUIRE(result.errors()[0].kind == ErrorKind::MODEL_REJECTION);
    REQUIRE(result.errors()[0].message == "empty payload");
    REQUIRE(field_checks == 0);
}

TEST_CASE("A model validator must return a mapping", "[model-validators]") {
    auto s = make_schema(Schema("Shape")
                             .field(FieldSpec("n", Type::integer()))
                             .modelValidator(model_after("flatten", [](const Value& record) { return Verdict::replace(record.at("n")); })));
    auto result = validate(s, Value{{"n", 1}});
    REQUIRE(result.error_count() == 1);
    REQUIRE(result.errors()[0].message == "model validator must return a mapping, got integer");
}

TEST_CASE("After-model validators may replace the record", "[model-validators]") {
    auto s = make_schema(Schema("Range")
                             .field(FieldSpec("lo", Type::integer()))
                             .field(FieldSpec("hi", Type::integer()))
                             .modelValidator(model_after("ordered", [](const Value& record) {
                                 if (record.at("lo").asInt() <= record.at("hi").asInt()) return Verdict::accept();
                                 Value swapped = record;
                                 swapped["lo"] = record.at("hi");
                                 swapped["hi"] = record.at("lo");
                                 return Verdict::replace(swapped);
                             })));
    auto result = validate(s, Value{{"lo", 9}, {"hi", 2}});
    REQUIRE(result.is_valid());
    REQUIRE(result.record().getInt("lo") == 2);
    REQUIRE(result.record().getInt("hi") == 9);
}

TEST_CASE("Model errors in nested models carry the nested path", "[model-validators][nested]") {
    auto inner = make_schema(Schema("Pair")
                                 .field(FieldSpec("a", Type::integer()))
                                 .field(FieldSpec("b", Type::integer()))
                                 .modelValidator(model_after("distinct", [](const Value& r) {
                                     return r.at("a") == r.at("b") ? Verdict::reject("a and b must differ") : Verdict::accept();
                                 })));
    auto outer = make_schema(Schema("Pairs").field(FieldSpec("pairs", Type::list(Type::model(inner)))));
    auto result = validate(outer, Value{{"pairs", Value::array({Value{{"a", 1}, {"b", 2}}, Value{{"a", 3}, {"b", 3}}})}});
    REQUIRE(result.error_count() == 1);
    REQUIRE(result.errors()[0].location() == "pairs[1]");
    REQUIRE(result.errors()[0].kind == ErrorKind::MODEL_REJECTION);
}
