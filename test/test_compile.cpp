#include <catch2/catch_all.hpp>
#include <cf/validate.h>

using namespace cf;
using Catch::Matchers::ContainsSubstring;

namespace {
FieldValidator reads(const std::string& name, std::vector<std::string> fields) {
    return after(name, [](const Value&, const Siblings&) { return Verdict::accept(); }, std::move(fields));
}
}  // namespace

TEST_CASE("compile is idempotent per schema instance", "[compile]") {
    auto s = make_schema(Schema("Point").field(FieldSpec("x", Type::integer())).field(FieldSpec("y", Type::integer())));
    auto first = compile(s);
    auto second = compile(s);
    REQUIRE(first.get() == second.get());
    REQUIRE(PlanCache::global().find(s.get()) == first);

    PlanCompiler fresh;
    auto third = fresh.compile(s);
    REQUIRE(third.get() != first.get());
    REQUIRE(third->executionOrderNames() == first->executionOrderNames());
}

TEST_CASE("The plan cache does not keep released schemas alive", "[compile][cache]") {
    const size_t before = PlanCache::global().size();
    std::weak_ptr<const Schema> last;
    for (int i = 0; i < 100; ++i) {
        auto s = make_schema(Schema("Temp").field(FieldSpec("n", Type::integer())));
        REQUIRE(validate(s, Value{{"n", i}}).is_valid());
        last = s;
    }
    REQUIRE(last.expired());
    REQUIRE(PlanCache::global().size() == before);

    auto kept = make_schema(Schema("Kept").field(FieldSpec("n", Type::integer())));
    auto plan = compile(kept);
    REQUIRE(PlanCache::global().size() == before + 1);
    REQUIRE(PlanCache::global().find(kept.get()) == plan);
}

TEST_CASE("Plans expose fields in declaration order", "[compile]") {
    auto s = make_schema(Schema("User")
                             .field(FieldSpec("id", Type::integer()))
                             .field(FieldSpec("email", Type::string()).alias("emailAddress"))
                             .field(FieldSpec("nick", Type::optional(Type::string()))));
    auto plan = compile(s);
    REQUIRE(plan->schemaName() == "User");
    REQUIRE(plan->fields().size() == 3);
    REQUIRE(plan->fields()[1].alias == "emailAddress");
    REQUIRE(plan->fields()[0].required);
    REQUIRE_FALSE(plan->fields()[2].required);
    REQUIRE(plan->findField("email") != nullptr);
    REQUIRE(plan->findField("missing") == nullptr);
}

TEST_CASE("Execution order follows validator dependencies", "[compile][order]") {
    auto s = make_schema(Schema("Booking")
                             .field(FieldSpec("end", Type::date()).check(reads("after_start", {"start"})))
                             .field(FieldSpec("nights", Type::integer()).check(reads("fits", {"end"})))
                             .field(FieldSpec("start", Type::date())));
    auto plan = compile(s);
    std::vector<std::string> expected = {"start", "end", "nights"};
    REQUIRE(plan->executionOrderNames() == expected);
}

TEST_CASE("Independent fields keep declaration order", "[compile][order]") {
    auto s = make_schema(Schema("Flat")
                             .field(FieldSpec("c", Type::any()))
                             .field(FieldSpec("a", Type::any()))
                             .field(FieldSpec("b", Type::any()).defaultTo(Default::dependent({"c"}, [](const Siblings& sib) {
                                 return sib["c"];
                             }))));
    std::vector<std::string> expected = {"c", "a", "b"};
    REQUIRE(compile(s)->executionOrderNames() == expected);
}

TEST_CASE("Definition errors are reported at compile time", "[compile][errors]") {
    SECTION("dependency cycle lists the cycle") {
        auto s = make_schema(Schema("Loop")
                                 .field(FieldSpec("a", Type::integer()).check(reads("needs_b", {"b"})))
                                 .field(FieldSpec("b", Type::integer()).check(reads("needs_a", {"a"}))));
        REQUIRE_THROWS_AS(compile(s), CompileError);
        REQUIRE_THROWS_WITH(compile(s), ContainsSubstring("validator dependency cycle: a -> b -> a"));
    }
    SECTION("duplicate field") {
        auto s = make_schema(Schema("Dup").field(FieldSpec("a", Type::integer())).field(FieldSpec("a", Type::string())));
        REQUIRE_THROWS_WITH(compile(s), ContainsSubstring("duplicate field 'a'"));
    }
    SECTION("validator targets an unknown field") {
        auto s = make_schema(Schema("Lost").field(FieldSpec("a", Type::integer())).validator("b", reads("check", {})));
        REQUIRE_THROWS_WITH(compile(s), ContainsSubstring("targets unknown field 'b'"));
    }
    SECTION("validator reads an unknown field") {
        auto s = make_schema(Schema("Lost").field(FieldSpec("a", Type::integer()).check(reads("check", {"zz"}))));
        REQUIRE_THROWS_WITH(compile(s), ContainsSubstring("reads unknown field 'zz'"));
    }
    SECTION("validator reads its own field") {
        auto s = make_schema(Schema("Self").field(FieldSpec("a", Type::integer()).check(reads("check", {"a"}))));
        REQUIRE_THROWS_WITH(compile(s), ContainsSubstring("reads its own field"));
    }
    SECTION("validator without a function") {
        auto s = make_schema(Schema("Empty").field(FieldSpec("a", Type::integer()).check(FieldValidator{"nothing", HookMode::After, {}, nullptr})));
        REQUIRE_THROWS_WITH(compile(s), ContainsSubstring("has no function"));
    }
    SECTION("alias clashes with another field") {
        auto s = make_schema(Schema("Clash")
                                 .field(FieldSpec("a", Type::integer()))
                                 .field(FieldSpec("b", Type::integer()).alias("a")));
        REQUIRE_THROWS_WITH(compile(s), ContainsSubstring("input key 'a' used by both 'a' and 'b'"));
    }
    SECTION("the error names the schema") {
        auto s = make_schema(Schema("Named").field(FieldSpec("", Type::integer())));
        try {
            compile(s);
            FAIL("expected a CompileError");
        } catch (const CompileError& e) {
            REQUIRE(e.schema() == "Named");
            REQUIRE(std::string(e.what()).find("schema 'Named'") == 0);
        }
    }
}

TEST_CASE("Inheritance merges parents before the child", "[compile][inheritance]") {
    auto base = make_schema(Schema("Base")
                                .field(FieldSpec("id", Type::integer()))
                                .field(FieldSpec("name", Type::string()).check(after("strip", [](const Value& v, const Siblings&) {
                                    return Verdict::replace(Value(v.asString() + "!"));
                                })))
                                .extra(ExtraPolicy::Forbid));
    auto audit = make_schema(Schema("Audit").field(FieldSpec("created", Type::date())));

    SECTION("fields keep inherited order and children append") {
        auto child = make_schema(Schema("Child").extends(base).extends(audit).field(FieldSpec("extra_note", Type::string())));
        auto plan = compile(child);
        std::vector<std::string> expected = {"id", "name", "created", "extra_note"};
        REQUIRE(plan->executionOrderNames() == expected);
        REQUIRE(plan->config().extra == ExtraPolicy::Forbid);
    }
    SECTION("an override keeps its position and drops inherited validators") {
        auto child = make_schema(Schema("Child").extends(base).field(FieldSpec("name", Type::optional(Type::string()))));
        auto plan = compile(child);
        REQUIRE(plan->fields()[1].name == "name");
        REQUIRE(plan->fields()[1].type.isOptional());
        REQUIRE(plan->fields()[1].after.empty());

        auto result = plan->validate(Value{{"id", 1}, {"name", "x"}});
        REQUIRE(result.is_valid());
        REQUIRE(result.record().getString("name") == "x");
    }
    SECTION("inherited validators run parent first") {
        auto child = make_schema(Schema("Child").extends(base).validator(
            "name", after("suffix", [](const Value& v, const Siblings&) { return Verdict::replace(Value(v.asString() + "?")); })));
        auto result = validate(child, Value{{"id", 1}, {"name", "x"}});
        REQUIRE(result.is_valid());
        REQUIRE(result.record().getString("name") == "x!?");
    }
    SECTION("config settings merge one by one") {
        auto child = make_schema(Schema("Child").extends(base).populateByName(true));
        auto plan = compile(child);
        REQUIRE(plan->config().extra == ExtraPolicy::Forbid);
        REQUIRE(plan->config().populate_by_name);
    }
    SECTION("a shared ancestor is merged once") {
        auto left = make_schema(Schema("Left").extends(base).field(FieldSpec("l", Type::integer())));
        auto right = make_schema(Schema("Right").extends(base).field(FieldSpec("r", Type::integer())));
        auto both = make_schema(Schema("Both").extends(left).extends(right));
        std::vector<std::string> expected = {"id", "name", "l", "r"};
        REQUIRE(compile(both)->executionOrderNames() == expected);
    }
}

TEST_CASE("Recursive model references must use self", "[compile][nested]") {
    auto leaf = make_schema(Schema("Leaf").field(FieldSpec("v", Type::integer())));
    auto tree = make_schema(Schema("Tree")
                                .field(FieldSpec("leaf", Type::model(leaf)))
                                .field(FieldSpec("children", Type::list(Type::self())).defaultTo(Value::array())));
    auto plan = compile(tree);
    REQUIRE(&plan->planFor(Type::self()) == plan.get());
    REQUIRE(&plan->planFor(Type::model(leaf)) == compile(leaf).get());
}
