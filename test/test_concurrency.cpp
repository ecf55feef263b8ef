#include <catch2/catch_all.hpp>
#include <cf/validate.h>

#include <atomic>
#include <thread>
#include <vector>

using namespace cf;

TEST_CASE("Concurrent compiles of one schema share a single plan", "[concurrency][compile]") {
    auto s = make_schema(Schema("Shared").field(FieldSpec("n", Type::integer())));
    std::vector<std::shared_ptr<const ValidationPlan> > plans(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < plans.size(); ++i) {
        threads.emplace_back([&plans, &s, i]() { plans[i] = compile(s); });
    }
    for (auto& t : threads) t.join();
    for (auto const& p : plans) REQUIRE(p.get() == plans[0].get());
}

TEST_CASE("One plan validates from many threads", "[concurrency][validate]") {
    auto line = make_schema(Schema("Line")
                                .field(FieldSpec("qty", Type::integer()).constraints(Constraints().ge(1)))
                                .field(FieldSpec("tags", Type::list(Type::string())).defaultTo(Value::array())));
    auto plan = compile(line);

    std::atomic<int> valid{0};
    std::atomic<int> invalid{0};
    std::atomic<int> shared_default{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < 200; ++i) {
                int64_t qty = (i + t) % 3;
                auto result = plan->validate(Value{{"qty", Value(qty)}});
                if (result.is_valid()) {
                    ++valid;
                    Value record = result.record().asValue();
                    record["tags"].push_back("mine");
                    if (result.record().at("tags").size() != 0) ++shared_default;
                } else {
                    ++invalid;
                }
            }
        });
    }
    for (auto& t : threads) t.join();

    REQUIRE(valid.load() + invalid.load() == 1600);
    REQUIRE(shared_default.load() == 0);
    REQUIRE(plan->validate(Value{{"qty", 1}}).record().at("tags").empty());
}
