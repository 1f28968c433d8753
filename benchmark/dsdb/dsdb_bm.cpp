#include <benchmark/benchmark.h>

#include "../bench.hpp"

template<BenchmarkSettings bs>
static void dsdb_A(benchmark::State& state) {
    using namespace dsdb;

    TimeDelta delta = {1.0F / 60.0F};

    bench_or_once<bs, BenchmarkSettings::Init>(state,
    [&] {
        Database db;

        bench_or_once<bs, BenchmarkSettings::Expand>(state,
        [&] {
            for (size_t i = 0; i < BMEntities; ++i) {
                std::unordered_map<std::string, Component> components = { { "position", positionComponent() } };
                if ((i & 3) == 0)
                    components.emplace("velocity", velocityComponent());
                if ((i & 8) == 0)
                    components.emplace("data", dataComponent());
                db.addEntity(std::move(components));
            }

            bench_or_once<bs, BenchmarkSettings::Update>(state,
            [&] {
                for (auto const& e : db.getEntitiesWithComponents({ "position", "velocity" }))
                    updatePosition(db, e, delta);
                for (auto const& e : db.getEntitiesWithComponents({ "position", "velocity", "data" }))
                    updateComponents(db, e);
                for (auto const& e : db.getEntitiesWithComponents({ "data" }))
                    updateData(db, e, delta);
            });

            bench_or_once<bs, BenchmarkSettings::Query>(state,
            [&] {
                benchmark::DoNotOptimize(db.getEntitiesWithComponents({ "position", "velocity", "data" }));
            });
        });
    });
}

BENCHMARK(dsdb_A<BsUpdate>);
BENCHMARK(dsdb_A<BsInit>);
BENCHMARK(dsdb_A<BsExpand>);
BENCHMARK(dsdb_A<BsQuery>);

// getEntity walks every registered category, whether the entity has it or not
static void dsdb_getEntity(benchmark::State& state) {
    using namespace dsdb;

    Database db;
    auto e = db.addEntity({ { "position", positionComponent() } });
    for (int64_t i = 0; i < state.range(0); ++i)
        db.attachComponent(e + 1, fmt::format("category{}", i), dataComponent());

    for (auto _ : state)
        benchmark::DoNotOptimize(db.getEntity(e));
}

BENCHMARK(dsdb_getEntity)->Range(1, BMCategories);

static void dsdb_incrementField(benchmark::State& state) {
    using namespace dsdb;

    Database db;
    auto e = db.addEntity({ { "data", dataComponent() } });

    for (auto _ : state)
        db.incrementField(e, "data", "thingy", makeInteger(1));
}

BENCHMARK(dsdb_incrementField);
