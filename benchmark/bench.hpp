#pragma once
#include <benchmark/benchmark.h>
#include <random>
#include <string>
#include <vector>

#include <fmt/format.h>
#include "../dsdb.hpp"

constexpr size_t BMEntities = 512; //16 * 1024;
constexpr size_t BMCategories = 64;

using TimeDelta = double;

inline auto positionComponent() -> dsdb::Component {
    return { { { "x", dsdb::makeFloat(0.0) }, { "y", dsdb::makeFloat(0.0) } } };
}

inline auto velocityComponent() -> dsdb::Component {
    return { { { "x", dsdb::makeFloat(0.0) }, { "y", dsdb::makeFloat(0.0) } } };
}

inline auto dataComponent() -> dsdb::Component {
    return { {
        { "thingy", dsdb::makeInteger(0) },
        { "dingy", dsdb::makeFloat(0.0) },
        { "mingy", dsdb::makeInteger(0) },
    } };
}

inline void updatePosition(dsdb::Database& db, dsdb::Entity const& e, TimeDelta dt) {
    auto const& direction = e.components.at("velocity");
    db.incrementField(e.id, "position", "x", dsdb::makeFloat(direction.get("x")->asFloat() * dt));
    db.incrementField(e.id, "position", "y", dsdb::makeFloat(direction.get("y")->asFloat() * dt));
}

static std::random_device m_rd;
static std::mt19937 m_eng;
inline int random(int min, int max) {
    std::uniform_int_distribution<int> distr(min, max);
    return distr(m_eng);
}
inline void updateComponents(dsdb::Database& db, dsdb::Entity const& e) {
    auto const& position = e.components.at("position");
    auto thingy = std::get<dsdb::Integer>(e.components.at("data").get("thingy")->value);
    if ((thingy % 10) == 0) {
        if (position.get("x")->asFloat() > position.get("y")->asFloat()) {
            db.updateField(e.id, "velocity", "x", dsdb::makeFloat(random(-5, 5)));
            db.updateField(e.id, "velocity", "y", dsdb::makeFloat(random(-10, 10)));
        } else {
            db.updateField(e.id, "velocity", "x", dsdb::makeFloat(random(-10, 10)));
            db.updateField(e.id, "velocity", "y", dsdb::makeFloat(random(-5, 5)));
        }
    }
}

inline void updateData(dsdb::Database& db, dsdb::Entity const& e, TimeDelta dt) {
    auto mingy = std::get<dsdb::Integer>(e.components.at("data").get("mingy")->value);
    db.incrementField(e.id, "data", "thingy", dsdb::makeInteger(1));
    db.incrementField(e.id, "data", "dingy", dsdb::makeFloat(0.0001 * dt));
    db.updateField(e.id, "data", "mingy", dsdb::makeInteger(mingy == 0 ? 1 : 0));
}


struct BenchmarkSettings {
    enum EMainType {
        Init = 1,
        Update = 2,
        Expand = 4,
        Query = 8,
    } MainType;

};

static constexpr inline BenchmarkSettings::EMainType operator|(BenchmarkSettings::EMainType a, BenchmarkSettings::EMainType b) {
    return (BenchmarkSettings::EMainType)((int)a | (int)b);
}

template<BenchmarkSettings bs, BenchmarkSettings::EMainType type, typename FNRun>
static inline void bench_or_once(benchmark::State& state, FNRun&& run) {
    if constexpr (((int)bs.MainType & (int)type)) {
        for (auto _ : state)
            run();
    } else {
        run();
    }
}

constexpr BenchmarkSettings BsInit = { BenchmarkSettings::Init };
constexpr BenchmarkSettings BsUpdate = { BenchmarkSettings::Update };
constexpr BenchmarkSettings BsExpand = { BenchmarkSettings::Expand };
constexpr BenchmarkSettings BsQuery = { BenchmarkSettings::Query };
