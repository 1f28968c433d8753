#define CATCH_CONFIG_MAIN  // This tells Catch to provide a main() - only do this in one cpp file
#include "catch2/catch.hpp"

#include <algorithm>
#include <limits>

#include "dsdb.hpp"

using namespace dsdb;

namespace {
    auto position(Float x, Float y) -> Component {
        return Component { { { "x", makeFloat(x) }, { "y", makeFloat(y) } } };
    }

    auto idsOf(std::vector<Entity> const& entities) -> std::vector<EntityId> {
        std::vector<EntityId> ids;
        for (auto const& e : entities)
            ids.push_back(e.id);
        std::ranges::sort(ids);
        return ids;
    }
}

TEST_CASE("Fields combine by the promotion table", "[field]") {
    SECTION("integer and integer stay integer") {
        REQUIRE( combine(makeInteger(2), makeInteger(3)) == makeInteger(5) );
    }
    SECTION("integer and float widen to float") {
        REQUIRE( combine(makeInteger(2), makeFloat(1.5)) == makeFloat(3.5) );
        REQUIRE( combine(makeFloat(1.5), makeInteger(2)) == makeFloat(3.5) );
    }
    SECTION("float and float") {
        REQUIRE( combine(makeFloat(1.0), makeFloat(2.0)) == makeFloat(3.0) );
    }
    SECTION("integer overflow wraps") {
        auto max = std::numeric_limits<Integer>::max();
        auto min = std::numeric_limits<Integer>::min();
        REQUIRE( combine(makeInteger(max), makeInteger(1)) == makeInteger(min) );
        REQUIRE( combine(makeInteger(min), makeInteger(-1)) == makeInteger(max) );
    }
}

TEST_CASE("Field equality includes the kind", "[field]") {
    REQUIRE( makeInteger(1) != makeFloat(1.0) );
    REQUIRE( makeInteger(1).isInteger() );
    REQUIRE( makeFloat(1.0).isFloat() );
    REQUIRE( makeInteger(7).asFloat() == 7.0 );
}

TEST_CASE("Fields and components print", "[field][print]") {
    REQUIRE( fmt::format("{}", makeInteger(5)) == "Integer(5)" );
    REQUIRE( fmt::format("{}", makeFloat(3.5)) == "Float(3.5)" );
    REQUIRE( fmt::format("{}", position(0.5, 1.5)) == "{x: Float(0.5), y: Float(1.5)}" );
    REQUIRE( fmt::format("{}", Component {}) == "{}" );
}

TEST_CASE("Entity ids count up from one", "[entity]") {
    Database db;

    auto e0 = db.addEntity();
    auto e1 = db.addEntity();
    auto e2 = db.addEntity({ { "position", position(0, 0) } });

    REQUIRE( e0 == 1 );
    REQUIRE( e1 == 2 );
    REQUIRE( e2 == 3 );
    REQUIRE( db.entityCount() == 3 );
    REQUIRE( std::ranges::equal(db.allEntities(), std::vector<EntityId> { 1, 2, 3 }) );
}

TEST_CASE("Unknown entities are empty views", "[entity]") {
    Database db;
    db.addEntity({ { "position", position(0, 0) } });

    auto e = db.getEntity(42);
    REQUIRE( e.id == 42 );
    REQUIRE( e.empty() );
}

TEST_CASE("Entities collect every attached component", "[entity]") {
    Database db;
    auto e = db.addEntity({
        { "position", position(1, 2) },
        { "health", Component { { { "hp", makeInteger(10) } } } },
    });
    db.addEntity({ { "position", position(5, 5) } });

    auto view = db.getEntity(e);
    REQUIRE( view.id == e );
    REQUIRE( view.components.size() == 2 );
    REQUIRE( view.has("position") );
    REQUIRE( view.has("health") );
    REQUIRE( view.components.at("position").get("x") == makeFloat(1) );
    REQUIRE( view.components.at("health").get("hp") == makeInteger(10) );
}

TEST_CASE("Entity views are copies", "[entity]") {
    Database db;
    auto e = db.addEntity({ { "position", position(1, 2) } });

    auto view = db.getEntity(e);
    view.components.at("position").set("x", makeFloat(99));

    REQUIRE( db.getField(e, "position", "x") == makeFloat(1) );
}

TEST_CASE("Attaching a component is first write wins", "[component]") {
    Database db;
    auto e = db.addEntity({ { "position", position(1, 1) } });

    REQUIRE_FALSE( db.attachComponent(e, "position", position(9, 9)) );
    REQUIRE( db.getField(e, "position", "x") == makeFloat(1) );

    REQUIRE( db.attachComponent(e, "velocity", position(2, 2)) );
    REQUIRE( db.getEntity(e).has("velocity") );
}

TEST_CASE("Components can be attached to ids never created", "[component]") {
    Database db;
    db.addEntity();

    REQUIRE( db.attachComponent(100, "position", position(3, 4)) );
    REQUIRE( db.getEntity(100).has("position") );
    REQUIRE( db.getField(100, "position", "y") == makeFloat(4) );

    SECTION("but they are not part of the created entities") {
        REQUIRE( db.entityCount() == 1 );
        REQUIRE( db.getEntitiesWithComponents({ "position" }).empty() );
        REQUIRE( idsOf(db.getEntitiesWithComponents({})) == std::vector<EntityId> { 1 } );
    }
}

TEST_CASE("Querying by component names", "[query]") {
    Database db;
    auto a = db.addEntity({ { "position", position(0, 0) } });
    auto b = db.addEntity({ { "position", position(0, 0) }, { "velocity", position(1, 0) } });
    auto c = db.addEntity({ { "velocity", position(1, 0) } });
    auto d = db.addEntity();

    SECTION("a single name") {
        REQUIRE( idsOf(db.getEntitiesWithComponents({ "position" })) == std::vector<EntityId> { a, b } );
        REQUIRE( idsOf(db.getEntitiesWithComponents({ "velocity" })) == std::vector<EntityId> { b, c } );
    }
    SECTION("names intersect") {
        REQUIRE( idsOf(db.getEntitiesWithComponents({ "position", "velocity" })) == std::vector<EntityId> { b } );
        REQUIRE( idsOf(db.getEntitiesWithComponents({ "velocity", "position" })) == std::vector<EntityId> { b } );
    }
    SECTION("no names match everything") {
        REQUIRE( idsOf(db.getEntitiesWithComponents({})) == std::vector<EntityId> { a, b, c, d } );
    }
    SECTION("an unknown name matches nothing") {
        REQUIRE( db.getEntitiesWithComponents({ "mass" }).empty() );
        REQUIRE( db.getEntitiesWithComponents({ "position", "mass" }).empty() );
        REQUIRE( db.getEntitiesWithComponents({ "mass", "position" }).empty() );
    }
    SECTION("results carry the full entity") {
        auto res = db.getEntitiesWithComponents({ "position", "velocity" });
        REQUIRE( res.size() == 1 );
        REQUIRE( res[0].components.size() == 2 );
    }
    SECTION("adding a name only narrows the result") {
        std::vector<std::vector<std::string>> lists = {
            {}, { "position" }, { "velocity" }, { "position", "velocity" }, { "mass" },
        };
        for (auto const& list : lists) {
            auto base = idsOf(db.getEntitiesWithComponents(list));
            for (auto extra : { "position", "velocity", "mass" }) {
                auto longer = list;
                longer.push_back(extra);
                auto narrowed = idsOf(db.getEntitiesWithComponents(longer));
                REQUIRE( std::ranges::includes(base, narrowed) );
            }
        }
    }
}

TEST_CASE("Querying an empty database", "[query]") {
    Database db;
    REQUIRE( db.getEntitiesWithComponents({}).empty() );
    REQUIRE( db.getEntitiesWithComponents({ "position" }).empty() );
}

TEST_CASE("Updating fields", "[fields]") {
    Database db;
    auto e = db.addEntity({ { "position", position(0, 0) } });
    auto other = db.addEntity({ { "velocity", position(0, 0) } });

    SECTION("overwrites an existing field") {
        REQUIRE( db.updateField(e, "position", "x", makeFloat(1.0)) );
        REQUIRE( db.getField(e, "position", "x") == makeFloat(1.0) );
    }
    SECTION("adds a new field, of any kind") {
        REQUIRE( db.updateField(e, "position", "z", makeInteger(3)) );
        REQUIRE( db.getField(e, "position", "z") == makeInteger(3) );
        REQUIRE( db.updateField(e, "position", "x", makeInteger(4)) );
        REQUIRE( db.getField(e, "position", "x") == makeInteger(4) );
    }
    SECTION("fails on an unknown component") {
        REQUIRE_FALSE( db.updateField(e, "mass", "kg", makeFloat(1.0)) );
        REQUIRE( db.findCategory("mass") == nullptr );
    }
    SECTION("fails when the entity lacks the component") {
        REQUIRE_FALSE( db.updateField(other, "position", "x", makeFloat(1.0)) );
        REQUIRE_FALSE( db.getEntity(other).has("position") );
    }
}

TEST_CASE("Reading fields", "[fields]") {
    Database db;
    auto e = db.addEntity({ { "position", position(0.25, 0) } });

    REQUIRE( db.getField(e, "position", "x") == makeFloat(0.25) );
    REQUIRE_FALSE( db.getField(e, "position", "z").has_value() );
    REQUIRE_FALSE( db.getField(e, "mass", "kg").has_value() );
    REQUIRE_FALSE( db.getField(e + 1, "position", "x").has_value() );
}

TEST_CASE("Incrementing fields", "[fields]") {
    Database db;
    auto e = db.addEntity({
        { "position", position(0.5, 0) },
        { "counter", Component { { { "n", makeInteger(2) } } } },
    });

    SECTION("combines the stored value with the delta") {
        REQUIRE( db.incrementField(e, "counter", "n", makeInteger(3)) );
        REQUIRE( db.getField(e, "counter", "n") == makeInteger(5) );

        REQUIRE( db.incrementField(e, "counter", "n", makeFloat(0.5)) );
        REQUIRE( db.getField(e, "counter", "n") == makeFloat(5.5) );

        REQUIRE( db.incrementField(e, "position", "x", makeInteger(2)) );
        REQUIRE( db.getField(e, "position", "x") == makeFloat(2.5) );
    }
    SECTION("leaves the database alone when the field is absent") {
        auto before = fmt::format("{}", db.getEntity(e));
        auto categories = db.categoryCount();

        REQUIRE_FALSE( db.incrementField(e, "position", "z", makeFloat(1.0)) );
        REQUIRE_FALSE( db.incrementField(e, "mass", "kg", makeFloat(1.0)) );
        REQUIRE_FALSE( db.incrementField(e + 1, "position", "x", makeFloat(1.0)) );

        REQUIRE( fmt::format("{}", db.getEntity(e)) == before );
        REQUIRE( db.categoryCount() == categories );
        REQUIRE( db.getEntity(e + 1).empty() );
    }
}

TEST_CASE("Categories are stable handles", "[ergonomics]") {
    Database db;

    REQUIRE( db.findCategory("position") == nullptr );

    auto c0 = db.requireCategory("position");
    auto c1 = db.requireCategory("position");
    REQUIRE( c0 != nullptr );
    REQUIRE( c0 == c1 );
    REQUIRE( c0->name == "position" );

    auto e = db.addEntity({ { "position", position(1, 1) } });
    REQUIRE( c0->has(e) );
    REQUIRE( c0 == db.findCategory("position") );

    bool called = false;
    c0->with(e, [&](Component& c) { called = true; c.set("x", makeFloat(7)); });
    c0->with(e + 1, [&](Component&) { FAIL("no component for this entity"); });
    REQUIRE( called );
    REQUIRE( db.getField(e, "position", "x") == makeFloat(7) );
    REQUIRE( c0->str(e + 1) == "<NULL>" );
}

TEST_CASE("Diagnose lists every component of an entity", "[ergonomics][print]") {
    Database db;
    auto e = db.addEntity({
        { "position", position(0.5, 1.5) },
        { "counter", Component { { { "n", makeInteger(2) } } } },
    });

    auto lines = db.diagnose(e);
    REQUIRE( lines ==
        fmt::format("{:20}||{}\n", "counter", "{n: Integer(2)}") +
        fmt::format("{:20}||{}\n", "position", "{x: Float(0.5), y: Float(1.5)}") );
    REQUIRE( db.diagnose(e + 1).empty() );
}

TEST_CASE("Databases are independent", "[database]") {
    Database a;
    Database b;

    a.addEntity({ { "position", position(0, 0) } });
    REQUIRE( b.addEntity() == FirstEntity );
    REQUIRE( b.findCategory("position") == nullptr );
    REQUIRE( b.getEntitiesWithComponents({ "position" }).empty() );
}

TEST_CASE("Position walkthrough", "[database]") {
    Database db;

    auto e1 = db.addEntity({ { "position", position(0.0, 0.0) } });
    auto e2 = db.addEntity();
    REQUIRE( e1 == 1 );
    REQUIRE( e2 == 2 );

    auto moving = db.getEntitiesWithComponents({ "position" });
    REQUIRE( moving.size() == 1 );
    REQUIRE( moving[0].id == e1 );

    REQUIRE( db.updateField(e1, "position", "x", makeFloat(1.0)) );
    REQUIRE( db.getField(e1, "position", "x") == makeFloat(1.0) );

    REQUIRE( db.incrementField(e1, "position", "x", makeFloat(1.0)) );
    REQUIRE( db.getField(e1, "position", "x") == makeFloat(2.0) );
    REQUIRE( db.getField(e1, "position", "y") == makeFloat(0.0) );

    REQUIRE( idsOf(db.getEntitiesWithComponents({})) == std::vector<EntityId> { e1, e2 } );
}
