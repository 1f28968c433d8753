#include <fmt/format.h>
#include "dsdb.hpp"

static void printAll(std::vector<dsdb::Entity> const& entities) {
    for (auto const& e : entities)
        fmt::print("  {}\n", e);
}

int main()
{
    using namespace dsdb;

    Database db;

    Entity e0 = db.getEntity(db.addEntity({
        { "position", Component { { { "x", makeFloat(0.0) }, { "y", makeFloat(0.0) } } } },
    }));
    db.addEntity();

    fmt::print("{}\n", e0);

    fmt::print("with position:\n");
    printAll(db.getEntitiesWithComponents({ "position" }));

    db.updateField(e0.id, "position", "x", makeFloat(1.0));
    fmt::print("after update:\n");
    printAll(db.getEntitiesWithComponents({ "position" }));

    db.incrementField(e0.id, "position", "x", makeFloat(1.0));
    fmt::print("after increment:\n");
    printAll(db.getEntitiesWithComponents({ "position" }));

    fmt::print("everything:\n");
    printAll(db.getEntitiesWithComponents({}));

    fmt::print("==== DIAGNOSE {:03} =====\n", e0.id);
    fmt::print("{}", db.diagnose(e0.id));

    return 0;
}
