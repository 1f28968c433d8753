#include "dsdb.hpp"

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace dsdb {
    namespace {
        // two's complement wrap, the unsigned sum is well defined where the signed one is not
        inline auto wrappingAdd(Integer a, Integer b) -> Integer {
            return static_cast<Integer>(static_cast<std::uint64_t>(a) + static_cast<std::uint64_t>(b));
        }

        template<typename TMap>
        auto sortedKeys(TMap const& map) -> std::vector<std::string> {
            std::vector<std::string> keys;
            keys.reserve(map.size());
            for (auto const& [k, _] : map)
                keys.push_back(k);
            std::ranges::sort(keys);
            return keys;
        }
    }

    /* field trinity */

    auto FieldType::asFloat() const -> Float {
        if (auto i = std::get_if<Integer>(&value))
            return static_cast<Float>(*i);
        return std::get<Float>(value);
    }

    auto combine(FieldType a, FieldType b) -> FieldType {
        if (a.isInteger() && b.isInteger())
            return { wrappingAdd(std::get<Integer>(a.value), std::get<Integer>(b.value)) };
        return { a.asFloat() + b.asFloat() };
    }

    /* category */

    auto ComponentCategory::str(EntityId e) const -> std::string {
        if (auto it = values.find(e); it != values.end())
            return fmt::format("{}", it->second);
        else
            return "<NULL>";
    }

    /* trinity */

    auto Database::addEntity(std::unordered_map<std::string, Component> components) -> EntityId {
        auto e = _nextEntity++;
        for (auto& [name, component] : components)
            attachComponent(e, name, std::move(component));
        _entities.push_back(e);
        return e;
    }

    auto Database::attachComponent(EntityId e, std::string const& name, Component component) -> bool {
        // try_emplace leaves an existing component untouched
        return requireCategory(name)->values.try_emplace(e, std::move(component)).second;
    }

    auto Database::getEntity(EntityId e) const -> Entity {
        Entity res { e, {} };
        for (auto c : allComponents()) {
            c->with(e, [&](Component const& component) {
                res.components.emplace(c->name, component);
            });
        }
        return res;
    }

    auto Database::getEntitiesWithComponents(std::vector<std::string> const& names) const -> std::vector<Entity> {
        std::unordered_set<EntityId> candidates(_entities.begin(), _entities.end());

        for (auto const& name : names) {
            auto category = findCategory(name);
            if (!category) {
                // nobody has ever carried this component, nothing can match
                candidates.clear();
                break;
            }
            std::erase_if(candidates, [&](EntityId e) { return !category->has(e); });
        }

        std::vector<Entity> res;
        res.reserve(candidates.size());
        for (auto e : allEntities())
            if (candidates.contains(e))
                res.push_back(getEntity(e));
        return res;
    }

    /* fields */

    auto Database::updateField(EntityId e, std::string const& component, std::string const& field, FieldType value) -> bool {
        auto category = findCategory(component);
        if (!category)
            return false;

        bool found = false;
        category->with(e, [&](Component& c) {
            c.set(field, value);
            found = true;
        });
        return found;
    }

    auto Database::getField(EntityId e, std::string const& component, std::string const& field) const -> std::optional<FieldType> {
        auto category = findCategory(component);
        if (!category)
            return std::nullopt;

        std::optional<FieldType> res;
        std::as_const(*category).with(e, [&](Component const& c) { res = c.get(field); });
        return res;
    }

    auto Database::incrementField(EntityId e, std::string const& component, std::string const& field, FieldType delta) -> bool {
        if (auto current = getField(e, component, field))
            return updateField(e, component, field, combine(*current, delta));
        return false;
    }

    /* ergonomics */

    auto Database::findCategory(std::string const& name) const -> std::shared_ptr<ComponentCategory> {
        auto it = _components.find(name);
        return (it != _components.end()) ? it->second : nullptr;
    }

    auto Database::requireCategory(std::string const& name) -> std::shared_ptr<ComponentCategory> {
        if (auto c = findCategory(name))
            return c;
        return _components[name] = std::make_shared<ComponentCategory>(name);
    }

    auto Database::diagnose(EntityId e) const -> std::string {
        std::string res;
        for (auto const& name : sortedKeys(_components)) {
            auto const& c = _components.at(name);
            if (c->has(e))
                res += fmt::format("{:20}||{}\n", c->name, c->str(e));
        }
        return res;
    }

    /* printing */

    auto operator<<(std::ostream& os, FieldType const& f) -> std::ostream& {
        if (auto i = std::get_if<Integer>(&f.value))
            return os << fmt::format("Integer({})", *i);
        return os << fmt::format("Float({})", std::get<Float>(f.value));
    }

    auto operator<<(std::ostream& os, Component const& c) -> std::ostream& {
        std::vector<std::string> parts;
        for (auto const& field : sortedKeys(c.fields))
            parts.push_back(fmt::format("{}: {}", field, c.fields.at(field)));
        return os << fmt::format("{{{}}}", fmt::join(parts, ", "));
    }

    auto operator<<(std::ostream& os, Entity const& e) -> std::ostream& {
        std::vector<std::string> parts;
        for (auto const& name : sortedKeys(e.components))
            parts.push_back(fmt::format("{}: {}", name, e.components.at(name)));
        return os << fmt::format("Entity {} {{{}}}", e.id, fmt::join(parts, ", "));
    }
}
