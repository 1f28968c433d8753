#pragma once
#include <concepts>
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <ranges>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include <fmt/format.h>
#include <fmt/ostream.h>

// dead simple database
namespace dsdb {
    /* field trinity */

    using Integer = std::int64_t;
    using Float = double;

    // A tagged numeric value, either an Integer or a Float.
    // Equality compares the kind as well as the value: Integer(1) != Float(1.0).
    struct FieldType {
        std::variant<Integer, Float> value;

        auto isInteger() const -> bool { return std::holds_alternative<Integer>(value); }
        auto isFloat() const -> bool { return std::holds_alternative<Float>(value); }

        // the value widened to floating point, whatever the kind
        auto asFloat() const -> Float;

        friend bool operator==(FieldType const&, FieldType const&) = default;
    };

    inline auto makeInteger(Integer v) -> FieldType { return { v }; }
    inline auto makeFloat(Float v) -> FieldType { return { v }; }

    // Integer + Integer stays Integer (wrapping on overflow), anything involving
    // a Float widens the Integer side and yields a Float.
    auto combine(FieldType a, FieldType b) -> FieldType;

    /* component trinity */

    struct Component {
        std::unordered_map<std::string, FieldType> fields;

        auto has(std::string const& field) const -> bool { return fields.contains(field); }
        auto size() const -> size_t { return fields.size(); }

        auto get(std::string const& field) const -> std::optional<FieldType> {
            if (auto it = fields.find(field); it != fields.end())
                return it->second;
            return std::nullopt;
        }

        void set(std::string const& field, FieldType value) { fields.insert_or_assign(field, value); }
    };

    /* entity trinity */

    using EntityId = std::uint64_t;
    constexpr EntityId NoEntity = 0;
    constexpr EntityId FirstEntity = 1;

    // A view over everything attached to one id. Never stored, rebuilt on every lookup.
    struct Entity {
        EntityId id = NoEntity;
        std::unordered_map<std::string, Component> components;

        auto has(std::string const& name) const -> bool { return components.contains(name); }
        auto empty() const -> bool { return components.empty(); }
    };

    /* category, every component registered under one name */

    struct ComponentCategory {
        std::string name;
        std::unordered_map<EntityId, Component> values; // the actual storage

        ComponentCategory(std::string_view name)
            : name(name), values() { }

        void with(EntityId e, std::invocable<Component&> auto chain) {
            if (auto it = values.find(e); it != values.end())
                chain(it->second); // reuse the found iterator/lookup
        }

        void with(EntityId e, std::invocable<Component const&> auto chain) const {
            if (auto it = values.find(e); it != values.end())
                chain(it->second);
        }

        auto has(EntityId e) const -> bool { return values.contains(e); }
        auto str(EntityId e) const -> std::string;
    };

    /* final database type */

    class Database {
            EntityId _nextEntity = FirstEntity;
            std::vector<EntityId> _entities; // every id ever issued, in creation order
            std::unordered_map<std::string, std::shared_ptr<ComponentCategory>> _components; // the dynamic structure

        public:
            /* trinity */

            auto addEntity(std::unordered_map<std::string, Component> components = {}) -> EntityId;

            // first write wins, returns false when `name` was already attached to `e`
            auto attachComponent(EntityId e, std::string const& name, Component component) -> bool;

            auto getEntity(EntityId e) const -> Entity;

            // An empty name list matches every created entity, an unknown name matches none.
            auto getEntitiesWithComponents(std::vector<std::string> const& names) const -> std::vector<Entity>;

            /* fields */

            auto updateField(EntityId e, std::string const& component, std::string const& field, FieldType value) -> bool;
            auto getField(EntityId e, std::string const& component, std::string const& field) const -> std::optional<FieldType>;
            auto incrementField(EntityId e, std::string const& component, std::string const& field, FieldType delta) -> bool;

            /* ergonomics */

            auto findCategory(std::string const& name) const -> std::shared_ptr<ComponentCategory>;
            auto requireCategory(std::string const& name) -> std::shared_ptr<ComponentCategory>;

            auto allEntities() const { return _entities | std::views::all; }
            auto allComponents() const { return _components | std::views::values; }

            auto entityCount() const -> size_t { return _entities.size(); }
            auto categoryCount() const -> size_t { return _components.size(); }

            auto diagnose(EntityId e) const -> std::string;
    };

    auto operator<<(std::ostream& os, FieldType const& f) -> std::ostream&;
    auto operator<<(std::ostream& os, Component const& c) -> std::ostream&;
    auto operator<<(std::ostream& os, Entity const& e) -> std::ostream&;
}

template<> struct fmt::formatter<dsdb::FieldType> : fmt::ostream_formatter { };
template<> struct fmt::formatter<dsdb::Component> : fmt::ostream_formatter { };
template<> struct fmt::formatter<dsdb::Entity> : fmt::ostream_formatter { };
