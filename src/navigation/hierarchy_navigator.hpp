#pragma once

/// @file hierarchy_navigator.hpp
/// @brief Parent/child lookups over a system's object list.

#include "catalog/celestial_object.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace orrery::navigation
{
    /// @brief Structural queries over the parent/child graph of one system.
    ///
    /// A child is any object whose orbit names the given object by id or name
    /// (case-insensitive). Lookups are linear scans; systems hold at most a few
    /// hundred objects.
    class HierarchyNavigator
    {
    public:
        HierarchyNavigator() = default;
        explicit HierarchyNavigator(std::vector<catalog::CelestialObject> objects);

        void set_objects(std::vector<catalog::CelestialObject> objects);
        void clear() { m_objects.clear(); }

        /// @brief Object with this id or name, or nullptr.
        [[nodiscard]] const catalog::CelestialObject* find(std::string_view id) const;

        /// @brief Objects orbiting `id`, in list order. Empty for unknown ids.
        [[nodiscard]] std::vector<const catalog::CelestialObject*> children_of(std::string_view id) const;

        /// @brief The object `id` orbits, or nullptr if it has none or it is unknown.
        [[nodiscard]] const catalog::CelestialObject* parent_of(std::string_view id) const;

        /// @brief The system primary: the first object without a parent.
        [[nodiscard]] const catalog::CelestialObject* root() const;

        [[nodiscard]] const std::vector<catalog::CelestialObject>& objects() const { return m_objects; }

    private:
        std::vector<catalog::CelestialObject> m_objects;
    };

} // namespace orrery::navigation
