#pragma once

/// @file scene_index.hpp
/// @brief Object id -> world node index maintained by the scene layer.

#include "catalog/celestial_object.hpp"
#include "core/types.hpp"
#include "scaling/orbital_mechanics.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace orrery::scene
{
    /// @brief World placement of one object.
    ///
    /// A plain node has the body at `origin`. A composite node (an orbit holder)
    /// carries the body at `origin + body_offset`; the holder origin usually sits
    /// on the parent, so using it as the body position would collapse distances.
    struct SceneNode
    {
        SceneRef ref = 0;
        Vec3d origin{0.0};
        std::optional<Vec3d> body_offset;

        [[nodiscard]] bool is_holder() const { return body_offset.has_value(); }
        [[nodiscard]] Vec3d body_position() const { return body_offset ? origin + *body_offset : origin; }
    };

    class SceneIndex
    {
    public:
        SceneIndex() = default;

        /// @brief Add or replace the node for `id`.
        /// @return The node's scene reference (stable for the lifetime of the entry).
        SceneRef register_node(const std::string& id, const Vec3d& origin,
                               std::optional<Vec3d> body_offset = std::nullopt);

        bool remove(std::string_view id);
        void clear();

        /// @brief World position of the body registered under `id`, holders resolved.
        [[nodiscard]] std::optional<Vec3d> world_position_of(std::string_view id) const;

        [[nodiscard]] const SceneNode* node(std::string_view id) const;

        /// @brief Id registered with `ref`, or nullopt.
        [[nodiscard]] std::optional<std::string> id_of(SceneRef ref) const;

        /// @brief Largest distance of any body from the world origin (0 when empty).
        [[nodiscard]] f64 max_extent() const;

        [[nodiscard]] std::size_t size() const { return m_nodes.size(); }
        [[nodiscard]] bool empty() const { return m_nodes.empty(); }

        /// @brief Replace the index with a linear layout of `objects`.
        ///
        /// Roots sit at the origin; each other body is a holder on its parent's
        /// body position with the body offset along +x by its orbit distance.
        /// Objects absent from `placements` or without a resolvable parent are
        /// treated as roots.
        void rebuild_linear_layout(const std::vector<catalog::CelestialObject>& objects,
                                   const scaling::OrbitalMechanicsResult& placements);

    private:
        std::unordered_map<std::string, SceneNode> m_nodes;
        SceneRef m_next_ref = 1;
    };

} // namespace orrery::scene
