/// @file scene_index.cpp
/// @brief Scene index and linear layout.

#include "scene/scene_index.hpp"

#include "core/logger.hpp"

#include <glm/geometric.hpp>

#include <algorithm>
#include <functional>

namespace orrery::scene
{

SceneRef SceneIndex::register_node(const std::string& id, const Vec3d& origin, std::optional<Vec3d> body_offset)
{
    auto [it, inserted] = m_nodes.try_emplace(id);
    if (inserted)
    {
        it->second.ref = m_next_ref++;
    }
    it->second.origin      = origin;
    it->second.body_offset = body_offset;
    return it->second.ref;
}

bool SceneIndex::remove(std::string_view id)
{
    return m_nodes.erase(std::string(id)) > 0;
}

void SceneIndex::clear()
{
    m_nodes.clear();
}

const SceneNode* SceneIndex::node(std::string_view id) const
{
    const auto it = m_nodes.find(std::string(id));
    return it != m_nodes.end() ? &it->second : nullptr;
}

std::optional<Vec3d> SceneIndex::world_position_of(std::string_view id) const
{
    const SceneNode* n = node(id);
    if (n == nullptr)
    {
        return std::nullopt;
    }
    return n->body_position();
}

std::optional<std::string> SceneIndex::id_of(SceneRef ref) const
{
    for (const auto& [id, n] : m_nodes)
    {
        if (n.ref == ref)
        {
            return id;
        }
    }
    return std::nullopt;
}

f64 SceneIndex::max_extent() const
{
    f64 extent = 0.0;
    for (const auto& [id, n] : m_nodes)
    {
        extent = std::max(extent, glm::length(n.body_position()));
    }
    return extent;
}

void SceneIndex::rebuild_linear_layout(const std::vector<catalog::CelestialObject>& objects,
                                       const scaling::OrbitalMechanicsResult& placements)
{
    clear();

    // Parents may be listed after their children, so resolve lazily with a
    // depth guard against cyclic parent references.
    std::unordered_map<std::string, Vec3d> positions;

    const auto parent_index = [&](const catalog::CelestialObject& child) -> const catalog::CelestialObject* {
        for (const auto& candidate : objects)
        {
            if (&candidate != &child && catalog::references(candidate, child.orbit->parent))
            {
                return &candidate;
            }
        }
        return nullptr;
    };

    std::function<Vec3d(const catalog::CelestialObject&, u32)> place =
        [&](const catalog::CelestialObject& object, u32 depth) -> Vec3d {
        if (auto it = positions.find(object.id); it != positions.end())
        {
            return it->second;
        }

        Vec3d origin{0.0};
        Vec3d offset{0.0};
        bool holder = false;

        const auto placement = placements.find(object.id);
        if (object.has_parent() && placement != placements.end() && depth < objects.size())
        {
            if (const catalog::CelestialObject* parent = parent_index(object))
            {
                origin = place(*parent, depth + 1);
                offset = Vec3d{placement->second.orbit_distance, 0.0, 0.0};
                holder = true;
            }
        }

        const Vec3d position = origin + offset;
        positions[object.id] = position;
        register_node(object.id, origin, holder ? std::optional<Vec3d>(offset) : std::nullopt);
        return position;
    };

    for (const auto& object : objects)
    {
        place(object, 0);
    }

    ORR_CORE_TRACE("SceneIndex: laid out {} nodes", m_nodes.size());
}

} // namespace orrery::scene
