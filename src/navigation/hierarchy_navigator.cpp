/// @file hierarchy_navigator.cpp
/// @brief Parent/child lookups.

#include "navigation/hierarchy_navigator.hpp"

#include <algorithm>
#include <utility>

namespace orrery::navigation
{

HierarchyNavigator::HierarchyNavigator(std::vector<catalog::CelestialObject> objects)
    : m_objects(std::move(objects))
{
}

void HierarchyNavigator::set_objects(std::vector<catalog::CelestialObject> objects)
{
    m_objects = std::move(objects);
}

const catalog::CelestialObject* HierarchyNavigator::find(std::string_view id) const
{
    // Exact id first so an id never loses to another object's display name
    for (const auto& object : m_objects)
    {
        if (object.id == id)
        {
            return &object;
        }
    }
    const auto it = std::find_if(m_objects.begin(), m_objects.end(),
                                 [&](const catalog::CelestialObject& o) { return catalog::references(o, id); });
    return it != m_objects.end() ? &*it : nullptr;
}

std::vector<const catalog::CelestialObject*> HierarchyNavigator::children_of(std::string_view id) const
{
    std::vector<const catalog::CelestialObject*> children;

    const catalog::CelestialObject* parent = find(id);
    if (parent == nullptr)
    {
        return children;
    }

    for (const auto& object : m_objects)
    {
        if (&object != parent && object.has_parent() && catalog::references(*parent, object.orbit->parent))
        {
            children.push_back(&object);
        }
    }
    return children;
}

const catalog::CelestialObject* HierarchyNavigator::parent_of(std::string_view id) const
{
    const catalog::CelestialObject* child = find(id);
    if (child == nullptr || !child->has_parent())
    {
        return nullptr;
    }

    const std::string& reference = child->orbit->parent;
    for (const auto& object : m_objects)
    {
        if (&object != child && catalog::references(object, reference))
        {
            return &object;
        }
    }
    return nullptr;
}

const catalog::CelestialObject* HierarchyNavigator::root() const
{
    const auto it = std::find_if(m_objects.begin(), m_objects.end(),
                                 [](const catalog::CelestialObject& o) { return !o.has_parent(); });
    return it != m_objects.end() ? &*it : nullptr;
}

} // namespace orrery::navigation
