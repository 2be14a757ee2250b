/// @file orbital_mechanics.cpp
/// @brief Orbital mechanics pipeline: placement rules, cache and generation tracking.

#include "scaling/orbital_mechanics.hpp"

#include "core/logger.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iterator>
#include <stdexcept>

namespace orrery::scaling
{

namespace
{

/// Index of the object an orbit's parent reference names, if any.
const catalog::CelestialObject* find_parent(const std::vector<catalog::CelestialObject>& objects,
                                            const catalog::CelestialObject& child)
{
    const std::string& reference = child.orbit->parent;
    for (const auto& candidate : objects)
    {
        if (&candidate != &child && catalog::references(candidate, reference))
        {
            return &candidate;
        }
    }
    return nullptr;
}

bool well_formed(const OrbitalMechanicsResult& result)
{
    return std::all_of(result.begin(), result.end(), [](const auto& entry) {
        return std::isfinite(entry.second.visual_radius)
            && std::isfinite(entry.second.orbit_distance)
            && entry.second.visual_radius >= 0.0
            && entry.second.orbit_distance >= 0.0;
    });
}

} // anonymous namespace

OrbitalMechanicsPipeline::OrbitalMechanicsPipeline(const DualPropertiesResolver& resolver,
                                                   catalog::SystemSource& source,
                                                   core::TaskQueue& queue)
    : m_resolver(resolver)
    , m_source(source)
    , m_queue(queue)
{
}

// -----------------------------------------------------------------
// Computation
// -----------------------------------------------------------------

OrbitalMechanicsResult OrbitalMechanicsPipeline::compute(const std::vector<catalog::CelestialObject>& objects,
                                                         std::string_view mode) const
{
    OrbitalMechanicsResult result;

    try
    {
        const view::ViewModeConfig& config = m_resolver.registry().get_config(mode);

        // Pass 1: visual radii and scaled orbits
        for (const auto& object : objects)
        {
            if (object.id.empty())
            {
                throw std::invalid_argument("descriptor without an id");
            }
            const DualProperties props = m_resolver.resolve(object, mode, m_system_scale);
            result[object.id] = OrbitalPlacement{
                .visual_radius  = props.visual_radius,
                .orbit_distance = props.visual_orbit_radius,
            };
        }

        // Pass 2: group children by parent, keeping first-seen parent order
        std::vector<std::pair<std::string, std::vector<const catalog::CelestialObject*>>> groups;
        for (const auto& object : objects)
        {
            if (!object.has_orbit_data())
            {
                // Orbit present but unusable: no distance contribution
                if (object.has_parent())
                {
                    result[object.id].orbit_distance = 0.0;
                }
                continue;
            }

            const catalog::CelestialObject* parent = find_parent(objects, object);
            if (parent == nullptr)
            {
                ORR_CORE_TRACE("Orbital mechanics: '{}' orbits unknown parent '{}'",
                               object.id, object.orbit->parent);
                continue;
            }

            auto group = std::find_if(groups.begin(), groups.end(),
                                      [&](const auto& g) { return g.first == parent->id; });
            if (group == groups.end())
            {
                groups.emplace_back(parent->id, std::vector<const catalog::CelestialObject*>{});
                group = std::prev(groups.end());
            }
            group->second.push_back(&object);
        }

        // Pass 3: spacing, innermost first
        for (auto& [parent_id, children] : groups)
        {
            std::stable_sort(children.begin(), children.end(),
                             [](const catalog::CelestialObject* a, const catalog::CelestialObject* b) {
                                 return a->orbit_radius() < b->orbit_radius();
                             });
            place_children(children, parent_id, config, result);
        }

        if (!well_formed(result))
        {
            throw std::domain_error("non-finite placement");
        }
    }
    catch (const std::exception& e)
    {
        ORR_CORE_ERROR("Orbital mechanics failed for mode '{}': {}; using empty result", mode, e.what());
        result.clear();
    }

    return result;
}

void OrbitalMechanicsPipeline::place_children(const std::vector<const catalog::CelestialObject*>& children,
                                              const std::string& parent_id,
                                              const view::ViewModeConfig& config,
                                              OrbitalMechanicsResult& result) const
{
    if (config.diagrammatic)
    {
        // nth child at base * (1 + n * multiplier), ignoring the real orbit
        const auto& spacing = config.equidistant_spacing;
        for (std::size_t n = 0; n < children.size(); ++n)
        {
            result[children[n]->id].orbit_distance =
                spacing.base_spacing * (1.0 + static_cast<f64>(n) * spacing.spacing_multiplier);
        }
        return;
    }

    // Scaled orbits, pushed outward where they would overlap the parent or the
    // previous sibling.
    const f64 parent_radius = result[parent_id].visual_radius;
    const f64 clearance     = config.min_orbit_clearance;
    f64 inner_edge = std::max(parent_radius * config.safety_factor, parent_radius + clearance);

    for (const auto* child : children)
    {
        OrbitalPlacement& placement = result[child->id];
        const f64 child_radius = placement.visual_radius;

        const f64 distance = std::max(placement.orbit_distance, inner_edge + child_radius);
        placement.orbit_distance = distance;
        inner_edge = distance + child_radius + clearance;
    }
}

// -----------------------------------------------------------------
// Asynchronous entry points
// -----------------------------------------------------------------

u64 OrbitalMechanicsPipeline::calculate(std::string system_id,
                                        std::vector<catalog::CelestialObject> objects,
                                        std::string mode,
                                        CompletionCallback done)
{
    const u64 generation = ++m_generation;

    m_queue.post([this, generation, system_id = std::move(system_id), objects = std::move(objects),
                  mode = std::move(mode), done = std::move(done)]() mutable {
        finish(generation, std::move(system_id), std::move(mode), std::move(objects), done);
    });
    return generation;
}

u64 OrbitalMechanicsPipeline::load_and_calculate(std::string system_id, std::string mode, CompletionCallback done)
{
    const u64 generation = ++m_generation;
    const std::string requested = system_id;

    m_source.list_objects(requested, [this, generation, system_id = std::move(system_id),
                                      mode = std::move(mode), done = std::move(done)](
                                         std::optional<catalog::SystemSource::ObjectList> objects) {
        if (is_stale(generation))
        {
            ORR_CORE_TRACE("Orbital mechanics: dropping stale load of '{}' (generation {}, current {})",
                           system_id, generation, m_generation);
            return;
        }

        if (!objects.has_value())
        {
            ORR_CORE_ERROR("Orbital mechanics: failed to load system '{}'", system_id);
            if (done)
            {
                CalculationOutcome outcome;
                outcome.generation = generation;
                outcome.system_id  = system_id;
                outcome.mode       = mode;
                outcome.status     = CalculationStatus::LoadFailed;
                outcome.error      = "failed to load system '" + system_id + "'";
                done(outcome);
            }
            return;
        }

        finish(generation, system_id, mode, std::move(*objects), done);
    });
    return generation;
}

void OrbitalMechanicsPipeline::finish(u64 generation,
                                      std::string system_id,
                                      std::string mode,
                                      std::vector<catalog::CelestialObject> objects,
                                      const CompletionCallback& done)
{
    if (is_stale(generation))
    {
        ORR_CORE_TRACE("Orbital mechanics: dropping stale result for '{}'/'{}' (generation {}, current {})",
                       system_id, mode, generation, m_generation);
        return;
    }

    CalculationOutcome outcome;
    outcome.generation = generation;
    outcome.system_id  = std::move(system_id);
    outcome.mode       = std::move(mode);

    CacheKey key{outcome.system_id, outcome.mode};
    if (auto it = m_cache.find(key); it != m_cache.end())
    {
        outcome.result = it->second;
    }
    else
    {
        outcome.result = compute(objects, outcome.mode);
        m_cache.emplace(std::move(key), outcome.result);
        ORR_CORE_INFO("Orbital mechanics: {} placements for '{}' in mode '{}'",
                      outcome.result.size(), outcome.system_id, outcome.mode);
    }
    outcome.objects = std::move(objects);

    if (done)
    {
        done(outcome);
    }
}

// -----------------------------------------------------------------
// Cache
// -----------------------------------------------------------------

void OrbitalMechanicsPipeline::invalidate(std::string_view system_id)
{
    for (auto it = m_cache.begin(); it != m_cache.end();)
    {
        if (it->first.first == system_id)
        {
            it = m_cache.erase(it);
        }
        else
        {
            ++it;
        }
    }
}

void OrbitalMechanicsPipeline::invalidate_all()
{
    m_cache.clear();
}

const OrbitalMechanicsResult* OrbitalMechanicsPipeline::cached(std::string_view system_id,
                                                               std::string_view mode) const
{
    const auto it = m_cache.find(CacheKey{std::string(system_id), std::string(mode)});
    return it != m_cache.end() ? &it->second : nullptr;
}

void OrbitalMechanicsPipeline::set_system_scale(f64 scale)
{
    if (!std::isfinite(scale) || scale <= 0.0)
    {
        ORR_CORE_WARN("Orbital mechanics: ignoring invalid system scale {}", scale);
        return;
    }
    if (scale != m_system_scale)
    {
        m_system_scale = scale;
        invalidate_all();
    }
}

} // namespace orrery::scaling
