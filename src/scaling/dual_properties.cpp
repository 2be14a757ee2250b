/// @file dual_properties.cpp
/// @brief Dual properties resolution and object type inference.

#include "scaling/dual_properties.hpp"

#include "core/logger.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <string>
#include <vector>

namespace orrery::scaling
{

namespace
{

// Thresholds in Earth units
constexpr f64 kStellarMassThreshold   = 26000.0;  // ~0.08 solar masses (hydrogen burning limit)
constexpr f64 kGasGiantMassThreshold  = 10.0;
constexpr f64 kGasGiantRadiusThreshold = 6.0;
constexpr f64 kAsteroidMassThreshold  = 0.001;

constexpr std::array kStarWords     = {"star", "sun", "sol", "centauri"};
constexpr std::array kGasGiantWords = {"jupiter", "saturn", "uranus", "neptune", "giant"};
constexpr std::array kMoonWords     = {"moon", "satellite", "luna", "europa", "io", "ganymede",
                                       "callisto", "titan", "enceladus", "triton"};
constexpr std::array kAsteroidWords = {"asteroid", "belt", "ceres", "vesta", "pallas", "juno"};

/// Lowercase words of a display name ("Alpha Centauri A" -> alpha, centauri, a).
std::vector<std::string> name_words(std::string_view name)
{
    std::vector<std::string> words;
    std::string current;
    for (char c : name)
    {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc))
        {
            current.push_back(static_cast<char>(std::tolower(uc)));
        }
        else if (!current.empty())
        {
            words.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty())
    {
        words.push_back(std::move(current));
    }
    return words;
}

template <std::size_t N>
bool contains_any(const std::vector<std::string>& words, const std::array<const char*, N>& patterns)
{
    return std::any_of(words.begin(), words.end(), [&](const std::string& w) {
        return std::find_if(patterns.begin(), patterns.end(),
                            [&](const char* p) { return w == p; }) != patterns.end();
    });
}

bool looks_like_gas_giant(const std::vector<std::string>& words, f64 mass, f64 radius)
{
    return contains_any(words, kGasGiantWords)
        || mass > kGasGiantMassThreshold
        || radius > kGasGiantRadiusThreshold;
}

bool usable(f64 value)
{
    return std::isfinite(value) && value > 0.0;
}

} // anonymous namespace

DualPropertiesResolver::DualPropertiesResolver(const view::ViewModeRegistry& registry)
    : m_registry(registry)
{
}

// -----------------------------------------------------------------
// Object type inference
// -----------------------------------------------------------------

view::ObjectType DualPropertiesResolver::determine_object_type(
    std::string_view name,
    f64 mass,
    f64 radius,
    std::optional<catalog::Classification> classification)
{
    using catalog::Classification;
    using view::ObjectType;

    const auto words = name_words(name);

    if (classification.has_value())
    {
        switch (*classification)
        {
            case Classification::Star:   return ObjectType::Star;
            case Classification::Moon:   return ObjectType::Moon;
            case Classification::Belt:   return ObjectType::Asteroid;
            case Classification::Planet:
                return looks_like_gas_giant(words, mass, radius) ? ObjectType::GasGiant
                                                                 : ObjectType::Planet;
            case Classification::Other:
            default:
                break;
        }
    }

    // Name patterns
    if (contains_any(words, kStarWords))     return ObjectType::Star;
    if (contains_any(words, kGasGiantWords)) return ObjectType::GasGiant;
    if (contains_any(words, kMoonWords))     return ObjectType::Moon;
    if (contains_any(words, kAsteroidWords)) return ObjectType::Asteroid;

    // Physical thresholds
    if (usable(mass))
    {
        if (mass >= kStellarMassThreshold)  return ObjectType::Star;
        if (mass > kGasGiantMassThreshold)  return ObjectType::GasGiant;
        if (mass < kAsteroidMassThreshold)  return ObjectType::Asteroid;
    }
    if (usable(radius) && radius > kGasGiantRadiusThreshold)
    {
        return ObjectType::GasGiant;
    }

    if (!usable(mass) && !usable(radius))
    {
        ORR_CORE_WARN("DualProperties: nothing identifies '{}', defaulting to planet", name);
    }
    return ObjectType::Planet;
}

// -----------------------------------------------------------------
// View distances
//
// optimal = visual_radius * radius_multiplier
// min/max = clamp(visual_radius * {min,max}_multiplier, absolute_min, absolute_max)
// -----------------------------------------------------------------

ViewDistances DualPropertiesResolver::view_distances(f64 visual_radius, const view::CameraConfig& camera)
{
    ViewDistances d;
    d.min = std::clamp(visual_radius * camera.min_distance_multiplier,
                       camera.absolute_min_distance, camera.absolute_max_distance);
    d.max = std::clamp(visual_radius * camera.max_distance_multiplier,
                       camera.absolute_min_distance, camera.absolute_max_distance);
    d.optimal = std::clamp(visual_radius * camera.radius_multiplier, d.min, d.max);
    return d;
}

// -----------------------------------------------------------------
// Resolution
// -----------------------------------------------------------------

DualProperties DualPropertiesResolver::resolve(f64 real_radius,
                                               f64 real_orbit_radius,
                                               f64 real_mass,
                                               std::string_view name,
                                               std::string_view mode,
                                               f64 system_scale,
                                               std::optional<catalog::Classification> classification) const
{
    const view::ViewModeConfig& config = m_registry.get_config(mode);
    const f64 scale = usable(system_scale) ? system_scale : 1.0;

    DualProperties props;
    props.real_radius       = real_radius;
    props.real_orbit_radius = real_orbit_radius;
    props.real_mass         = real_mass;
    props.object_type       = determine_object_type(name, real_mass, real_radius, classification);

    // Degenerate radii resolve to the smallest visible size
    if (usable(real_radius))
    {
        const f64 factor = config.object_scaling.factor_for(props.object_type);
        props.visual_radius = std::clamp(real_radius * factor * scale,
                                         config.min_visual_size, config.max_visual_size);
    }
    else
    {
        props.visual_radius = config.min_visual_size;
    }

    props.visual_orbit_radius = usable(real_orbit_radius)
        ? real_orbit_radius * config.orbit_scaling_factor * scale
        : 0.0;

    const ViewDistances distances = view_distances(props.visual_radius, config.camera);
    props.optimal_view_distance = distances.optimal;
    props.min_view_distance     = distances.min;
    props.max_view_distance     = distances.max;

    return props;
}

DualProperties DualPropertiesResolver::resolve(const catalog::CelestialObject& object,
                                               std::string_view mode,
                                               f64 system_scale) const
{
    return resolve(object.properties.radius,
                   object.orbit_radius(),
                   object.properties.mass,
                   object.name,
                   mode,
                   system_scale,
                   object.classification);
}

} // namespace orrery::scaling
