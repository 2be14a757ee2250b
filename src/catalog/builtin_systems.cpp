/// @file builtin_systems.cpp
/// @brief Built-in system tables.

#include "catalog/builtin_systems.hpp"

#include "core/logger.hpp"

#include <cmath>
#include <utility>

namespace orrery::catalog
{

namespace
{

// Format: {id, name, classification, mass (M_earth), radius (R_earth), T (K), parent, a (AU)}
struct Entry
{
    const char*    id;
    const char*    name;
    Classification cls;
    f64            mass;
    f64            radius;
    f64            temperature;
    const char*    parent;    ///< nullptr for the system primary
    f64            semi_major_axis;
};

constexpr Entry kSol[] = {
    { "sol",           "Sun",           Classification::Star,   333000.0,  109.2,  5778.0, nullptr,   0.0     },
    { "mercury",       "Mercury",       Classification::Planet,      0.055,  0.383,  440.0, "sol",     0.387   },
    { "venus",         "Venus",         Classification::Planet,      0.815,  0.949,  737.0, "sol",     0.723   },
    { "earth",         "Earth",         Classification::Planet,      1.0,    1.0,    288.0, "sol",     1.0     },
    { "luna",          "Moon",          Classification::Moon,        0.0123, 0.273,  250.0, "Earth",   0.00257 },
    { "mars",          "Mars",          Classification::Planet,      0.107,  0.532,  210.0, "sol",     1.524   },
    { "main-belt",     "Asteroid Belt", Classification::Belt,        0.0004, 0.0,    165.0, "sol",     2.7     },
    { "jupiter",       "Jupiter",       Classification::Planet,    317.8,   11.21,   165.0, "sol",     5.203   },
    { "io",            "Io",            Classification::Moon,        0.015,  0.286,  110.0, "jupiter", 0.00282 },
    { "europa",        "Europa",        Classification::Moon,        0.008,  0.245,  102.0, "jupiter", 0.00449 },
    { "ganymede",      "Ganymede",      Classification::Moon,        0.025,  0.413,  110.0, "jupiter", 0.00716 },
    { "callisto",      "Callisto",      Classification::Moon,        0.018,  0.378,  134.0, "jupiter", 0.01259 },
    { "saturn",        "Saturn",        Classification::Planet,     95.2,    9.45,   134.0, "sol",     9.537   },
    { "enceladus",     "Enceladus",     Classification::Moon,        0.000018, 0.0395, 75.0, "saturn", 0.00159 },
    { "titan",         "Titan",         Classification::Moon,        0.0225, 0.404,   94.0, "Saturn",  0.00817 },
    { "uranus",        "Uranus",        Classification::Planet,     14.5,    4.01,    76.0, "sol",     19.19   },
    { "neptune",       "Neptune",       Classification::Planet,     17.1,    3.88,    72.0, "sol",     30.07   },
    { "triton",        "Triton",        Classification::Moon,        0.0036, 0.212,   38.0, "neptune", 0.00237 },
};

constexpr Entry kAlphaCentauri[] = {
    { "alpha-cen-a",   "Alpha Centauri A", Classification::Star,   366000.0, 133.0, 5790.0, nullptr,            0.0    },
    { "alpha-cen-b",   "Alpha Centauri B", Classification::Star,   302000.0,  94.0, 5260.0, "alpha-cen-a",     23.4    },
    { "proxima",       "Proxima Centauri", Classification::Star,    40600.0,  16.8, 3042.0, "alpha-cen-a",   8700.0    },
    { "proxima-b",     "Proxima b",        Classification::Planet,      1.07,  1.07,  234.0, "Proxima Centauri", 0.0485 },
};

template <std::size_t N>
SystemSource::ObjectList build(const Entry (&entries)[N])
{
    SystemSource::ObjectList objects;
    objects.reserve(N);

    for (const auto& e : entries)
    {
        CelestialObject obj;
        obj.id             = e.id;
        obj.name           = e.name;
        obj.classification = e.cls;
        obj.properties.mass        = e.mass;
        obj.properties.radius      = e.radius;
        obj.properties.temperature = e.temperature;
        if (e.cls == Classification::Star)
        {
            // Rough mass-luminosity relation, L ~ M^3.5 (solar units)
            constexpr f64 kEarthMassesPerSolarMass = 333000.0;
            obj.properties.luminosity = std::pow(e.mass / kEarthMassesPerSolarMass, 3.5);
        }
        if (e.parent != nullptr)
        {
            obj.orbit = OrbitData{
                .parent          = e.parent,
                .semi_major_axis = e.semi_major_axis,
            };
        }
        objects.push_back(std::move(obj));
    }
    return objects;
}

} // anonymous namespace

BuiltinSystemSource::BuiltinSystemSource(core::TaskQueue& queue)
    : m_queue(queue)
{
}

void BuiltinSystemSource::list_objects(const std::string& system_id, ListCallback done)
{
    m_queue.post([system_id, done = std::move(done)]() {
        auto objects = load(system_id);
        if (!objects.has_value())
        {
            ORR_CORE_ERROR("BuiltinSystemSource: unknown system '{}'", system_id);
        }
        done(std::move(objects));
    });
}

std::vector<std::string> BuiltinSystemSource::get_available_systems(const std::string& /*mode*/) const
{
    // Every data mode ships the same built-in table
    return {"sol", "alpha-centauri"};
}

std::optional<SystemSource::ObjectList> BuiltinSystemSource::load(const std::string& system_id)
{
    if (iequals(system_id, "sol"))
    {
        return build(kSol);
    }
    if (iequals(system_id, "alpha-centauri"))
    {
        return build(kAlphaCentauri);
    }
    return std::nullopt;
}

} // namespace orrery::catalog
