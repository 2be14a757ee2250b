#pragma once

/// @file types.hpp
/// @brief Precision aliases and world-space vector types.

#include <glm/vec3.hpp>

#include <cstdint>

namespace orrery
{
    // Precision aliases
    using f32 = float;
    using f64 = double;
    using u8  = uint8_t;
    using u16 = uint16_t;
    using u32 = uint32_t;
    using u64 = uint64_t;
    using i32 = int32_t;
    using i64 = int64_t;

    // World-space vectors (double precision; scene units)
    using Vec3d = glm::dvec3;

    // Handle into the scene index (arena slot), owned by the rendering layer
    using SceneRef = u32;

    // World basis used by camera framing: y is up, z is forward (toward the viewer)
    namespace world_axes
    {
        inline const Vec3d kUp{0.0, 1.0, 0.0};
        inline const Vec3d kForward{0.0, 0.0, 1.0};
    }
}
