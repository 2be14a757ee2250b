#pragma once

/// @file system_source.hpp
/// @brief Boundary to the external system data loader.

#include "catalog/celestial_object.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace orrery::catalog
{
    /// @brief Asynchronous provider of star-system descriptors.
    ///
    /// Implementations may complete immediately or later (e.g. by posting onto the
    /// viewer's TaskQueue). A load failure is reported as std::nullopt.
    class SystemSource
    {
    public:
        using ObjectList = std::vector<CelestialObject>;
        using ListCallback = std::function<void(std::optional<ObjectList>)>;

        virtual ~SystemSource() = default;

        /// @brief Fetch all descriptors of one system. `done` is invoked exactly once.
        virtual void list_objects(const std::string& system_id, ListCallback done) = 0;

        /// @brief Ids of the systems available in a data mode (e.g. "realistic").
        [[nodiscard]] virtual std::vector<std::string> get_available_systems(const std::string& mode) const = 0;
    };

} // namespace orrery::catalog
