#pragma once

/// @file orbital_mechanics.hpp
/// @brief System-wide visual size and orbit distance calculation (cached, cancellable).

#include "catalog/system_source.hpp"
#include "core/task_queue.hpp"
#include "core/types.hpp"
#include "scaling/dual_properties.hpp"

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace orrery::scaling
{
    /// @brief Visual size of one body and its distance from its parent (scene units).
    struct OrbitalPlacement
    {
        f64 visual_radius  = 0.0;
        f64 orbit_distance = 0.0;
    };

    /// @brief Object id -> placement. Ids that were not computed are simply absent.
    using OrbitalMechanicsResult = std::unordered_map<std::string, OrbitalPlacement>;

    enum class CalculationStatus : u8
    {
        Ok,
        LoadFailed,
    };

    /// @brief What a completed (non-stale) calculation hands back to its caller.
    struct CalculationOutcome
    {
        u64 generation = 0;
        std::string system_id;
        std::string mode;
        CalculationStatus status = CalculationStatus::Ok;
        OrbitalMechanicsResult result;
        std::vector<catalog::CelestialObject> objects;   ///< Descriptors the result was computed from
        std::string error;

        [[nodiscard]] bool ok() const { return status == CalculationStatus::Ok; }
    };

    /// @brief Computes OrbitalMechanicsResult for whole systems.
    ///
    /// Every calculate()/load_and_calculate() call takes a new generation number.
    /// A completion is delivered only if its generation is still the latest one
    /// started; otherwise it is dropped before it can reach the cache or the
    /// callback. All work completes through the TaskQueue, so the pipeline must
    /// outlive any queue drain that may still run its tasks.
    class OrbitalMechanicsPipeline
    {
    public:
        using CompletionCallback = std::function<void(const CalculationOutcome&)>;

        OrbitalMechanicsPipeline(const DualPropertiesResolver& resolver,
                                 catalog::SystemSource& source,
                                 core::TaskQueue& queue);

        OrbitalMechanicsPipeline(const OrbitalMechanicsPipeline&) = delete;
        OrbitalMechanicsPipeline& operator=(const OrbitalMechanicsPipeline&) = delete;

        /// @brief Synchronous, side-effect free computation for one object list.
        ///
        /// Any fault inside the computation (an exception or a non-finite value)
        /// yields an empty mapping.
        [[nodiscard]] OrbitalMechanicsResult compute(const std::vector<catalog::CelestialObject>& objects,
                                                     std::string_view mode) const;

        /// @brief Compute for descriptors the caller already holds.
        /// @return The generation assigned to this request.
        u64 calculate(std::string system_id,
                      std::vector<catalog::CelestialObject> objects,
                      std::string mode,
                      CompletionCallback done);

        /// @brief Fetch the system from the SystemSource, then compute.
        /// A loader failure completes with CalculationStatus::LoadFailed.
        /// @return The generation assigned to this request.
        u64 load_and_calculate(std::string system_id, std::string mode, CompletionCallback done);

        /// @brief Drop every cached result of one system (all modes).
        void invalidate(std::string_view system_id);
        void invalidate_all();

        /// @brief Cached result for (system, mode), or nullptr.
        [[nodiscard]] const OrbitalMechanicsResult* cached(std::string_view system_id,
                                                           std::string_view mode) const;

        [[nodiscard]] u64 current_generation() const { return m_generation; }
        [[nodiscard]] std::size_t cache_size() const { return m_cache.size(); }

        /// @brief Global size multiplier; changing it invalidates the cache.
        void set_system_scale(f64 scale);
        [[nodiscard]] f64 system_scale() const { return m_system_scale; }

    private:
        using CacheKey = std::pair<std::string, std::string>;

        [[nodiscard]] bool is_stale(u64 generation) const { return generation != m_generation; }

        void finish(u64 generation,
                    std::string system_id,
                    std::string mode,
                    std::vector<catalog::CelestialObject> objects,
                    const CompletionCallback& done);

        void place_children(const std::vector<const catalog::CelestialObject*>& children,
                            const std::string& parent_id,
                            const view::ViewModeConfig& config,
                            OrbitalMechanicsResult& result) const;

        const DualPropertiesResolver& m_resolver;
        catalog::SystemSource& m_source;
        core::TaskQueue& m_queue;

        std::map<CacheKey, OrbitalMechanicsResult> m_cache;
        u64 m_generation   = 0;
        f64 m_system_scale = 1.0;
    };

} // namespace orrery::scaling
