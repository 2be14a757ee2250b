#pragma once

/// @file view_mode_registry.hpp
/// @brief Lookup of view-mode tunables by mode name, with an explorational fallback.

#include "view/view_mode_config.hpp"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace orrery::view
{
    /// @brief Outcome of validating a ViewModeConfig before registration.
    struct ViewModeValidation
    {
        std::vector<std::string> errors;
        std::vector<std::string> warnings;

        [[nodiscard]] bool is_valid() const { return errors.empty(); }
    };

    /// @brief Name of the mode used whenever a lookup misses.
    inline constexpr std::string_view kFallbackModeId = "explorational";

    /// @brief Upper bound, per child, on the span of an equidistant diagram.
    inline constexpr f64 kDiagramSpanPerChild = 5.0;

    // Built-in mode definitions
    [[nodiscard]] ViewModeConfig explorational_mode();
    [[nodiscard]] ViewModeConfig navigational_mode();
    [[nodiscard]] ViewModeConfig profile_mode();
    [[nodiscard]] ViewModeConfig scientific_mode();
    [[nodiscard]] ViewModeConfig cinematic_mode();

    /// @brief Registry of immutable per-mode configurations.
    ///
    /// Populated at startup; afterwards only read. get_config() never fails:
    /// unknown names resolve to the explorational configuration.
    class ViewModeRegistry
    {
    public:
        ViewModeRegistry();

        /// @brief Registry holding every built-in mode.
        [[nodiscard]] static ViewModeRegistry create_builtin();

        /// @brief Check the invariants a configuration must satisfy to be registered.
        [[nodiscard]] static ViewModeValidation validate(const ViewModeConfig& config);

        /// @brief Add a mode. Rejects invalid configs and, unless `replace` is set, duplicates.
        /// @return true if the mode is now registered under config.id.
        bool register_mode(ViewModeConfig config, bool replace = false);

        /// @brief Configuration for `mode`, or the explorational configuration if unknown.
        [[nodiscard]] const ViewModeConfig& get_config(std::string_view mode) const;

        [[nodiscard]] bool has(std::string_view mode) const;

        /// @brief Registered mode ids in registration order.
        [[nodiscard]] const std::vector<std::string>& ids() const { return m_order; }

    private:
        std::unordered_map<std::string, ViewModeConfig> m_modes;
        std::vector<std::string> m_order;
        ViewModeConfig m_fallback;   ///< Used until explorational itself is registered
    };

} // namespace orrery::view
