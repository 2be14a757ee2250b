#pragma once

/// @file builtin_systems.hpp
/// @brief Compiled-in star systems served through the SystemSource boundary.

#include "catalog/system_source.hpp"
#include "core/task_queue.hpp"

#include <optional>
#include <string>
#include <vector>

namespace orrery::catalog
{
    /// @brief SystemSource backed by a small built-in table (Sol, Alpha Centauri).
    ///
    /// Results are delivered asynchronously by posting onto the TaskQueue, which
    /// mirrors how a file or network loader completes on the UI loop.
    class BuiltinSystemSource final : public SystemSource
    {
    public:
        explicit BuiltinSystemSource(core::TaskQueue& queue);

        void list_objects(const std::string& system_id, ListCallback done) override;

        [[nodiscard]] std::vector<std::string> get_available_systems(const std::string& mode) const override;

        /// @brief Synchronous lookup of a built-in system (nullopt for unknown ids).
        [[nodiscard]] static std::optional<ObjectList> load(const std::string& system_id);

    private:
        core::TaskQueue& m_queue;
    };

} // namespace orrery::catalog
