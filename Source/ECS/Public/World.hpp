#pragma once
#include "../../Core/Public/Core.hpp"
#include "../../Core/Public/Expected.hpp"
#include "Components.hpp"

#include <cstddef>
#include <string>
#include <vector>

#include <entt/entity/registry.hpp>

LW_SUPPRESS_DLL_WARNINGS

/// ECS world: wraps an entt::registry and provides entity lifecycle management
/// for scripted simulation entities.
class LW_EXPORT World
{
  public:
    World() = default;

    // ── Entity lifecycle ──────────────────────────────────────────────

    /// Creates a new entity with Name, Transform and ScriptVariables.
    /// Every component a script may write is created here, so ticks never add components.
    entt::entity create_entity(std::string name = "");

    /// Destroys an entity together with its attachments. Initialized scripts get
    /// unload() first, in execution order; a failing unload is logged and skipped.
    void destroy_entity(entt::entity entity);

    /// Calls unload() on the instance `attachment` was initialized with, if that instance
    /// is still alive, and forgets it. Exceptions from the script are returned as errors.
    Result<> unload_attachment(entt::entity entity, ScriptAttachment& attachment);

    bool is_valid(entt::entity entity) const noexcept
    {
        return m_registry.valid(entity);
    }

    /// Returns every entity that carries at least one script attachment.
    std::vector<entt::entity> collect_scripted_entities() const;

    /// Number of live entities.
    std::size_t entity_count() const noexcept;

    // ── Registry access ───────────────────────────────────────────────

    entt::registry& registry() noexcept
    {
        return m_registry;
    }
    const entt::registry& registry() const noexcept
    {
        return m_registry;
    }

  private:
    entt::registry m_registry;
};

LW_RESTORE_DLL_WARNINGS
