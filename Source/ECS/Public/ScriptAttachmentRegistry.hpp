#pragma once
#include "../../Core/Public/Core.hpp"
#include "../../Core/Public/Expected.hpp"
#include "Components.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include <entt/entity/entity.hpp>

class World;

LW_SUPPRESS_DLL_WARNINGS

/// Mutates and orders the script attachments stored on entities of a World.
///
/// Ordering is a pure function of (priority desc, insertion order asc); the order
/// in which the registry stores entities or components never affects it.
class LW_EXPORT ScriptAttachmentRegistry
{
  public:
    explicit ScriptAttachmentRegistry(World& world) noexcept : m_world(&world)
    {}

    /// Attaches `scriptId` to `entity`. A script can be attached to an entity only once.
    Result<> add_attachment(entt::entity entity, std::string_view scriptId, std::int32_t priority = 0);

    /// Detaches `scriptId`, calling unload() first if the script was initialized on `entity`.
    /// A failing unload is logged and the script is detached anyway. Returns false if it was not attached.
    bool remove_attachment(entt::entity entity, std::string_view scriptId);

    /// Flips the active flag in place. Returns false if the script is not attached.
    bool set_active(entt::entity entity, std::string_view scriptId, bool active);

    /// Returns true if `scriptId` is attached (active or not).
    bool has_attachment(entt::entity entity, std::string_view scriptId) const;

    /// Number of attachment records on the entity, inactive ones included.
    std::size_t attachment_count(entt::entity entity) const;

    /// All attachments in execution order, inactive ones included.
    std::vector<ScriptAttachment> attachments_in_order(entt::entity entity) const;

    /// Active attachments in execution order.
    std::vector<ScriptAttachment> active_attachments_in_order(entt::entity entity) const;

    /// Sorts attachment pointers into execution order. Used by the scheduler and World::destroy_entity().
    static void sort_by_execution_order(std::vector<ScriptAttachment*>& attachments);

  private:
    World* m_world;
};

LW_RESTORE_DLL_WARNINGS
