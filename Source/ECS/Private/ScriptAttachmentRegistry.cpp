#include "../Public/ScriptAttachmentRegistry.hpp"
#include "../Public/World.hpp"

#include <fmt/core.h>

#include <algorithm>

namespace
{

bool execution_order_less(const ScriptAttachment& lhs, const ScriptAttachment& rhs) noexcept
{
    if (lhs.priority != rhs.priority)
        return lhs.priority > rhs.priority;
    return lhs.sequence < rhs.sequence;
}

std::vector<ScriptAttachment> sorted_copy(const ScriptAttachmentsComponent& component, bool activeOnly)
{
    std::vector<ScriptAttachment> result;
    result.reserve(component.attachments.size());
    for (const auto& attachment : component.attachments)
    {
        if (!activeOnly || attachment.active)
            result.push_back(attachment);
    }
    std::sort(result.begin(), result.end(), execution_order_less);
    return result;
}

} // namespace

// ── Mutation ──────────────────────────────────────────────────────────

Result<> ScriptAttachmentRegistry::add_attachment(entt::entity entity, std::string_view scriptId, std::int32_t priority)
{
    if (scriptId.empty())
        return make_error("Script identifier must not be empty", ErrorCode::InvalidScriptIdentifier);

    auto& reg = m_world->registry();
    if (!reg.valid(entity))
        return make_error(fmt::format("Cannot attach '{}': invalid entity", scriptId), ErrorCode::InvalidEntity);

    auto& component = reg.get_or_emplace<ScriptAttachmentsComponent>(entity);
    auto existing = std::find_if(component.attachments.begin(), component.attachments.end(),
                                 [&](const ScriptAttachment& a) { return a.scriptId == scriptId; });
    if (existing != component.attachments.end())
        return make_error(fmt::format("Script '{}' is already attached to entity {}", scriptId,
                                      static_cast<std::uint32_t>(entity)),
                          ErrorCode::ScriptAlreadyAttached);

    // Scripts write their state here during ticks; it has to exist before the first one.
    reg.get_or_emplace<ScriptVariablesComponent>(entity);

    ScriptAttachment attachment;
    attachment.scriptId = std::string(scriptId);
    attachment.priority = priority;
    attachment.active = true;
    attachment.sequence = component.nextSequence++;
    component.attachments.push_back(std::move(attachment));
    return {};
}

bool ScriptAttachmentRegistry::remove_attachment(entt::entity entity, std::string_view scriptId)
{
    auto& reg = m_world->registry();
    if (!reg.valid(entity))
        return false;

    auto* component = reg.try_get<ScriptAttachmentsComponent>(entity);
    if (!component)
        return false;

    auto& attachments = component->attachments;
    auto it = std::find_if(attachments.begin(), attachments.end(),
                           [&](const ScriptAttachment& a) { return a.scriptId == scriptId; });
    if (it == attachments.end())
        return false;

    auto unloaded = m_world->unload_attachment(entity, *it);
    if (!unloaded)
        fmt::print("[ScriptAttachments] unload of '{}' failed on entity {}: {}\n", it->scriptId,
                   static_cast<std::uint32_t>(entity), unloaded.error().message);

    // Scripts have no access to attachment storage, so `it` is still valid.
    attachments.erase(it);
    if (attachments.empty())
        reg.remove<ScriptAttachmentsComponent>(entity);
    return true;
}

bool ScriptAttachmentRegistry::set_active(entt::entity entity, std::string_view scriptId, bool active)
{
    auto& reg = m_world->registry();
    if (!reg.valid(entity))
        return false;

    auto* component = reg.try_get<ScriptAttachmentsComponent>(entity);
    if (!component)
        return false;

    for (auto& attachment : component->attachments)
    {
        if (attachment.scriptId == scriptId)
        {
            attachment.active = active;
            return true;
        }
    }
    return false;
}

// ── Queries ───────────────────────────────────────────────────────────

bool ScriptAttachmentRegistry::has_attachment(entt::entity entity, std::string_view scriptId) const
{
    const auto& reg = m_world->registry();
    if (!reg.valid(entity))
        return false;

    const auto* component = reg.try_get<ScriptAttachmentsComponent>(entity);
    if (!component)
        return false;

    return std::any_of(component->attachments.begin(), component->attachments.end(),
                       [&](const ScriptAttachment& a) { return a.scriptId == scriptId; });
}

std::size_t ScriptAttachmentRegistry::attachment_count(entt::entity entity) const
{
    const auto& reg = m_world->registry();
    if (!reg.valid(entity))
        return 0;

    const auto* component = reg.try_get<ScriptAttachmentsComponent>(entity);
    return component ? component->attachments.size() : 0;
}

std::vector<ScriptAttachment> ScriptAttachmentRegistry::attachments_in_order(entt::entity entity) const
{
    const auto& reg = m_world->registry();
    if (!reg.valid(entity))
        return {};

    const auto* component = reg.try_get<ScriptAttachmentsComponent>(entity);
    return component ? sorted_copy(*component, false) : std::vector<ScriptAttachment>{};
}

std::vector<ScriptAttachment> ScriptAttachmentRegistry::active_attachments_in_order(entt::entity entity) const
{
    const auto& reg = m_world->registry();
    if (!reg.valid(entity))
        return {};

    const auto* component = reg.try_get<ScriptAttachmentsComponent>(entity);
    return component ? sorted_copy(*component, true) : std::vector<ScriptAttachment>{};
}

void ScriptAttachmentRegistry::sort_by_execution_order(std::vector<ScriptAttachment*>& attachments)
{
    std::sort(attachments.begin(), attachments.end(),
              [](const ScriptAttachment* lhs, const ScriptAttachment* rhs) { return execution_order_less(*lhs, *rhs); });
}
