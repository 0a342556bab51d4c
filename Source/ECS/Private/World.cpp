#include "../Public/World.hpp"
#include "../Public/ScriptAttachmentRegistry.hpp"

#include <fmt/core.h>

#include <cstdint>
#include <memory>

entt::entity World::create_entity(std::string name)
{
    entt::entity entity = m_registry.create();

    m_registry.emplace<NameComponent>(entity, std::move(name));
    m_registry.emplace<TransformComponent>(entity);
    m_registry.emplace<ScriptVariablesComponent>(entity);

    return entity;
}

void World::destroy_entity(entt::entity entity)
{
    if (!m_registry.valid(entity))
        return;

    if (auto* component = m_registry.try_get<ScriptAttachmentsComponent>(entity))
    {
        std::vector<ScriptAttachment*> ordered;
        ordered.reserve(component->attachments.size());
        for (auto& attachment : component->attachments)
            ordered.push_back(&attachment);
        ScriptAttachmentRegistry::sort_by_execution_order(ordered);

        for (ScriptAttachment* attachment : ordered)
        {
            auto unloaded = unload_attachment(entity, *attachment);
            if (!unloaded)
                fmt::print("[World] unload of '{}' failed on entity {}: {}\n", attachment->scriptId,
                           static_cast<std::uint32_t>(entity), unloaded.error().message);
        }
    }

    m_registry.destroy(entity);
}

Result<> World::unload_attachment(entt::entity entity, ScriptAttachment& attachment)
{
    std::shared_ptr<IScriptBehavior> instance = attachment.initializedInstance.lock();
    const ScriptVersion version = attachment.initializedVersion;
    attachment.initializedInstance.reset();
    attachment.initializedVersion = kInvalidScriptVersion;
    if (!instance)
        return {};

    ScriptContext context{this, entity, attachment.scriptId, version, 0.0f};
    return guarded_call(ErrorCode::ScriptExecutionFailed, [&] { return instance->unload(context); });
}

std::vector<entt::entity> World::collect_scripted_entities() const
{
    auto view = m_registry.view<const ScriptAttachmentsComponent>();
    return std::vector<entt::entity>(view.begin(), view.end());
}

std::size_t World::entity_count() const noexcept
{
    // create_entity() always emplaces a NameComponent.
    return m_registry.view<const NameComponent>().size();
}
