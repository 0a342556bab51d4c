#pragma once
#include "../../Core/Public/Core.hpp"
#include "../../Scripting/Public/ScriptBehavior.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <entt/entity/entity.hpp>

/// Name identifier for an entity.
struct NameComponent
{
    std::string name;
};

struct Vec3
{
    float x{0.0f};
    float y{0.0f};
    float z{0.0f};
};

/// Position and scale. Scripts move entities by writing `position`.
struct TransformComponent
{
    Vec3 position{0.0f, 0.0f, 0.0f};
    Vec3 scale{1.0f, 1.0f, 1.0f};
};

/// Per-entity numeric blackboard readable and writable from scripts.
/// Script instances are shared between entities, so this is where per-entity script state lives.
struct ScriptVariablesComponent
{
    std::unordered_map<std::string, double> values;
};

/// One script bound to an entity.
struct ScriptAttachment
{
    std::string scriptId;
    std::int32_t priority{0};
    bool active{true};
    std::uint64_t sequence{0}; // insertion order on the owning entity

    // Identity of the instance this attachment last ran initialize() on, and its version.
    // Ticks never call through it; the scheduler always resolves through the cache.
    // Only unload() on detach or entity destruction uses it.
    std::weak_ptr<IScriptBehavior> initializedInstance;
    ScriptVersion initializedVersion{kInvalidScriptVersion};
};

/// All scripts attached to an entity, kept in insertion order.
/// Toggling `active` never restructures this list.
struct ScriptAttachmentsComponent
{
    std::vector<ScriptAttachment> attachments;
    std::uint64_t nextSequence{0};
};
