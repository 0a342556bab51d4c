#pragma once

#include "../../Core/Public/Core.hpp"
#include "../../Core/Public/Expected.hpp"

#include <entt/entity/entity.hpp>

#include <cstdint>
#include <string>
#include <string_view>

class World;

/// Version number assigned by the script cache. Negative values mean "not found".
using ScriptVersion = std::int32_t;
constexpr static ScriptVersion kInvalidScriptVersion{-1};

/// Entity-scoped view handed to a behavior for the duration of one hook call.
/// Valid only inside that call; behaviors must not keep it.
struct ScriptContext
{
    World* world{nullptr};
    entt::entity entity{entt::null};
    std::string_view scriptId{};
    ScriptVersion version{kInvalidScriptVersion};
    float deltaTime{0.0f};
};

/// A named event delivered to every active script on an entity.
struct ScriptEvent
{
    std::string name;
    double value{0.0};
};

LW_SUPPRESS_DLL_WARNINGS

/// Minimal capability set every attached script provides.
///
/// One instance exists per script version and is shared by all entities the
/// script is attached to, so per-entity state belongs on the entity, not in the
/// instance. Implementations must tolerate concurrent calls for different entities.
class LW_EXPORT IScriptBehavior
{
  public:
    virtual ~IScriptBehavior() = default;

    /// Called once per entity before its first tick with this instance.
    virtual Result<> initialize(ScriptContext& context) = 0;

    /// Called every simulation tick.
    virtual Result<> tick(ScriptContext& context, float deltaTime) = 0;

    /// Called for each event dispatched to the owning entity.
    virtual Result<> handle_event(ScriptContext& context, const ScriptEvent& event) = 0;

    /// Called when an initialized script is detached from an entity or the entity is destroyed.
    virtual Result<> unload(ScriptContext& /*context*/)
    {
        return {};
    }
};

LW_RESTORE_DLL_WARNINGS
