#include "../Public/LuaBindings.hpp"

#include "../../ECS/Public/World.hpp"

bool LuaEntity::valid() const noexcept
{
    return world && handle != entt::null && world->registry().valid(handle);
}

std::string LuaEntity::name() const
{
    if (!valid())
        return "";
    const auto* nc = world->registry().try_get<NameComponent>(handle);
    return nc ? nc->name : "";
}

std::uint32_t LuaEntity::id() const noexcept
{
    return static_cast<std::uint32_t>(handle);
}

LuaVec3 LuaEntity::get_position() const
{
    if (!valid())
        return {};
    const auto* tc = world->registry().try_get<TransformComponent>(handle);
    return tc ? LuaVec3(tc->position) : LuaVec3{};
}

void LuaEntity::set_position(const LuaVec3& position)
{
    if (!valid())
        return;
    if (auto* tc = world->registry().try_get<TransformComponent>(handle))
        tc->position = position.to_vec3();
}

double LuaEntity::get_var(const std::string& key, double fallback) const
{
    if (!valid())
        return fallback;
    const auto* vars = world->registry().try_get<ScriptVariablesComponent>(handle);
    if (!vars)
        return fallback;
    auto it = vars->values.find(key);
    return it != vars->values.end() ? it->second : fallback;
}

void LuaEntity::set_var(const std::string& key, double value)
{
    if (!valid())
        return;
    // Never emplace here: structural changes are not allowed during a parallel tick.
    if (auto* vars = world->registry().try_get<ScriptVariablesComponent>(handle))
        vars->values[key] = value;
}
