#include "LuaScriptBehavior.hpp"
#include "../Public/LuaBindings.hpp"

#include <fmt/core.h>

#include <cstddef>

LuaScriptBehavior::LuaScriptBehavior(std::string name) : m_name(std::move(name))
{}

// Members referencing the VM are declared after it, so they are released first.
LuaScriptBehavior::~LuaScriptBehavior() = default;

// ── load ──────────────────────────────────────────────────────────────

Result<> LuaScriptBehavior::load(std::string_view bytecode)
{
    std::lock_guard lock(m_mutex);

    m_lua.open_libraries(sol::lib::base, sol::lib::math, sol::lib::string, sol::lib::table);
    register_bindings();

    auto result = m_lua.safe_script(bytecode, sol::script_pass_on_error, m_name, sol::load_mode::binary);
    if (!result.valid())
    {
        sol::error err = result;
        return make_error(fmt::format("Lua error while running '{}': {}", m_name, err.what()),
                          ErrorCode::ScriptInstantiationFailed);
    }

    if (result.return_count() == 0)
        return make_error(fmt::format("Script '{}' must return a behavior table", m_name),
                          ErrorCode::ScriptInstantiationFailed);

    sol::object returned = result.get<sol::object>();
    if (returned.get_type() != sol::type::table)
        return make_error(fmt::format("Script '{}' returned a {} instead of a behavior table", m_name,
                                      sol::type_name(m_lua.lua_state(), returned.get_type())),
                          ErrorCode::ScriptInstantiationFailed);

    sol::table behavior = returned.as<sol::table>();

    sol::object onTick = behavior["on_tick"];
    if (onTick.get_type() != sol::type::function)
        return make_error(fmt::format("Script '{}' does not define on_tick(entity, dt)", m_name),
                          ErrorCode::ScriptInstantiationFailed);

    for (const char* optionalHook : {"on_initialize", "on_event", "on_unload"})
    {
        sol::object hook = behavior[optionalHook];
        if (hook.get_type() != sol::type::lua_nil && hook.get_type() != sol::type::function)
            return make_error(fmt::format("Script '{}': {} must be a function", m_name, optionalHook),
                              ErrorCode::ScriptInstantiationFailed);
    }

    m_behavior = behavior;
    m_onTick = behavior["on_tick"];
    if (behavior["on_initialize"].get_type() == sol::type::function)
        m_onInitialize = behavior["on_initialize"];
    if (behavior["on_event"].get_type() == sol::type::function)
        m_onEvent = behavior["on_event"];
    if (behavior["on_unload"].get_type() == sol::type::function)
        m_onUnload = behavior["on_unload"];

    return {};
}

// ── Hooks ─────────────────────────────────────────────────────────────

Result<> LuaScriptBehavior::initialize(ScriptContext& context)
{
    std::lock_guard lock(m_mutex);
    if (!m_onInitialize.valid())
        return {};

    LuaEntity entity{context.entity, context.world};
    return check_result(m_onInitialize(entity), "on_initialize");
}

Result<> LuaScriptBehavior::tick(ScriptContext& context, float deltaTime)
{
    std::lock_guard lock(m_mutex);
    if (!m_onTick.valid())
        return make_error(fmt::format("Script '{}' is not loaded", m_name), ErrorCode::ScriptExecutionFailed);

    LuaEntity entity{context.entity, context.world};
    return check_result(m_onTick(entity, deltaTime), "on_tick");
}

Result<> LuaScriptBehavior::handle_event(ScriptContext& context, const ScriptEvent& event)
{
    std::lock_guard lock(m_mutex);
    if (!m_onEvent.valid())
        return {};

    LuaEntity entity{context.entity, context.world};
    return check_result(m_onEvent(entity, event.name, event.value), "on_event");
}

Result<> LuaScriptBehavior::unload(ScriptContext& context)
{
    std::lock_guard lock(m_mutex);
    if (!m_onUnload.valid())
        return {};

    LuaEntity entity{context.entity, context.world};
    return check_result(m_onUnload(entity), "on_unload");
}

Result<> LuaScriptBehavior::check_result(sol::protected_function_result result, std::string_view hook) const
{
    if (result.valid())
        return {};

    sol::error err = result;
    return make_error(fmt::format("{} in '{}': {}", hook, m_name, err.what()), ErrorCode::ScriptExecutionFailed);
}

// ── Bindings ──────────────────────────────────────────────────────────

void LuaScriptBehavior::register_bindings()
{
    auto& lua = m_lua;

    // Override print() to go through fmt
    lua.set_function("print", [name = m_name](sol::variadic_args va) {
        std::string msg;
        for (std::size_t i = 0; i < va.size(); ++i)
        {
            if (i > 0)
                msg += "\t";
            sol::object obj = va[i];
            if (obj.is<std::string>())
                msg += obj.as<std::string>();
            else if (obj.is<double>())
                msg += fmt::format("{}", obj.as<double>());
            else if (obj.is<bool>())
                msg += obj.as<bool>() ? "true" : "false";
            else if (obj.is<sol::nil_t>())
                msg += "nil";
            else
                msg += fmt::format("[{}]", sol::type_name(va.lua_state(), obj.get_type()));
        }
        fmt::print("[Lua:{}] {}\n", name, msg);
    });

    lua.new_usertype<LuaVec3>(
        "Vec3", sol::constructors<LuaVec3(), LuaVec3(float, float, float)>(), "x", &LuaVec3::x, "y", &LuaVec3::y, "z",
        &LuaVec3::z, sol::meta_function::addition, &LuaVec3::operator+, sol::meta_function::subtraction,
        sol::resolve<LuaVec3(const LuaVec3&) const>(&LuaVec3::operator-), sol::meta_function::multiplication,
        &LuaVec3::operator*, sol::meta_function::unary_minus, sol::resolve<LuaVec3() const>(&LuaVec3::operator-),
        "length", &LuaVec3::length, "normalized", &LuaVec3::normalized, "dot", &LuaVec3::dot);

    lua.new_usertype<LuaEntity>("Entity", sol::no_constructor, "name", &LuaEntity::name, "id", &LuaEntity::id,
                                "valid", &LuaEntity::valid, "position",
                                sol::property(&LuaEntity::get_position, &LuaEntity::set_position), "get_var",
                                &LuaEntity::get_var, "set_var", &LuaEntity::set_var);
}
