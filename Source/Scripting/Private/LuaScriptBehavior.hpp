#pragma once

#include "../Public/ScriptBehavior.hpp"

#define SOL_ALL_SAFETIES_ON 1
#include <sol/sol.hpp>

#include <mutex>
#include <string>
#include <string_view>

/// Behavior backed by a Lua table returned from a compiled chunk.
///
/// The chunk must return a table with an `on_tick(entity, dt)` function and may
/// define `on_initialize(entity)`, `on_event(entity, name, value)` and `on_unload(entity)`.
/// Every instance owns its own Lua VM; calls into it are serialized.
class LuaScriptBehavior final : public IScriptBehavior
{
  public:
    explicit LuaScriptBehavior(std::string name);
    ~LuaScriptBehavior() override;

    /// Runs the bytecode and validates the returned table. Called once by LuaCompileService::execute().
    Result<> load(std::string_view bytecode);

    Result<> initialize(ScriptContext& context) override;
    Result<> tick(ScriptContext& context, float deltaTime) override;
    Result<> handle_event(ScriptContext& context, const ScriptEvent& event) override;
    Result<> unload(ScriptContext& context) override;

  private:
    void register_bindings();
    Result<> check_result(sol::protected_function_result result, std::string_view hook) const;

    std::string m_name;
    std::mutex m_mutex;

    sol::state m_lua;
    sol::table m_behavior;
    sol::protected_function m_onInitialize;
    sol::protected_function m_onTick;
    sol::protected_function m_onEvent;
    sol::protected_function m_onUnload;
};
