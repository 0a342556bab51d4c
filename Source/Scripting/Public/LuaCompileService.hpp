#pragma once
#include "../../Core/Public/Core.hpp"
#include "../../Core/Public/Expected.hpp"
#include "CompileService.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <stop_token>
#include <string_view>

LW_SUPPRESS_DLL_WARNINGS

/// Compiles Lua behavior scripts to bytecode and instantiates them in dedicated VMs.
///
/// A behavior script is a chunk that returns a table:
///
///     local wander = {}
///     function wander.on_initialize(entity) entity:set_var("speed", 2) end
///     function wander.on_tick(entity, dt) ... end
///     function wander.on_event(entity, name, value) ... end
///     function wander.on_unload(entity) ... end
///     return wander
///
/// `on_tick` is required; the other hooks are optional.
class LW_EXPORT LuaCompileService final : public ICompileService
{
  public:
    LuaCompileService() = default;

    /// Parses `source` and dumps it to bytecode. Syntax errors become error diagnostics
    /// carrying the line Lua reported.
    CompileResult compile(std::string_view source, std::string_view identifier,
                          std::stop_token stopToken = {}) override;

    /// Runs the unit's bytecode in a fresh VM and validates the returned behavior table.
    Result<std::shared_ptr<IScriptBehavior>> execute(const CompiledUnit& unit) override;

    /// Reads a .lua file and compiles it using the file stem as identifier.
    CompileResult compile_file(const std::filesystem::path& scriptPath, std::stop_token stopToken = {});

    /// Number of successful compilations (for diagnostics UI).
    std::size_t compiled_count() const noexcept
    {
        return m_compiledCount.load();
    }

    /// Number of successful instantiations (for diagnostics UI).
    std::size_t executed_count() const noexcept
    {
        return m_executedCount.load();
    }

  private:
    std::atomic<std::size_t> m_compiledCount{0};
    std::atomic<std::size_t> m_executedCount{0};
};

LW_RESTORE_DLL_WARNINGS
