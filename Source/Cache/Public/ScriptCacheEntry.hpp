#pragma once
#include "../../Core/Public/Core.hpp"
#include "../../Core/Public/Expected.hpp"
#include "../../Scripting/Public/CompileService.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string_view>

LW_SUPPRESS_DLL_WARNINGS

/// One installed version of a script: its compiled unit, a lazily created
/// instance, and a link to the version it replaced.
///
/// Version, unit and timestamp never change after construction. The instance slot
/// is guarded by its own mutex. The `previous` link is only read or written by the
/// owning cache while it holds that identifier's write lock.
class LW_EXPORT ScriptCacheEntry
{
  public:
    ScriptCacheEntry(ScriptVersion version, std::shared_ptr<const CompiledUnit> unit);

    ScriptCacheEntry(const ScriptCacheEntry&) = delete;
    ScriptCacheEntry& operator=(const ScriptCacheEntry&) = delete;

    ScriptVersion version() const noexcept
    {
        return m_version;
    }

    const std::shared_ptr<const CompiledUnit>& unit() const noexcept
    {
        return m_unit;
    }

    std::chrono::system_clock::time_point last_updated() const noexcept
    {
        return m_lastUpdated;
    }

    /// Returns the instance, creating it through `compiler.execute()` on first use.
    /// Exactly one caller executes the unit; concurrent callers wait and get the same instance.
    /// On failure, including an exception thrown by the backend, the entry stays
    /// uninstantiated so the next call retries.
    Result<std::shared_ptr<IScriptBehavior>> get_or_create_instance(ICompileService& compiler,
                                                                    std::string_view scriptId);

    /// Current instance without creating one (nullptr when uninstantiated).
    std::shared_ptr<IScriptBehavior> instance() const;

    bool is_instantiated() const;

    /// Drops the instance; the next get_or_create_instance() creates a fresh one.
    void clear_instance();

    const std::shared_ptr<ScriptCacheEntry>& previous() const noexcept
    {
        return m_previous;
    }

    void set_previous(std::shared_ptr<ScriptCacheEntry> previous) noexcept
    {
        m_previous = std::move(previous);
    }

  private:
    const ScriptVersion m_version;
    const std::shared_ptr<const CompiledUnit> m_unit;
    const std::chrono::system_clock::time_point m_lastUpdated;

    mutable std::mutex m_instanceMutex;
    std::shared_ptr<IScriptBehavior> m_instance;

    std::shared_ptr<ScriptCacheEntry> m_previous;
};

LW_RESTORE_DLL_WARNINGS
