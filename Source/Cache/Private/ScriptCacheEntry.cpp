#include "../Public/ScriptCacheEntry.hpp"

#include <fmt/core.h>

ScriptCacheEntry::ScriptCacheEntry(ScriptVersion version, std::shared_ptr<const CompiledUnit> unit)
    : m_version(version), m_unit(std::move(unit)), m_lastUpdated(std::chrono::system_clock::now())
{}

Result<std::shared_ptr<IScriptBehavior>> ScriptCacheEntry::get_or_create_instance(ICompileService& compiler,
                                                                                  std::string_view scriptId)
{
    std::lock_guard lock(m_instanceMutex);
    if (m_instance)
        return m_instance;

    auto created = guarded_call(ErrorCode::ScriptInstantiationFailed, [&] { return compiler.execute(*m_unit); });
    if (!created)
        return make_error(fmt::format("Failed to instantiate script '{}' v{} ({}): {}", scriptId, m_version,
                                      m_unit->name, created.error().message),
                          ErrorCode::ScriptInstantiationFailed);

    if (!created.value())
        return make_error(fmt::format("Failed to instantiate script '{}' v{} ({}): backend returned no instance",
                                      scriptId, m_version, m_unit->name),
                          ErrorCode::ScriptInstantiationFailed);

    m_instance = std::move(created.value());
    return m_instance;
}

std::shared_ptr<IScriptBehavior> ScriptCacheEntry::instance() const
{
    std::lock_guard lock(m_instanceMutex);
    return m_instance;
}

bool ScriptCacheEntry::is_instantiated() const
{
    std::lock_guard lock(m_instanceMutex);
    return m_instance != nullptr;
}

void ScriptCacheEntry::clear_instance()
{
    std::shared_ptr<IScriptBehavior> released;
    {
        std::lock_guard lock(m_instanceMutex);
        released = std::move(m_instance);
    }
    // `released` is destroyed outside the lock.
}
