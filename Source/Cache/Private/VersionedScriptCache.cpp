#include "../Public/VersionedScriptCache.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <mutex>

// One identifier's position in the cache. `current` is swapped atomically so readers
// never lock; `writeMutex` serializes installs, rollbacks and chain traversal.
struct VersionedScriptCache::Slot
{
    std::mutex writeMutex;
    std::atomic<std::shared_ptr<ScriptCacheEntry>> current;
    bool removed{false}; // set under writeMutex once the slot left the map
};

namespace
{

Error invalid_identifier_error()
{
    return Error{"Script identifier must not be empty", ErrorCode::InvalidScriptIdentifier};
}

} // namespace

// ── Constructor / destructor ──────────────────────────────────────────

VersionedScriptCache::VersionedScriptCache(std::shared_ptr<ICompileService> compiler, std::size_t maxHistoryDepth)
    : m_compiler(std::move(compiler)), m_maxHistoryDepth(std::max<std::size_t>(1, maxHistoryDepth))
{}

VersionedScriptCache::~VersionedScriptCache() = default;

// ── Slot helpers ──────────────────────────────────────────────────────

std::shared_ptr<VersionedScriptCache::Slot> VersionedScriptCache::find_slot(std::string_view scriptId) const
{
    std::shared_lock lock(m_slotsMutex);
    auto it = m_slots.find(scriptId);
    if (it == m_slots.end())
        return nullptr;
    return it->second;
}

std::shared_ptr<VersionedScriptCache::Slot> VersionedScriptCache::find_or_create_slot(std::string_view scriptId)
{
    if (auto slot = find_slot(scriptId))
        return slot;

    std::unique_lock lock(m_slotsMutex);
    auto [it, inserted] = m_slots.try_emplace(std::string(scriptId), nullptr);
    if (inserted)
        it->second = std::make_shared<Slot>();
    return it->second;
}

std::shared_ptr<ScriptCacheEntry> VersionedScriptCache::current_entry(std::string_view scriptId) const
{
    if (scriptId.empty())
        return nullptr;

    auto slot = find_slot(scriptId);
    if (!slot)
        return nullptr;
    return slot->current.load();
}

std::vector<std::pair<std::string, std::shared_ptr<VersionedScriptCache::Slot>>> VersionedScriptCache::
    snapshot_slots() const
{
    std::shared_lock lock(m_slotsMutex);
    std::vector<std::pair<std::string, std::shared_ptr<Slot>>> slots;
    slots.reserve(m_slots.size());
    for (const auto& [id, slot] : m_slots)
        slots.emplace_back(id, slot);
    return slots;
}

// ── Install / rollback ────────────────────────────────────────────────

Result<ScriptVersion> VersionedScriptCache::update_version(std::string_view scriptId,
                                                          std::shared_ptr<const CompiledUnit> unit)
{
    if (scriptId.empty())
        return make_error(invalid_identifier_error());
    if (!unit)
        return make_error(fmt::format("Cannot install '{}': compiled unit is null", scriptId),
                          ErrorCode::InvalidCompiledUnit);

    // A concurrent remove() may retire the slot between lookup and lock; retry with a fresh one.
    for (;;)
    {
        auto slot = find_or_create_slot(scriptId);
        std::lock_guard writeLock(slot->writeMutex);
        if (slot->removed)
            continue;

        const ScriptVersion version = m_currentVersion.fetch_add(1) + 1;
        auto entry = std::make_shared<ScriptCacheEntry>(version, std::move(unit));

        auto previous = slot->current.load();
        if (previous)
        {
            entry->set_previous(previous);
            prune_version_history(*entry, m_maxHistoryDepth);
        }

        slot->current.store(std::move(entry));

        // Superseded versions keep their unit for rollback but not their instance.
        if (previous)
            previous->clear_instance();

        fmt::print("[ScriptCache] Installed '{}' v{}\n", scriptId, version);
        return version;
    }
}

Result<> VersionedScriptCache::update_version(std::string_view scriptId, std::shared_ptr<const CompiledUnit> unit,
                                              ScriptVersion explicitVersion)
{
    if (scriptId.empty())
        return make_error(invalid_identifier_error());
    if (!unit)
        return make_error(fmt::format("Cannot restore '{}': compiled unit is null", scriptId),
                          ErrorCode::InvalidCompiledUnit);
    if (explicitVersion < 1)
        return make_error(fmt::format("Cannot restore '{}': explicit version {} must be positive", scriptId,
                                      explicitVersion),
                          ErrorCode::InvalidScriptVersion);

    for (;;)
    {
        auto slot = find_or_create_slot(scriptId);
        std::lock_guard writeLock(slot->writeMutex);
        if (slot->removed)
            continue;

        auto entry = std::make_shared<ScriptCacheEntry>(explicitVersion, std::move(unit));
        if (auto replaced = slot->current.load())
        {
            entry->set_previous(replaced->previous());
            prune_version_history(*entry, m_maxHistoryDepth);
        }

        // Keep future counter values above every number that has been in use.
        ScriptVersion observed = m_currentVersion.load();
        while (observed < explicitVersion && !m_currentVersion.compare_exchange_weak(observed, explicitVersion))
        {
        }

        slot->current.store(std::move(entry));
        fmt::print("[ScriptCache] Restored '{}' as v{}\n", scriptId, explicitVersion);
        return {};
    }
}

bool VersionedScriptCache::rollback(std::string_view scriptId)
{
    if (scriptId.empty())
        return false;

    auto slot = find_slot(scriptId);
    if (!slot)
        return false;

    std::lock_guard writeLock(slot->writeMutex);
    if (slot->removed)
        return false;

    auto current = slot->current.load();
    if (!current || !current->previous())
        return false;

    std::shared_ptr<ScriptCacheEntry> restored = current->previous();
    restored->clear_instance();
    slot->current.store(restored);

    fmt::print("[ScriptCache] Rolled back '{}' from v{} to v{}\n", scriptId, current->version(),
               restored->version());
    return true;
}

void VersionedScriptCache::prune_version_history(ScriptCacheEntry& head, std::size_t maxDepth)
{
    if (maxDepth == 0)
        return;

    ScriptCacheEntry* current = &head;
    std::size_t depth = 0;
    while (current->previous() && depth < maxDepth - 1)
    {
        current = current->previous().get();
        ++depth;
    }

    // Everything behind this link becomes unreachable and is released.
    if (current->previous())
        current->set_previous(nullptr);
}

// ── Lookup ────────────────────────────────────────────────────────────

Result<std::shared_ptr<IScriptBehavior>> VersionedScriptCache::get_or_create_instance(std::string_view scriptId)
{
    auto resolved = resolve_instance(scriptId);
    if (!resolved)
        return make_error(resolved.error());
    return std::move(resolved.value().instance);
}

Result<ScriptInstanceView> VersionedScriptCache::resolve_instance(std::string_view scriptId)
{
    if (scriptId.empty())
        return make_error(invalid_identifier_error());

    auto entry = current_entry(scriptId);
    if (!entry)
        return make_error(fmt::format("Script '{}' not found in cache", scriptId), ErrorCode::ScriptNotFound);

    if (!m_compiler)
        return make_error(fmt::format("Cannot instantiate '{}': no compile service", scriptId),
                          ErrorCode::ScriptInstantiationFailed);

    auto instance = entry->get_or_create_instance(*m_compiler, scriptId);
    if (!instance)
        return make_error(instance.error());
    return ScriptInstanceView{entry->version(), std::move(instance.value())};
}

ScriptInstanceView VersionedScriptCache::get_instance(std::string_view scriptId) const
{
    auto entry = current_entry(scriptId);
    if (!entry)
        return {};
    return {entry->version(), entry->instance()};
}

ScriptVersion VersionedScriptCache::get_version(std::string_view scriptId) const
{
    auto entry = current_entry(scriptId);
    return entry ? entry->version() : kInvalidScriptVersion;
}

std::shared_ptr<const CompiledUnit> VersionedScriptCache::get_script_type(std::string_view scriptId) const
{
    auto entry = current_entry(scriptId);
    return entry ? entry->unit() : nullptr;
}

bool VersionedScriptCache::contains(std::string_view scriptId) const
{
    return current_entry(scriptId) != nullptr;
}

// ── Lifecycle ─────────────────────────────────────────────────────────

bool VersionedScriptCache::clear_instance(std::string_view scriptId)
{
    auto entry = current_entry(scriptId);
    if (!entry)
        return false;

    entry->clear_instance();
    return true;
}

bool VersionedScriptCache::remove(std::string_view scriptId)
{
    if (scriptId.empty())
        return false;

    std::shared_ptr<Slot> slot;
    {
        std::unique_lock lock(m_slotsMutex);
        auto it = m_slots.find(scriptId);
        if (it == m_slots.end())
            return false;
        slot = std::move(it->second);
        m_slots.erase(it);
    }

    std::lock_guard writeLock(slot->writeMutex);
    slot->removed = true;
    const bool hadEntry = slot->current.exchange(nullptr) != nullptr;
    if (hadEntry)
        fmt::print("[ScriptCache] Removed '{}'\n", scriptId);
    return hadEntry;
}

void VersionedScriptCache::clear()
{
    SlotMap retired;
    {
        std::unique_lock lock(m_slotsMutex);
        retired.swap(m_slots);
        m_currentVersion.store(0);
    }

    for (auto& [id, slot] : retired)
    {
        std::lock_guard writeLock(slot->writeMutex);
        slot->removed = true;
        slot->current.store(nullptr);
    }

    fmt::print("[ScriptCache] Cleared {} script(s)\n", retired.size());
}

// ── Diagnostics ───────────────────────────────────────────────────────

std::vector<std::string> VersionedScriptCache::get_all_type_ids() const
{
    std::vector<std::string> ids;
    for (const auto& [id, slot] : snapshot_slots())
    {
        if (slot->current.load())
            ids.push_back(id);
    }
    return ids;
}

std::vector<CacheEntryInfo> VersionedScriptCache::get_diagnostics() const
{
    std::vector<CacheEntryInfo> infos;
    for (const auto& [id, slot] : snapshot_slots())
    {
        std::lock_guard writeLock(slot->writeMutex);
        auto entry = slot->current.load();
        if (!entry)
            continue;

        CacheEntryInfo info;
        info.typeId = id;
        info.version = entry->version();
        info.typeName = entry->unit()->name;
        info.isInstantiated = entry->is_instantiated();
        info.lastUpdated = entry->last_updated();
        info.hasPreviousVersion = entry->previous() != nullptr;
        if (entry->previous())
            info.previousVersionNumber = entry->previous()->version();
        infos.push_back(std::move(info));
    }
    return infos;
}

std::size_t VersionedScriptCache::get_version_history_depth(std::string_view scriptId) const
{
    if (scriptId.empty())
        return 0;

    auto slot = find_slot(scriptId);
    if (!slot)
        return 0;

    std::lock_guard writeLock(slot->writeMutex);
    auto entry = slot->current.load();
    if (!entry)
        return 0;

    std::size_t depth = 0;
    for (const ScriptCacheEntry* it = entry->previous().get(); it; it = it->previous().get())
        ++depth;
    return depth;
}

std::size_t VersionedScriptCache::get_total_version_entries() const
{
    std::size_t total = 0;
    for (const auto& [id, slot] : snapshot_slots())
    {
        std::lock_guard writeLock(slot->writeMutex);
        auto entry = slot->current.load();
        for (const ScriptCacheEntry* it = entry.get(); it; it = it->previous().get())
            ++total;
    }
    return total;
}

std::size_t VersionedScriptCache::cached_script_count() const
{
    std::shared_lock lock(m_slotsMutex);
    return static_cast<std::size_t>(std::count_if(m_slots.begin(), m_slots.end(),
                                                  [](const auto& pair) { return pair.second->current.load() != nullptr; }));
}
