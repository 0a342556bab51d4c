#pragma once
#include "../../Core/Public/Core.hpp"
#include "../../Core/Public/Expected.hpp"
#include "../../Scripting/Public/CompileService.hpp"
#include "ScriptCacheEntry.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

/// Default length of a version chain: the current entry plus two predecessors.
constexpr static std::size_t kDefaultMaxHistoryDepth{3};

/// Version and instance of a script as seen by get_instance(). `version` is
/// kInvalidScriptVersion and `instance` null when the identifier is unknown.
struct ScriptInstanceView
{
    ScriptVersion version{kInvalidScriptVersion};
    std::shared_ptr<IScriptBehavior> instance;
};

/// Diagnostic snapshot of one cached identifier.
struct CacheEntryInfo
{
    std::string typeId;
    ScriptVersion version{kInvalidScriptVersion};
    std::string typeName;
    bool isInstantiated{false};
    std::chrono::system_clock::time_point lastUpdated{};
    bool hasPreviousVersion{false};
    std::optional<ScriptVersion> previousVersionNumber;
};

LW_SUPPRESS_DLL_WARNINGS

/// Thread-safe store of hot-reloadable scripts with bounded version history.
///
/// Each identifier maps to a chain of ScriptCacheEntry objects, newest first.
/// Installing publishes a new entry atomically: once update_version() returns,
/// every thread resolving that identifier sees the new version or a later one.
/// Instances are created lazily from the compile service on first use.
///
/// Writers to one identifier are serialized; writers to different identifiers and
/// all readers proceed in parallel.
class LW_EXPORT VersionedScriptCache
{
  public:
    /// `maxHistoryDepth` counts the current entry; values below 1 are treated as 1.
    explicit VersionedScriptCache(std::shared_ptr<ICompileService> compiler,
                                  std::size_t maxHistoryDepth = kDefaultMaxHistoryDepth);
    ~VersionedScriptCache();

    VersionedScriptCache(const VersionedScriptCache&) = delete;
    VersionedScriptCache& operator=(const VersionedScriptCache&) = delete;

    // ── Install / rollback ────────────────────────────────────────────

    /// Installs `unit` as the newest version of `scriptId` and returns its version number.
    /// The replaced entry becomes `previous`; history beyond the depth limit is dropped.
    Result<ScriptVersion> update_version(std::string_view scriptId, std::shared_ptr<const CompiledUnit> unit);

    /// Restores a known snapshot under an explicit version number (backup restore path).
    /// Replaces the current entry but keeps its history. The global counter is not
    /// advanced; it is raised to `explicitVersion` if lower so later installs stay unique.
    Result<> update_version(std::string_view scriptId, std::shared_ptr<const CompiledUnit> unit,
                            ScriptVersion explicitVersion);

    /// Makes the previous entry current again. Returns false if there is none.
    /// The restored entry starts uninstantiated.
    bool rollback(std::string_view scriptId);

    // ── Lookup ────────────────────────────────────────────────────────

    /// Returns the instance of the current version, creating it on first access.
    /// Fails with ScriptNotFound for unknown identifiers and ScriptInstantiationFailed
    /// (retryable) when the unit cannot be executed.
    Result<std::shared_ptr<IScriptBehavior>> get_or_create_instance(std::string_view scriptId);

    /// Same as get_or_create_instance(), also returning the version the instance belongs to.
    /// Both come from one entry, so a concurrent install cannot mix them.
    Result<ScriptInstanceView> resolve_instance(std::string_view scriptId);

    /// Current version and instance without creating one.
    ScriptInstanceView get_instance(std::string_view scriptId) const;

    /// Current version, or kInvalidScriptVersion.
    ScriptVersion get_version(std::string_view scriptId) const;

    /// Current compiled unit, or nullptr.
    std::shared_ptr<const CompiledUnit> get_script_type(std::string_view scriptId) const;

    bool contains(std::string_view scriptId) const;

    // ── Lifecycle ─────────────────────────────────────────────────────

    /// Drops the current instance so the next lookup recreates it. Returns false if unknown.
    bool clear_instance(std::string_view scriptId);

    /// Removes the identifier and its whole chain. Returns false if unknown.
    bool remove(std::string_view scriptId);

    /// Removes everything and resets the global version counter to 0.
    void clear();

    // ── Diagnostics ───────────────────────────────────────────────────

    std::vector<std::string> get_all_type_ids() const;
    std::vector<CacheEntryInfo> get_diagnostics() const;

    /// Number of predecessors reachable from the current entry (0 if unknown).
    std::size_t get_version_history_depth(std::string_view scriptId) const;

    /// Sum of chain lengths (current entries included) over all identifiers.
    std::size_t get_total_version_entries() const;

    std::size_t cached_script_count() const;

    /// Last version number handed out by the global counter.
    ScriptVersion current_version() const noexcept
    {
        return m_currentVersion.load();
    }

    std::size_t max_history_depth() const noexcept
    {
        return m_maxHistoryDepth;
    }

  private:
    struct Slot;

    struct StringHash
    {
        using is_transparent = void;
        std::size_t operator()(std::string_view value) const noexcept
        {
            return std::hash<std::string_view>{}(value);
        }
    };

    using SlotMap = std::unordered_map<std::string, std::shared_ptr<Slot>, StringHash, std::equal_to<>>;

    std::shared_ptr<Slot> find_slot(std::string_view scriptId) const;
    std::shared_ptr<Slot> find_or_create_slot(std::string_view scriptId);
    std::shared_ptr<ScriptCacheEntry> current_entry(std::string_view scriptId) const;
    std::vector<std::pair<std::string, std::shared_ptr<Slot>>> snapshot_slots() const;

    static void prune_version_history(ScriptCacheEntry& head, std::size_t maxDepth);

    std::shared_ptr<ICompileService> m_compiler;
    const std::size_t m_maxHistoryDepth;

    mutable std::shared_mutex m_slotsMutex;
    SlotMap m_slots;

    std::atomic<ScriptVersion> m_currentVersion{0};
};

LW_RESTORE_DLL_WARNINGS
