#pragma once
#include "../../Core/Public/Core.hpp"
#include "../../Core/Public/Expected.hpp"
#include "../../Scripting/Public/CompileService.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

/// Last known good compiled unit of one script.
struct ScriptBackup
{
    ScriptVersion version{kInvalidScriptVersion};
    std::shared_ptr<const CompiledUnit> unit;
    std::chrono::system_clock::time_point createdAt{std::chrono::system_clock::now()};
};

LW_SUPPRESS_DLL_WARNINGS

/// Thread-safe store of one backup per script identifier.
///
/// HotReloadService backs up the running version before every reload so a
/// failed or bad reload can be undone even when the cache has no history left.
/// The store can be persisted (.lw_backup, FlatBuffers) to survive restarts.
class LW_EXPORT ScriptBackupStore
{
  public:
    ScriptBackupStore() = default;

    ScriptBackupStore(const ScriptBackupStore&) = delete;
    ScriptBackupStore& operator=(const ScriptBackupStore&) = delete;

    /// Stores `unit` as the backup for `scriptId`, replacing any older one.
    Result<> create_backup(std::string_view scriptId, ScriptVersion version, std::shared_ptr<const CompiledUnit> unit);

    std::optional<ScriptBackup> restore_backup(std::string_view scriptId) const;

    /// Returns true if a backup was removed.
    bool clear_backup(std::string_view scriptId);

    bool has_backup(std::string_view scriptId) const;
    std::size_t backup_count() const;
    void clear();

    // ── Persistence ───────────────────────────────────────────────────

    /// Serializes every backup into a FlatBuffers buffer.
    Result<std::vector<std::uint8_t>> serialize() const;

    /// Replaces the store contents with the backups in `buffer`.
    Result<> deserialize(const std::vector<std::uint8_t>& buffer);

    Result<> save_to_file(const std::filesystem::path& filePath) const;
    Result<> load_from_file(const std::filesystem::path& filePath);

  private:
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, ScriptBackup> m_backups;
};

LW_RESTORE_DLL_WARNINGS
