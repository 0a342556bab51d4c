#pragma once
#include "../../Core/Public/Core.hpp"
#include "../../Core/Public/Expected.hpp"
#include "../../Scripting/Public/CompileService.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <stop_token>
#include <string_view>

class VersionedScriptCache;
class ScriptBackupStore;

struct HotReloadConfig
{
    bool validateOnInstall{false};              // instantiate right after installing
    bool rollbackOnInstantiationFailure{true};  // only with validateOnInstall
    bool backupBeforeInstall{true};
};

struct HotReloadStatistics
{
    std::uint64_t totalReloads{0};
    std::uint64_t successfulReloads{0};
    std::uint64_t failedReloads{0};
    std::uint64_t rollbacksPerformed{0};
    double totalCompileMs{0.0};

    double average_compile_ms() const noexcept
    {
        return totalReloads > 0 ? totalCompileMs / static_cast<double>(totalReloads) : 0.0;
    }

    /// Percentage of reloads that installed a new version.
    double success_rate() const noexcept
    {
        return totalReloads > 0 ? static_cast<double>(successfulReloads) / static_cast<double>(totalReloads) * 100.0
                                : 0.0;
    }
};

LW_SUPPRESS_DLL_WARNINGS

/// Compiles changed scripts and swaps them into the cache while the simulation runs.
///
/// A failed compilation never touches the cache, so the last good version keeps
/// running. The version being replaced is backed up first so it can be restored
/// after the cache history is exhausted.
class LW_EXPORT HotReloadService
{
  public:
    HotReloadService(ICompileService& compiler, VersionedScriptCache& cache, ScriptBackupStore& backups,
                     HotReloadConfig config = {});

    /// Compiles `source` and installs it as the newest version of `scriptId`.
    Result<ScriptVersion> reload(std::string_view scriptId, std::string_view source, std::stop_token stopToken = {});

    /// Reloads a .lua file; the identifier is the file stem.
    Result<ScriptVersion> reload_file(const std::filesystem::path& scriptPath, std::stop_token stopToken = {});

    /// Undoes the last install of `scriptId`: first through the cache history, then
    /// from the backup store. Returns the version that is current afterwards.
    /// Never moves a script to a newer version than the one it runs.
    Result<ScriptVersion> rollback(std::string_view scriptId);

    HotReloadStatistics statistics() const;
    void reset_statistics();

    const HotReloadConfig& config() const noexcept
    {
        return m_config;
    }

  private:
    void report_failure(std::string_view scriptId, const CompilationFailure& failure) const;

    ICompileService& m_compiler;
    VersionedScriptCache& m_cache;
    ScriptBackupStore& m_backups;
    HotReloadConfig m_config;

    mutable std::mutex m_statsMutex;
    HotReloadStatistics m_stats;
};

LW_RESTORE_DLL_WARNINGS
