#include "../Public/HotReloadService.hpp"
#include "../../Cache/Public/VersionedScriptCache.hpp"
#include "../../Core/Public/Utils.hpp"
#include "../Public/ScriptBackupStore.hpp"

#include <fmt/core.h>

#include <chrono>

namespace
{

const char* severity_name(DiagnosticSeverity severity) noexcept
{
    switch (severity)
    {
    case DiagnosticSeverity::Info:
        return "info";
    case DiagnosticSeverity::Warning:
        return "warning";
    case DiagnosticSeverity::Error:
        return "error";
    }
    return "unknown";
}

} // namespace

HotReloadService::HotReloadService(ICompileService& compiler, VersionedScriptCache& cache, ScriptBackupStore& backups,
                                   HotReloadConfig config)
    : m_compiler(compiler), m_cache(cache), m_backups(backups), m_config(config)
{}

// ── reload ───────────────────────────────────────────────────────────

Result<ScriptVersion> HotReloadService::reload(std::string_view scriptId, std::string_view source,
                                               std::stop_token stopToken)
{
    const auto compileStart = std::chrono::steady_clock::now();
    CompileResult compiled = m_compiler.compile(source, scriptId, std::move(stopToken));
    const double compileMs =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - compileStart).count();

    {
        std::lock_guard lock(m_statsMutex);
        ++m_stats.totalReloads;
        m_stats.totalCompileMs += compileMs;
    }

    if (!compiled)
    {
        report_failure(scriptId, compiled.error());
        std::lock_guard lock(m_statsMutex);
        ++m_stats.failedReloads;
        return make_error(compiled.error().error);
    }

    // Back up the version about to be replaced.
    if (m_config.backupBeforeInstall)
    {
        if (auto current = m_cache.get_script_type(scriptId))
        {
            auto backedUp = m_backups.create_backup(scriptId, m_cache.get_version(scriptId), std::move(current));
            if (!backedUp)
                fmt::print("[HotReload] Could not back up '{}': {}\n", scriptId, backedUp.error().message);
        }
    }

    auto installed = m_cache.update_version(scriptId, std::move(compiled.value()));
    if (!installed)
    {
        fmt::print("[HotReload] Failed to install '{}': {}\n", scriptId, installed.error().message);
        std::lock_guard lock(m_statsMutex);
        ++m_stats.failedReloads;
        return make_error(installed.error());
    }

    if (m_config.validateOnInstall)
    {
        auto instance = m_cache.get_or_create_instance(scriptId);
        if (!instance)
        {
            fmt::print("[HotReload] '{}' v{} failed to instantiate: {}\n", scriptId, installed.value(),
                       instance.error().message);

            bool rolledBack = false;
            if (m_config.rollbackOnInstantiationFailure)
            {
                rolledBack = m_cache.rollback(scriptId);
                if (!rolledBack)
                    fmt::print("[HotReload] No previous version of '{}' to fall back to\n", scriptId);
            }

            std::lock_guard lock(m_statsMutex);
            ++m_stats.failedReloads;
            if (rolledBack)
                ++m_stats.rollbacksPerformed;
            return make_error(instance.error());
        }
    }

    fmt::print("[HotReload] Reloaded '{}' as v{} (compiled in {:.2f} ms)\n", scriptId, installed.value(), compileMs);

    std::lock_guard lock(m_statsMutex);
    ++m_stats.successfulReloads;
    return installed.value();
}

Result<ScriptVersion> HotReloadService::reload_file(const std::filesystem::path& scriptPath,
                                                    std::stop_token stopToken)
{
    auto source = read_file(scriptPath);
    if (!source)
    {
        fmt::print("[HotReload] {}\n", source.error().message);
        return make_error(source.error());
    }

    return reload(scriptPath.stem().string(), source.value(), std::move(stopToken));
}

// ── rollback ─────────────────────────────────────────────────────────

Result<ScriptVersion> HotReloadService::rollback(std::string_view scriptId)
{
    // Tier 1: the cache still holds the previous version.
    if (m_cache.rollback(scriptId))
    {
        const ScriptVersion current = m_cache.get_version(scriptId);

        // A backup at or above the restored version is no longer behind the script.
        if (auto backup = m_backups.restore_backup(scriptId); backup && backup->version >= current)
            m_backups.clear_backup(scriptId);

        std::lock_guard lock(m_statsMutex);
        ++m_stats.rollbacksPerformed;
        return current;
    }

    // Tier 2: restore the backed-up unit under its original version number. Only an older
    // backup qualifies, or any backup when the identifier is not cached (after a restart).
    const ScriptVersion current = m_cache.get_version(scriptId);
    auto backup = m_backups.restore_backup(scriptId);
    if (!backup || (current != kInvalidScriptVersion && backup->version >= current))
        return make_error(fmt::format("No earlier version of '{}' to roll back to", scriptId),
                          ErrorCode::ScriptRollbackUnavailable);

    auto restored = m_cache.update_version(scriptId, backup->unit, backup->version);
    if (!restored)
        return make_error(restored.error());

    m_backups.clear_backup(scriptId);
    fmt::print("[HotReload] Restored '{}' v{} from backup\n", scriptId, backup->version);

    std::lock_guard lock(m_statsMutex);
    ++m_stats.rollbacksPerformed;
    return backup->version;
}

// ── Statistics ───────────────────────────────────────────────────────

HotReloadStatistics HotReloadService::statistics() const
{
    std::lock_guard lock(m_statsMutex);
    return m_stats;
}

void HotReloadService::reset_statistics()
{
    std::lock_guard lock(m_statsMutex);
    m_stats = {};
}

void HotReloadService::report_failure(std::string_view scriptId, const CompilationFailure& failure) const
{
    fmt::print("[HotReload] Reload of '{}' failed, keeping v{}: {}\n", scriptId, m_cache.get_version(scriptId),
               failure.error.message);

    for (const auto& diagnostic : failure.diagnostics)
    {
        if (diagnostic.line > 0)
            fmt::print("[HotReload]   {}:{}:{}: {}: {}\n", scriptId, diagnostic.line, diagnostic.column,
                       severity_name(diagnostic.severity), diagnostic.message);
        else
            fmt::print("[HotReload]   {}: {}: {}\n", scriptId, severity_name(diagnostic.severity), diagnostic.message);
    }
}
