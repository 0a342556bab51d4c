#include "../Public/ScriptBackupStore.hpp"

#include <ScriptBackup_generated.h>

#include <flatbuffers/flatbuffers.h>
#include <fmt/core.h>

#include <fstream>

namespace fb = flatbuffers;
namespace lwb = LiveWire::Backup;

namespace
{

std::int64_t to_unix_millis(std::chrono::system_clock::time_point time)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_unix_millis(std::int64_t millis)
{
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(millis)));
}

} // namespace

// ── In-memory store ──────────────────────────────────────────────────

Result<> ScriptBackupStore::create_backup(std::string_view scriptId, ScriptVersion version,
                                          std::shared_ptr<const CompiledUnit> unit)
{
    if (scriptId.empty())
        return make_error("Script identifier must not be empty", ErrorCode::InvalidScriptIdentifier);
    if (!unit)
        return make_error(fmt::format("Cannot back up '{}' without a compiled unit", scriptId),
                          ErrorCode::InvalidCompiledUnit);

    std::lock_guard lock(m_mutex);
    m_backups[std::string(scriptId)] = ScriptBackup{version, std::move(unit), std::chrono::system_clock::now()};
    return {};
}

std::optional<ScriptBackup> ScriptBackupStore::restore_backup(std::string_view scriptId) const
{
    std::lock_guard lock(m_mutex);
    auto it = m_backups.find(std::string(scriptId));
    if (it == m_backups.end())
        return std::nullopt;
    return it->second;
}

bool ScriptBackupStore::clear_backup(std::string_view scriptId)
{
    std::lock_guard lock(m_mutex);
    return m_backups.erase(std::string(scriptId)) > 0;
}

bool ScriptBackupStore::has_backup(std::string_view scriptId) const
{
    std::lock_guard lock(m_mutex);
    return m_backups.contains(std::string(scriptId));
}

std::size_t ScriptBackupStore::backup_count() const
{
    std::lock_guard lock(m_mutex);
    return m_backups.size();
}

void ScriptBackupStore::clear()
{
    std::lock_guard lock(m_mutex);
    m_backups.clear();
}

// ── Serialization ────────────────────────────────────────────────────

Result<std::vector<std::uint8_t>> ScriptBackupStore::serialize() const
{
    fb::FlatBufferBuilder builder(4096);
    std::vector<fb::Offset<lwb::ScriptBackupEntry>> entryOffsets;

    {
        std::lock_guard lock(m_mutex);
        entryOffsets.reserve(m_backups.size());
        for (const auto& [scriptId, backup] : m_backups)
        {
            const CompiledUnit& unit = *backup.unit;
            auto idOffset = builder.CreateString(scriptId);
            auto nameOffset = builder.CreateString(unit.name);
            auto payloadOffset = builder.CreateVector(reinterpret_cast<const std::uint8_t*>(unit.payload.data()),
                                                      unit.payload.size());

            entryOffsets.push_back(lwb::CreateScriptBackupEntry(builder, idOffset, backup.version, nameOffset,
                                                                payloadOffset, to_unix_millis(unit.compiledAt),
                                                                to_unix_millis(backup.createdAt)));
        }
    }

    auto archive = lwb::CreateScriptBackupArchive(builder, 1, builder.CreateVector(entryOffsets));
    lwb::FinishScriptBackupArchiveBuffer(builder, archive);

    const std::uint8_t* buf = builder.GetBufferPointer();
    return std::vector<std::uint8_t>(buf, buf + builder.GetSize());
}

Result<> ScriptBackupStore::deserialize(const std::vector<std::uint8_t>& buffer)
{
    fb::Verifier verifier(buffer.data(), buffer.size());
    if (!lwb::VerifyScriptBackupArchiveBuffer(verifier))
        return make_error("Invalid or corrupted script backup archive", ErrorCode::BackupParsingFailed);

    const auto* archive = lwb::GetScriptBackupArchive(buffer.data());
    if (!archive)
        return make_error("Failed to parse script backup archive", ErrorCode::BackupParsingFailed);

    std::unordered_map<std::string, ScriptBackup> restored;
    if (const auto* entries = archive->entries())
    {
        for (const auto* entry : *entries)
        {
            std::string scriptId = entry->identifier()->str();
            if (scriptId.empty())
                return make_error("Script backup archive contains an entry without identifier",
                                  ErrorCode::BackupParsingFailed);

            auto unit = std::make_shared<CompiledUnit>();
            unit->identifier = scriptId;
            unit->name = entry->unit_name() ? entry->unit_name()->str() : fmt::format("{}.lua", scriptId);
            if (const auto* payload = entry->payload())
                unit->payload.assign(reinterpret_cast<const char*>(payload->data()), payload->size());
            unit->compiledAt = from_unix_millis(entry->compiled_at());

            restored[std::move(scriptId)] = ScriptBackup{entry->version(), std::move(unit),
                                                         from_unix_millis(entry->created_at())};
        }
    }

    std::lock_guard lock(m_mutex);
    m_backups = std::move(restored);
    return {};
}

// ── Files ────────────────────────────────────────────────────────────

Result<> ScriptBackupStore::save_to_file(const std::filesystem::path& filePath) const
{
    auto bufferResult = serialize();
    if (!bufferResult)
        return make_error(bufferResult.error());

    std::ofstream file(filePath, std::ios::binary);
    if (!file)
        return make_error(fmt::format("Failed to open file for writing: {}", filePath.string()),
                          ErrorCode::BackupWriteFailed);

    const auto& buffer = bufferResult.value();
    file.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    if (!file)
        return make_error(fmt::format("Failed to write script backups to file: {}", filePath.string()),
                          ErrorCode::BackupWriteFailed);

    fmt::print("[HotReload] Saved {} script backup(s) to {}\n", backup_count(), filePath.string());
    return {};
}

Result<> ScriptBackupStore::load_from_file(const std::filesystem::path& filePath)
{
    std::ifstream file(filePath, std::ios::binary | std::ios::ate);
    if (!file)
        return make_error(fmt::format("Failed to open script backup file: {}", filePath.string()),
                          ErrorCode::FileReadFailed);

    auto size = file.tellg();
    if (size <= 0)
        return make_error(fmt::format("Script backup file is empty: {}", filePath.string()),
                          ErrorCode::BackupParsingFailed);

    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(size));
    file.seekg(0);
    file.read(reinterpret_cast<char*>(buffer.data()), size);
    if (!file)
        return make_error(fmt::format("Failed to read script backup file: {}", filePath.string()),
                          ErrorCode::FileReadFailed);

    auto loaded = deserialize(buffer);
    if (!loaded)
        return loaded;

    fmt::print("[HotReload] Loaded {} script backup(s) from {}\n", backup_count(), filePath.string());
    return {};
}
