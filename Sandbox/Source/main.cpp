#include <Cache/Public/VersionedScriptCache.hpp>
#include <ECS/Public/ScriptAttachmentRegistry.hpp>
#include <ECS/Public/World.hpp>
#include <HotReload/Public/HotReloadService.hpp>
#include <HotReload/Public/ScriptBackupStore.hpp>
#include <Runtime/Public/ScriptScheduler.hpp>
#include <Scripting/Public/LuaCompileService.hpp>

#include <fmt/core.h>

#include <filesystem>
#include <memory>

constexpr static float TICK_DT{1.0f};
constexpr static int TICKS_PER_PHASE{3};

constexpr static const char* WANDER_V1 = R"(
local wander = {}
function wander.on_initialize(entity) entity:set_var("speed", 1.0) end
function wander.on_tick(entity, dt)
    local p = entity.position
    entity.position = Vec3.new(p.x + entity:get_var("speed", 1.0) * dt, p.y, p.z)
end
return wander
)";

// Same behavior, twice as fast. Initialize runs again for the new version.
constexpr static const char* WANDER_V2 = R"(
local wander = {}
function wander.on_initialize(entity) entity:set_var("speed", 2.0) end
function wander.on_tick(entity, dt)
    local p = entity.position
    entity.position = Vec3.new(p.x + entity:get_var("speed", 1.0) * dt, p.y, p.z)
end
return wander
)";

constexpr static const char* WANDER_BROKEN = R"(
local wander = {}
function wander.on_tick(entity, dt)
    entity.position = Vec3.new(1, 2, 3
end
return wander
)";

static void print_position(World& world, entt::entity entity)
{
    const auto& transform = world.registry().get<TransformComponent>(entity);
    fmt::print("[Sandbox] {} at ({:.1f}, {:.1f}, {:.1f})\n", world.registry().get<NameComponent>(entity).name,
               transform.position.x, transform.position.y, transform.position.z);
}

int main(int argc, char** argv)
{
    auto compiler = std::make_shared<LuaCompileService>();
    VersionedScriptCache cache{compiler};
    ScriptBackupStore backups;
    HotReloadService hotReload{*compiler, cache, backups, HotReloadConfig{.validateOnInstall = true}};

    World world;
    ScriptAttachmentRegistry attachments{world};
    ScriptScheduler scheduler{cache, SchedulerConfig{.workerCount = 2, .summaryInterval = TICKS_PER_PHASE}};

    // Optional: a directory of .lua files to load in addition to the built-in wander script.
    if (argc > 1)
    {
        std::error_code ec;
        for (const auto& file : std::filesystem::directory_iterator(argv[1], ec))
        {
            if (file.path().extension() != ".lua")
                continue;
            if (auto loaded = hotReload.reload_file(file.path()); !loaded)
                fmt::print("[Sandbox] Skipping {}: {}\n", file.path().string(), loaded.error().message);
        }
        if (ec)
            fmt::print("[Sandbox] Cannot read script directory {}: {}\n", argv[1], ec.message());
    }

    if (auto installed = hotReload.reload("wander", WANDER_V1); !installed)
        return static_cast<int>(get_error_code(make_error(installed.error())));

    const entt::entity walker = world.create_entity("Walker");
    if (auto code = get_error_code(attachments.add_attachment(walker, "wander")); code != 0)
        return static_cast<int>(code);

    for (int i = 0; i < TICKS_PER_PHASE; ++i)
        scheduler.tick(world, TICK_DT);
    print_position(world, walker);

    // A broken edit is rejected; v1 keeps running.
    if (auto broken = hotReload.reload("wander", WANDER_BROKEN); !broken)
        fmt::print("[Sandbox] Broken reload rejected as expected\n");

    if (auto reloaded = hotReload.reload("wander", WANDER_V2); !reloaded)
        return static_cast<int>(get_error_code(make_error(reloaded.error())));

    for (int i = 0; i < TICKS_PER_PHASE; ++i)
        scheduler.tick(world, TICK_DT);
    print_position(world, walker);

    if (auto rolledBack = hotReload.rollback("wander"); rolledBack)
        fmt::print("[Sandbox] Rolled back to v{}\n", rolledBack.value());

    for (int i = 0; i < TICKS_PER_PHASE; ++i)
        scheduler.tick(world, TICK_DT);
    print_position(world, walker);

    const HotReloadStatistics stats = hotReload.statistics();
    fmt::print("[Sandbox] Reloads: {} ok, {} failed, {} rollbacks, {:.1f}% success, {:.2f} ms avg compile\n",
               stats.successfulReloads, stats.failedReloads, stats.rollbacksPerformed, stats.success_rate(),
               stats.average_compile_ms());
    fmt::print("[Sandbox] Script failures: {}\n", scheduler.failure_count());
    return 0;
}
