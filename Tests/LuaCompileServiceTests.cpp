#include <Cache/Public/VersionedScriptCache.hpp>
#include <ECS/Public/ScriptAttachmentRegistry.hpp>
#include <ECS/Public/World.hpp>
#include <Runtime/Public/ScriptScheduler.hpp>
#include <Scripting/Public/LuaCompileService.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stop_token>

namespace
{

constexpr const char* kWander = R"(
local wander = {}

function wander.on_initialize(entity)
    entity:set_var("speed", 2.0)
end

function wander.on_tick(entity, dt)
    local p = entity.position
    entity.position = Vec3.new(p.x + entity:get_var("speed", 0) * dt, p.y, p.z)
end

function wander.on_event(entity, name, value)
    if name == "boost" then
        entity:set_var("speed", entity:get_var("speed", 0) + value)
    end
end

return wander
)";

constexpr const char* kSyntaxError = R"(local t = {}
function t.on_tick(entity, dt)
    local x = = 1
end
return t
)";

} // namespace

class LuaCompileServiceTest : public ::testing::Test
{
  protected:
    LuaCompileService compiler;
    World world;

    std::shared_ptr<IScriptBehavior> instantiate(std::string_view source, std::string_view id = "test")
    {
        auto unit = compiler.compile(source, id);
        EXPECT_TRUE(unit.has_value());
        if (!unit)
            return nullptr;
        auto behavior = compiler.execute(*unit.value());
        EXPECT_TRUE(behavior.has_value());
        return behavior ? behavior.value() : nullptr;
    }

    Result<std::shared_ptr<IScriptBehavior>> try_instantiate(std::string_view source)
    {
        auto unit = compiler.compile(source, "test");
        if (!unit)
            return make_error(unit.error().error);
        return compiler.execute(*unit.value());
    }
};

// ── compile ──────────────────────────────────────────────────────────

TEST_F(LuaCompileServiceTest, CompilesToBytecode)
{
    auto unit = compiler.compile(kWander, "wander");
    ASSERT_TRUE(unit);
    EXPECT_EQ(unit.value()->identifier, "wander");
    EXPECT_EQ(unit.value()->name, "wander.lua");
    EXPECT_FALSE(unit.value()->payload.empty());
    EXPECT_EQ(compiler.compiled_count(), 1u);
    EXPECT_EQ(compiler.executed_count(), 0u);
}

TEST_F(LuaCompileServiceTest, SyntaxErrorReportsTheLine)
{
    auto unit = compiler.compile(kSyntaxError, "broken");
    ASSERT_FALSE(unit);
    EXPECT_EQ(unit.error().error.code, ErrorCode::ScriptCompilationFailed);
    ASSERT_EQ(unit.error().diagnostics.size(), 1u);

    const CompileDiagnostic& diagnostic = unit.error().diagnostics.front();
    EXPECT_EQ(diagnostic.severity, DiagnosticSeverity::Error);
    EXPECT_EQ(diagnostic.line, 3);
    EXPECT_FALSE(diagnostic.message.empty());
    EXPECT_EQ(diagnostic.message.find("broken:"), std::string::npos);
    EXPECT_EQ(compiler.compiled_count(), 0u);
}

TEST_F(LuaCompileServiceTest, CancelledCompilationProducesNothing)
{
    std::stop_source source;
    source.request_stop();

    auto unit = compiler.compile(kWander, "wander", source.get_token());
    ASSERT_FALSE(unit);
    EXPECT_EQ(unit.error().error.code, ErrorCode::ScriptCompilationCancelled);
}

TEST_F(LuaCompileServiceTest, EmptyIdentifierIsRejected)
{
    auto unit = compiler.compile(kWander, "");
    ASSERT_FALSE(unit);
    EXPECT_EQ(unit.error().error.code, ErrorCode::InvalidScriptIdentifier);
}

TEST_F(LuaCompileServiceTest, CompileFileUsesTheStem)
{
    const auto path = std::filesystem::temp_directory_path() / "livewire_patrol.lua";
    {
        std::ofstream file(path);
        file << kWander;
    }

    auto unit = compiler.compile_file(path);
    std::filesystem::remove(path);
    ASSERT_TRUE(unit);
    EXPECT_EQ(unit.value()->identifier, "livewire_patrol");

    auto missing = compiler.compile_file(path);
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().error.code, ErrorCode::FileReadFailed);
}

// ── execute ──────────────────────────────────────────────────────────

TEST_F(LuaCompileServiceTest, BehaviorTableIsValidated)
{
    auto noTable = try_instantiate("return 42");
    ASSERT_FALSE(noTable);
    EXPECT_EQ(noTable.error().code, ErrorCode::ScriptInstantiationFailed);

    auto nothing = try_instantiate("local x = 1");
    ASSERT_FALSE(nothing);
    EXPECT_EQ(nothing.error().code, ErrorCode::ScriptInstantiationFailed);

    auto noTick = try_instantiate("return { on_initialize = function(e) end }");
    ASSERT_FALSE(noTick);
    EXPECT_EQ(noTick.error().code, ErrorCode::ScriptInstantiationFailed);

    auto badHook = try_instantiate("return { on_tick = function(e, dt) end, on_event = 5 }");
    ASSERT_FALSE(badHook);
    EXPECT_EQ(badHook.error().code, ErrorCode::ScriptInstantiationFailed);

    auto badUnload = try_instantiate("return { on_tick = function(e, dt) end, on_unload = 'later' }");
    ASSERT_FALSE(badUnload);
    EXPECT_EQ(badUnload.error().code, ErrorCode::ScriptInstantiationFailed);

    auto throwing = try_instantiate("error('boom')");
    ASSERT_FALSE(throwing);
    EXPECT_EQ(throwing.error().code, ErrorCode::ScriptInstantiationFailed);
    EXPECT_NE(throwing.error().message.find("boom"), std::string::npos);
}

TEST_F(LuaCompileServiceTest, EmptyPayloadIsRejected)
{
    CompiledUnit unit;
    unit.name = "empty.lua";
    auto behavior = compiler.execute(unit);
    ASSERT_FALSE(behavior);
    EXPECT_EQ(behavior.error().code, ErrorCode::ScriptInstantiationFailed);
}

TEST_F(LuaCompileServiceTest, HooksReadAndWriteTheEntity)
{
    auto behavior = instantiate(kWander, "wander");
    ASSERT_NE(behavior, nullptr);

    const entt::entity entity = world.create_entity("Walker");
    ScriptContext context{&world, entity, "wander", 1, 0.5f};

    ASSERT_TRUE(behavior->initialize(context));
    EXPECT_DOUBLE_EQ(world.registry().get<ScriptVariablesComponent>(entity).values.at("speed"), 2.0);

    ASSERT_TRUE(behavior->tick(context, 0.5f));
    EXPECT_FLOAT_EQ(world.registry().get<TransformComponent>(entity).position.x, 1.0f);

    ASSERT_TRUE(behavior->handle_event(context, ScriptEvent{"boost", 2.0}));
    ASSERT_TRUE(behavior->tick(context, 0.5f));
    EXPECT_FLOAT_EQ(world.registry().get<TransformComponent>(entity).position.x, 3.0f);
}

TEST_F(LuaCompileServiceTest, OptionalHooksMayBeMissing)
{
    auto behavior = instantiate("return { on_tick = function(entity, dt) end }");
    ASSERT_NE(behavior, nullptr);

    const entt::entity entity = world.create_entity();
    ScriptContext context{&world, entity, "test", 1, 0.1f};
    EXPECT_TRUE(behavior->initialize(context));
    EXPECT_TRUE(behavior->handle_event(context, ScriptEvent{"anything", 1.0}));
    EXPECT_TRUE(behavior->tick(context, 0.1f));
}

TEST_F(LuaCompileServiceTest, UnloadHookRunsOnDetach)
{
    auto compilerPtr = std::make_shared<LuaCompileService>();
    VersionedScriptCache cache{compilerPtr};
    ScriptAttachmentRegistry attachments{world};
    ScriptScheduler scheduler{cache};

    auto unit = compilerPtr->compile(R"(
        return {
            on_tick = function(entity, dt) end,
            on_unload = function(entity) entity.position = Vec3.new(0, 0, -1) end,
        }
    )",
                                     "sentry");
    ASSERT_TRUE(unit);
    ASSERT_TRUE(cache.update_version("sentry", unit.value()));

    const entt::entity entity = world.create_entity("Sentry");
    ASSERT_TRUE(attachments.add_attachment(entity, "sentry"));
    ASSERT_EQ(scheduler.tick(world, 0.1f).initialized, 1u);

    ASSERT_TRUE(attachments.remove_attachment(entity, "sentry"));
    EXPECT_FLOAT_EQ(world.registry().get<TransformComponent>(entity).position.z, -1.0f);

    // Without on_unload, detaching is silent.
    auto plain = instantiate("return { on_tick = function(entity, dt) end }");
    ASSERT_NE(plain, nullptr);
    ScriptContext context{&world, entity, "test", 1, 0.0f};
    EXPECT_TRUE(plain->unload(context));
}

TEST_F(LuaCompileServiceTest, RuntimeErrorBecomesExecutionFailure)
{
    auto behavior = instantiate(R"(
        return { on_tick = function(entity, dt) error("fell off the map") end }
    )");
    ASSERT_NE(behavior, nullptr);

    const entt::entity entity = world.create_entity();
    ScriptContext context{&world, entity, "test", 1, 0.1f};
    auto ticked = behavior->tick(context, 0.1f);
    ASSERT_FALSE(ticked);
    EXPECT_EQ(ticked.error().code, ErrorCode::ScriptExecutionFailed);
    EXPECT_NE(ticked.error().message.find("fell off the map"), std::string::npos);

    // The VM stays usable after an error.
    EXPECT_FALSE(behavior->tick(context, 0.1f));
}

TEST_F(LuaCompileServiceTest, EachInstanceHasItsOwnVm)
{
    constexpr const char* counter = R"(
        calls = 0
        return { on_tick = function(entity, dt) calls = calls + 1; entity:set_var("calls", calls) end }
    )";
    auto first = instantiate(counter);
    auto second = instantiate(counter);
    ASSERT_NE(first, nullptr);
    ASSERT_NE(second, nullptr);

    const entt::entity a = world.create_entity("A");
    const entt::entity b = world.create_entity("B");
    ScriptContext contextA{&world, a, "test", 1, 0.1f};
    ScriptContext contextB{&world, b, "test", 2, 0.1f};

    ASSERT_TRUE(first->tick(contextA, 0.1f));
    ASSERT_TRUE(first->tick(contextA, 0.1f));
    ASSERT_TRUE(second->tick(contextB, 0.1f));

    EXPECT_DOUBLE_EQ(world.registry().get<ScriptVariablesComponent>(a).values.at("calls"), 2.0);
    EXPECT_DOUBLE_EQ(world.registry().get<ScriptVariablesComponent>(b).values.at("calls"), 1.0);
    EXPECT_EQ(compiler.executed_count(), 2u);
}

// ── End to end ───────────────────────────────────────────────────────

TEST(LuaScenarioTest, HotReloadChangesBehaviorWithoutTouchingEntities)
{
    auto compiler = std::make_shared<LuaCompileService>();
    VersionedScriptCache cache{compiler};
    World world;
    ScriptAttachmentRegistry attachments{world};
    ScriptScheduler scheduler{cache, SchedulerConfig{.workerCount = 2}};

    auto v1 = compiler->compile(R"(
        return {
            on_initialize = function(entity) entity:set_var("speed", 1) end,
            on_tick = function(entity, dt)
                local p = entity.position
                entity.position = Vec3.new(p.x + entity:get_var("speed", 0) * dt, p.y, p.z)
            end,
        }
    )",
                                "wander");
    ASSERT_TRUE(v1);
    ASSERT_TRUE(cache.update_version("wander", v1.value()));

    const entt::entity first = world.create_entity("First");
    const entt::entity second = world.create_entity("Second");
    ASSERT_TRUE(attachments.add_attachment(first, "wander"));
    ASSERT_TRUE(attachments.add_attachment(second, "wander"));

    for (int i = 0; i < 2; ++i)
        EXPECT_EQ(scheduler.tick(world, 1.0f).failed, 0u);
    EXPECT_FLOAT_EQ(world.registry().get<TransformComponent>(first).position.x, 2.0f);

    auto v2 = compiler->compile(R"(
        return {
            on_initialize = function(entity) entity:set_var("speed", 5) end,
            on_tick = function(entity, dt)
                local p = entity.position
                entity.position = Vec3.new(p.x, p.y + entity:get_var("speed", 0) * dt, p.z)
            end,
        }
    )",
                                "wander");
    ASSERT_TRUE(v2);
    ASSERT_TRUE(cache.update_version("wander", v2.value()));

    EXPECT_EQ(scheduler.tick(world, 1.0f).initialized, 2u);
    for (const entt::entity entity : {first, second})
    {
        const Vec3& position = world.registry().get<TransformComponent>(entity).position;
        EXPECT_FLOAT_EQ(position.x, 2.0f);
        EXPECT_FLOAT_EQ(position.y, 5.0f);
    }
    EXPECT_EQ(compiler->executed_count(), 2u);
}
