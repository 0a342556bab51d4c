#include "../Public/ScriptScheduler.hpp"

#include "../../Cache/Public/VersionedScriptCache.hpp"
#include "../../ECS/Public/ScriptAttachmentRegistry.hpp"
#include "../../ECS/Public/World.hpp"

#include <fmt/core.h>

#include <algorithm>

struct ScriptScheduler::EntityCounters
{
    std::size_t executed{0};
    std::size_t initialized{0};
    std::size_t skipped{0};
    std::size_t failed{0};
};

namespace
{

const char* phase_name(ScriptPhase phase) noexcept
{
    switch (phase)
    {
    case ScriptPhase::Resolve:
        return "resolve";
    case ScriptPhase::Initialize:
        return "initialize";
    case ScriptPhase::Tick:
        return "tick";
    case ScriptPhase::Event:
        return "event";
    }
    return "unknown";
}

} // namespace

// ── Constructor / destructor ──────────────────────────────────────────

ScriptScheduler::ScriptScheduler(VersionedScriptCache& cache, SchedulerConfig config)
    : m_cache(cache), m_config(config)
{}

ScriptScheduler::~ScriptScheduler()
{
    if (m_executor)
        m_executor->wait_for_all();
}

tf::Executor& ScriptScheduler::get_executor()
{
    if (!m_executor)
    {
        const std::uint32_t workers = std::max(1u, m_config.workerCount);
        m_executor = std::make_unique<tf::Executor>(workers);
    }
    return *m_executor;
}

// ── tick ──────────────────────────────────────────────────────────────

TickReport ScriptScheduler::tick(World& world, float deltaTime)
{
    ++m_tickCount;

    const HookFn tickHook = [deltaTime](IScriptBehavior& behavior, ScriptContext& context) {
        return behavior.tick(context, deltaTime);
    };

    const std::vector<entt::entity> entities = world.collect_scripted_entities();
    std::vector<EntityCounters> counters(entities.size());
    for_each_entity(entities, [&](std::size_t index) {
        run_entity(world, entities[index], deltaTime, ScriptPhase::Tick, tickHook, counters[index]);
    });

    TickReport report;
    report.entities = entities.size();
    for (const auto& c : counters)
    {
        report.executed += c.executed;
        report.initialized += c.initialized;
        report.skipped += c.skipped;
        report.failed += c.failed;
    }

    log_summary(report);
    if (report.executed > 0)
        m_lastExecutedCount = report.executed;
    return report;
}

// ── Events ────────────────────────────────────────────────────────────

TickReport ScriptScheduler::dispatch_event(World& world, entt::entity entity, const ScriptEvent& event)
{
    TickReport report;
    if (!world.is_valid(entity))
        return report;

    const HookFn eventHook = [&event](IScriptBehavior& behavior, ScriptContext& context) {
        return behavior.handle_event(context, event);
    };

    EntityCounters counters;
    run_entity(world, entity, 0.0f, ScriptPhase::Event, eventHook, counters);

    report.entities = 1;
    report.executed = counters.executed;
    report.initialized = counters.initialized;
    report.skipped = counters.skipped;
    report.failed = counters.failed;
    return report;
}

TickReport ScriptScheduler::broadcast_event(World& world, const ScriptEvent& event)
{
    const HookFn eventHook = [&event](IScriptBehavior& behavior, ScriptContext& context) {
        return behavior.handle_event(context, event);
    };

    const std::vector<entt::entity> entities = world.collect_scripted_entities();
    std::vector<EntityCounters> counters(entities.size());
    for_each_entity(entities, [&](std::size_t index) {
        run_entity(world, entities[index], 0.0f, ScriptPhase::Event, eventHook, counters[index]);
    });

    TickReport report;
    report.entities = entities.size();
    for (const auto& c : counters)
    {
        report.executed += c.executed;
        report.initialized += c.initialized;
        report.skipped += c.skipped;
        report.failed += c.failed;
    }
    return report;
}

// ── Per-entity execution ──────────────────────────────────────────────

std::vector<ScriptAttachment*> ScriptScheduler::ordered_active_attachments(World& world, entt::entity entity,
                                                                           EntityCounters& counters)
{
    std::vector<ScriptAttachment*> ordered;
    auto* component = world.registry().try_get<ScriptAttachmentsComponent>(entity);
    if (!component)
        return ordered;

    ordered.reserve(component->attachments.size());
    for (auto& attachment : component->attachments)
    {
        if (attachment.active)
            ordered.push_back(&attachment);
        else
            ++counters.skipped;
    }

    ScriptAttachmentRegistry::sort_by_execution_order(ordered);
    return ordered;
}

void ScriptScheduler::run_entity(World& world, entt::entity entity, float deltaTime, ScriptPhase phase,
                                 const HookFn& hook, EntityCounters& counters)
{
    for (ScriptAttachment* attachment : ordered_active_attachments(world, entity, counters))
    {
        const std::string& scriptId = attachment->scriptId;

        // Always resolve by identifier: this is what makes hot-reloaded versions visible.
        auto resolved = guarded_call(ErrorCode::ScriptInstantiationFailed,
                                     [&] { return m_cache.resolve_instance(scriptId); });
        if (!resolved)
        {
            record_failure({entity, scriptId, m_cache.get_version(scriptId), ScriptPhase::Resolve,
                            resolved.error().code, resolved.error().message, m_tickCount});
            ++counters.failed;
            continue;
        }

        std::shared_ptr<IScriptBehavior> instance = std::move(resolved.value().instance);
        ScriptContext context{&world, entity, scriptId, resolved.value().version, deltaTime};

        if (attachment->initializedInstance.lock() != instance)
        {
            auto initialized =
                guarded_call(ErrorCode::ScriptExecutionFailed, [&] { return instance->initialize(context); });
            if (!initialized)
            {
                record_failure({entity, scriptId, context.version, ScriptPhase::Initialize, initialized.error().code,
                                initialized.error().message, m_tickCount});
                ++counters.failed;
                continue;
            }
            attachment->initializedInstance = instance;
            attachment->initializedVersion = context.version;
            ++counters.initialized;
        }

        auto called = guarded_call(ErrorCode::ScriptExecutionFailed, [&] { return hook(*instance, context); });
        if (!called)
        {
            record_failure({entity, scriptId, context.version, phase, called.error().code, called.error().message,
                            m_tickCount});
            ++counters.failed;
            continue;
        }
        ++counters.executed;
    }
}

template <typename Fn> void ScriptScheduler::for_each_entity(const std::vector<entt::entity>& entities, Fn&& work)
{
    if (m_config.workerCount <= 1 || entities.size() < 2)
    {
        for (std::size_t i = 0; i < entities.size(); ++i)
            work(i);
        return;
    }

    // Each entity is handled by exactly one worker, so its attachments are never shared.
    tf::Taskflow taskflow;
    taskflow.for_each_index(std::size_t{0}, entities.size(), std::size_t{1}, [&](std::size_t i) { work(i); });
    get_executor().run(taskflow).wait();
}

// ── Failure log ───────────────────────────────────────────────────────

void ScriptScheduler::record_failure(ScriptFailure failure)
{
    ++m_totalFailures;
    if (m_config.logFailures)
    {
        fmt::print("[ScriptScheduler] {} failed for '{}' v{} on entity {}: {}\n", phase_name(failure.phase),
                   failure.scriptId, failure.version, static_cast<std::uint32_t>(failure.entity), failure.message);
    }

    std::lock_guard lock(m_failureMutex);
    if (m_config.maxRecordedFailures == 0)
        return;
    m_failures.push_back(std::move(failure));
    while (m_failures.size() > m_config.maxRecordedFailures)
        m_failures.pop_front();
}

std::vector<ScriptFailure> ScriptScheduler::recent_failures() const
{
    std::lock_guard lock(m_failureMutex);
    return std::vector<ScriptFailure>(m_failures.begin(), m_failures.end());
}

void ScriptScheduler::clear_failures()
{
    std::lock_guard lock(m_failureMutex);
    m_failures.clear();
}

void ScriptScheduler::log_summary(const TickReport& report) const
{
    const bool periodic = m_config.summaryInterval > 0 && m_tickCount % m_config.summaryInterval == 0;
    const bool shouldLog = report.initialized > 0 || report.failed > 0 || (periodic && report.executed > 0) ||
                           (report.executed > 0 && report.executed != m_lastExecutedCount);
    if (!shouldLog)
        return;

    fmt::print("[ScriptScheduler] Tick {}: {} entities, executed={}, initialized={}, failed={}, skipped={}\n",
               m_tickCount, report.entities, report.executed, report.initialized, report.failed, report.skipped);
}
