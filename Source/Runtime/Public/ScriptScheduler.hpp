#pragma once
#include "../../Core/Public/Core.hpp"
#include "../../Core/Public/Expected.hpp"
#include "../../Scripting/Public/ScriptBehavior.hpp"

#include <entt/entity/entity.hpp>
#include <taskflow/taskflow.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class World;
class VersionedScriptCache;
struct ScriptAttachment;

/// Scheduler settings.
struct SchedulerConfig
{
    std::uint32_t workerCount{1};          // > 1 processes entities in parallel on a Taskflow executor
    std::uint32_t summaryInterval{60};     // ticks between periodic summary lines, 0 disables them
    std::size_t maxRecordedFailures{64};   // size of the recent_failures() ring
    bool logFailures{true};
};

/// Which lifecycle step a failure happened in.
enum class ScriptPhase
{
    Resolve,
    Initialize,
    Tick,
    Event,
};

/// One isolated script failure.
struct ScriptFailure
{
    entt::entity entity{entt::null};
    std::string scriptId;
    ScriptVersion version{kInvalidScriptVersion};
    ScriptPhase phase{ScriptPhase::Tick};
    ErrorCode code{ErrorCode::None};
    std::string message;
    std::uint64_t tick{0};
};

/// Counters for one tick() or event dispatch.
struct TickReport
{
    std::size_t entities{0};
    std::size_t executed{0};    // hooks that completed
    std::size_t initialized{0}; // initialize() calls that completed
    std::size_t skipped{0};     // inactive attachments
    std::size_t failed{0};
};

LW_SUPPRESS_DLL_WARNINGS

/// Runs the scripts attached to entities every simulation tick.
///
/// For each entity, active attachments run in (priority desc, insertion order asc).
/// Every call resolves the instance through the cache by identifier, so a version
/// installed between ticks is picked up on the next tick with no entity bookkeeping.
/// A failing script is logged, recorded and skipped; it never stops the scripts after
/// it or other entities.
class LW_EXPORT ScriptScheduler
{
  public:
    explicit ScriptScheduler(VersionedScriptCache& cache, SchedulerConfig config = {});
    /// Waits for in-flight parallel work.
    ~ScriptScheduler();

    ScriptScheduler(const ScriptScheduler&) = delete;
    ScriptScheduler& operator=(const ScriptScheduler&) = delete;

    /// Runs one simulation tick for every scripted entity in `world`.
    TickReport tick(World& world, float deltaTime);

    /// Delivers `event` to the active scripts of one entity, in execution order.
    TickReport dispatch_event(World& world, entt::entity entity, const ScriptEvent& event);

    /// Delivers `event` to every scripted entity.
    TickReport broadcast_event(World& world, const ScriptEvent& event);

    /// Most recent failures, oldest first.
    std::vector<ScriptFailure> recent_failures() const;
    void clear_failures();

    /// Total failures since construction.
    std::uint64_t failure_count() const noexcept
    {
        return m_totalFailures.load();
    }

    std::uint64_t tick_count() const noexcept
    {
        return m_tickCount;
    }

    const SchedulerConfig& config() const noexcept
    {
        return m_config;
    }

  private:
    struct EntityCounters;

    using HookFn = std::function<Result<>(IScriptBehavior&, ScriptContext&)>;

    /// Resolves, initializes if needed, and calls `hook` for each active attachment of `entity`.
    void run_entity(World& world, entt::entity entity, float deltaTime, ScriptPhase phase, const HookFn& hook,
                    EntityCounters& counters);

    /// Collects the active attachments of `entity` in execution order.
    static std::vector<ScriptAttachment*> ordered_active_attachments(World& world, entt::entity entity,
                                                                     EntityCounters& counters);

    /// Runs `work` for every entity, in parallel when configured.
    template <typename Fn> void for_each_entity(const std::vector<entt::entity>& entities, Fn&& work);

    void record_failure(ScriptFailure failure);
    void log_summary(const TickReport& report) const;

    tf::Executor& get_executor();

    VersionedScriptCache& m_cache;
    SchedulerConfig m_config;

    std::unique_ptr<tf::Executor> m_executor;

    mutable std::mutex m_failureMutex;
    std::deque<ScriptFailure> m_failures;
    std::atomic<std::uint64_t> m_totalFailures{0};

    std::uint64_t m_tickCount{0};
    std::size_t m_lastExecutedCount{0};
};

LW_RESTORE_DLL_WARNINGS
