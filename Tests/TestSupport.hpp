#pragma once
#include <Scripting/Public/CompileService.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <new>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

/// Shared log of hook calls, in call order.
struct CallLog
{
    std::mutex mutex;
    std::vector<std::string> calls;

    void push(std::string call)
    {
        std::lock_guard lock(mutex);
        calls.push_back(std::move(call));
    }

    std::vector<std::string> snapshot()
    {
        std::lock_guard lock(mutex);
        return calls;
    }

    void clear()
    {
        std::lock_guard lock(mutex);
        calls.clear();
    }
};

/// Behavior that records "<tag>:init", "<tag>:tick", "<tag>:event:<name>" and "<tag>:unload".
class RecordingBehavior final : public IScriptBehavior
{
  public:
    RecordingBehavior(std::string tag, std::shared_ptr<CallLog> log) : m_tag(std::move(tag)), m_log(std::move(log))
    {}

    Result<> initialize(ScriptContext&) override
    {
        m_log->push(m_tag + ":init");
        if (failInitialize)
            return make_error(m_tag + " refused to initialize", ErrorCode::ScriptExecutionFailed);
        return {};
    }

    Result<> tick(ScriptContext&, float) override
    {
        m_log->push(m_tag + ":tick");
        if (throwOnTick)
            throw std::runtime_error(m_tag + " exploded");
        if (throwNonStandardOnTick)
            throw 42;
        if (failTick)
            return make_error(m_tag + " tick failed", ErrorCode::ScriptExecutionFailed);
        return {};
    }

    Result<> handle_event(ScriptContext&, const ScriptEvent& event) override
    {
        m_log->push(m_tag + ":event:" + event.name);
        return {};
    }

    Result<> unload(ScriptContext&) override
    {
        m_log->push(m_tag + ":unload");
        if (throwOnUnload)
            throw std::runtime_error(m_tag + " failed to unload");
        return {};
    }

    bool failInitialize{false};
    bool failTick{false};
    bool throwOnTick{false};
    bool throwNonStandardOnTick{false};
    bool throwOnUnload{false};

  private:
    std::string m_tag;
    std::shared_ptr<CallLog> m_log;
};

/// Compile service double. `compile` wraps the source text in a unit; `execute`
/// builds a RecordingBehavior tagged with the unit's payload. A "broken" payload
/// fails to instantiate and a "bad_alloc" payload makes `execute` throw.
class FakeCompileService final : public ICompileService
{
  public:
    explicit FakeCompileService(std::shared_ptr<CallLog> log = std::make_shared<CallLog>()) : m_log(std::move(log))
    {}

    CompileResult compile(std::string_view source, std::string_view identifier, std::stop_token stopToken) override
    {
        if (stopToken.stop_requested())
            return std::unexpected(
                CompilationFailure{Error{"cancelled", ErrorCode::ScriptCompilationCancelled}, {}});
        if (source.find("syntax error") != std::string_view::npos)
            return std::unexpected(CompilationFailure{Error{"bad source", ErrorCode::ScriptCompilationFailed},
                                                      {{DiagnosticSeverity::Error, "unexpected symbol", 3, 7}}});
        return make_unit(identifier, source);
    }

    Result<std::shared_ptr<IScriptBehavior>> execute(const CompiledUnit& unit) override
    {
        ++executeCalls;
        if (executeDelay.count() > 0)
            std::this_thread::sleep_for(executeDelay);
        if (unit.payload == "bad_alloc")
            throw std::bad_alloc();
        if (failExecute || unit.payload == "broken")
            return make_error("cannot instantiate " + unit.name, ErrorCode::ScriptInstantiationFailed);

        auto behavior = std::make_shared<RecordingBehavior>(unit.payload, m_log);
        if (onExecute)
            onExecute(*behavior);
        return std::shared_ptr<IScriptBehavior>(std::move(behavior));
    }

    static std::shared_ptr<const CompiledUnit> make_unit(std::string_view identifier, std::string_view payload)
    {
        auto unit = std::make_shared<CompiledUnit>();
        unit->identifier = std::string(identifier);
        unit->name = std::string(identifier) + ".fake";
        unit->payload = std::string(payload);
        return unit;
    }

    std::shared_ptr<CallLog> log() const
    {
        return m_log;
    }

    std::atomic<int> executeCalls{0};
    std::atomic<bool> failExecute{false};
    std::chrono::milliseconds executeDelay{0};
    std::function<void(RecordingBehavior&)> onExecute;

  private:
    std::shared_ptr<CallLog> m_log;
};
