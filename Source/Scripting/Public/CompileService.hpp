#pragma once

#include "../../Core/Public/Core.hpp"
#include "../../Core/Public/Expected.hpp"
#include "ScriptBehavior.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

/// Output of a successful compilation. Opaque to the cache: only the backend
/// that produced it knows how to interpret `payload`.
struct CompiledUnit
{
    std::string name;       // human readable, used in diagnostics
    std::string identifier; // script identifier it was compiled for
    std::string payload;    // backend-defined bytes (e.g. Lua bytecode)
    std::chrono::system_clock::time_point compiledAt{std::chrono::system_clock::now()};
};

enum class DiagnosticSeverity
{
    Info,
    Warning,
    Error,
};

struct CompileDiagnostic
{
    DiagnosticSeverity severity{DiagnosticSeverity::Error};
    std::string message;
    std::int32_t line{0}; // 1-based, 0 when unknown
    std::int32_t column{0};
};

struct CompilationFailure
{
    Error error;
    std::vector<CompileDiagnostic> diagnostics;
};

using CompileResult = std::expected<std::shared_ptr<const CompiledUnit>, CompilationFailure>;

LW_SUPPRESS_DLL_WARNINGS

/// Turns script source into compiled units and compiled units into behavior instances.
///
/// Compilation never installs anything into the script cache; callers decide what
/// to do with the unit. Both operations must be callable from any thread.
class LW_EXPORT ICompileService
{
  public:
    virtual ~ICompileService() = default;

    /// Compiles source text for `identifier`.
    /// Fails with ScriptCompilationFailed when any diagnostic is error-severity,
    /// or ScriptCompilationCancelled once `stopToken` is signalled.
    virtual CompileResult compile(std::string_view source, std::string_view identifier,
                                  std::stop_token stopToken = {}) = 0;

    /// Materializes a default behavior instance from a compiled unit.
    /// Fails with ScriptInstantiationFailed when the result does not satisfy IScriptBehavior's contract.
    virtual Result<std::shared_ptr<IScriptBehavior>> execute(const CompiledUnit& unit) = 0;
};

LW_RESTORE_DLL_WARNINGS
