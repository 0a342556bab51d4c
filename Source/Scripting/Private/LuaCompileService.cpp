#include "../Public/LuaCompileService.hpp"
#include "../../Core/Public/Utils.hpp"
#include "LuaScriptBehavior.hpp"

#include <fmt/core.h>

#include <cctype>
#include <charconv>
#include <string>

namespace fs = std::filesystem;

namespace
{

CompilationFailure make_failure(std::string message, ErrorCode code, std::vector<CompileDiagnostic> diagnostics = {})
{
    return CompilationFailure{Error{std::move(message), code}, std::move(diagnostics)};
}

/// Lua reports syntax errors as "<chunk>:<line>: <message>". Splits that into a diagnostic.
CompileDiagnostic parse_lua_error(std::string_view chunkName, std::string_view text)
{
    CompileDiagnostic diagnostic;
    diagnostic.severity = DiagnosticSeverity::Error;
    diagnostic.message = std::string(text);

    std::string_view rest = text;
    if (rest.starts_with(chunkName) && rest.size() > chunkName.size() && rest[chunkName.size()] == ':')
        rest.remove_prefix(chunkName.size() + 1);
    else
        return diagnostic;

    std::int32_t line = 0;
    auto [ptr, ec] = std::from_chars(rest.data(), rest.data() + rest.size(), line);
    if (ec != std::errc{} || ptr == rest.data() || ptr == rest.data() + rest.size() || *ptr != ':')
        return diagnostic;

    rest.remove_prefix(static_cast<std::size_t>(ptr - rest.data()) + 1);
    while (!rest.empty() && std::isspace(static_cast<unsigned char>(rest.front())))
        rest.remove_prefix(1);

    diagnostic.line = line;
    diagnostic.message = std::string(rest);
    return diagnostic;
}

} // namespace

// ── compile ───────────────────────────────────────────────────────────

CompileResult LuaCompileService::compile(std::string_view source, std::string_view identifier,
                                         std::stop_token stopToken)
{
    if (identifier.empty())
        return std::unexpected(make_failure("Script identifier must not be empty", ErrorCode::InvalidScriptIdentifier));

    if (stopToken.stop_requested())
        return std::unexpected(make_failure(fmt::format("Compilation of '{}' was cancelled", identifier),
                                            ErrorCode::ScriptCompilationCancelled));

    // A leading '=' makes Lua print the chunk name verbatim in error messages.
    const std::string chunkName = fmt::format("={}", identifier);
    sol::state scratch;
    sol::load_result loaded = scratch.load(source, chunkName, sol::load_mode::text);
    if (!loaded.valid())
    {
        sol::error err = loaded;
        CompileDiagnostic diagnostic = parse_lua_error(identifier, err.what());
        std::string message = diagnostic.line > 0
                                  ? fmt::format("Lua compilation failed ({}:{}): {}", identifier, diagnostic.line,
                                                diagnostic.message)
                                  : fmt::format("Lua compilation failed ({}): {}", identifier, diagnostic.message);
        return std::unexpected(make_failure(std::move(message), ErrorCode::ScriptCompilationFailed, {diagnostic}));
    }

    if (stopToken.stop_requested())
        return std::unexpected(make_failure(fmt::format("Compilation of '{}' was cancelled", identifier),
                                            ErrorCode::ScriptCompilationCancelled));

    sol::protected_function chunk = loaded.get<sol::protected_function>();
    sol::bytecode bytecode = chunk.dump();

    auto unit = std::make_shared<CompiledUnit>();
    unit->name = fmt::format("{}.lua", identifier);
    unit->identifier = std::string(identifier);
    unit->payload = std::string(bytecode.as_string_view());

    ++m_compiledCount;
    return std::shared_ptr<const CompiledUnit>(std::move(unit));
}

CompileResult LuaCompileService::compile_file(const fs::path& scriptPath, std::stop_token stopToken)
{
    auto source = read_file(scriptPath);
    if (!source)
        return std::unexpected(make_failure(source.error().message, source.error().code));

    return compile(source.value(), scriptPath.stem().string(), std::move(stopToken));
}

// ── execute ───────────────────────────────────────────────────────────

Result<std::shared_ptr<IScriptBehavior>> LuaCompileService::execute(const CompiledUnit& unit)
{
    if (unit.payload.empty())
        return make_error(fmt::format("Compiled unit '{}' has no bytecode", unit.name),
                          ErrorCode::ScriptInstantiationFailed);

    auto behavior = std::make_shared<LuaScriptBehavior>(unit.name);
    auto loaded = behavior->load(unit.payload);
    if (!loaded)
        return make_error(loaded.error());

    ++m_executedCount;
    return std::shared_ptr<IScriptBehavior>(std::move(behavior));
}
