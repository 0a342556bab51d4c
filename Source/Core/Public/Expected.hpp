#pragma once
#include "Core.hpp"

#include <cstdint>
#include <exception>
#include <expected>
#include <string>
#include <string_view>

#include <fmt/core.h>

enum class ErrorCode
{
    None = 0,

    // Utils Errors
    FileReadFailed = 100,

    // Scripting Errors
    InvalidScriptIdentifier = 200,
    InvalidCompiledUnit,
    ScriptNotFound,
    ScriptCompilationFailed,
    ScriptCompilationCancelled,
    ScriptInstantiationFailed,
    ScriptExecutionFailed,
    ScriptRollbackUnavailable,
    InvalidScriptVersion,

    // ECS Errors
    InvalidEntity = 300,
    ScriptAlreadyAttached,

    // Backup Errors
    BackupWriteFailed = 400,
    BackupParsingFailed,
};

struct Error
{
    std::string message{};
    ErrorCode code{ErrorCode::None};
};

template <typename T = void> using Result = std::expected<T, Error>;

inline static auto make_error(std::string_view message, ErrorCode code = ErrorCode::None)
{
    return std::unexpected(Error{std::string(message), code});
}

inline static auto make_error(const Error& error)
{
    return std::unexpected(error);
}

inline static std::uint32_t get_error_code(const Result<>& result) noexcept
{
    if (result)
        return static_cast<std::uint32_t>(ErrorCode::None);
    const auto& err = result.error();
    const std::uint32_t code = static_cast<std::uint32_t>(err.code);
    fmt::print("ERROR ({}): {}\n", code, err.message);
    return code;
}

/// Runs `fn` and returns its Result. An exception escaping `fn` becomes an Error
/// carrying `code`, so callers that isolate failures keep going.
template <typename Fn> auto guarded_call(ErrorCode code, Fn&& fn) -> decltype(fn())
{
    try
    {
        return fn();
    }
    catch (const std::exception& ex)
    {
        return make_error(fmt::format("unhandled exception: {}", ex.what()), code);
    }
    catch (...)
    {
        return make_error("unhandled non-standard exception", code);
    }
}
