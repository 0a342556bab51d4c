#pragma once
#include <cstdint>

#define STRINGIFY_DETAIL(x) #x
#define STRINGIFY(x) STRINGIFY_DETAIL(x)

#define DEFINE_VERSION(VarName, Major, Minor, Patch)                                                                   \
    constexpr const struct                                                                                             \
    {                                                                                                                  \
        const uint32_t major{Major};                                                                                   \
        const uint32_t minor{Minor};                                                                                   \
        const uint32_t patch{Patch};                                                                                   \
                                                                                                                       \
        constexpr operator const char*() const noexcept                                                                \
        {                                                                                                              \
            return STRINGIFY(Major) "." STRINGIFY(Minor) "." STRINGIFY(Patch);                                         \
        }                                                                                                              \
    } VarName                                                                                                          \
    {}
DEFINE_VERSION(LIVE_WIRE, 0, 1, 0);

#if defined(_WIN32)
#ifdef LiveWire_EXPORTS
#define LW_EXPORT __declspec(dllexport)
#else
#define LW_EXPORT __declspec(dllimport)
#endif
#else
#define LW_EXPORT __attribute__((visibility("default")))
#endif

// Disable C4251 warning for STL types in exported classes
#ifdef _MSC_VER
#define LW_SUPPRESS_DLL_WARNINGS \
    __pragma(warning(push)) \
    __pragma(warning(disable: 4251))
#define LW_RESTORE_DLL_WARNINGS \
    __pragma(warning(pop))
#else
#define LW_SUPPRESS_DLL_WARNINGS
#define LW_RESTORE_DLL_WARNINGS
#endif
