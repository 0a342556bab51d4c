#pragma once

#include "../../ECS/Public/Components.hpp"

#include <entt/entity/entity.hpp>

#include <cmath>
#include <cstdint>
#include <string>
#include <string_view>

class World;

/// Lightweight Vec3 for Lua scripts. Mirrors the Vec3 stored in TransformComponent.
struct LuaVec3
{
    float x{0.0f};
    float y{0.0f};
    float z{0.0f};

    LuaVec3() = default;
    LuaVec3(float x, float y, float z) : x(x), y(y), z(z)
    {}
    explicit LuaVec3(const Vec3& v) : x(v.x), y(v.y), z(v.z)
    {}

    Vec3 to_vec3() const noexcept
    {
        return {x, y, z};
    }

    LuaVec3 operator+(const LuaVec3& o) const noexcept
    {
        return {x + o.x, y + o.y, z + o.z};
    }
    LuaVec3 operator-(const LuaVec3& o) const noexcept
    {
        return {x - o.x, y - o.y, z - o.z};
    }
    LuaVec3 operator*(float s) const noexcept
    {
        return {x * s, y * s, z * s};
    }
    LuaVec3 operator-() const noexcept
    {
        return {-x, -y, -z};
    }

    float length() const noexcept
    {
        return std::sqrt(x * x + y * y + z * z);
    }

    LuaVec3 normalized() const noexcept
    {
        float len = length();
        if (len < 1e-8f)
            return {0.0f, 0.0f, 0.0f};
        return {x / len, y / len, z / len};
    }

    float dot(const LuaVec3& o) const noexcept
    {
        return x * o.x + y * o.y + z * o.z;
    }
};

/// Safe, limited view of an entity handed to Lua hooks.
/// Only touches components the world created up front, so it is usable from worker threads.
struct LuaEntity
{
    entt::entity handle{entt::null};
    World* world{nullptr};

    bool valid() const noexcept;
    std::string name() const;
    std::uint32_t id() const noexcept;

    LuaVec3 get_position() const;
    void set_position(const LuaVec3& position);

    /// Reads a per-entity script variable, or `fallback` if it was never set.
    double get_var(const std::string& key, double fallback) const;
    void set_var(const std::string& key, double value);
};
