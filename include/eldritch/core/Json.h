// include/eldritch/core/Json.h
#pragma once
//
// Snapshot aliases and tolerant accessors over nlohmann::json.
// The game loop hands us loosely-typed maps; reads go through GetOr so a
// missing or mistyped key falls back instead of throwing mid-turn.

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace eldritch {

using json = nlohmann::json;

// Mutable world snapshot owned by the turn loop (location, sanity, inventory...).
using GameState = nlohmann::json;
// Per-turn action payload (action_type, discovery, san_loss...).
using ActionData = nlohmann::json;

template <typename T>
[[nodiscard]] T GetOr(const json& j, const char* key, const T& fallback)
{
    if (!j.is_object())
        return fallback;
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return fallback;
    try
    {
        return it->get<T>();
    }
    catch (const json::exception&)
    {
        return fallback;
    }
}

// Pointer to j[key], or nullptr when j is not an object or lacks the key.
[[nodiscard]] inline const json* Find(const json& j, const char* key) noexcept
{
    if (!j.is_object())
        return nullptr;
    auto it = j.find(key);
    return it == j.end() ? nullptr : &*it;
}

[[nodiscard]] inline bool Has(const json& j, const char* key) noexcept
{
    return Find(j, key) != nullptr;
}

// Loose truthiness: false/0/""/null/empty containers are false.
[[nodiscard]] inline bool Truthy(const json& v) noexcept
{
    if (v.is_boolean())
        return v.get<bool>();
    if (v.is_number_integer())
        return v.get<long long>() != 0;
    if (v.is_number_float())
        return v.get<double>() != 0.0;
    if (v.is_string())
        return !v.get_ref<const std::string&>().empty();
    if (v.is_array() || v.is_object())
        return !v.empty();
    return false;
}

// String payloads stay as-is; anything else is rendered as compact JSON.
[[nodiscard]] inline std::string AsString(const json& v)
{
    return v.is_string() ? v.get<std::string>() : v.dump();
}

// True if `arr` is an array holding a string equal to `needle`.
[[nodiscard]] inline bool ArrayContains(const json& arr, std::string_view needle)
{
    if (!arr.is_array())
        return false;
    for (const auto& v : arr)
        if (v.is_string() && v.get_ref<const std::string&>() == needle)
            return true;
    return false;
}

} // namespace eldritch
