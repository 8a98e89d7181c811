#pragma once
// ═══════════════════════════════════════════════════════════════════
//  forgepp/json_utils.h — JSON serialization helpers
// ═══════════════════════════════════════════════════════════════════
//  Uses nlohmann/json + C++20 Concepts so build results and the run
//  summary serialize without hand-written field lists.
// ═══════════════════════════════════════════════════════════════════

#include <nlohmann/json.hpp>
#include <concepts>
#include <string>

namespace forgepp {

// ─────────────────────────────────────────────
//  Macro: FORGEPP_SERIALIZE
//  Makes a struct serializable to/from JSON.
//
//  Usage:
//    struct Artifact {
//        std::string name;
//        std::uint64_t size;
//        FORGEPP_SERIALIZE(Artifact, name, size)
//    };
// ─────────────────────────────────────────────
#define FORGEPP_SERIALIZE(Type, ...) \
    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Type, __VA_ARGS__)

// ─────────────────────────────────────────────
//  Macro: FORGEPP_SERIALIZE_ENUM
//  Serializes an enum by name instead of by value.
// ─────────────────────────────────────────────
#define FORGEPP_SERIALIZE_ENUM(Enum, ...) \
    NLOHMANN_JSON_SERIALIZE_ENUM(Enum, __VA_ARGS__)

template <typename T>
concept JsonSerializable = requires(T t) {
    { nlohmann::json(t) } -> std::convertible_to<nlohmann::json>;
};

template <JsonSerializable T>
inline nlohmann::json toJson(const T& value) {
    return nlohmann::json(value);
}

} // namespace forgepp
