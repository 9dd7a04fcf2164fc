#pragma once
// Env prelude: the fixed nodes every environment starts with
//
//   ^0  self_env      structure: the env's own node in the meta env
//   ^1  self_des      designation context for symbol lookup
//   ^2  tell_handler  optional predicate consulted by tell
//   ^3..^9            reserved
//
// Prelude names resolve relative to the current env; they are never
// stored in designation tables.

#include "environment.hpp"
#include <optional>
#include <string>

namespace smriti {
namespace env_prelude {

constexpr LocalId SELF_ENV = 0;
constexpr LocalId SELF_DES = 1;
constexpr LocalId TELL_HANDLER = 2;
constexpr LocalId PRELUDE_SIZE = 10;

inline LocalNode self_env() { return LocalNode(SELF_ENV); }
inline LocalNode self_des() { return LocalNode(SELF_DES); }
inline LocalNode tell_handler() { return LocalNode(TELL_HANDLER); }

inline std::optional<LocalNode> from_name(const std::string& name) {
    if (name == "self_env") return self_env();
    if (name == "self_des") return self_des();
    if (name == "tell_handler") return tell_handler();
    return std::nullopt;
}

inline const char* name_of(LocalNode n) {
    switch (n.id) {
        case SELF_ENV: return "self_env";
        case SELF_DES: return "self_des";
        case TELL_HANDLER: return "tell_handler";
        default: return nullptr;
    }
}

inline bool is_prelude(LocalNode n) { return !n.is_triple() && n.id < PRELUDE_SIZE; }

// Populate a fresh env; self is the env's node in the meta env
inline void populate(Environment& env, Node self) {
    if (env.node_count() != 0) {
        throw lang_error(LangError::invalid_state(
            std::to_string(env.node_count()) + " nodes", "empty env"));
    }
    env.insert_node(Sexp(self));
    for (LocalId i = 1; i < PRELUDE_SIZE; ++i) env.insert_node(std::nullopt);
}

} // namespace env_prelude
} // namespace smriti
