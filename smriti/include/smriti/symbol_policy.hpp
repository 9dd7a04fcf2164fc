#pragma once
// Symbol policies: which identifier tokens become Symbols
//
// Every policy accepts plain identifiers first; policies differ in what
// else they admit or reject. A policy returns the Symbol on success and
// nullopt when the token is not a valid symbol under it.

#include "sexp.hpp"
#include <cctype>
#include <optional>
#include <regex>
#include <string>

namespace smriti {

// [letter _ - * ! ?][letter digit _ - * ! ?]*  or exactly one of + - * /
inline bool is_identifier(const std::string& s) {
    if (s.empty()) return false;
    if (s.size() == 1 && (s[0] == '+' || s[0] == '-' || s[0] == '*' || s[0] == '/')) {
        return true;
    }
    auto special = [](char c) {
        return c == '_' || c == '-' || c == '*' || c == '!' || c == '?';
    };
    unsigned char first = static_cast<unsigned char>(s[0]);
    if (!std::isalpha(first) && !special(s[0])) return false;
    for (size_t i = 1; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (!std::isalnum(c) && !special(s[i])) return false;
    }
    return true;
}

using SymbolPolicy = std::optional<Symbol> (*)(const std::string&);

// Admin policy: all identifiers, including reserved "__" names
inline std::optional<Symbol> policy_admin(const std::string& s) {
    if (!is_identifier(s)) return std::nullopt;
    return Symbol(s);
}

// User policy: "__" names are reserved for the system
inline std::optional<Symbol> policy_base(const std::string& s) {
    if (s.rfind("__", 0) == 0) return std::nullopt;
    return policy_admin(s);
}

// ═══════════════════════════════════════════════════════════════════
// Env file sigils
// ═══════════════════════════════════════════════════════════════════

struct Sigil {
    enum class Kind { LocalNode, LocalTriple, Node, Triple };
    Kind kind;
    LocalId env = 0;     // Node / Triple only
    LocalId value = 0;   // node id, or triple index

    // Node in the given env (the env the sigil is read in, for local forms)
    Node node_in(LocalNode current_env) const {
        LocalNode e = (kind == Kind::Node || kind == Kind::Triple) ? LocalNode(env) : current_env;
        LocalNode l = (kind == Kind::LocalTriple || kind == Kind::Triple)
                          ? LocalNode(index_to_triple_id(value))
                          : LocalNode(value);
        return Node(e, l);
    }
};

inline std::optional<Sigil> parse_sigil(const std::string& s) {
    static const std::regex local_node(R"(^\^(\d+)$)");
    static const std::regex local_triple(R"(^\^t(\d+)$)");
    static const std::regex global_node(R"(^\^(\d+)\^(\d+)$)");
    static const std::regex global_triple(R"(^\^(\d+)\^t(\d+)$)");

    if (s.empty() || s[0] != '^') return std::nullopt;

    std::smatch m;
    auto num = [](const std::ssub_match& sm) -> std::optional<LocalId> {
        try {
            return static_cast<LocalId>(std::stoull(sm.str()));
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    };

    Sigil sig{};
    if (std::regex_match(s, m, local_node)) {
        sig.kind = Sigil::Kind::LocalNode;
    } else if (std::regex_match(s, m, local_triple)) {
        sig.kind = Sigil::Kind::LocalTriple;
    } else if (std::regex_match(s, m, global_node)) {
        sig.kind = Sigil::Kind::Node;
    } else if (std::regex_match(s, m, global_triple)) {
        sig.kind = Sigil::Kind::Triple;
    } else {
        return std::nullopt;
    }

    if (m.size() == 2) {
        auto v = num(m[1]);
        if (!v) return std::nullopt;
        sig.value = *v;
    } else {
        auto e = num(m[1]);
        auto v = num(m[2]);
        if (!e || !v) return std::nullopt;
        sig.env = *e;
        sig.value = *v;
    }
    // Node ids never carry the triple bit; triple indices must leave room for it
    if (is_triple_id(sig.value) || is_triple_id(sig.env)) return std::nullopt;
    return sig;
}

// Env serde policy: identifiers plus node/triple sigils
inline std::optional<Symbol> policy_env_serde(const std::string& s) {
    if (parse_sigil(s)) return Symbol(s);
    return policy_admin(s);
}

} // namespace smriti
