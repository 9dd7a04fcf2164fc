#pragma once
// Core identity types: LocalNode, LocalTriple, Node
//
// A LocalId is a 64-bit id scoped to one environment. The top bit
// discriminates triples from plain nodes, so a triple is addressable
// as a node (meta-triples) without a separate tag.

#include <cstdint>
#include <functional>
#include <ostream>
#include <stdexcept>
#include <string>

namespace smriti {

using LocalId = uint64_t;

constexpr LocalId TRIPLE_BIT = 1ull << 63;

constexpr bool is_triple_id(LocalId id) { return (id & TRIPLE_BIT) != 0; }

inline LocalId index_to_triple_id(size_t index) {
    if (static_cast<LocalId>(index) & TRIPLE_BIT) {
        throw std::overflow_error("triple id space exhausted");
    }
    return static_cast<LocalId>(index) | TRIPLE_BIT;
}

constexpr size_t triple_index_of(LocalId id) { return static_cast<size_t>(id & ~TRIPLE_BIT); }

// Node or triple id within one environment. LocalNode(0) is the env's self node.
struct LocalNode {
    LocalId id = 0;

    constexpr LocalNode() = default;
    constexpr explicit LocalNode(LocalId i) : id(i) {}

    bool is_triple() const { return is_triple_id(id); }

    bool operator==(const LocalNode& o) const { return id == o.id; }
    bool operator!=(const LocalNode& o) const { return id != o.id; }
    bool operator<(const LocalNode& o) const { return id < o.id; }

    std::string to_string() const {
        if (is_triple()) return "^t" + std::to_string(triple_index_of(id));
        return "^" + std::to_string(id);
    }
};

// Triple handle; its id always has TRIPLE_BIT set.
struct LocalTriple {
    LocalId id = TRIPLE_BIT;

    LocalTriple() = default;
    explicit LocalTriple(LocalId i) : id(i) {}

    static LocalTriple from_index(size_t index) { return LocalTriple(index_to_triple_id(index)); }

    LocalNode node() const { return LocalNode(id); }
    size_t index() const { return triple_index_of(id); }

    bool operator==(const LocalTriple& o) const { return id == o.id; }
    bool operator!=(const LocalTriple& o) const { return id != o.id; }
    bool operator<(const LocalTriple& o) const { return id < o.id; }
};

// Globally addressable reference: (env node in the meta env, local node in that env)
struct Node {
    LocalNode env;
    LocalNode local;

    Node() = default;
    Node(LocalNode e, LocalNode l) : env(e), local(l) {}

    bool operator==(const Node& o) const { return env == o.env && local == o.local; }
    bool operator!=(const Node& o) const { return !(*this == o); }
    bool operator<(const Node& o) const {
        if (env != o.env) return env < o.env;
        return local < o.local;
    }

    // "^E^N" or "^E^tN"
    std::string to_string() const {
        return "^" + std::to_string(env.id) + local.to_string();
    }
};

inline std::ostream& operator<<(std::ostream& os, const LocalNode& n) {
    return os << n.to_string();
}

inline std::ostream& operator<<(std::ostream& os, const Node& n) {
    return os << n.to_string();
}

struct LocalNodeHash {
    size_t operator()(const LocalNode& n) const { return std::hash<uint64_t>{}(n.id); }
};

struct NodeHash {
    size_t operator()(const Node& n) const {
        return std::hash<uint64_t>{}(n.env.id) ^ (std::hash<uint64_t>{}(n.local.id) << 1);
    }
};

} // namespace smriti
