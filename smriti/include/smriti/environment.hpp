#pragma once
// Environment: triple store over dense local ids
//
// Layout:
// - Nodes: dense vector, id == index, optional structure per node
// - Triples: dense vector of (s, p, o); a triple's id is its index | TRIPLE_BIT
// - Edge sets: per node and per triple, the triples using it as subject,
//   predicate or object (ascending id order)
// - Designations: per context node, a bijective Symbol <-> Node map
//
// Ids are never reused and nothing is ever removed.

#include "error.hpp"
#include "sexp.hpp"
#include "types.hpp"
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <vector>

namespace smriti {

using TripleSet = std::set<LocalTriple>;

// Symbol <-> Node map for one designation context
class Designation {
public:
    // Replaces any earlier binding of either side
    void insert(const Symbol& s, Node n) {
        auto by_sym = sym_to_node_.find(s);
        if (by_sym != sym_to_node_.end()) node_to_sym_.erase(by_sym->second);
        auto by_node = node_to_sym_.find(n);
        if (by_node != node_to_sym_.end()) sym_to_node_.erase(by_node->second);
        sym_to_node_[s] = n;
        node_to_sym_[n] = s;
    }

    std::optional<Node> node(const Symbol& s) const {
        auto it = sym_to_node_.find(s);
        if (it == sym_to_node_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<Symbol> symbol(Node n) const {
        auto it = node_to_sym_.find(n);
        if (it == node_to_sym_.end()) return std::nullopt;
        return it->second;
    }

    size_t size() const { return sym_to_node_.size(); }
    const std::map<Symbol, Node>& by_symbol() const { return sym_to_node_; }

private:
    std::map<Symbol, Node> sym_to_node_;
    std::map<Node, Symbol> node_to_sym_;
};

class Environment;

// Scoped mutable access to a node's structure. The structure is moved out on
// creation and written back when the entry goes out of scope.
class EntryMut {
public:
    EntryMut(Environment& env, LocalNode node);
    ~EntryMut();
    EntryMut(const EntryMut&) = delete;
    EntryMut& operator=(const EntryMut&) = delete;

    std::optional<Sexp>& structure() { return value_; }
    LocalNode node() const { return node_; }

private:
    Environment& env_;
    LocalNode node_;
    std::optional<Sexp> value_;
};

class Environment {
public:
    virtual ~Environment() = default;

    virtual LocalNode insert_node(std::optional<Sexp> structure) = 0;
    virtual LocalTriple insert_triple(LocalNode s, LocalNode p, LocalNode o) = 0;

    virtual bool contains(LocalNode n) const = 0;
    virtual size_t node_count() const = 0;
    virtual size_t triple_count() const = 0;

    virtual const TripleSet& match_subject(LocalNode n) const = 0;
    virtual const TripleSet& match_predicate(LocalNode n) const = 0;
    virtual const TripleSet& match_object(LocalNode n) const = 0;

    virtual LocalNode triple_subject(LocalTriple t) const = 0;
    virtual LocalNode triple_predicate(LocalTriple t) const = 0;
    virtual LocalNode triple_object(LocalTriple t) const = 0;

    // nullptr for atomic nodes, triples and unknown ids
    virtual const Sexp* structure(LocalNode n) const = 0;
    virtual std::optional<Sexp> take_structure(LocalNode n) = 0;
    virtual void set_structure(LocalNode n, std::optional<Sexp> s) = 0;

    virtual void insert_designation(LocalNode context, const Symbol& s, Node n) = 0;
    virtual const Designation* designation(LocalNode context) const = 0;
    virtual std::vector<LocalNode> designation_contexts() const = 0;

    // ─── Derived queries ───

    TripleSet match_but_subject(LocalNode p, LocalNode o) const {
        return intersect(match_predicate(p), match_object(o));
    }
    TripleSet match_but_predicate(LocalNode s, LocalNode o) const {
        return intersect(match_subject(s), match_object(o));
    }
    TripleSet match_but_object(LocalNode s, LocalNode p) const {
        return intersect(match_subject(s), match_predicate(p));
    }

    std::optional<LocalTriple> match_triple(LocalNode s, LocalNode p, LocalNode o) const {
        for (const auto& t : match_but_object(s, p)) {
            if (triple_object(t) == o) return t;
        }
        return std::nullopt;
    }

    TripleSet match_all() const {
        TripleSet all;
        for (size_t i = 0; i < triple_count(); ++i) all.insert(LocalTriple::from_index(i));
        return all;
    }

    // Triples using n in any role
    TripleSet match_any(LocalNode n) const {
        TripleSet out = match_subject(n);
        const auto& p = match_predicate(n);
        const auto& o = match_object(n);
        out.insert(p.begin(), p.end());
        out.insert(o.begin(), o.end());
        return out;
    }

    std::vector<LocalNode> all_nodes() const {
        std::vector<LocalNode> out;
        out.reserve(node_count());
        for (size_t i = 0; i < node_count(); ++i) out.emplace_back(static_cast<LocalId>(i));
        return out;
    }

    std::optional<LocalTriple> node_as_triple(LocalNode n) const {
        if (!n.is_triple() || triple_index_of(n.id) >= triple_count()) return std::nullopt;
        return LocalTriple(n.id);
    }

    size_t triple_index(LocalTriple t) const { return t.index(); }
    LocalTriple triple_from_index(size_t i) const { return LocalTriple::from_index(i); }

    EntryMut entry_mut(LocalNode n) { return EntryMut(*this, n); }

    std::optional<Node> match_designation(LocalNode context, const Symbol& s) const {
        const Designation* d = designation(context);
        return d ? d->node(s) : std::nullopt;
    }

    std::optional<Symbol> find_designation(LocalNode context, Node n) const {
        const Designation* d = designation(context);
        return d ? d->symbol(n) : std::nullopt;
    }

    std::vector<std::pair<Symbol, Node>> designation_pairs(LocalNode context) const {
        std::vector<std::pair<Symbol, Node>> out;
        if (const Designation* d = designation(context)) {
            for (const auto& [s, n] : d->by_symbol()) out.emplace_back(s, n);
        }
        return out;
    }

protected:
    static TripleSet intersect(const TripleSet& a, const TripleSet& b) {
        TripleSet out;
        const TripleSet& small = a.size() <= b.size() ? a : b;
        const TripleSet& large = a.size() <= b.size() ? b : a;
        for (const auto& t : small) {
            if (large.count(t)) out.insert(t);
        }
        return out;
    }
};

inline EntryMut::EntryMut(Environment& env, LocalNode node)
    : env_(env), node_(node), value_(env.take_structure(node)) {}

inline EntryMut::~EntryMut() {
    if (!node_.is_triple() && env_.contains(node_)) env_.set_structure(node_, std::move(value_));
}

// ═══════════════════════════════════════════════════════════════════
// In-memory backend
// ═══════════════════════════════════════════════════════════════════

class MemEnvironment : public Environment {
public:
    LocalNode insert_node(std::optional<Sexp> structure) override {
        if (is_triple_id(static_cast<LocalId>(nodes_.size()))) {
            throw std::overflow_error("node id space exhausted");
        }
        LocalNode id(static_cast<LocalId>(nodes_.size()));
        NodeData data;
        data.structure = std::move(structure);
        nodes_.push_back(std::move(data));
        return id;
    }

    LocalTriple insert_triple(LocalNode s, LocalNode p, LocalNode o) override {
        for (LocalNode n : {s, p, o}) {
            if (!contains(n)) {
                throw lang_error(LangError::invalid_argument(
                    Sexp(Number::u64(n.id)), "node existing in env"));
            }
        }
        LocalTriple t = LocalTriple::from_index(triples_.size());
        TripleData data;
        data.s = s;
        data.p = p;
        data.o = o;
        triples_.push_back(std::move(data));

        edges_mut(s).as_subject.insert(t);
        edges_mut(p).as_predicate.insert(t);
        edges_mut(o).as_object.insert(t);
        return t;
    }

    bool contains(LocalNode n) const override {
        if (n.is_triple()) return triple_index_of(n.id) < triples_.size();
        return n.id < nodes_.size();
    }

    size_t node_count() const override { return nodes_.size(); }
    size_t triple_count() const override { return triples_.size(); }

    const TripleSet& match_subject(LocalNode n) const override { return edges(n).as_subject; }
    const TripleSet& match_predicate(LocalNode n) const override { return edges(n).as_predicate; }
    const TripleSet& match_object(LocalNode n) const override { return edges(n).as_object; }

    LocalNode triple_subject(LocalTriple t) const override { return triple(t).s; }
    LocalNode triple_predicate(LocalTriple t) const override { return triple(t).p; }
    LocalNode triple_object(LocalTriple t) const override { return triple(t).o; }

    const Sexp* structure(LocalNode n) const override {
        if (n.is_triple() || n.id >= nodes_.size()) return nullptr;
        const auto& s = nodes_[n.id].structure;
        return s ? &*s : nullptr;
    }

    std::optional<Sexp> take_structure(LocalNode n) override {
        if (n.is_triple() || n.id >= nodes_.size()) return std::nullopt;
        std::optional<Sexp> out = std::move(nodes_[n.id].structure);
        nodes_[n.id].structure.reset();
        return out;
    }

    void set_structure(LocalNode n, std::optional<Sexp> s) override {
        if (n.is_triple()) {
            // Triples carry no structure
            if (s) {
                throw lang_error(LangError::invalid_argument(
                    Sexp(Number::u64(n.id)), "non-triple node"));
            }
            return;
        }
        if (n.id >= nodes_.size()) {
            throw lang_error(LangError::invalid_argument(
                Sexp(Number::u64(n.id)), "node existing in env"));
        }
        nodes_[n.id].structure = std::move(s);
    }

    void insert_designation(LocalNode context, const Symbol& s, Node n) override {
        designations_[context].insert(s, n);
    }

    const Designation* designation(LocalNode context) const override {
        auto it = designations_.find(context);
        return it == designations_.end() ? nullptr : &it->second;
    }

    std::vector<LocalNode> designation_contexts() const override {
        std::vector<LocalNode> out;
        for (const auto& [ctx, _] : designations_) out.push_back(ctx);
        return out;
    }

private:
    struct Edges {
        TripleSet as_subject;
        TripleSet as_predicate;
        TripleSet as_object;
    };

    struct NodeData {
        std::optional<Sexp> structure;
        Edges edges;
    };

    struct TripleData {
        LocalNode s, p, o;
        Edges edges;
    };

    std::vector<NodeData> nodes_;
    std::vector<TripleData> triples_;
    std::map<LocalNode, Designation> designations_;

    const TripleData& triple(LocalTriple t) const {
        size_t i = t.index();
        if (i >= triples_.size()) {
            throw lang_error(LangError::invalid_argument(
                Sexp(Number::u64(t.id)), "triple existing in env"));
        }
        return triples_[i];
    }

    const Edges& edges(LocalNode n) const {
        static const Edges empty;
        if (n.is_triple()) {
            size_t i = triple_index_of(n.id);
            return i < triples_.size() ? triples_[i].edges : empty;
        }
        return n.id < nodes_.size() ? nodes_[n.id].edges : empty;
    }

    Edges& edges_mut(LocalNode n) {
        if (n.is_triple()) return triples_[triple_index_of(n.id)].edges;
        return nodes_[n.id].edges;
    }
};

} // namespace smriti
