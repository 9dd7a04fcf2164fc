#pragma once
// Reification protocol: structured values <-> s-expressions
//
// The Serializer is driven by the value being written, one call per
// primitive and begin/end pairs for compound shapes. It keeps a stack of
// partial lists under construction:
//
//   bool                 -> true / false (context nodes when known)
//   none / unit          -> ()
//   unit variant         -> Variant
//   newtype variant      -> (Variant value)
//   tuple variant        -> (Variant v1 v2 ...)
//   struct variant       -> ((Name . Variant) (field . value)...)
//   struct               -> (Name (field . value)...)
//   newtype struct       -> (Name value)
//   seq / tuple          -> (v1 v2 ...)
//   map                  -> ((k . v)...)
//
// The Deserializer walks the same shapes back. Sigil symbols such as
// ^3^t12 read as Node values wherever a Node is expected.

#include "error.hpp"
#include "sexp.hpp"
#include "symbol_policy.hpp"
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace smriti {

class Serializer {
public:
    Serializer() = default;
    // Booleans become these nodes instead of the bare symbols
    Serializer(Node true_node, Node false_node) : bools_(std::make_pair(true_node, false_node)) {}

    // ─── Scalars ───

    void serialize_bool(bool v) {
        if (bools_) {
            emit(Sexp(v ? bools_->first : bools_->second));
        } else {
            emit(sym(v ? "true" : "false"));
        }
    }
    void serialize_number(Number n) { emit(Sexp(n)); }
    void serialize_u64(uint64_t v) { emit(Sexp(Number::u64(v))); }
    void serialize_str(const std::string& s) { emit(Sexp(LangString(s))); }
    void serialize_symbol(const Symbol& s) { emit(Sexp(s)); }
    void serialize_node(Node n) { emit(Sexp(n)); }
    void serialize_local_node(LocalNode n) { serialize_u64(n.id); }
    void serialize_sexp(Sexp s) { emit(std::move(s)); }
    void serialize_none() { emit(Sexp()); }
    void serialize_unit() { emit(Sexp()); }

    // ─── Enums ───

    void serialize_unit_variant(const std::string& /*name*/, const std::string& variant) {
        emit(sym(variant));
    }

    template <typename F>
    void serialize_newtype_variant(const std::string& /*name*/, const std::string& variant, F&& value) {
        push(Kind::List);
        emit(sym(variant));
        value(*this);
        pop();
    }

    void begin_tuple_variant(const std::string& /*name*/, const std::string& variant) {
        push(Kind::List);
        emit(sym(variant));
    }
    void end_tuple_variant() { pop(); }

    void begin_struct_variant(const std::string& name, const std::string& variant) {
        push(Kind::List);
        emit(make_pair(sym(name), sym(variant)));
    }
    void end_struct_variant() { pop(); }

    // ─── Structs ───

    void begin_struct(const std::string& name) {
        push(Kind::List);
        emit(sym(name));
    }
    void end_struct() { pop(); }

    template <typename F>
    void serialize_newtype_struct(const std::string& name, F&& value) {
        push(Kind::List);
        emit(sym(name));
        value(*this);
        pop();
    }

    // (field . value)
    template <typename F>
    void serialize_field(const std::string& field, F&& value) {
        push(Kind::Pair);
        stack_.back().key = sym(field);
        value(*this);
        pop();
    }

    // ─── Sequences and maps ───

    void begin_seq() { push(Kind::List); }
    void end_seq() { pop(); }

    void begin_map() { push(Kind::List); }
    void end_map() { pop(); }

    // (key . value)
    template <typename K, typename V>
    void serialize_entry(K&& key, V&& value) {
        push(Kind::Pair);
        push(Kind::Key);
        key(*this);
        Sexp k = take_key();
        stack_.back().key = std::move(k);
        value(*this);
        pop();
    }

    Sexp finish() {
        if (!stack_.empty() || !result_) {
            throw lang_error(LangError::invalid_state("incomplete serialization", "finished value"));
        }
        Sexp out = std::move(*result_);
        result_.reset();
        return out;
    }

private:
    enum class Kind { List, Pair, Key };

    struct Partial {
        Kind kind;
        ConsList list;
        std::optional<Sexp> key;
        std::optional<Sexp> value;
    };

    std::optional<std::pair<Node, Node>> bools_;
    std::vector<Partial> stack_;
    std::optional<Sexp> result_;

    void push(Kind k) {
        stack_.emplace_back();
        stack_.back().kind = k;
    }

    void emit(Sexp s) {
        if (stack_.empty()) {
            result_ = std::move(s);
            return;
        }
        Partial& top = stack_.back();
        if (top.kind == Kind::List) {
            top.list.append(std::move(s));
        } else {
            top.value = std::move(s);
        }
    }

    Sexp take_key() {
        Partial p = std::move(stack_.back());
        stack_.pop_back();
        return p.value ? std::move(*p.value) : Sexp();
    }

    void pop() {
        Partial p = std::move(stack_.back());
        stack_.pop_back();
        if (p.kind == Kind::List) {
            emit(p.list.release());
        } else {
            emit(make_pair(p.key ? std::move(*p.key) : Sexp(), p.value ? std::move(*p.value) : Sexp()));
        }
    }
};

// Cursor over one list-shaped value. Errors are DeserializeErrors naming the
// offending data.
class Deserializer {
public:
    // current_env resolves local sigils such as ^5
    explicit Deserializer(const Sexp& input, LocalNode current_env = LocalNode(0))
        : input_(input), env_(current_env) {
        if (input.is_primitive()) {
            throw deserialize_error(DeserializeError::Type::UnexpectedType, input, "list");
        }
        it_ = input.list().begin();
    }

    bool done() const { return it_ == ListIterator(); }

    const Sexp& next() {
        if (done()) throw deserialize_error(DeserializeError::Type::MissingData, input_);
        auto item = *it_;
        if (!item.proper) {
            throw deserialize_error(DeserializeError::Type::ExtraneousData, item.elem, "proper list");
        }
        ++it_;
        return item.elem;
    }

    void finish() const {
        if (!done()) {
            throw deserialize_error(DeserializeError::Type::ExtraneousData, (*it_).elem);
        }
    }

    LocalNode env() const { return env_; }

    // ─── Element readers ───

    Symbol symbol() { return as_symbol(next()); }
    Node node() { return as_node(next(), env_); }
    Number number() { return as_number(next()); }
    std::string string() { return as_string(next()); }
    LocalNode local_node() { return as_local_node(next()); }

    bool boolean(std::optional<std::pair<Node, Node>> bools = std::nullopt) {
        const Sexp& s = next();
        if (bools) {
            if (const Node* n = s.as<Node>()) {
                if (*n == bools->first) return true;
                if (*n == bools->second) return false;
            }
        }
        if (const Symbol* sy = s.as<Symbol>()) {
            if (sy->str() == "true") return true;
            if (sy->str() == "false") return false;
        }
        throw deserialize_error(DeserializeError::Type::UnexpectedType, s, "boolean");
    }

    std::vector<Node> node_seq() {
        std::vector<Node> out;
        Deserializer seq(next(), env_);
        while (!seq.done()) out.push_back(seq.node());
        return out;
    }

    // (field . value) with the expected field name; returns the value
    const Sexp& field(const std::string& name) {
        const Sexp& f = next();
        const Cons* c = f.cons();
        if (!c || !c->car()) {
            throw deserialize_error(DeserializeError::Type::UnexpectedType, f, "(" + name + " . value)");
        }
        const Symbol* key = c->car()->as<Symbol>();
        if (!key || key->str() != name) {
            throw deserialize_error(DeserializeError::Type::ExpectedSymbol, *c->car(), name);
        }
        // (name) is (name . ())
        static const Sexp nil;
        return c->cdr() ? *c->cdr() : nil;
    }

    void expect_symbol(const std::string& name) {
        const Sexp& s = next();
        const Symbol* sy = s.as<Symbol>();
        if (!sy || sy->str() != name) {
            throw deserialize_error(DeserializeError::Type::ExpectedSymbol, s, name);
        }
    }

    // ─── Value converters ───

    static Symbol as_symbol(const Sexp& s) {
        if (const Symbol* sy = s.as<Symbol>()) return *sy;
        throw deserialize_error(DeserializeError::Type::ExpectedSymbol, s);
    }

    static Number as_number(const Sexp& s) {
        if (const Number* n = s.as<Number>()) return *n;
        throw deserialize_error(DeserializeError::Type::UnexpectedType, s, "Number");
    }

    static std::string as_string(const Sexp& s) {
        if (const LangString* str = s.as<LangString>()) return str->str();
        throw deserialize_error(DeserializeError::Type::UnexpectedType, s, "LangString");
    }

    static LocalNode as_local_node(const Sexp& s) {
        Number n = as_number(s);
        if (n.is_float()) throw deserialize_error(DeserializeError::Type::UnexpectedType, s, "integer");
        return LocalNode(n.as_u64());
    }

    // Node primitive, sigil symbol, or (Node (env . E) (local . L))
    static Node as_node(const Sexp& s, LocalNode current_env) {
        if (const Node* n = s.as<Node>()) return *n;
        if (const Symbol* sy = s.as<Symbol>()) {
            if (auto sig = parse_sigil(sy->str())) return sig->node_in(current_env);
            throw deserialize_error(DeserializeError::Type::UnexpectedType, s, "Node sigil");
        }
        if (s.is_cons() && !s.is_nil()) {
            Deserializer d(s, current_env);
            d.expect_symbol("Node");
            LocalNode env = as_local_node(d.field("env"));
            LocalNode local = as_local_node(d.field("local"));
            d.finish();
            return Node(env, local);
        }
        throw deserialize_error(DeserializeError::Type::UnexpectedType, s, "Node");
    }

private:
    const Sexp& input_;
    LocalNode env_;
    ListIterator it_;
};

// ═══════════════════════════════════════════════════════════════════
// Procedure and tables
// ═══════════════════════════════════════════════════════════════════

inline void serialize_nodes(Serializer& ser, const std::vector<Node>& nodes) {
    ser.begin_seq();
    for (const auto& n : nodes) ser.serialize_node(n);
    ser.end_seq();
}

inline void serialize_procedure(Serializer& ser, const Procedure& proc) {
    const std::string name = "Procedure";
    const std::string variant = Procedure::type_name(proc.type);
    switch (proc.type) {
        case Procedure::Type::Application:
            ser.begin_tuple_variant(name, variant);
            ser.serialize_node(proc.proc);
            serialize_nodes(ser, proc.args);
            ser.end_tuple_variant();
            return;
        case Procedure::Type::Abstraction:
        case Procedure::Type::InterpreterAbstraction:
            ser.begin_tuple_variant(name, variant);
            serialize_nodes(ser, proc.params);
            ser.serialize_node(proc.body);
            ser.end_tuple_variant();
            return;
        case Procedure::Type::Sequence:
            ser.serialize_newtype_variant(name, variant,
                                          [&](Serializer& s) { serialize_nodes(s, proc.seq); });
            return;
        case Procedure::Type::Branch:
            ser.begin_tuple_variant(name, variant);
            ser.serialize_node(proc.pred);
            ser.serialize_node(proc.then_branch);
            ser.serialize_node(proc.else_branch);
            ser.end_tuple_variant();
            return;
    }
}

inline Procedure reflect_procedure(const Sexp& s, LocalNode current_env = LocalNode(0)) {
    Deserializer d(s, current_env);
    Symbol variant = d.symbol();
    auto type = Procedure::type_from_name(variant.str());
    if (!type) {
        throw deserialize_error(DeserializeError::Type::UnexpectedType, Sexp(variant), "Procedure variant");
    }
    Procedure out;
    switch (*type) {
        case Procedure::Type::Application: {
            Node f = d.node();
            out = Procedure::application(f, d.node_seq());
            break;
        }
        case Procedure::Type::Abstraction:
        case Procedure::Type::InterpreterAbstraction: {
            std::vector<Node> params = d.node_seq();
            Node body = d.node();
            out = *type == Procedure::Type::Abstraction
                      ? Procedure::abstraction(std::move(params), body)
                      : Procedure::interpreter_abstraction(std::move(params), body);
            break;
        }
        case Procedure::Type::Sequence:
            out = Procedure::sequence(d.node_seq());
            break;
        case Procedure::Type::Branch: {
            Node p = d.node();
            Node a = d.node();
            Node b = d.node();
            out = Procedure::branch(p, a, b);
            break;
        }
    }
    d.finish();
    return out;
}

inline void serialize_sym_node_table(Serializer& ser, const SymNodeTable& table) {
    ser.serialize_newtype_struct("SymNodeTable", [&](Serializer& s) {
        s.begin_map();
        for (const auto& [k, v] : table.as_map()) {
            s.serialize_entry([&](Serializer& ks) { ks.serialize_symbol(k); },
                              [&](Serializer& vs) { vs.serialize_node(v); });
        }
        s.end_map();
    });
}

inline void serialize_sym_sexp_table(Serializer& ser, const SymSexpTable& table) {
    ser.serialize_newtype_struct("SymSexpTable", [&](Serializer& s) {
        s.begin_map();
        for (const auto& [k, v] : table.entries()) {
            s.serialize_entry([&](Serializer& ks) { ks.serialize_symbol(k); },
                              [&](Serializer& vs) { vs.serialize_sexp(v); });
        }
        s.end_map();
    });
}

inline void serialize_local_node_table(Serializer& ser, const LocalNodeTable& table) {
    ser.begin_struct("LocalNodeTable");
    ser.serialize_field("env", [&](Serializer& s) { s.serialize_local_node(table.env()); });
    ser.serialize_field("map", [&](Serializer& s) {
        s.begin_map();
        for (const auto& [k, v] : table.as_map()) {
            s.serialize_entry([&](Serializer& ks) { ks.serialize_local_node(k); },
                              [&](Serializer& vs) { vs.serialize_local_node(v); });
        }
        s.end_map();
    });
    ser.end_struct();
}

// Iterate ((k . v)...) pairs
template <typename F>
void for_each_entry(const Sexp& map, F&& f) {
    Deserializer d(map);
    while (!d.done()) {
        const Sexp& entry = d.next();
        const Cons* c = entry.cons();
        if (!c || !c->car()) {
            throw deserialize_error(DeserializeError::Type::UnexpectedType, entry, "(key . value)");
        }
        static const Sexp nil;
        f(*c->car(), c->cdr() ? *c->cdr() : nil);
    }
}

inline SymNodeTable reflect_sym_node_table(const Sexp& s, LocalNode current_env = LocalNode(0)) {
    Deserializer d(s, current_env);
    d.expect_symbol("SymNodeTable");
    SymNodeTable out;
    for_each_entry(d.next(), [&](const Sexp& k, const Sexp& v) {
        out.insert(Deserializer::as_symbol(k), Deserializer::as_node(v, current_env));
    });
    d.finish();
    return out;
}

inline SymSexpTable reflect_sym_sexp_table(const Sexp& s) {
    Deserializer d(s);
    d.expect_symbol("SymSexpTable");
    SymSexpTable out;
    for_each_entry(d.next(), [&](const Sexp& k, const Sexp& v) {
        out.insert(Deserializer::as_symbol(k), v);
    });
    d.finish();
    return out;
}

inline LocalNodeTable reflect_local_node_table(const Sexp& s) {
    Deserializer d(s);
    d.expect_symbol("LocalNodeTable");
    LocalNodeTable out(Deserializer::as_local_node(d.field("env")));
    for_each_entry(d.field("map"), [&](const Sexp& k, const Sexp& v) {
        out.insert(Deserializer::as_local_node(k), Deserializer::as_local_node(v));
    });
    d.finish();
    return out;
}

// Visitor form of a procedure or table primitive; nullopt for other values
inline std::optional<Sexp> reify_structured(const Primitive& p) {
    Serializer ser;
    if (const auto* proc = std::get_if<Procedure>(&p)) {
        serialize_procedure(ser, *proc);
    } else if (const auto* t = std::get_if<SymNodeTable>(&p)) {
        serialize_sym_node_table(ser, *t);
    } else if (const auto* t = std::get_if<SymSexpTable>(&p)) {
        serialize_sym_sexp_table(ser, *t);
    } else if (const auto* t = std::get_if<LocalNodeTable>(&p)) {
        serialize_local_node_table(ser, *t);
    } else {
        return std::nullopt;
    }
    return ser.finish();
}

// Inverse of reify_structured, chosen by the head symbol; nullopt if the
// head names neither a procedure variant nor a table
inline std::optional<Sexp> reflect_structured(const Sexp& s, LocalNode current_env = LocalNode(0)) {
    const Cons* c = s.cons();
    if (!c || !c->car()) return std::nullopt;
    const Symbol* head = c->car()->as<Symbol>();
    if (!head) return std::nullopt;
    if (Procedure::type_from_name(head->str())) return Sexp(reflect_procedure(s, current_env));
    if (head->str() == "SymNodeTable") return Sexp(reflect_sym_node_table(s, current_env));
    if (head->str() == "SymSexpTable") return Sexp(reflect_sym_sexp_table(s));
    if (head->str() == "LocalNodeTable") return Sexp(reflect_local_node_table(s));
    return std::nullopt;
}

} // namespace smriti
