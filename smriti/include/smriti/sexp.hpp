#pragma once
// Sexp: the value type of the semantic environment
//
// A Sexp is either a Primitive or a Cons cell pairing two optional owned
// Sexps. The empty Cons is nil. Primitives:
// - Number, Symbol, LangString, LangPath
// - BuiltIn (named native procedure)
// - Node (reference into the env federation)
// - SymNodeTable, SymSexpTable, LocalNodeTable
// - Vector
// - Procedure (lowered code: Application, Abstraction, InterpreterAbstraction,
//   Sequence, Branch)

#include "types.hpp"
#include "number.hpp"
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace smriti {

class Sexp;
class Agent;

// ═══════════════════════════════════════════════════════════════════
// Scalar primitives
// ═══════════════════════════════════════════════════════════════════

class Symbol {
public:
    Symbol() = default;
    explicit Symbol(std::string name) : name_(std::move(name)) {}

    const std::string& str() const { return name_; }

    bool operator==(const Symbol& o) const { return name_ == o.name_; }
    bool operator!=(const Symbol& o) const { return name_ != o.name_; }
    bool operator<(const Symbol& o) const { return name_ < o.name_; }

private:
    std::string name_;
};

class LangString {
public:
    LangString() = default;
    explicit LangString(std::string s) : value_(std::move(s)) {}

    const std::string& str() const { return value_; }

    // Escapes \t \r \n \\ \" for quoting
    std::string escaped() const {
        std::string out;
        out.reserve(value_.size());
        for (char c : value_) {
            switch (c) {
                case '\t': out += "\\t"; break;
                case '\r': out += "\\r"; break;
                case '\n': out += "\\n"; break;
                case '\\': out += "\\\\"; break;
                case '"': out += "\\\""; break;
                default: out += c; break;
            }
        }
        return out;
    }

    bool operator==(const LangString& o) const { return value_ == o.value_; }
    bool operator!=(const LangString& o) const { return value_ != o.value_; }

private:
    std::string value_;
};

class LangPath {
public:
    LangPath() = default;
    explicit LangPath(std::string p) : path_(std::move(p)) {}

    const std::string& str() const { return path_; }

    bool ends_with(const std::string& suffix) const {
        if (suffix.size() > path_.size()) return false;
        if (path_.compare(path_.size() - suffix.size(), suffix.size(), suffix) != 0) return false;
        // Match whole path components only
        return suffix.size() == path_.size() || suffix.front() == '/' ||
               path_[path_.size() - suffix.size() - 1] == '/';
    }

    bool operator==(const LangPath& o) const { return path_ == o.path_; }
    bool operator!=(const LangPath& o) const { return path_ != o.path_; }

private:
    std::string path_;
};

// Native procedure, identified by its registered name.
using BuiltInFn = Sexp (*)(std::vector<Sexp>& args, Agent& agent);

struct BuiltIn {
    std::string name;
    BuiltInFn fn = nullptr;

    BuiltIn() = default;
    BuiltIn(std::string n, BuiltInFn f) : name(std::move(n)), fn(f) {}

    Sexp call(std::vector<Sexp>& args, Agent& agent) const;

    bool operator==(const BuiltIn& o) const { return name == o.name; }
    bool operator!=(const BuiltIn& o) const { return name != o.name; }
};

// ═══════════════════════════════════════════════════════════════════
// Tables
// ═══════════════════════════════════════════════════════════════════

class SymNodeTable {
public:
    std::optional<Node> lookup(const Symbol& s) const {
        auto it = map_.find(s);
        if (it == map_.end()) return std::nullopt;
        return it->second;
    }
    bool contains(const Symbol& s) const { return map_.count(s) > 0; }
    void insert(Symbol s, Node n) { map_[std::move(s)] = n; }
    size_t size() const { return map_.size(); }
    bool empty() const { return map_.empty(); }
    const std::map<Symbol, Node>& as_map() const { return map_; }

    bool operator==(const SymNodeTable& o) const { return map_ == o.map_; }
    bool operator!=(const SymNodeTable& o) const { return !(*this == o); }

private:
    std::map<Symbol, Node> map_;
};

// Maps LocalNodes of one env to LocalNodes of another. Used for import tables.
class LocalNodeTable {
public:
    LocalNodeTable() = default;
    explicit LocalNodeTable(LocalNode env) : env_(env) {}

    // Env the values live in
    LocalNode env() const { return env_; }

    std::optional<LocalNode> lookup(LocalNode k) const {
        auto it = map_.find(k);
        if (it == map_.end()) return std::nullopt;
        return it->second;
    }
    void insert(LocalNode k, LocalNode v) { map_[k] = v; }
    size_t size() const { return map_.size(); }
    const std::map<LocalNode, LocalNode>& as_map() const { return map_; }

    bool operator==(const LocalNodeTable& o) const { return env_ == o.env_ && map_ == o.map_; }
    bool operator!=(const LocalNodeTable& o) const { return !(*this == o); }

private:
    LocalNode env_;
    std::map<LocalNode, LocalNode> map_;
};

// Sorted symbol -> Sexp association list
class SymSexpTable {
public:
    const Sexp* lookup(const Symbol& s) const;
    void insert(Symbol s, Sexp v);
    size_t size() const { return entries_.size(); }
    const std::vector<std::pair<Symbol, Sexp>>& entries() const { return entries_; }

    bool operator==(const SymSexpTable& o) const;
    bool operator!=(const SymSexpTable& o) const { return !(*this == o); }

private:
    std::vector<std::pair<Symbol, Sexp>> entries_;
};

class Vector {
public:
    Vector() = default;
    explicit Vector(std::vector<Sexp> elems);

    const std::vector<Sexp>& elems() const { return elems_; }
    std::vector<Sexp>& elems_mut() { return elems_; }

    bool operator==(const Vector& o) const;
    bool operator!=(const Vector& o) const { return !(*this == o); }

private:
    std::vector<Sexp> elems_;
};

// ═══════════════════════════════════════════════════════════════════
// Procedure: lowered code whose sub-terms are named by nodes
// ═══════════════════════════════════════════════════════════════════

struct Procedure {
    enum class Type { Application, Abstraction, InterpreterAbstraction, Sequence, Branch };
    Type type = Type::Sequence;

    Node proc;                  // Application: procedure being applied
    std::vector<Node> args;     // Application: argument nodes
    std::vector<Node> params;   // Abstraction / InterpreterAbstraction
    Node body;                  // Abstraction / InterpreterAbstraction
    std::vector<Node> seq;      // Sequence
    Node pred, then_branch, else_branch;  // Branch

    static Procedure application(Node f, std::vector<Node> a) {
        Procedure p;
        p.type = Type::Application;
        p.proc = f;
        p.args = std::move(a);
        return p;
    }
    static Procedure abstraction(std::vector<Node> ps, Node b) {
        Procedure p;
        p.type = Type::Abstraction;
        p.params = std::move(ps);
        p.body = b;
        return p;
    }
    // fexpr: arguments are bound unevaluated
    static Procedure interpreter_abstraction(std::vector<Node> ps, Node b) {
        Procedure p;
        p.type = Type::InterpreterAbstraction;
        p.params = std::move(ps);
        p.body = b;
        return p;
    }
    static Procedure sequence(std::vector<Node> s) {
        Procedure p;
        p.type = Type::Sequence;
        p.seq = std::move(s);
        return p;
    }
    static Procedure branch(Node c, Node a, Node b) {
        Procedure p;
        p.type = Type::Branch;
        p.pred = c;
        p.then_branch = a;
        p.else_branch = b;
        return p;
    }

    bool is_abstraction() const {
        return type == Type::Abstraction || type == Type::InterpreterAbstraction;
    }

    static const char* type_name(Type t) {
        switch (t) {
            case Type::Application: return "Application";
            case Type::Abstraction: return "Abstraction";
            case Type::InterpreterAbstraction: return "InterpreterAbstraction";
            case Type::Sequence: return "Sequence";
            case Type::Branch: return "Branch";
        }
        return "";
    }

    static std::optional<Type> type_from_name(const std::string& name) {
        if (name == "Application") return Type::Application;
        if (name == "Abstraction") return Type::Abstraction;
        if (name == "InterpreterAbstraction") return Type::InterpreterAbstraction;
        if (name == "Sequence") return Type::Sequence;
        if (name == "Branch") return Type::Branch;
        return std::nullopt;
    }

    bool operator==(const Procedure& o) const {
        if (type != o.type) return false;
        switch (type) {
            case Type::Application: return proc == o.proc && args == o.args;
            case Type::Abstraction:
            case Type::InterpreterAbstraction: return params == o.params && body == o.body;
            case Type::Sequence: return seq == o.seq;
            case Type::Branch:
                return pred == o.pred && then_branch == o.then_branch &&
                       else_branch == o.else_branch;
        }
        return false;
    }
    bool operator!=(const Procedure& o) const { return !(*this == o); }
};

using Primitive = std::variant<Number, Symbol, LangString, LangPath, BuiltIn, Node,
                               SymNodeTable, SymSexpTable, LocalNodeTable, Vector, Procedure>;

// Name used in messages and type checks
inline const char* primitive_type_name(const Primitive& p) {
    static const char* names[] = {"Number", "Symbol", "LangString", "LangPath",
                                  "BuiltIn", "Node", "SymNodeTable", "SymSexpTable",
                                  "LocalNodeTable", "Vector", "Procedure"};
    return names[p.index()];
}

// ═══════════════════════════════════════════════════════════════════
// Cons and Sexp
// ═══════════════════════════════════════════════════════════════════

class Cons {
public:
    Cons() = default;
    Cons(std::unique_ptr<Sexp> car, std::unique_ptr<Sexp> cdr)
        : car_(std::move(car)), cdr_(std::move(cdr)) {}
    Cons(Sexp car, Sexp cdr);

    // Copy, compare and destroy walk the cdr chain in a loop, so list
    // length is bounded by memory rather than stack depth.
    Cons(const Cons& o);
    Cons& operator=(const Cons& o);
    Cons(Cons&&) noexcept = default;
    Cons& operator=(Cons&&) noexcept = default;
    ~Cons();

    const Sexp* car() const { return car_.get(); }
    const Sexp* cdr() const { return cdr_.get(); }
    Sexp* car_mut() { return car_.get(); }
    Sexp* cdr_mut() { return cdr_.get(); }

    void set_car(std::unique_ptr<Sexp> s) { car_ = std::move(s); }
    void set_cdr(std::unique_ptr<Sexp> s) { cdr_ = std::move(s); }
    std::unique_ptr<Sexp> take_car() { return std::move(car_); }
    std::unique_ptr<Sexp> take_cdr() { return std::move(cdr_); }

    bool is_empty() const { return !car_ && !cdr_; }

    bool operator==(const Cons& o) const;
    bool operator!=(const Cons& o) const { return !(*this == o); }

private:
    std::unique_ptr<Sexp> car_;
    std::unique_ptr<Sexp> cdr_;
};

// One step of list iteration; proper is false for the tail of an improper list.
struct ListItem {
    const Sexp& elem;
    bool proper;
};

class ListIterator {
public:
    ListIterator() = default;
    explicit ListIterator(const Sexp* start) : cur_(start) { settle(); }

    ListItem operator*() const;
    ListIterator& operator++();
    bool operator!=(const ListIterator& o) const { return cur_ != o.cur_; }
    bool operator==(const ListIterator& o) const { return cur_ == o.cur_; }

private:
    const Sexp* cur_ = nullptr;
    void settle();
};

struct ListRange {
    const Sexp* start;
    ListIterator begin() const { return ListIterator(start); }
    ListIterator end() const { return ListIterator(); }
};

class Sexp {
public:
    Sexp() : value_(Cons()) {}
    Sexp(Primitive p) : value_(std::move(p)) {}
    Sexp(Cons c) : value_(std::move(c)) {}

    template <typename T,
              typename = std::enable_if_t<std::is_constructible_v<Primitive, T> &&
                                          !std::is_same_v<std::decay_t<T>, Primitive> &&
                                          !std::is_same_v<std::decay_t<T>, Sexp>>>
    Sexp(T v) : value_(Primitive(std::move(v))) {}

    static Sexp nil() { return Sexp(); }

    bool is_primitive() const { return std::holds_alternative<Primitive>(value_); }
    bool is_cons() const { return std::holds_alternative<Cons>(value_); }
    bool is_nil() const { return is_cons() && std::get<Cons>(value_).is_empty(); }

    const Primitive* primitive() const { return std::get_if<Primitive>(&value_); }
    Primitive* primitive_mut() { return std::get_if<Primitive>(&value_); }
    const Cons* cons() const { return std::get_if<Cons>(&value_); }
    Cons* cons_mut() { return std::get_if<Cons>(&value_); }

    template <typename T>
    const T* as() const {
        const Primitive* p = primitive();
        return p ? std::get_if<T>(p) : nullptr;
    }
    template <typename T>
    T* as_mut() {
        Primitive* p = primitive_mut();
        return p ? std::get_if<T>(p) : nullptr;
    }
    template <typename T>
    bool is() const { return as<T>() != nullptr; }

    // List view: yields (elem, proper) pairs
    ListRange list() const { return ListRange{this}; }

    // Number of elements of a proper list; nullopt for improper lists and primitives
    std::optional<size_t> proper_length() const {
        if (is_primitive()) return std::nullopt;
        size_t n = 0;
        for (auto item : list()) {
            if (!item.proper) return std::nullopt;
            ++n;
        }
        return n;
    }

    // Prepend an element, turning this list into (elem . this)
    void push_front(Sexp elem);

    std::string to_string() const;

    bool operator==(const Sexp& o) const { return value_ == o.value_; }
    bool operator!=(const Sexp& o) const { return !(value_ == o.value_); }

private:
    std::variant<Primitive, Cons> value_;
};

// O(1)-append list builder
class ConsList {
public:
    ConsList() = default;
    ConsList(const ConsList&) = delete;
    ConsList& operator=(const ConsList&) = delete;
    ConsList(ConsList&& o) noexcept : head_(std::move(o.head_)) {
        // The first cell lives inline in head_; later cells are heap-stable
        tail_ = (o.tail_ == o.head_.cons_mut()) ? head_.cons_mut() : o.tail_;
        o.tail_ = nullptr;
    }
    ConsList& operator=(ConsList&& o) noexcept {
        if (this != &o) {
            Cons* first = o.head_.cons_mut();
            bool tail_is_first = o.tail_ && o.tail_ == first;
            head_ = std::move(o.head_);
            tail_ = tail_is_first ? head_.cons_mut() : o.tail_;
            o.tail_ = nullptr;
        }
        return *this;
    }

    void append(Sexp elem) {
        if (!tail_) {
            head_ = Cons(std::make_unique<Sexp>(std::move(elem)), nullptr);
            tail_ = head_.cons_mut();
            return;
        }
        auto next = std::make_unique<Sexp>(Cons(std::make_unique<Sexp>(std::move(elem)), nullptr));
        Cons* next_cons = next->cons_mut();
        tail_->set_cdr(std::move(next));
        tail_ = next_cons;
    }

    // Terminate as an improper list: (... . tail)
    void append_tail(Sexp tail) {
        if (!tail_) {
            head_ = std::move(tail);
            return;
        }
        tail_->set_cdr(std::make_unique<Sexp>(std::move(tail)));
        tail_ = nullptr;
    }

    bool empty() const { return head_.is_nil(); }

    Sexp release() {
        tail_ = nullptr;
        return std::move(head_);
    }

private:
    Sexp head_;
    Cons* tail_ = nullptr;
};

inline Sexp make_list(std::initializer_list<Sexp> elems) {
    ConsList list;
    for (const auto& e : elems) list.append(e);
    return list.release();
}

inline Sexp make_list(std::vector<Sexp> elems) {
    ConsList list;
    for (auto& e : elems) list.append(std::move(e));
    return list.release();
}

inline Sexp make_pair(Sexp car, Sexp cdr) {
    return Sexp(Cons(std::move(car), std::move(cdr)));
}

inline Sexp sym(const std::string& name) { return Sexp(Symbol(name)); }

// ═══════════════════════════════════════════════════════════════════
// Out-of-line definitions needing complete Sexp
// ═══════════════════════════════════════════════════════════════════

inline Sexp BuiltIn::call(std::vector<Sexp>& a, Agent& agent) const { return fn(a, agent); }

inline const Sexp* SymSexpTable::lookup(const Symbol& s) const {
    for (const auto& [k, v] : entries_) {
        if (k == s) return &v;
    }
    return nullptr;
}

inline void SymSexpTable::insert(Symbol s, Sexp v) {
    for (auto& entry : entries_) {
        if (entry.first == s) {
            entry.second = std::move(v);
            return;
        }
    }
    auto it = entries_.begin();
    while (it != entries_.end() && it->first < s) ++it;
    entries_.insert(it, std::make_pair(std::move(s), std::move(v)));
}

inline bool SymSexpTable::operator==(const SymSexpTable& o) const {
    if (entries_.size() != o.entries_.size()) return false;
    for (size_t i = 0; i < entries_.size(); ++i) {
        if (entries_[i].first != o.entries_[i].first) return false;
        if (entries_[i].second != o.entries_[i].second) return false;
    }
    return true;
}

inline Vector::Vector(std::vector<Sexp> elems) : elems_(std::move(elems)) {}

inline bool Vector::operator==(const Vector& o) const { return elems_ == o.elems_; }

inline Cons::Cons(Sexp car, Sexp cdr)
    : car_(std::make_unique<Sexp>(std::move(car))), cdr_(std::make_unique<Sexp>(std::move(cdr))) {}

inline Cons::Cons(const Cons& o) : car_(o.car_ ? std::make_unique<Sexp>(*o.car_) : nullptr) {
    const Sexp* src = o.cdr_.get();
    std::unique_ptr<Sexp>* dst = &cdr_;
    while (src) {
        const Cons* c = src->cons();
        if (!c) {
            *dst = std::make_unique<Sexp>(*src);
            break;
        }
        auto cell = std::make_unique<Sexp>(
            Cons(c->car_ ? std::make_unique<Sexp>(*c->car_) : nullptr, nullptr));
        Cons* copy = cell->cons_mut();
        *dst = std::move(cell);
        dst = &copy->cdr_;
        src = c->cdr_.get();
    }
}

inline Cons::~Cons() {
    std::unique_ptr<Sexp> next = std::move(cdr_);
    while (next) {
        Cons* c = next->cons_mut();
        std::unique_ptr<Sexp> rest = c ? c->take_cdr() : nullptr;
        next = std::move(rest);
    }
}

inline Cons& Cons::operator=(const Cons& o) {
    if (this != &o) {
        Cons tmp(o);
        *this = std::move(tmp);
    }
    return *this;
}

inline bool Cons::operator==(const Cons& o) const {
    // A missing cdr and a nil cdr both end the list
    auto eq = [](const Sexp* a, const Sexp* b) {
        if (!a && !b) return true;
        if (!a) return b->is_nil();
        if (!b) return a->is_nil();
        return *a == *b;
    };
    auto ends = [](const Sexp* s) { return !s || s->is_nil(); };

    const Cons* a = this;
    const Cons* b = &o;
    while (true) {
        if (!eq(a->car_.get(), b->car_.get())) return false;
        const Sexp* x = a->cdr_.get();
        const Sexp* y = b->cdr_.get();
        if (ends(x) || ends(y)) return ends(x) == ends(y);
        if (!x->is_cons() || !y->is_cons()) return *x == *y;
        a = x->cons();
        b = y->cons();
    }
}

inline void Sexp::push_front(Sexp elem) {
    Sexp rest = std::move(*this);
    if (rest.is_nil()) {
        *this = Sexp(Cons(std::make_unique<Sexp>(std::move(elem)), nullptr));
    } else {
        *this = Sexp(Cons(std::move(elem), std::move(rest)));
    }
}

inline void ListIterator::settle() {
    // Skip empty cells; stop on an element or an improper tail
    while (cur_) {
        const Cons* c = cur_->cons();
        if (!c) return;
        if (c->car()) return;
        cur_ = c->cdr();
    }
}

inline ListItem ListIterator::operator*() const {
    const Cons* c = cur_->cons();
    if (c) return ListItem{*c->car(), true};
    return ListItem{*cur_, false};
}

inline ListIterator& ListIterator::operator++() {
    const Cons* c = cur_->cons();
    cur_ = c ? c->cdr() : nullptr;
    settle();
    return *this;
}

// ═══════════════════════════════════════════════════════════════════
// Writing
// ═══════════════════════════════════════════════════════════════════

// Callbacks let callers (printer, env serializer) render primitives their way.
struct SexpWriter {
    std::function<void(std::ostream&, const Primitive&, size_t depth)> primitive;
    std::function<void(std::ostream&, const char* paren, size_t depth)> paren;
    std::optional<size_t> max_length;
    std::optional<size_t> max_depth;
};

inline void write_default_primitive(std::ostream& os, const Primitive& p) {
    std::visit([&os](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Number>) {
            os << v.to_string(true);
        } else if constexpr (std::is_same_v<T, Symbol>) {
            os << v.str();
        } else if constexpr (std::is_same_v<T, LangString>) {
            os << '"' << v.escaped() << '"';
        } else if constexpr (std::is_same_v<T, LangPath>) {
            os << "(__path \"" << LangString(v.str()).escaped() << "\")";
        } else if constexpr (std::is_same_v<T, BuiltIn>) {
            os << "[BUILTIN_" << v.name << "]";
        } else if constexpr (std::is_same_v<T, Node>) {
            os << v.to_string();
        } else if constexpr (std::is_same_v<T, SymNodeTable>) {
            os << "[SymNodeTable " << v.size() << "]";
        } else if constexpr (std::is_same_v<T, SymSexpTable>) {
            os << "[SymSexpTable " << v.size() << "]";
        } else if constexpr (std::is_same_v<T, LocalNodeTable>) {
            os << "[LocalNodeTable " << v.size() << "]";
        } else if constexpr (std::is_same_v<T, Vector>) {
            os << "[";
            bool first = true;
            for (const auto& e : v.elems()) {
                if (!first) os << " ";
                first = false;
                os << e.to_string();
            }
            os << "]";
        } else if constexpr (std::is_same_v<T, Procedure>) {
            os << "[Procedure " << Procedure::type_name(v.type) << "]";
        }
    }, p);
}

inline void write_sexp(std::ostream& os, const Sexp& s, const SexpWriter& w, size_t depth = 0) {
    if (const Primitive* p = s.primitive()) {
        if (w.primitive) {
            w.primitive(os, *p, depth);
        } else {
            write_default_primitive(os, *p);
        }
        return;
    }

    auto paren = [&](const char* c) {
        if (w.paren) {
            w.paren(os, c, depth);
        } else {
            os << c;
        }
    };

    if (w.max_depth && depth > *w.max_depth) {
        paren("(");
        os << "...";
        paren(")");
        return;
    }

    paren("(");
    size_t count = 0;
    bool first = true;
    for (auto item : s.list()) {
        if (!first) os << " ";
        if (!item.proper) {
            os << ". ";
            write_sexp(os, item.elem, w, depth + 1);
            break;
        }
        first = false;
        if (w.max_length && count >= *w.max_length) {
            os << "...";
            break;
        }
        write_sexp(os, item.elem, w, depth + 1);
        ++count;
    }
    paren(")");
}

inline std::string Sexp::to_string() const {
    std::ostringstream oss;
    write_sexp(oss, *this, SexpWriter{});
    return oss.str();
}

inline std::ostream& operator<<(std::ostream& os, const Sexp& s) {
    write_sexp(os, s, SexpWriter{});
    return os;
}

} // namespace smriti
