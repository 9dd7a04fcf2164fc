#pragma once
// Agent: one actor over the env federation
//
// State:
// - env_state: position stack (current node, hence current env)
// - exec_state: execution stack of substitution frames
// - designation chain: env-scoped designation contexts, newest last
// - shared meta env plus the meta and lang contexts
//
// Agents forked from one another share the meta env; each keeps its own
// position, chain and exec stack.

#include "context.hpp"
#include "continuation.hpp"
#include "env_prelude.hpp"
#include "error.hpp"
#include "log.hpp"
#include "meta_env.hpp"
#include "serializer.hpp"
#include <deque>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

namespace smriti {

class Agent;

// Runs procedure values on behalf of the agent (set by the exec interpreter)
class Applier {
public:
    virtual ~Applier() = default;
    // Apply proc to already-computed argument values; context names the call
    virtual Sexp apply_values(const Sexp& proc, std::vector<Sexp> values, Node context) = 0;
};

using DesignationChain = std::deque<Node>;

constexpr size_t PRINT_MAX_LENGTH = 64;
constexpr size_t PRINT_MAX_DEPTH = 16;

class Agent {
public:
    Agent(std::shared_ptr<MetaEnv> meta, MetaEnvContext meta_ctx, Node pos)
        : meta_(std::move(meta)), meta_ctx_(meta_ctx),
          env_state_(EnvFrame{pos}), exec_state_(ExecFrame(pos)) {}

    // New agent sharing the meta env, position and designation chain
    Agent fork() const {
        Agent out(meta_, meta_ctx_, pos());
        out.designation_chain_ = designation_chain_;
        out.lang_ = lang_;
        out.history_env_ = history_env_;
        out.color_ = color_;
        return out;
    }

    // ═══════════════════════════════════════════════════════════════
    // State access
    // ═══════════════════════════════════════════════════════════════

    MetaEnv& meta() { return *meta_; }
    const MetaEnv& meta() const { return *meta_; }
    const MetaEnvContext& meta_context() const { return meta_ctx_; }

    bool has_lang() const { return lang_.has_value(); }
    const LangContext& lang() const {
        if (!lang_) throw error(LangError::invalid_state("no lang context", "loaded lang context"));
        return *lang_;
    }
    void set_lang(LangContext ctx) { lang_ = ctx; }

    std::optional<LocalNode> history_env() const { return history_env_; }
    void set_history_env(LocalNode env) { history_env_ = env; }

    void set_applier(Applier* applier) { applier_ = applier; }
    Applier* applier() const { return applier_; }

    void set_color(bool on) { color_ = on; }

    DesignationChain& designation_chain() { return designation_chain_; }
    const DesignationChain& designation_chain() const { return designation_chain_; }

    ExecStack& exec_state() { return exec_state_; }
    const ExecStack& exec_state() const { return exec_state_; }
    Continuation<EnvFrame>& env_state() { return env_state_; }

    // Error carrying the current exec stack
    Error error(ErrorKind kind) const { return Error::with_state(exec_state_, std::move(kind)); }

    // ═══════════════════════════════════════════════════════════════
    // Position
    // ═══════════════════════════════════════════════════════════════

    Node pos() const { return env_state_.top().pos; }
    Node globalize(LocalNode local) const { return Node(pos().env, local); }

    void jump(Node n) {
        Environment& e = access_env(n.env);
        if (!e.contains(n.local)) {
            throw error(LangError::invalid_argument(Sexp(n), "node existing in its env"));
        }
        env_state_.top_mut().pos = n;
    }

    void jump_env(LocalNode env) { jump(Node(env, env_prelude::self_env())); }

    Environment& access_env(LocalNode env) {
        Environment* e = meta_->env(env);
        if (!e) throw error(LangError::invalid_argument(Sexp(Node(LocalNode(0), env)), "env node"));
        return *e;
    }
    const Environment& access_env(LocalNode env) const {
        const Environment* e = meta_->env(env);
        if (!e) throw error(LangError::invalid_argument(Sexp(Node(LocalNode(0), env)), "env node"));
        return *e;
    }

    Environment& env() { return access_env(pos().env); }

    // ═══════════════════════════════════════════════════════════════
    // Designation
    // ═══════════════════════════════════════════════════════════════

    std::optional<Node> try_resolve(const Symbol& s) const {
        if (auto prelude = env_prelude::from_name(s.str())) return globalize(*prelude);
        for (auto it = designation_chain_.rbegin(); it != designation_chain_.rend(); ++it) {
            const Environment* e = meta_->env(it->env);
            if (!e) continue;
            if (auto n = e->match_designation(it->local, s)) return n;
        }
        return std::nullopt;
    }

    Node resolve(const Symbol& s) const {
        if (auto n = try_resolve(s)) return *n;
        throw error(LangError::unbound_symbol(s));
    }

    std::optional<Symbol> lookup_designation(Node n) const {
        for (auto it = designation_chain_.rbegin(); it != designation_chain_.rend(); ++it) {
            const Environment* e = meta_->env(it->env);
            if (!e) continue;
            if (auto s = e->find_designation(it->local, n)) return s;
        }
        if (n.env == pos().env) {
            if (const char* name = env_prelude::name_of(n.local)) return Symbol(name);
        }
        return std::nullopt;
    }

    // Structure held by n; nullptr for atomic nodes and triples
    const Sexp* structure_of(Node n) const {
        const Environment& e = access_env(n.env);
        if (!e.contains(n.local)) {
            throw error(LangError::invalid_argument(Sexp(n), "node existing in its env"));
        }
        return e.structure(n.local);
    }

    // (s p o) of a triple node, components globalized in its env
    Sexp triple_sexp(Node t) const {
        const Environment& e = access_env(t.env);
        auto triple = e.node_as_triple(t.local);
        if (!triple) throw error(LangError::invalid_argument(Sexp(t), "triple node"));
        return make_list({Sexp(Node(t.env, e.triple_subject(*triple))),
                          Sexp(Node(t.env, e.triple_predicate(*triple))),
                          Sexp(Node(t.env, e.triple_object(*triple)))});
    }

    Sexp designate(const Sexp& value) const {
        const Primitive* p = value.primitive();
        if (!p) return value;

        if (const auto* s = std::get_if<Symbol>(p)) return Sexp(resolve(*s));
        if (const auto* n = std::get_if<Node>(p)) {
            if (const Sexp* structure = structure_of(*n)) return *structure;
            if (n->local.is_triple()) return triple_sexp(*n);
            return value;
        }
        if (const auto* proc = std::get_if<Procedure>(p)) return procedure_source(*proc);
        if (auto reified = reify_structured(*p)) return *reified;
        return value;
    }

    // Substitution from the exec stack (newest first), else the designation
    Sexp concretize(Node n) const {
        const auto& frames = exec_state_.frames();
        for (auto it = frames.rbegin(); it != frames.rend(); ++it) {
            if (const Sexp* v = it->lookup(n)) return *v;
        }
        return designate(Sexp(n));
    }

    // Bind the symbol designated by name to target in the current env
    Node name_node(Node name, Node target) {
        Sexp designated = designate(Sexp(name));
        const Symbol* s = designated.as<Symbol>();
        if (!s) throw error(LangError::invalid_argument(designated, "Node abstracting Symbol"));
        std::optional<Node> local_name;
        if (name.env == pos().env) local_name = name;
        return bind_symbol(*s, target, local_name);
    }

    Node name_symbol(const Symbol& s, Node target) {
        std::optional<Node> local_name;
        return bind_symbol(s, target, local_name);
    }

    // ═══════════════════════════════════════════════════════════════
    // Nodes and structures
    // ═══════════════════════════════════════════════════════════════

    Node define(std::optional<Sexp> structure) {
        return define_to(pos().env, std::move(structure));
    }

    Node define_to(LocalNode env, std::optional<Sexp> structure) {
        LocalNode local = access_env(env).insert_node(std::move(structure));
        return Node(env, local);
    }

    void set(Node n, std::optional<Sexp> structure) {
        Environment& e = access_env(n.env);
        if (!e.contains(n.local)) {
            throw error(LangError::invalid_argument(Sexp(n), "node existing in its env"));
        }
        if (n.local.is_triple() && structure) {
            throw error(LangError::invalid_argument(Sexp(n), "non-triple node"));
        }
        e.set_structure(n.local, std::move(structure));
    }

    Node history_insert(Sexp structure) {
        if (!history_env_) {
            throw error(LangError::invalid_state("no history env", "history env"));
        }
        return define_to(*history_env_, std::move(structure));
    }

    // ═══════════════════════════════════════════════════════════════
    // Triples
    // ═══════════════════════════════════════════════════════════════

    // Nodes from other envs are imported only once the triple is accepted
    Node tell(Node s, Node p, Node o) {
        Node origin = pos();
        LocalNode env_node = origin.env;
        Sexp reified = make_list({Sexp(s), Sexp(p), Sexp(o)});

        auto duplicate = [this, env_node, s, p, o]() -> std::optional<LocalTriple> {
            auto is = get_imported(s, env_node);
            auto ip = get_imported(p, env_node);
            auto io = get_imported(o, env_node);
            if (!is || !ip || !io) return std::nullopt;
            return access_env(env_node).match_triple(is->local, ip->local, io->local);
        };

        if (duplicate()) throw error(LangError::duplicate_triple(std::move(reified)));

        if (const Sexp* handler = env().structure(env_prelude::tell_handler())) {
            Sexp result = run_tell_handler(*handler, s, p, o, origin);
            if (has_lang() && result == Sexp(lang_->false_node())) {
                throw error(LangError::rejected_triple(std::move(reified), std::move(result)));
            }
            // The handler may have inserted the same triple itself
            if (duplicate()) throw error(LangError::duplicate_triple(std::move(reified)));
        }

        s = import_to(s, env_node);
        p = import_to(p, env_node);
        o = import_to(o, env_node);
        LocalTriple t = access_env(env_node).insert_triple(s.local, p.local, o.local);
        log_debug("Agent", "tell %s -> %s", reified.to_string().c_str(),
                  Node(env_node, t.node()).to_string().c_str());
        return Node(env_node, t.node());
    }

    // Triples matching the pattern; the placeholder node is a wildcard
    std::vector<Node> ask(Node s, Node p, Node o) const {
        const Environment& e = access_env(pos().env);
        auto wild = [this](Node n) { return lang_ && n == lang_->placeholder(); };
        for (Node n : {s, p, o}) {
            if (!wild(n) && n.env != pos().env) {
                throw error(LangError::unsupported("ask with node outside the current env"));
            }
        }

        bool ws = wild(s), wp = wild(p), wo = wild(o);
        TripleSet found;
        if (!ws && !wp && !wo) {
            if (auto t = e.match_triple(s.local, p.local, o.local)) found.insert(*t);
        } else if (!ws && !wp) {
            found = e.match_but_object(s.local, p.local);
        } else if (!ws && !wo) {
            found = e.match_but_predicate(s.local, o.local);
        } else if (!wp && !wo) {
            found = e.match_but_subject(p.local, o.local);
        } else if (!ws) {
            found = e.match_subject(s.local);
        } else if (!wp) {
            found = e.match_predicate(p.local);
        } else if (!wo) {
            found = e.match_object(o.local);
        } else {
            found = e.match_all();
        }

        std::vector<Node> out;
        out.reserve(found.size());
        for (const auto& t : found) out.push_back(globalize(t.node()));
        return out;
    }

    // Triples using n in any role
    std::vector<Node> ask_any(Node n) const {
        if (n.env != pos().env) {
            throw error(LangError::unsupported("ask with node outside the current env"));
        }
        std::vector<Node> out;
        for (const auto& t : access_env(n.env).match_any(n.local)) out.push_back(globalize(t.node()));
        return out;
    }

    // ═══════════════════════════════════════════════════════════════
    // Import
    // ═══════════════════════════════════════════════════════════════

    Node import(Node original) { return import_to(original, pos().env); }

    Node import_to(Node original, LocalNode dest) {
        if (original.env == dest) return original;
        Environment& m = meta_->base();
        access_env(dest);
        access_env(original.env);

        LocalTriple imports;
        if (auto t = m.match_triple(dest, meta_ctx_.imports, original.env)) {
            imports = *t;
        } else {
            imports = m.insert_triple(dest, meta_ctx_.imports, original.env);
        }

        LocalNode table_node;
        TripleSet tables = m.match_but_object(imports.node(), meta_ctx_.import_table);
        if (tables.empty()) {
            table_node = m.insert_node(Sexp(LocalNodeTable(dest)));
            m.insert_triple(imports.node(), meta_ctx_.import_table, table_node);
        } else {
            table_node = m.triple_object(*tables.begin());
        }

        {
            const Sexp* table = m.structure(table_node);
            const LocalNodeTable* t = table ? table->as<LocalNodeTable>() : nullptr;
            if (!t) {
                throw error(LangError::invalid_state(
                    table ? table->to_string() : "atomic node", "LocalNodeTable"));
            }
            if (auto mapped = t->lookup(original.local)) return Node(dest, *mapped);
        }

        LocalNode local = access_env(dest).insert_node(Sexp(original));
        {
            EntryMut entry = m.entry_mut(table_node);
            entry.structure()->as_mut<LocalNodeTable>()->insert(original.local, local);
        }
        log_debug("Agent", "import %s -> %s", original.to_string().c_str(),
                  Node(dest, local).to_string().c_str());
        return Node(dest, local);
    }

    // Existing import of original into dest, without creating one
    std::optional<Node> get_imported(Node original, LocalNode dest) const {
        if (original.env == dest) return original;
        const Environment& m = meta_->base();
        auto imports = m.match_triple(dest, meta_ctx_.imports, original.env);
        if (!imports) return std::nullopt;
        TripleSet tables = m.match_but_object(imports->node(), meta_ctx_.import_table);
        if (tables.empty()) return std::nullopt;
        const Sexp* table = m.structure(m.triple_object(*tables.begin()));
        const LocalNodeTable* t = table ? table->as<LocalNodeTable>() : nullptr;
        if (!t) return std::nullopt;
        if (auto mapped = t->lookup(original.local)) return Node(dest, *mapped);
        return std::nullopt;
    }

    // Env whose serialize path ends with the given suffix, as a meta env node
    std::optional<Node> find_env(const std::string& suffix) const {
        const Environment& m = meta_->base();
        for (const auto& t : m.match_predicate(meta_ctx_.serialize_path)) {
            const Sexp* path = m.structure(m.triple_object(t));
            const LangPath* lp = path ? path->as<LangPath>() : nullptr;
            if (lp && lp->ends_with(suffix)) return Node(LocalNode(0), m.triple_subject(t));
        }
        return std::nullopt;
    }

    // ═══════════════════════════════════════════════════════════════
    // Printing
    // ═══════════════════════════════════════════════════════════════

    void print_sexp(std::ostream& os, const Sexp& s) const {
        SexpWriter w;
        w.max_length = PRINT_MAX_LENGTH;
        w.max_depth = PRINT_MAX_DEPTH;
        w.primitive = [this](std::ostream& out, const Primitive& p, size_t depth) {
            write_primitive(out, p, depth);
        };
        if (color_) {
            w.paren = [](std::ostream& out, const char* paren, size_t depth) {
                static const char* colors[] = {"\033[31m", "\033[32m", "\033[33m",
                                               "\033[34m", "\033[35m", "\033[36m"};
                out << colors[depth % 6] << paren << "\033[0m";
            };
        }
        write_sexp(os, s, w);
    }

    std::string sexp_to_string(const Sexp& s) const {
        std::ostringstream oss;
        print_sexp(oss, s);
        return oss.str();
    }

    void trace_error(std::ostream& os, const Error& err) const {
        if (!err.has_state()) return;
        os << "  --TRACE--\n";
        const auto& frames = err.state()->frames();
        for (auto it = frames.rbegin(); it != frames.rend(); ++it) {
            os << "  " << it->context.to_string();
            try {
                Sexp source = designate(Sexp(it->context));
                os << ": ";
                print_sexp(os, source);
            } catch (const Error&) {
                // Context may name a node that no longer resolves
            }
            os << "\n";
        }
    }

private:
    std::shared_ptr<MetaEnv> meta_;
    MetaEnvContext meta_ctx_;
    std::optional<LangContext> lang_;
    std::optional<LocalNode> history_env_;
    Continuation<EnvFrame> env_state_;
    ExecStack exec_state_;
    DesignationChain designation_chain_;
    Applier* applier_ = nullptr;
    bool color_ = false;

    Node bind_symbol(const Symbol& s, Node target, std::optional<Node> local_name) {
        if (try_resolve(s)) throw error(LangError::already_bound_symbol(s));
        Environment& e = env();
        e.insert_designation(env_prelude::self_des(), s, target);

        // Naming triple, for targets in this env only
        if (target.env == pos().env) {
            Node name = local_name ? *local_name : define(Sexp(s));
            if (!e.match_triple(target.local, env_prelude::self_des(), name.local)) {
                e.insert_triple(target.local, env_prelude::self_des(), name.local);
            }
        }
        log_debug("Agent", "designate %s -> %s", s.str().c_str(), target.to_string().c_str());
        return target;
    }

    Sexp run_tell_handler(const Sexp& handler, Node s, Node p, Node o, Node origin) {
        if (!applier_) {
            throw error(LangError::unsupported("tell handler without an interpreter"));
        }
        // The handler may jump; the triple still lands where tell was called
        struct PosRestore {
            Continuation<EnvFrame>& state;
            Node pos;
            ~PosRestore() { state.top_mut().pos = pos; }
        } restore{env_state_, origin};

        Sexp proc = handler;
        Node context = Node(origin.env, env_prelude::tell_handler());
        return applier_->apply_values(proc, {Sexp(s), Sexp(p), Sexp(o)}, context);
    }

    // Source form of lowered code, headed by lang nodes when available
    Sexp procedure_source(const Procedure& proc) const {
        auto head = [this](LangContext::Form f) {
            return lang_ ? Sexp(lang_->node(f)) : sym(LangContext::form_name(f));
        };
        auto nodes = [](const std::vector<Node>& ns) {
            ConsList l;
            for (const auto& n : ns) l.append(Sexp(n));
            return l.release();
        };
        switch (proc.type) {
            case Procedure::Type::Application:
                return make_list({head(LangContext::Form::Apply), Sexp(proc.proc), nodes(proc.args)});
            case Procedure::Type::Abstraction:
                return make_list({head(LangContext::Form::Lambda), nodes(proc.params), Sexp(proc.body)});
            case Procedure::Type::InterpreterAbstraction:
                return make_list({head(LangContext::Form::Fexpr), nodes(proc.params), Sexp(proc.body)});
            case Procedure::Type::Sequence: {
                Sexp out = nodes(proc.seq);
                out.push_front(head(LangContext::Form::Progn));
                return out;
            }
            case Procedure::Type::Branch:
                return make_list({head(LangContext::Form::If), Sexp(proc.pred),
                                  Sexp(proc.then_branch), Sexp(proc.else_branch)});
        }
        return Sexp();
    }

    void write_primitive(std::ostream& os, const Primitive& p, size_t depth) const {
        if (depth > PRINT_MAX_DEPTH) {
            os << "...";
            return;
        }
        SexpWriter nested;
        nested.max_length = PRINT_MAX_LENGTH;
        nested.max_depth = PRINT_MAX_DEPTH;
        nested.primitive = [this](std::ostream& out, const Primitive& inner, size_t d) {
            write_primitive(out, inner, d);
        };

        if (const auto* n = std::get_if<Node>(&p)) {
            if (auto name = lookup_designation(*n)) {
                os << name->str();
                return;
            }
            if (!meta_->is_env(n->env) || !access_env(n->env).contains(n->local)) {
                os << n->to_string();
                return;
            }
            if (n->local.is_triple()) {
                write_sexp(os, triple_sexp(*n), nested, depth + 1);
                return;
            }
            if (const Sexp* structure = structure_of(*n)) {
                os << n->to_string() << "->";
                write_sexp(os, *structure, nested, depth + 1);
                return;
            }
            os << n->to_string();
            return;
        }
        if (const auto* proc = std::get_if<Procedure>(&p)) {
            write_sexp(os, procedure_source(*proc), nested, depth + 1);
            return;
        }
        write_default_primitive(os, p);
    }
};

} // namespace smriti
