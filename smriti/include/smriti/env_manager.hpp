#pragma once
// EnvManager: loads and persists the environment federation
//
// One file per env, all under the configured base directory:
//
//   (header (version "1.0.0") (node-count N) (triple-count T))
//   (nodes
//    ^0
//    (^10 structure)
//    ...)
//   (triples
//    (^10 ^1 ^11)
//    ...)
//   (designation ^1
//    (^10 name)
//    ...)
//
// Node references are sigils: ^N and ^tI in the env itself, ^E^N and ^E^tI
// elsewhere. Load order is header, nodes (atomic placeholders), triples,
// designations, then structures, so structures may refer to anything in
// the federation.
//
// meta.env lists the other envs through (env __serialize_path path) triples.

#include "agent.hpp"
#include "builtins.hpp"
#include "config.hpp"
#include "env_header.hpp"
#include "log.hpp"
#include "parser.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace smriti {

// ═══════════════════════════════════════════════════════════════════
// Structure encoding
// ═══════════════════════════════════════════════════════════════════

namespace env_codec {

inline const char* const BUILTIN = "__builtin";
inline const char* const PATH = "__path";
inline const char* const VECTOR = "__vector";
inline const char* const PROCEDURE = "__procedure";
inline const char* const TABLE = "__table";

// Rebuild a list, applying f to every element and to an improper tail
template <typename F>
Sexp map_list(const Sexp& s, F&& f) {
    ConsList out;
    for (auto item : s.list()) {
        if (item.proper) {
            out.append(f(item.elem));
        } else {
            out.append_tail(f(item.elem));
        }
    }
    return out.release();
}

// Nested value: primitives that have no literal syntax become (__kind ...)
inline Sexp encode_datum(const Sexp& s) {
    if (s.is_nil()) return s;
    if (const Primitive* p = s.primitive()) {
        if (const auto* b = std::get_if<BuiltIn>(p)) return make_list({sym(BUILTIN), sym(b->name)});
        if (const auto* path = std::get_if<LangPath>(p)) {
            return make_list({sym(PATH), Sexp(LangString(path->str()))});
        }
        if (const auto* v = std::get_if<Vector>(p)) {
            ConsList out;
            out.append(sym(VECTOR));
            for (const auto& e : v->elems()) out.append(encode_datum(e));
            return out.release();
        }
        if (std::holds_alternative<Procedure>(*p)) {
            return make_list({sym(PROCEDURE), *reify_structured(*p)});
        }
        if (auto table = reify_structured(*p)) return make_list({sym(TABLE), *table});
        return s;
    }
    return map_list(s, [](const Sexp& e) { return encode_datum(e); });
}

// Node structure: procedures and tables in visitor form, lists quoted
inline Sexp encode_structure(const Sexp& s) {
    if (const Primitive* p = s.primitive()) {
        if (std::holds_alternative<Procedure>(*p) || std::holds_alternative<SymNodeTable>(*p) ||
            std::holds_alternative<SymSexpTable>(*p) || std::holds_alternative<LocalNodeTable>(*p)) {
            return *reify_structured(*p);
        }
        return encode_datum(s);
    }
    if (s.is_nil()) return s;
    return make_list({sym("quote"), encode_datum(s)});
}

inline Sexp decode_datum(const Sexp& s, LocalNode env) {
    if (s.is_nil()) return s;
    if (const Primitive* p = s.primitive()) {
        if (const auto* symbol = std::get_if<Symbol>(p)) {
            if (auto sig = parse_sigil(symbol->str())) return Sexp(sig->node_in(env));
        }
        return s;
    }

    const Cons* c = s.cons();
    const Symbol* head = c->car() ? c->car()->as<Symbol>() : nullptr;
    if (head) {
        const std::string& h = head->str();
        if (h == BUILTIN) {
            Deserializer d(s, env);
            d.symbol();
            Symbol name = d.symbol();
            d.finish();
            auto builtin = find_builtin(name.str());
            if (!builtin) throw deserialize_error(DeserializeError::Type::UnrecognizedBuiltIn, Sexp(name));
            return Sexp(*builtin);
        }
        if (h == PATH) {
            Deserializer d(s, env);
            d.symbol();
            std::string path = d.string();
            d.finish();
            return Sexp(LangPath(path));
        }
        if (h == VECTOR) {
            Deserializer d(s, env);
            d.symbol();
            std::vector<Sexp> elems;
            while (!d.done()) elems.push_back(decode_datum(d.next(), env));
            return Sexp(Vector(std::move(elems)));
        }
        if (h == PROCEDURE || h == TABLE) {
            Deserializer d(s, env);
            d.symbol();
            const Sexp& inner = d.next();
            d.finish();
            auto out = reflect_structured(inner, env);
            if (!out) throw deserialize_error(DeserializeError::Type::UnexpectedCommand, inner);
            return *out;
        }
    }
    return map_list(s, [env](const Sexp& e) { return decode_datum(e, env); });
}

inline Sexp decode_structure(const Sexp& s, LocalNode env) {
    if (s.is_nil()) return s;
    if (const Primitive* p = s.primitive()) {
        if (const auto* symbol = std::get_if<Symbol>(p)) {
            if (auto sig = parse_sigil(symbol->str())) return Sexp(sig->node_in(env));
        }
        return s;
    }
    const Cons* c = s.cons();
    const Symbol* head = c->car() ? c->car()->as<Symbol>() : nullptr;
    if (!head) throw deserialize_error(DeserializeError::Type::ExpectedSymbol, s, "structure command");

    if (head->str() == "quote") {
        Deserializer d(s, env);
        d.symbol();
        const Sexp& datum = d.next();
        d.finish();
        return decode_datum(datum, env);
    }
    if (auto structured = reflect_structured(s, env)) return *structured;
    const std::string& h = head->str();
    if (h == BUILTIN || h == PATH || h == VECTOR || h == PROCEDURE || h == TABLE) {
        return decode_datum(s, env);
    }
    throw deserialize_error(DeserializeError::Type::UnexpectedCommand, Sexp(*head));
}

} // namespace env_codec

// ═══════════════════════════════════════════════════════════════════
// EnvManager
// ═══════════════════════════════════════════════════════════════════

class EnvManager {
public:
    // Load the federation under config.base_dir, or bootstrap a fresh one
    explicit EnvManager(Config config) : config_(std::move(config)), meta_(std::make_shared<MetaEnv>()) {
        agent_.emplace(meta_, MetaEnvContext{}, meta_self());

        std::string meta_path = config_.path_of(config_.meta_file);
        if (!std::filesystem::exists(meta_path)) {
            bootstrap_fresh();
            if (config_.save_on_exit) serialize_full();
            return;
        }

        deserialize_curr_env(meta_path);
        agent_.emplace(meta_, MetaEnvContext::load(meta_->base()), meta_self());
        log_info("EnvManager", "Meta env loaded (%zu envs listed)", serialized_envs().size());

        for (const auto& [env_node, path] : serialized_envs()) {
            meta_->attach_env(env_node);
            agent_->jump_env(env_node);
            deserialize_curr_env(config_.path_of(path));
        }

        lang_env_ = ensure_env(config_.lang_file);
        history_env_ = ensure_env(config_.history_file);
        impl_env_ = ensure_env(config_.impl_file);
        working_env_ = ensure_env(config_.working_file);
        load_lang();
        agent_->jump(meta_self());
    }

    EnvManager(const EnvManager&) = delete;
    EnvManager& operator=(const EnvManager&) = delete;

    Agent& agent() { return *agent_; }
    const Agent& agent() const { return *agent_; }
    std::shared_ptr<MetaEnv> meta() const { return meta_; }
    const Config& config() const { return config_; }

    LocalNode lang_env() const { return lang_env_; }
    LocalNode history_env() const { return history_env_; }
    LocalNode impl_env() const { return impl_env_; }
    LocalNode working_env() const { return working_env_; }
    const LangContext& lang() const { return agent_->lang(); }
    bool fresh() const { return fresh_; }

    // New env persisted at path (relative to base_dir)
    LocalNode insert_new_env(const std::string& path) {
        LocalNode env_node = meta_->insert_env();
        Environment& m = meta_->base();
        LocalNode path_node = m.insert_node(Sexp(LangPath(path)));
        m.insert_triple(env_node, agent_->meta_context().serialize_path, path_node);
        log_debug("EnvManager", "new env %s at %s", env_node.to_string().c_str(), path.c_str());
        return env_node;
    }

    // (env node, path) for every env the meta env lists
    std::vector<std::pair<LocalNode, std::string>> serialized_envs() const {
        std::vector<std::pair<LocalNode, std::string>> out;
        const Environment& m = meta_->base();
        for (const auto& t : m.match_predicate(agent_->meta_context().serialize_path)) {
            const Sexp* path = m.structure(m.triple_object(t));
            const LangPath* lp = path ? path->as<LangPath>() : nullptr;
            if (!lp) {
                log_warn("EnvManager", "serialize path of %s is not a path",
                         m.triple_subject(t).to_string().c_str());
                continue;
            }
            out.emplace_back(m.triple_subject(t), lp->str());
        }
        return out;
    }

    // Write the meta env and every listed env not named in the blacklist
    void serialize_full() { serialize_full(config_.base_dir, config_.serialize_blacklist); }

    void serialize_full(const std::string& dir, const std::set<std::string>& blacklist) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) throw io_error(dir, ec.message());

        PosRestore restore(*agent_);
        auto in_dir = [&dir](const std::string& f) { return f.empty() || f[0] == '/' ? f : dir + "/" + f; };

        agent_->jump(meta_self());
        serialize_curr_env(in_dir(config_.meta_file));

        size_t written = 1;
        for (const auto& [env_node, path] : serialized_envs()) {
            if (blacklist.count(path)) {
                log_debug("EnvManager", "skipping blacklisted %s", path.c_str());
                continue;
            }
            agent_->jump_env(env_node);
            serialize_curr_env(in_dir(path));
            ++written;
        }
        log_info("EnvManager", "Serialized %zu envs to %s", written, dir.c_str());
    }

    // Write the env the agent is in
    void serialize_curr_env(const std::string& path) {
        LocalNode env_node = agent_->pos().env;
        const Environment& env = agent_->access_env(env_node);

        EnvHeader header = EnvHeader::from_env(env);
        auto extras = header_extras_.find(env_node);
        if (extras != header_extras_.end()) header.extras = extras->second;

        std::string tmp_path = path + ".tmp";
        {
            std::ofstream out(tmp_path);
            if (!out) throw io_error(tmp_path, std::strerror(errno));
            write_env(out, env, env_node, header);
            out.flush();
            if (!out.good()) {
                std::error_code ec;
                std::filesystem::remove(tmp_path, ec);
                throw io_error(tmp_path, "write failed");
            }
        }
        std::error_code ec;
        std::filesystem::rename(tmp_path, path, ec);
        if (ec) {
            std::filesystem::remove(tmp_path, ec);
            throw io_error(path, "rename failed");
        }
        log_debug("EnvManager", "Serialized env %s to \"%s\" (%zu nodes, %zu triples)",
                  env_node.to_string().c_str(), path.c_str(), header.node_count, header.triple_count);
    }

    // Load a file into the env the agent is in, which must still be bare
    void deserialize_curr_env(const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            if (!std::filesystem::exists(path)) {
                log_warn("EnvManager", "Env file not found: %s; leaving env %s unchanged",
                         path.c_str(), agent_->pos().env.to_string().c_str());
                return;
            }
            throw io_error(path, std::strerror(errno));
        }

        LocalNode env_node = agent_->pos().env;
        Environment& env = agent_->access_env(env_node);
        if (env.node_count() != env_prelude::PRELUDE_SIZE || env.triple_count() != 0) {
            throw agent_->error(LangError::invalid_state(
                std::to_string(env.node_count()) + " nodes", "bare env to load into"));
        }

        std::vector<Sexp> sections = parse_stream(in, policy_env_serde);
        load_sections(sections, env, env_node);
        log_info("EnvManager", "Loaded env %s from \"%s\"", env_node.to_string().c_str(), path.c_str());
        log_debug("EnvManager", "  nodes: %zu  triples: %zu", env.node_count(), env.triple_count());
    }

private:
    Config config_;
    std::shared_ptr<MetaEnv> meta_;
    std::optional<Agent> agent_;
    LocalNode lang_env_;
    LocalNode history_env_;
    LocalNode impl_env_;
    LocalNode working_env_;
    std::map<LocalNode, std::vector<Sexp>> header_extras_;
    bool fresh_ = false;

    struct PosRestore {
        Agent& agent;
        Node pos;
        explicit PosRestore(Agent& a) : agent(a), pos(a.pos()) {}
        ~PosRestore() { agent.env_state().top_mut().pos = pos; }
    };

    static Node meta_self() { return Node(LocalNode(0), LocalNode(0)); }

    void bootstrap_fresh() {
        fresh_ = true;
        agent_.emplace(meta_, MetaEnvContext::load(meta_->base()), meta_self());
        lang_env_ = insert_new_env(config_.lang_file);
        history_env_ = insert_new_env(config_.history_file);
        impl_env_ = insert_new_env(config_.impl_file);
        working_env_ = insert_new_env(config_.working_file);
        load_lang();
        log_info("EnvManager", "Bootstrapped fresh federation in %s", config_.base_dir.c_str());
    }

    LocalNode ensure_env(const std::string& file) {
        for (const auto& [env_node, path] : serialized_envs()) {
            if (path == file) return env_node;
        }
        log_warn("EnvManager", "No env for %s in meta env; creating it", file.c_str());
        return insert_new_env(file);
    }

    // Language nodes and built-ins, added where an older lang env lacks them
    void load_lang() {
        Environment& lang = agent_->access_env(lang_env_);
        LangContext ctx = LangContext::load(lang, lang_env_);
        size_t added = 0;
        for (const auto& builtin : builtin_table()) {
            Symbol name(builtin.name);
            if (lang.match_designation(env_prelude::self_des(), name)) continue;
            LocalNode n = lang.insert_node(Sexp(builtin));
            lang.insert_designation(env_prelude::self_des(), name, Node(lang_env_, n));
            ++added;
        }
        if (added) log_debug("EnvManager", "added %zu built-ins to lang env", added);
        agent_->set_lang(ctx);
    }

    // ─── Writing ───

    void write_env(std::ostream& out, const Environment& env, LocalNode env_node,
                   const EnvHeader& header) const {
        SexpWriter w;
        w.primitive = [env_node](std::ostream& os, const Primitive& p, size_t) {
            if (const auto* n = std::get_if<Node>(&p)) {
                os << (n->env == env_node ? n->local.to_string() : n->to_string());
                return;
            }
            write_default_primitive(os, p);
        };

        write_sexp(out, header.reify(), w);
        out << "\n(nodes";
        for (const auto& n : env.all_nodes()) {
            out << "\n ";
            const Sexp* structure = env.structure(n);
            if (!structure || n == env_prelude::self_des()) {
                out << n.to_string();
                continue;
            }
            write_sexp(out, make_list({sym(n.to_string()), env_codec::encode_structure(*structure)}), w);
        }
        out << ")\n(triples";
        for (const auto& t : env.match_all()) {
            out << "\n ";
            write_sexp(out, make_list({Sexp(Node(env_node, env.triple_subject(t))),
                                       Sexp(Node(env_node, env.triple_predicate(t))),
                                       Sexp(Node(env_node, env.triple_object(t)))}), w);
        }
        out << ")\n";
        for (const auto& ctx : env.designation_contexts()) {
            out << "(designation " << ctx.to_string();
            for (const auto& [s, n] : env.designation_pairs(ctx)) {
                out << "\n ";
                write_sexp(out, make_list({Sexp(n), Sexp(s)}), w);
            }
            out << ")\n";
        }
    }

    // ─── Reading ───

    static const Symbol* section_head(const Sexp& s) {
        const Cons* c = s.cons();
        if (!c || !c->car()) return nullptr;
        return c->car()->as<Symbol>();
    }

    void load_sections(const std::vector<Sexp>& sections, Environment& env, LocalNode env_node) {
        auto it = sections.begin();
        if (it == sections.end()) throw deserialize_error(DeserializeError::Type::MissingHeaderSection);
        EnvHeader header = EnvHeader::reflect(*it++);
        if (!header.extras.empty()) header_extras_[env_node] = header.extras;

        auto expect = [&](const char* name, DeserializeError::Type missing) -> const Sexp& {
            if (it == sections.end()) throw deserialize_error(missing);
            const Symbol* head = section_head(*it);
            if (!head || head->str() != name) throw deserialize_error(missing, *it);
            return *it++;
        };

        const Sexp& nodes = expect("nodes", DeserializeError::Type::MissingNodeSection);
        auto structures = load_nodes(nodes, header.node_count, env, env_node);

        const Sexp& triples = expect("triples", DeserializeError::Type::MissingTripleSection);
        load_triples(triples, header.triple_count, env_node);

        for (; it != sections.end(); ++it) {
            const Symbol* head = section_head(*it);
            if (!head || head->str() != "designation") {
                throw deserialize_error(DeserializeError::Type::ExtraneousSection, *it);
            }
            load_designation(*it, env, env_node);
        }

        for (auto& [node, raw] : structures) {
            env.set_structure(node, env_codec::decode_structure(raw, env_node));
        }
    }

    // Allocates nodes; returns the structures to patch in once all exist
    std::vector<std::pair<LocalNode, Sexp>> load_nodes(const Sexp& section, size_t count,
                                                       Environment& env, LocalNode env_node) {
        std::vector<std::pair<LocalNode, Sexp>> structures;
        Deserializer d(section, env_node);
        d.symbol();

        size_t i = 0;
        for (; !d.done(); ++i) {
            const Sexp& entry = d.next();
            const Sexp* structure = nullptr;
            const Symbol* sigil = entry.as<Symbol>();
            if (!sigil && !entry.is_primitive() && !entry.is_nil()) {
                Deserializer pair(entry, env_node);
                sigil = pair.next().as<Symbol>();
                structure = &pair.next();
                pair.finish();
            }
            auto sig = sigil ? parse_sigil(sigil->str()) : std::nullopt;
            if (!sig || sig->kind != Sigil::Kind::LocalNode || sig->value != i) {
                throw deserialize_error(DeserializeError::Type::InvalidNodeEntry, entry,
                                        "expected node ^" + std::to_string(i));
            }

            LocalNode node(sig->value);
            if (i >= env_prelude::PRELUDE_SIZE) {
                LocalNode inserted = env.insert_node(std::nullopt);
                if (inserted != node) {
                    throw deserialize_error(DeserializeError::Type::InvalidNodeEntry, entry);
                }
            }
            // ^0 is rebuilt by the prelude; ^1 carries no structure
            if (structure && node != env_prelude::self_env() && node != env_prelude::self_des()) {
                structures.emplace_back(node, *structure);
            }
        }
        if (i != count) {
            throw deserialize_error(i < count ? DeserializeError::Type::MissingData
                                              : DeserializeError::Type::ExtraneousData,
                                    section, "header node-count " + std::to_string(count));
        }
        return structures;
    }

    void load_triples(const Sexp& section, size_t count, LocalNode env_node) {
        Deserializer d(section, env_node);
        d.symbol();
        size_t i = 0;
        for (; !d.done(); ++i) {
            Deserializer triple(d.next(), env_node);
            Node s = triple.node();
            Node p = triple.node();
            Node o = triple.node();
            triple.finish();
            agent_->tell(s, p, o);
        }
        if (i != count) {
            throw deserialize_error(i < count ? DeserializeError::Type::MissingData
                                              : DeserializeError::Type::ExtraneousData,
                                    section, "header triple-count " + std::to_string(count));
        }
    }

    void load_designation(const Sexp& section, Environment& env, LocalNode env_node) {
        Deserializer d(section, env_node);
        d.symbol();
        Node context = d.node();
        if (context.env != env_node) {
            throw deserialize_error(DeserializeError::Type::UnexpectedType, Sexp(context),
                                    "designation context in this env");
        }
        size_t n = 0;
        while (!d.done()) {
            Deserializer pair(d.next(), env_node);
            Node target = pair.node();
            Symbol name = pair.symbol();
            pair.finish();
            env.insert_designation(context.local, name, target);
            ++n;
        }
        log_debug("EnvManager", "designation %s: %zu names", context.local.to_string().c_str(), n);
    }
};

} // namespace smriti
