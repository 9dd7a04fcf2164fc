#pragma once
// Contexts: well-known nodes resolved by designation at load time
//
// MetaEnvContext names the meta env predicates used for import tables and
// persistence. LangContext names the special forms, booleans and the
// placeholder of the lang env. Both load non-strictly: a missing name is
// created and designated so older files pick up new forms.

#include "env_prelude.hpp"
#include "environment.hpp"
#include "serializer.hpp"
#include <optional>
#include <string>
#include <vector>

namespace smriti {

namespace detail {
// Node designated by name in env's designation table, created if missing
inline LocalNode designated_or_insert(Environment& env, LocalNode env_node, const std::string& name) {
    Symbol s(name);
    if (auto n = env.match_designation(env_prelude::self_des(), s)) {
        if (n->env != env_node) {
            throw deserialize_error(DeserializeError::Type::UnexpectedType, Sexp(*n),
                                    "node of env " + env_node.to_string() + " for " + name);
        }
        return n->local;
    }
    LocalNode local = env.insert_node(std::nullopt);
    env.insert_designation(env_prelude::self_des(), s, Node(env_node, local));
    return local;
}
} // namespace detail

struct MetaEnvContext {
    LocalNode imports;
    LocalNode import_table;
    LocalNode serialize_path;

    static MetaEnvContext load(Environment& meta) {
        MetaEnvContext ctx;
        LocalNode self(0);
        ctx.imports = detail::designated_or_insert(meta, self, "__imports");
        ctx.import_table = detail::designated_or_insert(meta, self, "__import_table");
        ctx.serialize_path = detail::designated_or_insert(meta, self, "__serialize_path");
        return ctx;
    }
};

class LangContext {
public:
    enum class Form {
        Quote, Lambda, Fexpr, Def, NodeDef, Set, Let, Letrec, If, Progn,
        Tell, Ask, Curr, Jump, Import, EnvFind, Apply, Eval, Exec
    };

    LocalNode lang_env;

    // Special form node; nullopt for any other node
    std::optional<Form> form(Node n) const {
        if (n.env != lang_env) return std::nullopt;
        for (size_t i = 0; i < FORM_COUNT; ++i) {
            if (forms_[i] == n.local) return static_cast<Form>(i);
        }
        return std::nullopt;
    }

    Node node(Form f) const { return Node(lang_env, forms_[static_cast<size_t>(f)]); }
    Node true_node() const { return Node(lang_env, true_); }
    Node false_node() const { return Node(lang_env, false_); }
    Node placeholder() const { return Node(lang_env, placeholder_); }
    Node boolean(bool v) const { return v ? true_node() : false_node(); }

    static const char* form_name(Form f) {
        static const char* names[] = {"quote", "lambda", "fexpr", "def", "node", "set!", "let",
                                      "letrec", "if", "progn", "tell", "ask", "curr", "jump",
                                      "import", "env_find", "apply", "eval", "exec"};
        return names[static_cast<size_t>(f)];
    }

    static LangContext load(Environment& lang, LocalNode lang_env) {
        LangContext ctx;
        ctx.lang_env = lang_env;
        for (size_t i = 0; i < FORM_COUNT; ++i) {
            ctx.forms_[i] = detail::designated_or_insert(lang, lang_env, form_name(static_cast<Form>(i)));
        }
        ctx.placeholder_ = detail::designated_or_insert(lang, lang_env, "_");
        ctx.true_ = detail::designated_or_insert(lang, lang_env, "true");
        ctx.false_ = detail::designated_or_insert(lang, lang_env, "false");
        return ctx;
    }

    // (LangContext (lang_env . E) (quote . ^E^N) ...)
    Sexp reify() const {
        Serializer ser;
        ser.begin_struct("LangContext");
        ser.serialize_field("lang_env", [&](Serializer& s) { s.serialize_local_node(lang_env); });
        for (size_t i = 0; i < FORM_COUNT; ++i) {
            Node n = node(static_cast<Form>(i));
            ser.serialize_field(form_name(static_cast<Form>(i)), [&](Serializer& s) { s.serialize_node(n); });
        }
        ser.serialize_field("_", [&](Serializer& s) { s.serialize_node(placeholder()); });
        ser.serialize_field("true", [&](Serializer& s) { s.serialize_node(true_node()); });
        ser.serialize_field("false", [&](Serializer& s) { s.serialize_node(false_node()); });
        ser.end_struct();
        return ser.finish();
    }

    static LangContext reflect(const Sexp& s) {
        Deserializer d(s);
        d.expect_symbol("LangContext");
        LangContext ctx;
        ctx.lang_env = Deserializer::as_local_node(d.field("lang_env"));
        auto local = [&](const char* name) {
            Node n = Deserializer::as_node(d.field(name), ctx.lang_env);
            if (n.env != ctx.lang_env) {
                throw deserialize_error(DeserializeError::Type::UnexpectedType, Sexp(n), name);
            }
            return n.local;
        };
        for (size_t i = 0; i < FORM_COUNT; ++i) {
            ctx.forms_[i] = local(form_name(static_cast<Form>(i)));
        }
        ctx.placeholder_ = local("_");
        ctx.true_ = local("true");
        ctx.false_ = local("false");
        d.finish();
        return ctx;
    }

    bool operator==(const LangContext& o) const {
        if (lang_env != o.lang_env || placeholder_ != o.placeholder_ || true_ != o.true_ ||
            false_ != o.false_) {
            return false;
        }
        for (size_t i = 0; i < FORM_COUNT; ++i) {
            if (forms_[i] != o.forms_[i]) return false;
        }
        return true;
    }

private:
    static constexpr size_t FORM_COUNT = static_cast<size_t>(Form::Exec) + 1;

    LocalNode forms_[FORM_COUNT];
    LocalNode placeholder_;
    LocalNode true_;
    LocalNode false_;
};

} // namespace smriti
