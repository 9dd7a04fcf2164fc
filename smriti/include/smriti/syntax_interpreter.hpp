#pragma once
// SyntaxInterpreter: lowers s-expressions into procedure values
//
// Sub-expressions are named by nodes: values that are not already nodes
// are stored in the impl env and referenced from the enclosing Procedure.
// Symbols resolve against the lexical frame stack first (lambda params,
// let bindings, the slot of a def being defined), then through the agent.
//
// Lowering only ever writes to the impl env.

#include "agent.hpp"
#include "continuation.hpp"
#include "log.hpp"
#include <set>
#include <string>
#include <vector>

namespace smriti {

class SyntaxInterpreter {
public:
    SyntaxInterpreter(Agent& agent, LocalNode impl_env)
        : agent_(agent), impl_env_(impl_env), eval_state_(SymNodeTable{}) {}

    LocalNode impl_env() const { return impl_env_; }
    Continuation<SymNodeTable>& eval_state() { return eval_state_; }

    Sexp interpret(const Sexp& s) {
        if (const Primitive* p = s.primitive()) {
            if (const auto* sym = std::get_if<Symbol>(p)) return Sexp(lookup(*sym));
            return s;
        }
        if (s.is_nil()) return s;

        const Cons* c = s.cons();
        if (!c->car()) throw agent_.error(LangError::invalid_sexp(s));
        Sexp head = interpret(*c->car());
        static const Sexp nil;
        const Sexp& rest = c->cdr() ? *c->cdr() : nil;

        if (const Node* n = head.as<Node>()) {
            if (agent_.has_lang()) {
                if (auto form = agent_.lang().form(*n)) return special(*form, *n, rest);
            }
        }

        if (!head.is<Procedure>() && !head.is<Node>()) {
            throw agent_.error(LangError::invalid_argument(head, "special form or Procedure application"));
        }
        bool internalize = !is_fexpr(head);
        Node proc = node_or_insert(std::move(head));
        return Sexp(Procedure::application(proc, evlis(rest, internalize)));
    }

    // Lower with an extra lexical frame active
    Sexp interpret_with(const Sexp& s, SymNodeTable frame) {
        FrameScope scope(eval_state_, std::move(frame));
        return interpret(s);
    }

    Node node_or_insert(Sexp value) {
        if (const Node* n = value.as<Node>()) return *n;
        return agent_.define_to(impl_env_, std::move(value));
    }

private:
    Agent& agent_;
    LocalNode impl_env_;
    Continuation<SymNodeTable> eval_state_;

    struct FrameScope {
        Continuation<SymNodeTable>& state;
        FrameScope(Continuation<SymNodeTable>& s, SymNodeTable frame) : state(s) {
            state.push(std::move(frame));
        }
        ~FrameScope() { state.pop(); }
    };

    Node lookup(const Symbol& s) const {
        const auto& frames = eval_state_.frames();
        for (auto it = frames.rbegin(); it != frames.rend(); ++it) {
            if (auto n = it->lookup(s)) return *n;
        }
        return agent_.resolve(s);
    }

    // fexpr arguments are passed on unlowered
    bool is_fexpr(const Sexp& head) const {
        auto fexpr = [](const Sexp& v) {
            const Procedure* proc = v.as<Procedure>();
            return proc && proc->type == Procedure::Type::InterpreterAbstraction;
        };
        if (head.is<Node>()) return fexpr(agent_.designate(head));
        return fexpr(head);
    }

    std::vector<Sexp> elements(const Sexp& list) const {
        std::vector<Sexp> out;
        if (list.is_primitive()) throw agent_.error(LangError::invalid_sexp(list));
        for (auto item : list.list()) {
            if (!item.proper) throw agent_.error(LangError::invalid_sexp(list));
            out.push_back(item.elem);
        }
        return out;
    }

    std::vector<Node> evlis(const Sexp& list, bool internalize) {
        std::vector<Node> out;
        for (auto& elem : elements(list)) {
            if (internalize) {
                out.push_back(node_or_insert(interpret(elem)));
            } else {
                out.push_back(agent_.define_to(impl_env_, std::move(elem)));
            }
        }
        return out;
    }

    Sexp special(LangContext::Form form, Node form_node, const Sexp& rest) {
        using Form = LangContext::Form;
        log_debug("Syntax", "special form %s", LangContext::form_name(form));
        switch (form) {
            case Form::Quote: {
                auto args = elements(rest);
                if (args.size() != 1) {
                    throw agent_.error(LangError::wrong_argument_count(args.size(), ExpectedCount::exactly(1)));
                }
                return args[0];
            }
            case Form::Lambda:
            case Form::Fexpr:
                return Sexp(make_lambda(rest, form == Form::Fexpr));
            case Form::Let:
            case Form::Letrec:
                return make_let(rest, form == Form::Letrec);
            case Form::If: {
                auto args = elements(rest);
                if (args.size() != 3) {
                    throw agent_.error(LangError::wrong_argument_count(args.size(), ExpectedCount::exactly(3)));
                }
                Node p = node_or_insert(interpret(args[0]));
                Node a = node_or_insert(interpret(args[1]));
                Node b = node_or_insert(interpret(args[2]));
                return Sexp(Procedure::branch(p, a, b));
            }
            case Form::Progn:
                return Sexp(Procedure::sequence(evlis(rest, true)));
            case Form::Def:
            case Form::NodeDef:
                return Sexp(Procedure::application(form_node, evlis(rest, false)));
            default:
                return Sexp(Procedure::application(form_node, evlis(rest, true)));
        }
    }

    std::vector<Symbol> unique_params(const Sexp& params) const {
        std::vector<Symbol> out;
        std::set<Symbol> seen;
        for (const auto& p : elements(params)) {
            const Symbol* s = p.as<Symbol>();
            if (!s) throw agent_.error(LangError::invalid_argument(p, "Symbol"));
            if (!seen.insert(*s).second) {
                throw agent_.error(LangError::invalid_argument(p, "unique name within argument list"));
            }
            out.push_back(*s);
        }
        return out;
    }

    // Single body form: its node. Several: a Sequence node.
    Node lower_body(const std::vector<Sexp>& body) {
        if (body.size() == 1) return node_or_insert(interpret(body[0]));
        std::vector<Node> seq;
        for (const auto& form : body) seq.push_back(node_or_insert(interpret(form)));
        return node_or_insert(Sexp(Procedure::sequence(std::move(seq))));
    }

    std::pair<std::vector<Node>, SymNodeTable> param_frame(const std::vector<Symbol>& names) {
        std::vector<Node> nodes;
        SymNodeTable frame;
        for (const auto& name : names) {
            Node n = agent_.define_to(impl_env_, std::nullopt);
            nodes.push_back(n);
            frame.insert(name, n);
        }
        return {std::move(nodes), std::move(frame)};
    }

    Procedure make_lambda(const Sexp& rest, bool fexpr) {
        auto args = elements(rest);
        if (args.size() < 2) {
            throw agent_.error(LangError::wrong_argument_count(args.size(), ExpectedCount::at_least(2)));
        }
        auto names = unique_params(args[0]);
        auto [params, frame] = param_frame(names);

        std::vector<Sexp> body(args.begin() + 1, args.end());
        Node body_node;
        {
            FrameScope scope(eval_state_, std::move(frame));
            body_node = lower_body(body);
        }
        return fexpr ? Procedure::interpreter_abstraction(std::move(params), body_node)
                     : Procedure::abstraction(std::move(params), body_node);
    }

    // (let ((name value)...) body...) => ((lambda (name...) body...) value...)
    Sexp make_let(const Sexp& rest, bool rec) {
        auto args = elements(rest);
        if (args.size() < 2) {
            throw agent_.error(LangError::wrong_argument_count(args.size(), ExpectedCount::at_least(2)));
        }

        ConsList names;
        std::vector<Sexp> values;
        for (const auto& binding : elements(args[0])) {
            auto pair = binding.is_primitive() ? std::vector<Sexp>{} : elements(binding);
            if (pair.size() != 2 || !pair[0].is<Symbol>()) {
                throw agent_.error(LangError::invalid_argument(binding, "(Symbol value) binding"));
            }
            names.append(pair[0]);
            values.push_back(pair[1]);
        }

        auto param_names = unique_params(names.release());
        auto [params, frame] = param_frame(param_names);

        std::vector<Node> arg_nodes;
        if (rec) {
            FrameScope scope(eval_state_, frame);
            for (const auto& v : values) arg_nodes.push_back(node_or_insert(interpret(v)));
        } else {
            for (const auto& v : values) arg_nodes.push_back(node_or_insert(interpret(v)));
        }

        std::vector<Sexp> body(args.begin() + 1, args.end());
        Node body_node;
        {
            FrameScope scope(eval_state_, std::move(frame));
            body_node = lower_body(body);
        }

        Node lambda = node_or_insert(Sexp(Procedure::abstraction(std::move(params), body_node)));
        return Sexp(Procedure::application(lambda, std::move(arg_nodes)));
    }
};

} // namespace smriti
