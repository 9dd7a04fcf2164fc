#pragma once
// ExecInterpreter: runs lowered procedures against the agent's exec stack
//
// exec(node) concretizes the node through the exec frames and runs the
// value if it is a Procedure:
// - Application: push a frame named by the meaning node, apply, pop
// - Branch: the predicate must yield the lang true or false node
// - Sequence: run in order, yield the last value
// - Abstraction: yielded as a value
//
// Special forms that survive lowering (def, tell, jump, ...) are
// dispatched here by their lang env node.

#include "agent.hpp"
#include "builtins.hpp"
#include "log.hpp"
#include "syntax_interpreter.hpp"
#include <string>
#include <vector>

namespace smriti {

class ExecInterpreter : public Applier {
public:
    ExecInterpreter(Agent& agent, SyntaxInterpreter& syntax) : agent_(agent), syntax_(syntax) {
        agent_.set_applier(this);
    }

    ~ExecInterpreter() override {
        if (agent_.applier() == this) agent_.set_applier(nullptr);
    }

    ExecInterpreter(const ExecInterpreter&) = delete;
    ExecInterpreter& operator=(const ExecInterpreter&) = delete;

    // Lower, record in the history env, run
    Sexp interpret(const Sexp& s) {
        Sexp lowered = syntax_.interpret(s);
        Node meaning;
        if (const Node* n = lowered.as<Node>()) {
            meaning = *n;
        } else if (agent_.history_env()) {
            meaning = agent_.history_insert(std::move(lowered));
        } else {
            meaning = syntax_.node_or_insert(std::move(lowered));
        }
        return exec(meaning);
    }

    Sexp exec(Node meaning) {
        Sexp value = agent_.concretize(meaning);
        return exec_value(value, meaning);
    }

    // Run a value; context names the frame of an Application
    Sexp exec_value(const Sexp& value, Node context) {
        const Procedure* proc = value.as<Procedure>();
        if (!proc) return value;

        switch (proc->type) {
            case Procedure::Type::Application: {
                FrameGuard guard(agent_, context);
                try {
                    return apply(proc->proc, proc->args);
                } catch (Error& e) {
                    e.set_state(agent_.exec_state());
                    throw;
                }
            }
            case Procedure::Type::Branch: {
                Sexp pred = exec(proc->pred);
                const LangContext& lang = agent_.lang();
                if (pred == Sexp(lang.true_node())) return exec(proc->then_branch);
                if (pred == Sexp(lang.false_node())) return exec(proc->else_branch);
                throw agent_.error(LangError::invalid_argument(pred, "true or false Node"));
            }
            case Procedure::Type::Sequence: {
                Sexp last;
                for (const auto& n : proc->seq) last = exec(n);
                return last;
            }
            case Procedure::Type::Abstraction:
            case Procedure::Type::InterpreterAbstraction:
                return value;
        }
        return value;
    }

    // Node produced by running n, or n itself when the result is not a node
    Node exec_to_node(Node n) {
        Sexp v = exec(n);
        if (const Node* out = v.as<Node>()) return *out;
        return n;
    }

    Sexp apply_values(const Sexp& proc, std::vector<Sexp> values, Node context) override {
        FrameGuard guard(agent_, context);
        try {
            return call_with_values(proc, std::move(values));
        } catch (Error& e) {
            e.set_state(agent_.exec_state());
            throw;
        }
    }

private:
    Agent& agent_;
    SyntaxInterpreter& syntax_;

    // Pushes an exec frame for one application and pops it on every exit
    struct FrameGuard {
        Agent& agent;
        FrameGuard(Agent& a, Node context) : agent(a) {
            agent.exec_state().push(ExecFrame(context));
            log_debug("Exec", "push frame %s (depth %zu)", context.to_string().c_str(),
                      agent.exec_state().depth());
        }
        ~FrameGuard() {
            agent.exec_state().pop();
            log_debug("Exec", "pop frame (depth %zu)", agent.exec_state().depth());
        }
        FrameGuard(const FrameGuard&) = delete;
        FrameGuard& operator=(const FrameGuard&) = delete;
    };

    void check_arity(const std::vector<Node>& args, ExpectedCount expected) const {
        if (!expected.accepts(args.size())) {
            throw agent_.error(LangError::wrong_argument_count(args.size(), expected));
        }
    }

    Sexp apply(Node proc_node, const std::vector<Node>& args) {
        Sexp proc = agent_.concretize(proc_node);

        if (const Node* n = proc.as<Node>()) {
            if (agent_.has_lang()) {
                if (auto form = agent_.lang().form(*n)) return apply_special(*form, args);
            }
        }

        if (proc.is<BuiltIn>()) {
            std::vector<Sexp> values;
            values.reserve(args.size());
            for (const auto& a : args) values.push_back(exec(a));
            return call_with_values(proc, std::move(values));
        }

        if (const Procedure* p = proc.as<Procedure>()) {
            if (p->type == Procedure::Type::Abstraction) {
                // All arguments run before any parameter is bound
                std::vector<Sexp> values;
                values.reserve(args.size());
                for (const auto& a : args) values.push_back(exec(a));
                return call_with_values(proc, std::move(values));
            }
            if (p->type == Procedure::Type::InterpreterAbstraction) {
                std::vector<Sexp> values;
                values.reserve(args.size());
                for (const auto& a : args) values.push_back(agent_.concretize(a));
                return call_with_values(proc, std::move(values));
            }
        }
        throw agent_.error(LangError::invalid_argument(proc, "Procedure"));
    }

    // Values are final: builtins get them as-is, abstractions bind them
    Sexp call_with_values(const Sexp& proc, std::vector<Sexp> values) {
        if (const BuiltIn* b = proc.as<BuiltIn>()) {
            log_debug("Exec", "builtin %s/%zu", b->name.c_str(), values.size());
            return b->call(values, agent_);
        }
        if (const Node* n = proc.as<Node>()) {
            Sexp inner = agent_.concretize(*n);
            if (inner != proc) return call_with_values(inner, std::move(values));
        }
        const Procedure* p = proc.as<Procedure>();
        if (!p || !p->is_abstraction()) {
            throw agent_.error(LangError::invalid_argument(proc, "Procedure"));
        }
        if (p->params.size() != values.size()) {
            throw agent_.error(LangError::wrong_argument_count(
                values.size(), ExpectedCount::exactly(p->params.size())));
        }
        ExecFrame& frame = agent_.exec_state().top_mut();
        for (size_t i = 0; i < values.size(); ++i) {
            if (!frame.insert(p->params[i], std::move(values[i]))) {
                throw agent_.error(LangError::invalid_state(
                    p->params[i].to_string() + " already bound", "fresh frame"));
            }
            log_debug("Exec", "bind %s", p->params[i].to_string().c_str());
        }
        return exec(p->body);
    }

    Symbol designated_symbol(Node name) const {
        Sexp designated = agent_.designate(Sexp(name));
        const Symbol* s = designated.as<Symbol>();
        if (!s) throw agent_.error(LangError::invalid_argument(designated, "Node abstracting Symbol"));
        return *s;
    }

    // Define slot, lower the initializer with name -> slot in scope, run it.
    // A Node result is used directly instead of filling the slot.
    Node define_value(std::optional<Symbol> name, std::optional<Node> raw) {
        Node slot = agent_.define(std::nullopt);
        if (!raw) return slot;

        Sexp source = agent_.concretize(*raw);
        SymNodeTable frame;
        if (name) frame.insert(*name, slot);
        Sexp lowered = syntax_.interpret_with(source, std::move(frame));
        if (const Node* n = lowered.as<Node>()) return *n;

        Sexp value = exec_value(lowered, slot);
        if (const Node* n = value.as<Node>()) return *n;
        agent_.set(slot, std::move(value));
        return slot;
    }

    Sexp apply_special(LangContext::Form form, const std::vector<Node>& args) {
        using Form = LangContext::Form;
        log_debug("Exec", "special %s/%zu", LangContext::form_name(form), args.size());

        switch (form) {
            case Form::Tell:
            case Form::Ask: {
                check_arity(args, ExpectedCount::exactly(3));
                Node s = exec_to_node(args[0]);
                Node p = exec_to_node(args[1]);
                Node o = exec_to_node(args[2]);
                if (form == Form::Tell) return Sexp(agent_.tell(s, p, o));
                ConsList out;
                for (const auto& t : agent_.ask(s, p, o)) out.append(Sexp(t));
                return out.release();
            }
            case Form::Def: {
                if (args.empty()) check_arity(args, ExpectedCount::at_least(1));
                check_arity(args, ExpectedCount::at_most(2));
                Symbol name = designated_symbol(args[0]);
                if (agent_.try_resolve(name)) {
                    throw agent_.error(LangError::already_bound_symbol(name));
                }
                std::optional<Node> raw;
                if (args.size() == 2) raw = args[1];
                Node target = define_value(name, raw);
                agent_.name_node(args[0], target);
                return Sexp(target);
            }
            case Form::NodeDef: {
                check_arity(args, ExpectedCount::at_most(1));
                std::optional<Node> raw;
                if (!args.empty()) raw = args[0];
                return Sexp(define_value(std::nullopt, raw));
            }
            case Form::Set: {
                if (args.empty()) check_arity(args, ExpectedCount::at_least(1));
                check_arity(args, ExpectedCount::at_most(2));
                Node target = args[0];
                std::optional<Sexp> value;
                if (args.size() == 2) value = exec(args[1]);
                agent_.set(target, std::move(value));
                return Sexp(target);
            }
            case Form::Curr:
                check_arity(args, ExpectedCount::exactly(0));
                return Sexp(agent_.pos());
            case Form::Jump: {
                check_arity(args, ExpectedCount::exactly(1));
                Node dest = exec_to_node(args[0]);
                agent_.jump(dest);
                return Sexp(dest);
            }
            case Form::Import:
                check_arity(args, ExpectedCount::exactly(1));
                return Sexp(agent_.import(exec_to_node(args[0])));
            case Form::EnvFind: {
                check_arity(args, ExpectedCount::exactly(1));
                Sexp path = exec(args[0]);
                const LangString* s = path.as<LangString>();
                if (!s) throw agent_.error(LangError::invalid_argument(path, "LangString"));
                if (auto env = agent_.find_env(s->str())) return Sexp(*env);
                return Sexp();
            }
            case Form::Apply: {
                check_arity(args, ExpectedCount::exactly(2));
                Node proc = exec_to_node(args[0]);
                Sexp list = exec(args[1]);
                std::vector<Node> arg_nodes;
                if (!list.is_primitive()) {
                    for (auto item : list.list()) {
                        if (!item.proper) {
                            throw agent_.error(LangError::invalid_argument(list, "proper list"));
                        }
                        arg_nodes.push_back(syntax_.node_or_insert(item.elem));
                    }
                } else {
                    throw agent_.error(LangError::invalid_argument(list, "proper list"));
                }
                FrameGuard guard(agent_, proc);
                return apply(proc, arg_nodes);
            }
            case Form::Eval: {
                check_arity(args, ExpectedCount::exactly(1));
                Sexp source = exec(args[0]);
                Sexp lowered = syntax_.interpret(source);
                if (const Node* n = lowered.as<Node>()) return exec(*n);
                return exec_value(lowered, args[0]);
            }
            case Form::Exec: {
                check_arity(args, ExpectedCount::exactly(1));
                return syntax_.interpret(exec(args[0]));
            }
            default:
                // quote, lambda, let, if, ... exist only before lowering
                throw agent_.error(LangError::invalid_argument(
                    Sexp(agent_.lang().node(form)), "Procedure"));
        }
    }
};

} // namespace smriti
