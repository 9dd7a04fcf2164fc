#pragma once
// Built-in procedures
//
// Each takes its already-executed arguments and the calling agent. The
// registry is the set of names the env loader accepts in (__builtin NAME).

#include "agent.hpp"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace smriti {
namespace builtins {

inline void check_arity(const std::vector<Sexp>& args, ExpectedCount expected, const Agent& agent) {
    if (!expected.accepts(args.size())) {
        throw agent.error(LangError::wrong_argument_count(args.size(), expected));
    }
}

inline Sexp car(std::vector<Sexp>& args, Agent& agent) {
    check_arity(args, ExpectedCount::exactly(1), agent);
    const Cons* c = args[0].cons();
    if (!c || !c->car()) throw agent.error(LangError::invalid_argument(args[0], "non-empty list"));
    return *c->car();
}

inline Sexp cdr(std::vector<Sexp>& args, Agent& agent) {
    check_arity(args, ExpectedCount::exactly(1), agent);
    const Cons* c = args[0].cons();
    if (!c || !c->car()) throw agent.error(LangError::invalid_argument(args[0], "non-empty list"));
    return c->cdr() ? *c->cdr() : Sexp();
}

// A nil cdr ends the list: (cons 1 ()) is (1)
inline Sexp cons(std::vector<Sexp>& args, Agent& agent) {
    check_arity(args, ExpectedCount::exactly(2), agent);
    auto tail = args[1].is_nil() ? nullptr : std::make_unique<Sexp>(std::move(args[1]));
    return Sexp(Cons(std::make_unique<Sexp>(std::move(args[0])), std::move(tail)));
}

inline Sexp list_len(std::vector<Sexp>& args, Agent& agent) {
    check_arity(args, ExpectedCount::exactly(1), agent);
    auto len = args[0].proper_length();
    if (!len) throw agent.error(LangError::invalid_argument(args[0], "proper list"));
    return Sexp(Number::usize(*len));
}

inline Sexp println(std::vector<Sexp>& args, Agent& agent) {
    bool first = true;
    for (const auto& a : args) {
        if (!first) std::cout << " ";
        first = false;
        if (const LangString* s = a.as<LangString>()) {
            std::cout << s->str();
        } else {
            agent.print_sexp(std::cout, a);
        }
    }
    std::cout << std::endl;
    return Sexp();
}

inline Sexp eq(std::vector<Sexp>& args, Agent& agent) {
    check_arity(args, ExpectedCount::exactly(2), agent);
    return Sexp(agent.lang().boolean(args[0] == args[1]));
}

// Meta env node of an env -> jump to that env's self node
inline Sexp env_jump(std::vector<Sexp>& args, Agent& agent) {
    check_arity(args, ExpectedCount::exactly(1), agent);
    const Node* n = args[0].as<Node>();
    if (!n || n->env.id != 0 || !agent.meta().is_env(n->local)) {
        throw agent.error(LangError::invalid_argument(args[0], "meta env node of an env"));
    }
    agent.jump_env(n->local);
    return Sexp(agent.pos());
}

namespace detail {

inline Sexp fold_numbers(std::vector<Sexp>& args, Agent& agent, char op) {
    check_arity(args, ExpectedCount::at_least(1), agent);
    std::vector<Number> nums;
    nums.reserve(args.size());
    for (const auto& a : args) {
        const Number* n = a.as<Number>();
        if (!n) throw agent.error(LangError::invalid_argument(a, "Number"));
        nums.push_back(*n);
    }
    for (const auto& n : nums) {
        if (n.is_float() != nums[0].is_float()) {
            throw agent.error(LangError::invalid_argument(make_list(std::vector<Sexp>(args)),
                                                          "Numbers of one kind"));
        }
    }

    Number acc = nums[0];
    for (size_t i = 1; i < nums.size(); ++i) {
        if (op == '/' && nums[i].is_integer() && nums[i].is_zero()) {
            throw agent.error(LangError::invalid_argument(Sexp(nums[i]), "non-zero divisor"));
        }
        auto next = acc.apply(op, nums[i]);
        if (!next) {
            throw agent.error(LangError::invalid_argument(make_list(std::vector<Sexp>(args)),
                                                          "operands with a representable result"));
        }
        acc = *next;
    }
    return Sexp(acc);
}

} // namespace detail

inline Sexp add(std::vector<Sexp>& args, Agent& agent) { return detail::fold_numbers(args, agent, '+'); }
inline Sexp sub(std::vector<Sexp>& args, Agent& agent) { return detail::fold_numbers(args, agent, '-'); }
inline Sexp mul(std::vector<Sexp>& args, Agent& agent) { return detail::fold_numbers(args, agent, '*'); }
inline Sexp div(std::vector<Sexp>& args, Agent& agent) { return detail::fold_numbers(args, agent, '/'); }

} // namespace builtins

inline const std::vector<BuiltIn>& builtin_table() {
    static const std::vector<BuiltIn> table = {
        {"car", builtins::car},
        {"cdr", builtins::cdr},
        {"cons", builtins::cons},
        {"list-len", builtins::list_len},
        {"println", builtins::println},
        {"eq", builtins::eq},
        {"env-jump", builtins::env_jump},
        {"+", builtins::add},
        {"-", builtins::sub},
        {"*", builtins::mul},
        {"/", builtins::div},
    };
    return table;
}

inline std::optional<BuiltIn> find_builtin(const std::string& name) {
    for (const auto& b : builtin_table()) {
        if (b.name == name) return b;
    }
    return std::nullopt;
}

} // namespace smriti
