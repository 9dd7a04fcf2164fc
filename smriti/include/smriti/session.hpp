#pragma once
// Session: one interactive agent over a loaded federation
//
// The session agent is forked from the manager's agent, positioned in the
// working env and resolving names through the chain [lang, working]
// (working first). Code lowered by the syntax interpreter goes to the impl
// env; top-level meanings are recorded in the history env.

#include "config.hpp"
#include "env_manager.hpp"
#include "exec_interpreter.hpp"
#include "parser.hpp"
#include "syntax_interpreter.hpp"
#include <memory>
#include <string>
#include <vector>

namespace smriti {

class Session {
public:
    explicit Session(Config config)
        : manager_(std::move(config)),
          agent_(manager_.agent().fork()),
          syntax_(agent_, manager_.impl_env()),
          exec_(agent_, syntax_) {
        agent_.set_history_env(manager_.history_env());
        agent_.set_color(manager_.config().color);
        agent_.designation_chain().clear();
        agent_.designation_chain().push_back(Node(manager_.lang_env(), env_prelude::self_des()));
        agent_.designation_chain().push_back(Node(manager_.working_env(), env_prelude::self_des()));
        agent_.jump_env(manager_.working_env());
    }

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    Agent& agent() { return agent_; }
    EnvManager& manager() { return manager_; }
    SyntaxInterpreter& syntax() { return syntax_; }
    ExecInterpreter& exec() { return exec_; }

    Sexp evaluate(const Sexp& s) { return exec_.interpret(s); }

    // Every top-level form in order; the value of the last one
    Sexp run_text(const std::string& text) {
        Sexp last;
        for (const auto& s : parse_all(text)) last = evaluate(s);
        return last;
    }

    std::string to_string(const Sexp& s) const { return agent_.sexp_to_string(s); }

    void save() { manager_.serialize_full(); }

private:
    EnvManager manager_;
    Agent agent_;
    SyntaxInterpreter syntax_;
    ExecInterpreter exec_;
};

} // namespace smriti
