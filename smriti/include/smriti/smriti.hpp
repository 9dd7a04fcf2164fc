#pragma once
// smriti: a persistent semantic environment
//
// Environments of nodes and (subject predicate object) triples, federated
// under a meta env, driven by an s-expression language whose programs are
// themselves stored as nodes.

#include "version.hpp"
#include "log.hpp"
#include "types.hpp"
#include "number.hpp"
#include "sexp.hpp"
#include "symbol_policy.hpp"
#include "error.hpp"
#include "continuation.hpp"
#include "tokenizer.hpp"
#include "parser.hpp"
#include "environment.hpp"
#include "env_prelude.hpp"
#include "meta_env.hpp"
#include "serializer.hpp"
#include "context.hpp"
#include "agent.hpp"
#include "builtins.hpp"
#include "syntax_interpreter.hpp"
#include "exec_interpreter.hpp"
#include "config.hpp"
#include "env_header.hpp"
#include "env_manager.hpp"
#include "session.hpp"
